#include "transcription/transcription_client.hpp"

#include "wav.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

TranscriptionClient::TranscriptionClient(HttpTransport& transport, Options options)
    : transport_(transport), options_(std::move(options)) {}

TranscriptionResult TranscriptionClient::transcribe(const std::filesystem::path& audio_path,
                                                    const Credential& credential,
                                                    const std::filesystem::path& response_path) {
    if (wav::payload_bytes(audio_path) == 0) {
        return EmptyAudio{};
    }

    HttpRequest request;
    request.url = options_.url;
    request.headers = {{"Authorization", "Bearer " + credential.api_key}};
    request.fields = {
        {"model", MODEL},
        {"response_format", RESPONSE_FORMAT},
        {"language", options_.language},
    };
    request.file_path = audio_path;
    request.timeout_seconds = options_.timeout_seconds;
    request.response_path = response_path;

    auto start = std::chrono::steady_clock::now();
    ++requests_sent_;
    auto response = transport_.post_multipart(request);
    auto end = std::chrono::steady_clock::now();

    if (!response) {
        return NetworkFailure{.detail = response.error()};
    }

    auto result = map_response(*response);
    if (auto* t = std::get_if<Transcript>(&result)) {
        t->processing_s = std::chrono::duration<double>(end - start).count();
    }
    return result;
}

TranscriptionResult TranscriptionClient::map_response(const HttpResponse& response) {
    if (response.status != 200) {
        return ApiError{.status = response.status, .message = extract_error(response.body)};
    }

    try {
        auto j = json::parse(response.body);
        if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
            return NoText{};
        }

        auto text = trim(j["text"].get<std::string>());
        if (text.empty()) return NoText{};

        return Transcript{.text = std::move(text), .processing_s = 0.0};
    } catch (const json::exception&) {
        return NoText{};
    }
}

std::string TranscriptionClient::extract_error(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object()) return "request failed";

        if (j.contains("error")) {
            auto& e = j["error"];
            if (e.is_object() && e.contains("message") && e["message"].is_string()) {
                return e["message"].get<std::string>();
            }
            if (e.is_string()) return e.get<std::string>();
        }
        for (const char* key : {"message", "detail"}) {
            if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
        }
    } catch (const json::exception&) {
        return "request failed";
    }
    return "request failed";
}
