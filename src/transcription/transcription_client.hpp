#pragma once

#include "credential.hpp"
#include "transcription/http_transport.hpp"
#include "transcription/result.hpp"

#include <filesystem>
#include <string>

class TranscriptionClient {
public:
    static constexpr const char* MODEL = "whisper-large-v3";
    static constexpr const char* RESPONSE_FORMAT = "json";

    struct Options {
        std::string url = "https://api.groq.com/openai/v1/audio/transcriptions";
        std::string language = "en";
        long timeout_seconds = 30;
    };

    TranscriptionClient(HttpTransport& transport, Options options);

    // One upload, no retry. Empty audio returns EmptyAudio without a request.
    // `response_path` optionally receives the raw response body.
    TranscriptionResult transcribe(const std::filesystem::path& audio_path,
                                   const Credential& credential,
                                   const std::filesystem::path& response_path = {});

    // Maps an HTTP response onto a result.
    static TranscriptionResult map_response(const HttpResponse& response);

    // Best-effort message from an error body; "request failed" if none.
    static std::string extract_error(const std::string& body);

    size_t requests_sent() const { return requests_sent_; }

private:
    HttpTransport& transport_;
    Options options_;
    size_t requests_sent_ = 0;
};
