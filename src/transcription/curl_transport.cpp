#include "transcription/curl_transport.hpp"

#include <cstdio>
#include <curl/curl.h>
#include <print>

namespace {

struct WriteTarget {
    std::string* body;
    std::FILE* file;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* target = static_cast<WriteTarget*>(userdata);
    target->body->append(ptr, size * nmemb);
    if (target->file && std::fwrite(ptr, size, nmemb, target->file) != nmemb) {
        return 0;
    }
    return size * nmemb;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<CancelToken*>(userdata);
    return cancel && cancel->cancelled() ? 1 : 0;
}

} // namespace

CurlTransport::CurlTransport(CancelToken* cancel)
    : cancel_(cancel) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

std::expected<HttpResponse, std::string> CurlTransport::post_multipart(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, request.file_field.c_str());
    curl_mime_filedata(part, request.file_path.c_str());
    curl_mime_type(part, request.file_type.c_str());

    for (const auto& [name, value] : request.fields) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, name.c_str());
        curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
    }

    curl_slist* headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        headers = curl_slist_append(headers, (name + ": " + value).c_str());
    }

    HttpResponse response;
    std::FILE* out = nullptr;
    if (!request.response_path.empty()) {
        out = std::fopen(request.response_path.c_str(), "wb");
        if (!out) {
            std::println(stderr, "http: could not open {} for the response body",
                         request.response_path.string());
        }
    }
    WriteTarget target{.body = &response.body, .file = out};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &target);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, request.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (cancel_) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, cancel_);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    if (out) std::fclose(out);
    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected("cancelled");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    return response;
}
