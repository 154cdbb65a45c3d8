#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;

    // Plain multipart form fields, in order.
    std::vector<std::pair<std::string, std::string>> fields;

    // Multipart file part.
    std::string file_field = "file";
    std::filesystem::path file_path;
    std::string file_type = "audio/wav";

    long timeout_seconds = 30;
    long connect_timeout_seconds = 10;

    // If set, the response body is also written here.
    std::filesystem::path response_path;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Performs exactly one request. An unexpected value means no HTTP response
// was received.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual std::expected<HttpResponse, std::string> post_multipart(const HttpRequest& request) = 0;
};
