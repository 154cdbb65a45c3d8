#pragma once

#include "cancel_token.hpp"
#include "transcription/http_transport.hpp"

class CurlTransport : public HttpTransport {
public:
    // With a token, a pending cancellation aborts the transfer.
    explicit CurlTransport(CancelToken* cancel = nullptr);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::expected<HttpResponse, std::string> post_multipart(const HttpRequest& request) override;

private:
    CancelToken* cancel_;
};
