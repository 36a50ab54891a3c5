#pragma once

#include "analysis/http_transport.hpp"

class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::expected<HttpResponse, std::string> post(const HttpRequest& request) override;
};
