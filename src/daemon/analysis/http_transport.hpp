#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::seconds timeout{30};
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking HTTP POST. Any HTTP answer, including non-2xx, is a response; the
// error side is reserved for failures to get one (DNS, connect, timeout).
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual std::expected<HttpResponse, std::string> post(const HttpRequest& request) = 0;
};
