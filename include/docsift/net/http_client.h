#pragma once

#include <docsift/core/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsift::net {

struct Header {
    std::string name;
    std::string value;
};

enum class HttpMethod { Get, Post, Put, Delete, Head };

struct BasicAuth {
    std::string username;
    std::string password;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::vector<Header> headers;
    std::string body;
    std::chrono::milliseconds timeout{60'000};
    std::optional<BasicAuth> auth;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Blocking request/response transport. Never retries.
 *
 * Transport failures (DNS, connect, timeout) are errors; any HTTP status is a
 * response and left to the caller to judge.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

// libcurl easy-handle transport, one handle per request
class CurlHttpTransport final : public IHttpTransport {
public:
    CurlHttpTransport();
    Result<HttpResponse> send(const HttpRequest& request) override;
};

const char* methodToString(HttpMethod method);

// Error for a non-2xx response, carrying a prefix of the body
Error httpStatusError(const HttpResponse& response, std::string_view where);

// "http://h:9200/" + "/idx/_search" -> "http://h:9200/idx/_search"
std::string joinUrl(std::string_view base, std::string_view path);

} // namespace docsift::net
