#include <docsift/net/http_client.h>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace docsift::net {

namespace {

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

std::once_flag g_curlInit;

} // namespace

const char* methodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Put: return "PUT";
        case HttpMethod::Delete: return "DELETE";
        case HttpMethod::Head: return "HEAD";
    }
    return "GET";
}

CurlHttpTransport::CurlHttpTransport() {
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<HttpResponse> CurlHttpTransport::send(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    auto* list = build_header_list(request.headers);
    HttpResponse response;
    std::string userpwd;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(request.timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Head:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::Post:
        case HttpMethod::Put:
        case HttpMethod::Delete:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, methodToString(request.method));
            if (!request.body.empty() || request.method != HttpMethod::Delete) {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            }
            break;
    }

    if (request.auth) {
        userpwd = request.auth->username + ":" + request.auth->password;
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERPWD, userpwd.c_str());
    }

    spdlog::debug("HTTP {} {} ({} bytes)", methodToString(request.method), request.url,
                  request.body.size());
    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
    if (list)
        curl_slist_free_all(list);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        return makeCurlError(rc, fmt::format("{} {}", methodToString(request.method), request.url));
    }
    spdlog::debug("HTTP {} -> {} ({} bytes)", request.url, response.status, response.body.size());
    return response;
}

Error httpStatusError(const HttpResponse& response, std::string_view where) {
    ErrorCode code = ErrorCode::ServiceError;
    if (response.status == 404) {
        code = ErrorCode::NotFound;
    } else if (response.status == 401 || response.status == 403) {
        code = ErrorCode::PermissionDenied;
    } else if (response.status == 408 || response.status == 504) {
        code = ErrorCode::Timeout;
    } else if (response.status == 400) {
        code = ErrorCode::InvalidArgument;
    }
    constexpr size_t kMaxBody = 512;
    auto body = response.body.substr(0, kMaxBody);
    return Error{code, fmt::format("{}: HTTP {} {}", where, response.status, body)};
}

std::string joinUrl(std::string_view base, std::string_view path) {
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    std::string out(base);
    out.push_back('/');
    out.append(path);
    return out;
}

} // namespace docsift::net
