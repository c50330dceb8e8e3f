#pragma once

/**
 * @file http.hpp
 * @brief Minimal HTTP client used by verifiers with online data sources
 *
 * HttpClient is an interface so that verifiers can be exercised without the
 * network. CurlHttpClient is the libcurl implementation used by the CLI.
 */

#include <map>
#include <memory>
#include <string>

namespace scfw {

struct HttpRequest {
    std::string url;
    std::string method = "GET";
    std::string body;
    std::map<std::string, std::string> headers;
    long timeout_ms = 5000;
};

struct HttpResponse {
    int status_code = 0;        // 0 if no response was received
    std::string body;
    std::string error;          // transport error, empty on success

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

    // Transport error or "HTTP <status>"
    std::string describe() const;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse request(const HttpRequest& req) = 0;

    HttpResponse get(const std::string& url, long timeout_ms = 5000);
    HttpResponse post_json(const std::string& url, const std::string& body, long timeout_ms = 5000);
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse request(const HttpRequest& req) override;
};

} // namespace scfw
