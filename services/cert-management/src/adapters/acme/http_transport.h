#pragma once

#include <map>
#include <string>

/**
 * @file http_transport.h
 * @brief Minimal HTTPS transport used by the ACME client
 */

namespace adapters {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;    ///< Names lower-cased

    /// Header value by case-insensitive name, empty if absent
    std::string header(const std::string& name) const;
};

/**
 * @brief Request executor
 *
 * Implementations throw common::ProtocolException when no HTTP response was
 * obtained. HTTP error statuses are returned, not thrown.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual HttpResponse get(const std::string& url) = 0;
    virtual HttpResponse head(const std::string& url) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const std::string& contentType) = 0;
};

/**
 * @brief libcurl implementation, one easy handle per request
 *
 * curl_global_init() must have been called by the process.
 */
class CurlHttpTransport : public IHttpTransport {
public:
    explicit CurlHttpTransport(long timeoutSec = 30);

    HttpResponse get(const std::string& url) override;
    HttpResponse head(const std::string& url) override;
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::string& contentType) override;

private:
    enum class Method { Get, Head, Post };

    HttpResponse perform(Method method, const std::string& url,
                         const std::string& body, const std::string& contentType);

    long timeoutSec_;
};

} // namespace adapters
