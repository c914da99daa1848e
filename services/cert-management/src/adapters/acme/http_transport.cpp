/**
 * @file http_transport.cpp
 * @brief CurlHttpTransport implementation
 */

#include "http_transport.h"
#include "exceptions.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace adapters {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// --- Collects "Name: value" lines; a new status line resets after redirects ---
size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    std::string line(buffer, size * nitems);

    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
    } else {
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            (*headers)[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
    }
    return size * nitems;
}

struct CurlDeleter { void operator()(CURL* c) const { curl_easy_cleanup(c); } };
struct SlistDeleter { void operator()(curl_slist* s) const { curl_slist_free_all(s); } };

} // anonymous namespace

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string();
}

CurlHttpTransport::CurlHttpTransport(long timeoutSec)
    : timeoutSec_(timeoutSec > 0 ? timeoutSec : 30) {}

HttpResponse CurlHttpTransport::get(const std::string& url) {
    return perform(Method::Get, url, "", "");
}

HttpResponse CurlHttpTransport::head(const std::string& url) {
    return perform(Method::Head, url, "", "");
}

HttpResponse CurlHttpTransport::post(const std::string& url, const std::string& body,
                                     const std::string& contentType) {
    return perform(Method::Post, url, body, contentType);
}

HttpResponse CurlHttpTransport::perform(Method method, const std::string& url,
                                        const std::string& body, const std::string& contentType) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw common::ProtocolException("Failed to initialize CURL");
    }

    HttpResponse response;
    std::unique_ptr<curl_slist, SlistDeleter> requestHeaders;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSec_);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "cert-management/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);

    switch (method) {
        case Method::Get:
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
            break;
        case Method::Head:
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
            break;
        case Method::Post:
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
            if (!contentType.empty()) {
                requestHeaders.reset(curl_slist_append(nullptr, ("Content-Type: " + contentType).c_str()));
                curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, requestHeaders.get());
            }
            break;
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw common::ProtocolException("HTTP request to " + url + " failed: " + curl_easy_strerror(res));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    spdlog::debug("[CurlHttpTransport] {} {} -> {}",
                  method == Method::Get ? "GET" : method == Method::Head ? "HEAD" : "POST",
                  url, response.status);
    return response;
}

} // namespace adapters
