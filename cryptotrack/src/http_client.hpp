#pragma once

#include "cancel_token.hpp"
#include <string>
#include <curl/curl.h>

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Throws NetworkError on transport failure or timeout. HTTP error
    // statuses are returned, not thrown.
    virtual HttpResponse get(const std::string& url) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(int timeout_ms = 10000, const CancelToken* cancel = nullptr);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url) override;

private:
    int timeout_ms_;
    const CancelToken* cancel_;
    CURL* curl_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                 curl_off_t ultotal, curl_off_t ulnow);
};
