#include "http_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

CurlHttpClient::CurlHttpClient(int timeout_ms, const CancelToken* cancel)
    : timeout_ms_(timeout_ms)
    , cancel_(cancel)
    , curl_(nullptr)
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl_ = curl_easy_init();
    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "cryptotrack/1.0");

    if (cancel_) {
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, const_cast<CancelToken*>(cancel_));
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

int CurlHttpClient::progress_callback(void* clientp, curl_off_t, curl_off_t,
                                      curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancelToken*>(clientp);
    return cancel->is_cancelled() ? 1 : 0;
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    HttpResponse response;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);

    spdlog::debug("GET {}", url);
    CURLcode res = curl_easy_perform(curl_);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw NetworkError("request cancelled");
    }
    if (res != CURLE_OK) {
        spdlog::debug("Request failed: {}", curl_easy_strerror(res));
        throw NetworkError(std::string("request failed: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::debug("HTTP {} ({} bytes)", response.status, response.body.size());

    return response;
}
