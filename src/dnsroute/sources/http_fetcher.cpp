/**
 * @file http_fetcher.cpp
 * @brief libcurl-backed HttpFetcher.
 */
#include "dnsroute/sources/http_fetcher.hpp"

#include <memory>

#include <curl/curl.h>

namespace dnsroute::sources {

    CurlFetcher::CurlFetcher() {
        global_ok_ = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
    }

    CurlFetcher::~CurlFetcher() {
        if (global_ok_) curl_global_cleanup();
    }

    dnsroute_detail::expected<HttpResponse, std::string>
    CurlFetcher::get(const std::string& url, std::chrono::milliseconds timeout) {
        if (!global_ok_) return dnsroute_detail::unexpected<std::string>("curl global init failed");

        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) return dnsroute_detail::unexpected<std::string>("curl init failed");

        HttpResponse resp;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
                         +[](char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
                             auto* out = static_cast<std::string*>(userdata);
                             out->append(ptr, size * nmemb);
                             return size * nmemb;
                         });
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            return dnsroute_detail::unexpected<std::string>(curl_easy_strerror(res));
        }
        if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status) != CURLE_OK) {
            return dnsroute_detail::unexpected<std::string>("cannot read HTTP status");
        }
        return resp;
    }

} // namespace dnsroute::sources
