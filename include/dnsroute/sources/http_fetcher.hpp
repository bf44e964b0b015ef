#pragma once
/**
 * @file http_fetcher.hpp
 * @brief Pluggable HTTP GET used to download remote domain lists.
 */

#include <chrono>
#include <string>

#include "dnsroute/compat/expected.hpp"

namespace dnsroute::sources {

    /** @struct HttpResponse
     *  @brief Status line code and body of a completed request.
     */
    struct HttpResponse {
        long        status{0};
        std::string body;
    };

    class HttpFetcher {
    public:
        virtual ~HttpFetcher() = default;

        /**
         * @brief GET `url`, giving up after `timeout`.
         * @return Response for any completed exchange (including non-200);
         *         transport error text on timeout/DNS/TLS/connection failures.
         */
        virtual dnsroute_detail::expected<HttpResponse, std::string>
        get(const std::string& url, std::chrono::milliseconds timeout) = 0;
    };

    /** @class CurlFetcher
     *  @brief libcurl easy-interface implementation. Follows redirects.
     */
    class CurlFetcher final : public HttpFetcher {
    public:
        CurlFetcher();
        ~CurlFetcher() override;
        CurlFetcher(const CurlFetcher&) = delete;
        CurlFetcher& operator=(const CurlFetcher&) = delete;

        dnsroute_detail::expected<HttpResponse, std::string>
        get(const std::string& url, std::chrono::milliseconds timeout) override;

    private:
        bool global_ok_{false};
    };

} // namespace dnsroute::sources
