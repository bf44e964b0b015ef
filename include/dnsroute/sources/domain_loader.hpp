#pragma once
/**
 * @file domain_loader.hpp
 * @brief Turns a group's files and URLs into labeled raw-line sequences.
 *
 * Load errors are collected per source; one unreadable source never stops the
 * others. Remote bodies go through the UrlCache: a fresh entry skips the
 * network, an expired one still provides the previous checksum so a changed
 * remote list is reported.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "dnsroute/compat/expected.hpp"
#include "dnsroute/config/constants.hpp"
#include "dnsroute/config/group.hpp"
#include "dnsroute/obs/observability.hpp"
#include "dnsroute/sources/http_fetcher.hpp"
#include "dnsroute/sources/url_cache.hpp"

namespace dnsroute::sources {

/// Where a line sequence came from.
enum class SourceKind : std::uint8_t { File, Url };

/** @struct SourceLines
 *  @brief Raw lines of one source plus how they were obtained.
 */
struct SourceLines {
    SourceKind               kind{SourceKind::File};
    std::string              location;        ///< Path or URL
    std::vector<std::string> lines;           ///< Split on '\n', untrimmed
    bool                     from_cache{false};       ///< URL body served from a fresh cache entry
    bool                     content_changed{false};  ///< Checksum differs from the previous entry
    std::string              checksum;        ///< URL sources only

    /// Short label for diagnostics: "file <name>" or "URL <url>".
    [[nodiscard]] std::string label() const;
};

/** @struct GroupSources
 *  @brief All sources of a group in declaration order (files, then URLs) + load errors.
 */
struct GroupSources {
    std::vector<SourceLines> sources;
    std::vector<std::string> errors; ///< "group 'x': failed to ..." per failed source
};

/** @struct LoaderOptions
 *  @brief Cache lifetime and network timeout.
 */
struct LoaderOptions {
    std::chrono::seconds      cache_ttl{config::constants::URL_CACHE_TTL_DEFAULT};
    std::chrono::milliseconds fetch_timeout{config::constants::URL_FETCH_TIMEOUT};
};

/// Split text on '\n' (a trailing newline does not produce an extra empty line).
std::vector<std::string> split_lines(const std::string& text);

class DomainSourceLoader {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    DomainSourceLoader(HttpFetcher& fetcher, UrlCache& cache, obs::Observer& observer,
                       LoaderOptions opts = {}, Clock clock = {});

    /// Read a whole local file.
    dnsroute_detail::expected<SourceLines, std::string> load_file(const std::string& path) const;

    /// Fetch (or serve from cache) one remote list.
    dnsroute_detail::expected<SourceLines, std::string> load_url(const std::string& url);

    /// Load every source of `group`; failures are accumulated, not short-circuited.
    GroupSources load_group(const config::DomainGroup& group);

    [[nodiscard]] const LoaderOptions& options() const noexcept { return opts_; }

private:
    HttpFetcher&   fetcher_;
    UrlCache&      cache_;
    obs::Observer& obs_;
    LoaderOptions  opts_;
    Clock          clock_;
};

} // namespace dnsroute::sources
