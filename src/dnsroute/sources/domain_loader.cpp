/**
 * @file domain_loader.cpp
 * @brief File and URL sources for domain lists.
 */
#include "dnsroute/sources/domain_loader.hpp"

#include <cstring>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace dnsroute::sources {
    using dnsroute_detail::unexpected;

    std::string SourceLines::label() const {
        if (kind == SourceKind::File) {
            return "file " + std::filesystem::path(location).filename().string();
        }
        return "URL " + location;
    }

    std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        std::size_t start = 0;
        while (start < text.size()) {
            const auto nl = text.find('\n', start);
            if (nl == std::string::npos) {
                lines.emplace_back(text, start);
                break;
            }
            lines.emplace_back(text, start, nl - start);
            start = nl + 1;
        }
        return lines;
    }

    DomainSourceLoader::DomainSourceLoader(HttpFetcher& fetcher, UrlCache& cache,
                                           obs::Observer& observer,
                                           LoaderOptions opts, Clock clock)
        : fetcher_(fetcher), cache_(cache), obs_(observer), opts_(opts), clock_(std::move(clock)) {
        if (!clock_) clock_ = [] { return std::chrono::system_clock::now(); };
    }

    dnsroute_detail::expected<SourceLines, std::string>
    DomainSourceLoader::load_file(const std::string& path) const {
        std::error_code ec;
        const auto st = std::filesystem::status(path, ec);
        if (!ec && std::filesystem::is_directory(st)) {
            return unexpected<std::string>("failed to read domain file '" + path + "': is a directory");
        }
        if (!ec && !std::filesystem::is_regular_file(st)) {
            return unexpected<std::string>("failed to read domain file '" + path + "': not a regular file");
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return unexpected<std::string>("failed to read domain file '" + path + "': " +
                                           std::strerror(errno));
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad()) {
            return unexpected<std::string>("failed to read domain file '" + path + "'");
        }

        SourceLines out;
        out.kind = SourceKind::File;
        out.location = path;
        out.lines = split_lines(ss.str());
        return out;
    }

    dnsroute_detail::expected<SourceLines, std::string>
    DomainSourceLoader::load_url(const std::string& url) {
        const auto now = clock_();
        const auto previous = cache_.load(url);

        SourceLines out;
        out.kind = SourceKind::Url;
        out.location = url;

        if (previous && previous->fresh(now)) {
            out.lines = split_lines(previous->content);
            out.from_cache = true;
            out.checksum = previous->checksum;
            obs_.step("loader", "Loaded " + std::to_string(out.lines.size()) +
                                " line(s) from cache, URL: " + url);
            return out;
        }

        auto resp = fetcher_.get(url, opts_.fetch_timeout);
        if (!resp) {
            return unexpected<std::string>("failed to fetch domain URL '" + url + "': " + resp.error());
        }
        if (resp->status != config::constants::HTTP_STATUS_OK) {
            return unexpected<std::string>("failed to fetch domain URL '" + url + "': status code " +
                                           std::to_string(resp->status));
        }

        out.checksum = compute_checksum(resp->body);
        out.content_changed = previous && !previous->checksum.empty() &&
                              previous->checksum != out.checksum;

        UrlCacheEntry entry{resp->body, out.checksum, now + opts_.cache_ttl};
        if (!cache_.store(url, entry)) {
            obs_.warn("loader", "Could not write cache entry for URL: " + url);
        }
        if (out.content_changed) {
            obs_.step("loader", "Domain list updated (checksum changed): " + url);
        }

        out.lines = split_lines(resp->body);
        return out;
    }

    GroupSources DomainSourceLoader::load_group(const config::DomainGroup& group) {
        GroupSources gs;
        gs.sources.reserve(group.domain_files.size() + group.domain_urls.size());

        for (const auto& file : group.domain_files) {
            auto r = load_file(file);
            if (!r) {
                gs.errors.push_back("group '" + group.name + "': " + r.error());
                continue;
            }
            gs.sources.push_back(std::move(*r));
        }
        for (const auto& url : group.domain_urls) {
            auto r = load_url(url);
            if (!r) {
                gs.errors.push_back("group '" + group.name + "': " + r.error());
                continue;
            }
            gs.sources.push_back(std::move(*r));
        }
        return gs;
    }

} // namespace dnsroute::sources
