#pragma once
/**
 * @file url_cache.hpp
 * @brief Persistent cache of remote domain lists, keyed by a hash of the URL.
 *
 * An entry past its expiry is still returned by load(): callers use it for
 * checksum comparison (drift detection) even though they refetch the body.
 */

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dnsroute::sources {

/** @struct UrlCacheEntry
 *  @brief Cached body of one URL.
 */
struct UrlCacheEntry {
    std::string content;                               ///< Raw response body
    std::string checksum;                              ///< compute_checksum(content)
    std::chrono::system_clock::time_point expires_at;  ///< Entry is fresh strictly before this

    [[nodiscard]] bool fresh(std::chrono::system_clock::time_point now) const noexcept {
        return now < expires_at;
    }
};

/// Lowercase hex SHA-256 of `content`.
std::string compute_checksum(std::string_view content);

/// File name used for a URL: url_<sha256(url)>.yaml
std::string cache_file_name(std::string_view url);

/** @class UrlCache
 *  @brief Injectable cache service (file-backed in production, in-memory in tests).
 */
class UrlCache {
public:
    virtual ~UrlCache() = default;

    /// Return the stored entry for `url`, fresh or expired; nullopt if absent/unreadable.
    virtual std::optional<UrlCacheEntry> load(const std::string& url) const = 0;

    /// Overwrite the entry for `url`. Returns false if it could not be persisted.
    virtual bool store(const std::string& url, const UrlCacheEntry& entry) = 0;
};

/** @class FileUrlCache
 *  @brief One YAML document per URL under a directory created on first write.
 *  @note Writes go through a temp file + rename; concurrent processes are not coordinated.
 */
class FileUrlCache final : public UrlCache {
public:
    explicit FileUrlCache(std::filesystem::path dir) : dir_(std::move(dir)) {}

    std::optional<UrlCacheEntry> load(const std::string& url) const override;
    bool store(const std::string& url, const UrlCacheEntry& entry) override;

    [[nodiscard]] std::filesystem::path path_for(std::string_view url) const;

private:
    std::filesystem::path dir_;
};

/** @class MemoryUrlCache
 *  @brief Process-local cache, used where nothing may touch the disk.
 */
class MemoryUrlCache final : public UrlCache {
public:
    std::optional<UrlCacheEntry> load(const std::string& url) const override;
    bool store(const std::string& url, const UrlCacheEntry& entry) override;

    void clear() noexcept { entries_.clear(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    std::unordered_map<std::string, UrlCacheEntry> entries_;
};

} // namespace dnsroute::sources
