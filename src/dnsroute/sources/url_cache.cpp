/**
 * @file url_cache.cpp
 * @brief File-backed (yaml-cpp) and in-memory URL caches; OpenSSL checksums.
 */
#include "dnsroute/sources/url_cache.hpp"
#include "dnsroute/config/constants.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <system_error>

#include <openssl/evp.h>
#include <yaml-cpp/yaml.h>

namespace dnsroute::sources {
    namespace fs = std::filesystem;
    using namespace dnsroute::config::constants;
    using Clock = std::chrono::system_clock;

    static constexpr const char* KEY_CONTENT    = "content";
    static constexpr const char* KEY_CHECKSUM   = "checksum";
    static constexpr const char* KEY_EXPIRES_MS = "expires_at_ms";

    std::string compute_checksum(std::string_view content) {
        std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
        unsigned int len = 0;
        if (EVP_Digest(content.data(), content.size(), md.data(), &len, EVP_sha256(), nullptr) != 1) {
            return {}; // digest unavailable: callers treat an empty checksum as unknown
        }
        static constexpr char HEX[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (unsigned int i = 0; i < len; ++i) {
            out.push_back(HEX[md[i] >> 4]);
            out.push_back(HEX[md[i] & 0x0F]);
        }
        return out;
    }

    std::string cache_file_name(std::string_view url) {
        std::string name(URL_CACHE_FILE_PREFIX);
        name += compute_checksum(url);
        name += URL_CACHE_FILE_SUFFIX;
        return name;
    }

    // ----------------------------- FileUrlCache -------------------------------

    fs::path FileUrlCache::path_for(std::string_view url) const {
        return dir_ / cache_file_name(url);
    }

    std::optional<UrlCacheEntry> FileUrlCache::load(const std::string& url) const {
        const auto path = path_for(url);
        std::error_code ec;
        if (!fs::exists(path, ec) || ec) return std::nullopt;

        try {
            const YAML::Node doc = YAML::LoadFile(path.string());
            if (!doc.IsMap() || !doc[KEY_CONTENT] || !doc[KEY_CHECKSUM] || !doc[KEY_EXPIRES_MS]) {
                return std::nullopt;
            }
            UrlCacheEntry e;
            e.content  = doc[KEY_CONTENT].as<std::string>();
            e.checksum = doc[KEY_CHECKSUM].as<std::string>();
            e.expires_at = Clock::time_point{
                std::chrono::milliseconds{doc[KEY_EXPIRES_MS].as<std::int64_t>()}};
            return e;
        } catch (const YAML::Exception&) {
            // Corrupt entry behaves like a miss; the next successful fetch overwrites it.
            return std::nullopt;
        }
    }

    bool FileUrlCache::store(const std::string& url, const UrlCacheEntry& entry) {
        std::error_code ec;
        fs::create_directories(dir_, ec);
        if (ec) return false;

        const auto expires_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.expires_at.time_since_epoch()).count();

        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << KEY_CONTENT << YAML::Value << YAML::DoubleQuoted << entry.content;
        out << YAML::Key << KEY_CHECKSUM << YAML::Value << entry.checksum;
        out << YAML::Key << KEY_EXPIRES_MS << YAML::Value << static_cast<std::int64_t>(expires_ms);
        out << YAML::EndMap;
        if (!out.good()) return false;

        const auto path = path_for(url);
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
            if (!f) return false;
            f << out.c_str() << '\n';
            if (!f.good()) return false;
        }
        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) return false;
        fs::rename(tmp, path, ec);
        return !ec;
    }

    // ---------------------------- MemoryUrlCache ------------------------------

    std::optional<UrlCacheEntry> MemoryUrlCache::load(const std::string& url) const {
        auto it = entries_.find(url);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    bool MemoryUrlCache::store(const std::string& url, const UrlCacheEntry& entry) {
        entries_.insert_or_assign(url, entry);
        return true;
    }

} // namespace dnsroute::sources
