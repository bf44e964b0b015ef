#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: parse the YAML configuration into engine settings.
 * @details Unset values fall back to the named constants in constants.hpp.
 */

#include <chrono>
#include <filesystem>
#include <string>

#include "dnsroute/config/constants.hpp"
#include "dnsroute/config/group.hpp"
#include "dnsroute/error.hpp"

namespace dnsroute::config {

    /** @struct AppConfig
     *  @brief Aggregate of settings required by a DNS-routing run.
     */
    struct AppConfig {
        GroupList            groups;                                      ///< dns.routes.groups
        std::string          data_dir;                                    ///< Base dir for cache files (empty = $HOME)
        std::chrono::seconds url_cache_ttl{constants::URL_CACHE_TTL_DEFAULT}; ///< URL cache lifetime
        bool                 debug{false};                                ///< logs.debug
    };

    /** @class Loader
     *  @brief Source of configuration (YAML file or defaults).
     */
    class Loader {
    public:
        /**
         * @brief Load configuration from a YAML file.
         * @param path Config file path. Relative domain-file entries resolve against its directory.
         * @return AppConfig, or a Config error for unreadable/malformed documents.
         */
        static Result<AppConfig> load_from_file(const std::string& path);

        /**
         * @brief Parse configuration from YAML text.
         * @param text YAML document.
         * @param base_dir Directory used to resolve relative domain-file entries.
         */
        static Result<AppConfig> load_from_string(const std::string& text,
                                                  const std::filesystem::path& base_dir);

        /// Directory holding URL cache files: <data_dir or $HOME>/.dnsroute
        static std::filesystem::path cache_directory(const AppConfig& cfg);
    };

} // namespace dnsroute::config
