#pragma once
/**
 * @file group.hpp
 * @brief Desired DNS-routing group as delivered by configuration.
 */

#include <string>
#include <vector>

#include "dnsroute/error.hpp"

namespace dnsroute::config {

    /** @struct DomainGroup
     *  @brief Named domain set bound to one routing interface. Identity = name.
     *  @note Paths are absolute and URLs literal by the time a group reaches the engine.
     */
    struct DomainGroup {
        std::string              name;         ///< Object-group name on the device
        std::vector<std::string> domain_files; ///< Local list files, one entry per line
        std::vector<std::string> domain_urls;  ///< Remote list URLs
        std::string              interface_id; ///< Target interface, e.g. "Wireguard0"

        bool operator==(const DomainGroup&) const = default;
    };

    using GroupList = std::vector<DomainGroup>;

    /// True if the string is empty or only spaces, tabs, CR and LF.
    bool is_blank(const std::string& s) noexcept;

    /**
     * @brief Structural checks before any I/O.
     * @return Config error on: blank name, duplicate name, no source, empty interface.
     */
    Status validate_groups(const GroupList& groups);

} // namespace dnsroute::config
