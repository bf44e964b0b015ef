#pragma once
/**
 * @file version_gate.hpp
 * @brief Firmware version guard for DNS-routing commands.
 */

#include <compare>
#include <string>
#include <string_view>
#include <vector>

#include "dnsroute/config/constants.hpp"
#include "dnsroute/error.hpp"

namespace dnsroute::routing {

    /// Dotted numeric components, e.g. "4.3.6.3" -> {4,3,6,3}.
    using VersionParts = std::vector<unsigned long>;

    /** @struct Version
     *  @brief Parsed firmware title: numeric core plus an optional prerelease tag.
     */
    struct Version {
        VersionParts numbers;
        std::string  prerelease;  ///< "beta.2" for "5.0.1-beta.2"; empty for a release

        bool operator==(const Version&) const = default;
    };

    /**
     * @brief Parse a firmware title.
     * @details Each component must start with a digit. A non-numeric tail such
     *          as "-beta" becomes the prerelease tag; "+build" metadata is dropped.
     */
    dnsroute_detail::expected<Version, std::string> parse_version(std::string_view text);

    /**
     * @brief Numeric component-wise comparison ("5.10" > "5.9", "5.0" == "5.0.0").
     * @details With equal numbers a prerelease ranks below its release
     *          ("5.0.1-beta" < "5.0.1").
     */
    std::strong_ordering compare_versions(const Version& a, const Version& b);

    /**
     * @brief Fail unless `firmware` >= `minimum`.
     * @return VersionGate error for empty, unparsable or older versions.
     */
    Status check_dns_routing_support(std::string_view firmware,
                                     std::string_view minimum = config::constants::MIN_DNS_ROUTING_VERSION);

} // namespace dnsroute::routing
