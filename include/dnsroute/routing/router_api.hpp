#pragma once
/**
 * @file router_api.hpp
 * @brief Pluggable device access: state reads + one batched command call.
 * @details The HTTP transport, JSON envelope and authentication live behind
 *          implementations of this interface (MemoryRouter in-process).
 */

#include <map>
#include <set>
#include <string>
#include <vector>

#include "dnsroute/compat/expected.hpp"
#include "dnsroute/routing/command.hpp"

namespace dnsroute::routing {

    /// Existing object-groups: name -> domains.
    using ExistingGroups = std::map<std::string, std::set<std::string>>;

    /// Existing dns-proxy routes: group name -> interface ID.
    using ExistingRoutes = std::map<std::string, std::string>;

    /// Interface IDs known to the device ("ISP", "Wireguard0", ...).
    using InterfaceIds = std::set<std::string>;

    class RouterApi {
    public:
        virtual ~RouterApi() = default;

        /// Firmware version cached by the authentication step; empty if unknown.
        virtual std::string firmware_version() const = 0;

        /// Fresh read of FQDN object-groups and their entries.
        virtual dnsroute_detail::expected<ExistingGroups, std::string> existing_groups() = 0;

        /// Fresh read of dns-proxy routes.
        virtual dnsroute_detail::expected<ExistingRoutes, std::string> existing_routes() = 0;

        /// Fresh read of the device's interface list.
        virtual dnsroute_detail::expected<InterfaceIds, std::string> existing_interfaces() = 0;

        /**
         * @brief Submit the ordered batch.
         * @return One result per command in submission order, or a transport error
         *         when the batch as a whole could not be delivered.
         */
        virtual dnsroute_detail::expected<std::vector<CommandResult>, std::string>
        execute(const CommandList& commands) = 0;
    };

} // namespace dnsroute::routing
