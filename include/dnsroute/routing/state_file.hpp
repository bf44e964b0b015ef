#pragma once
/**
 * @file state_file.hpp
 * @brief YAML snapshot of a device's DNS-routing state, for offline runs.
 *
 * @code{.yaml}
 * firmware: "5.0.2"
 * object-groups:
 *   social: [facebook.com, instagram.com]
 * routes:
 *   social: Wireguard0
 * interfaces: [ISP, Wireguard0]
 * @endcode
 */

#include <string>

#include "dnsroute/error.hpp"
#include "dnsroute/routing/memory_router.hpp"

namespace dnsroute::routing {

    /// Parse a snapshot document. Missing sections are empty.
    Result<RouterState> parse_state(const std::string& text);

    /// Render a snapshot document (groups, routes and interfaces in name order).
    std::string emit_state(const RouterState& state);

    /// Read a snapshot file; StateFetch error if unreadable or malformed.
    Result<RouterState> load_state_file(const std::string& path);

    /// Write a snapshot file (temp file + rename).
    Status save_state_file(const std::string& path, const RouterState& state);

} // namespace dnsroute::routing
