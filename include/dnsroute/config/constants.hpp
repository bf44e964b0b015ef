#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the DNS-routing engine.
 * @details These values eliminate magic numbers from the codebase. Settings that
 *          operators may tune (TTL, data directory, debug) are overridden through
 *          the Config Loader; device limits are fixed by the firmware.
 */

#include <chrono>
#include <cstddef>
#include <string_view>

namespace dnsroute::config::constants {

// =====================
// Device limits
// =====================
/// Maximum number of entries the firmware accepts in one FQDN object-group.
inline constexpr std::size_t MAX_DOMAINS_PER_GROUP = 300;

/// Oldest firmware release that understands `dns-proxy route object-group`.
inline constexpr std::string_view MIN_DNS_ROUTING_VERSION = "5.0.1";

// =====================
// Domain name rules (RFC 1035 / RFC 1123)
// =====================
inline constexpr std::size_t DOMAIN_MAX_LENGTH = 253; ///< Whole name, ASCII form
inline constexpr std::size_t LABEL_MAX_LENGTH  = 63;  ///< Single label, ASCII form

// =====================
// Remote domain lists
// =====================
/// Lifetime of a cached URL body before it is fetched again.
inline constexpr std::chrono::seconds URL_CACHE_TTL_DEFAULT{60};

/// Hard cap on one remote list download (connect + transfer).
inline constexpr std::chrono::milliseconds URL_FETCH_TIMEOUT{5000};

/// Only this HTTP status counts as a successful download.
inline constexpr long HTTP_STATUS_OK = 200;

// =====================
// Local storage
// =====================
/// Directory created under the data dir (or $HOME) for cache files.
inline constexpr std::string_view DATA_DIR_NAME = ".dnsroute";

/// Prefix of per-URL cache files: url_<sha256(url)>.yaml
inline constexpr std::string_view URL_CACHE_FILE_PREFIX = "url_";
inline constexpr std::string_view URL_CACHE_FILE_SUFFIX = ".yaml";

} // namespace dnsroute::config::constants
