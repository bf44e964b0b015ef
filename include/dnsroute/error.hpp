#pragma once
/**
 * @file error.hpp
 * @brief Error model shared by every stage of a DNS-routing run.
 *
 * Operations return `Result<T>` (expected<T, Error>); nothing throws across a
 * module boundary. Non-fatal findings (load and limit errors) are collected in
 * `details` so one report lists all of them.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "dnsroute/compat/expected.hpp"
#include "dnsroute/routing/command.hpp"

namespace dnsroute {

/// Failure classes, in the order a run can hit them.
enum class ErrorKind : std::uint8_t {
    Config,             ///< Structurally invalid group definition; caught before I/O
    VersionGate,        ///< Firmware too old or unknown; no device I/O performed
    Load,               ///< One or more sources could not be read
    Limit,              ///< A group exceeds the per-group entry limit
    StateFetch,         ///< Reading existing groups/routes failed
    Execution,          ///< The batch could not be submitted at all
    PartialApplication  ///< Batch submitted, some commands failed; accepted ones stay applied
};

/** @struct Error
 *  @brief Error value with an optional multi-error and per-command report.
 */
struct Error {
    ErrorKind   kind{ErrorKind::Config};
    std::string message;                                ///< One-line summary
    std::vector<std::string> details;                   ///< Individual findings
    std::vector<routing::CommandOutcome> outcomes;      ///< Per-command report (execution)

    /// Multi-line human-readable rendering.
    [[nodiscard]] std::string describe() const;
};

template <class T>
using Result = dnsroute_detail::expected<T, Error>;

using Status = dnsroute_detail::expected<void, Error>;

const char* to_string(ErrorKind k) noexcept;

/// Build an unexpected Error for `return fail(...)` in functions returning Result/Status.
inline dnsroute_detail::unexpected<Error>
fail(ErrorKind kind, std::string message, std::vector<std::string> details = {}) {
    return dnsroute_detail::unexpected<Error>(
        Error{kind, std::move(message), std::move(details), {}});
}

} // namespace dnsroute
