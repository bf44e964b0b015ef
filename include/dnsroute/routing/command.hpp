#pragma once
/**
 * @file command.hpp
 * @brief Device command model for object-groups and dns-proxy routes.
 *
 * Commands are kept structured (kind + group + argument) so planners and the
 * in-memory device can reason about them; text() renders the device CLI form
 * that a transport submits in its batch.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace dnsroute::routing {

/// Every command shape the engine emits.
enum class CommandKind : std::uint8_t {
    CreateGroup,   ///< object-group fqdn <name>
    AddDomain,     ///< object-group fqdn <name> include <domain>
    RemoveDomain,  ///< no object-group fqdn <name> include <domain>
    DeleteGroup,   ///< no object-group fqdn <name>
    SetRoute,      ///< dns-proxy route object-group <name> <iface> auto
    DeleteRoute,   ///< no dns-proxy route object-group <name> <iface>
    SaveConfig     ///< system configuration save
};

/** @struct Command
 *  @brief One device command. `argument` is the domain or interface ID, if any.
 */
struct Command final {
    CommandKind kind{CommandKind::SaveConfig};
    std::string group;     ///< Object-group name (empty for SaveConfig)
    std::string argument;  ///< Domain for Add/RemoveDomain, interface for routes

    /// Render the device CLI text.
    [[nodiscard]] std::string text() const;

    bool operator==(const Command&) const = default;
};

using CommandList = std::vector<Command>;

/// Per-command status reported by the device.
enum class CommandStatus : std::uint8_t { Ok, Error };

/** @struct CommandResult
 *  @brief Device answer for one submitted command, same position as submitted.
 */
struct CommandResult final {
    CommandStatus status{CommandStatus::Ok};
    std::string   message;

    bool operator==(const CommandResult&) const = default;
};

/** @struct CommandOutcome
 *  @brief A submitted command paired with its result, for reports.
 */
struct CommandOutcome final {
    std::string   command;  ///< Rendered text
    CommandResult result;
};

/// Command factories.
namespace cmd {
    Command create_group(std::string group);
    Command add_domain(std::string group, std::string domain);
    Command remove_domain(std::string group, std::string domain);
    Command delete_group(std::string group);
    Command set_route(std::string group, std::string interface_id);
    Command delete_route(std::string group, std::string interface_id);
    Command save_config();
}

/// Pair commands with results; results beyond the command count are ignored.
std::vector<CommandOutcome> pair_outcomes(const CommandList& commands,
                                          const std::vector<CommandResult>& results);

const char* to_string(CommandStatus s) noexcept;

} // namespace dnsroute::routing
