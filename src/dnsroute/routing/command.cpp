/**
 * @file command.cpp
 * @brief Rendering and factories for device commands.
 */
#include "dnsroute/routing/command.hpp"

#include <algorithm>
#include <utility>

namespace dnsroute::routing {

std::string Command::text() const {
    switch (kind) {
        case CommandKind::CreateGroup:
            return "object-group fqdn " + group;
        case CommandKind::AddDomain:
            return "object-group fqdn " + group + " include " + argument;
        case CommandKind::RemoveDomain:
            return "no object-group fqdn " + group + " include " + argument;
        case CommandKind::DeleteGroup:
            return "no object-group fqdn " + group;
        case CommandKind::SetRoute:
            return "dns-proxy route object-group " + group + " " + argument + " auto";
        case CommandKind::DeleteRoute:
            return "no dns-proxy route object-group " + group + " " + argument;
        case CommandKind::SaveConfig:
            return "system configuration save";
    }
    return {};
}

namespace cmd {

    Command create_group(std::string group) {
        return Command{CommandKind::CreateGroup, std::move(group), {}};
    }

    Command add_domain(std::string group, std::string domain) {
        return Command{CommandKind::AddDomain, std::move(group), std::move(domain)};
    }

    Command remove_domain(std::string group, std::string domain) {
        return Command{CommandKind::RemoveDomain, std::move(group), std::move(domain)};
    }

    Command delete_group(std::string group) {
        return Command{CommandKind::DeleteGroup, std::move(group), {}};
    }

    Command set_route(std::string group, std::string interface_id) {
        return Command{CommandKind::SetRoute, std::move(group), std::move(interface_id)};
    }

    Command delete_route(std::string group, std::string interface_id) {
        return Command{CommandKind::DeleteRoute, std::move(group), std::move(interface_id)};
    }

    Command save_config() {
        return Command{CommandKind::SaveConfig, {}, {}};
    }

} // namespace cmd

std::vector<CommandOutcome> pair_outcomes(const CommandList& commands,
                                          const std::vector<CommandResult>& results) {
    std::vector<CommandOutcome> out;
    const auto n = std::min(commands.size(), results.size());
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(CommandOutcome{commands[i].text(), results[i]});
    }
    return out;
}

const char* to_string(CommandStatus s) noexcept {
    switch (s) {
        case CommandStatus::Ok:    return "ok";
        case CommandStatus::Error: return "error";
    }
    return "unknown";
}

} // namespace dnsroute::routing
