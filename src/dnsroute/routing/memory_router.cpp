/**
 * @file memory_router.cpp
 * @brief Command interpreter for the in-memory device model.
 */
#include "dnsroute/routing/memory_router.hpp"

#include <utility>

namespace dnsroute::routing {

namespace {

CommandResult ok(std::string message = {}) {
    return CommandResult{CommandStatus::Ok, std::move(message)};
}

CommandResult err(std::string message) {
    return CommandResult{CommandStatus::Error, std::move(message)};
}

} // namespace

MemoryRouter::MemoryRouter(RouterState initial, std::size_t group_limit)
    : state_(std::move(initial)), limit_(group_limit) {}

dnsroute_detail::expected<ExistingGroups, std::string> MemoryRouter::existing_groups() {
    ++reads_;
    if (read_error_) return dnsroute_detail::unexpected<std::string>(*read_error_);
    return state_.groups;
}

dnsroute_detail::expected<ExistingRoutes, std::string> MemoryRouter::existing_routes() {
    ++reads_;
    if (read_error_) return dnsroute_detail::unexpected<std::string>(*read_error_);
    return state_.routes;
}

dnsroute_detail::expected<InterfaceIds, std::string> MemoryRouter::existing_interfaces() {
    ++reads_;
    if (read_error_) return dnsroute_detail::unexpected<std::string>(*read_error_);
    return state_.interfaces;
}

dnsroute_detail::expected<std::vector<CommandResult>, std::string>
MemoryRouter::execute(const CommandList& commands) {
    if (batch_error_) return dnsroute_detail::unexpected<std::string>(*batch_error_);
    ++batches_;

    std::vector<CommandResult> results;
    results.reserve(commands.size());
    for (const auto& c : commands) {
        if (failing_.contains(c.text())) {
            results.push_back(err("command rejected: " + c.text()));
            continue;
        }
        results.push_back(apply_one(c));
    }
    return results;
}

CommandResult MemoryRouter::apply_one(const Command& c) {
    switch (c.kind) {
        case CommandKind::CreateGroup: {
            const auto [it, inserted] = state_.groups.try_emplace(c.group);
            (void)it;
            return ok(inserted ? "object-group \"" + c.group + "\" created" : std::string{});
        }
        case CommandKind::AddDomain: {
            auto it = state_.groups.find(c.group);
            if (it == state_.groups.end()) return err("object-group \"" + c.group + "\" not found");
            if (it->second.contains(c.argument)) return ok();
            if (it->second.size() >= limit_) {
                return err("object-group \"" + c.group + "\": entry limit (" +
                           std::to_string(limit_) + ") reached");
            }
            it->second.insert(c.argument);
            return ok("added \"" + c.argument + "\"");
        }
        case CommandKind::RemoveDomain: {
            auto it = state_.groups.find(c.group);
            if (it == state_.groups.end()) return err("object-group \"" + c.group + "\" not found");
            if (it->second.erase(c.argument) == 0) {
                return err("\"" + c.argument + "\" not in object-group \"" + c.group + "\"");
            }
            return ok("removed \"" + c.argument + "\"");
        }
        case CommandKind::DeleteGroup: {
            if (!state_.groups.contains(c.group)) return err("object-group \"" + c.group + "\" not found");
            if (state_.routes.contains(c.group)) {
                return err("object-group \"" + c.group + "\" is in use by dns-proxy route");
            }
            state_.groups.erase(c.group);
            return ok("object-group \"" + c.group + "\" deleted");
        }
        case CommandKind::SetRoute: {
            if (!state_.groups.contains(c.group)) return err("object-group \"" + c.group + "\" not found");
            if (!state_.interfaces.contains(c.argument)) return err("interface \"" + c.argument + "\" not found");
            state_.routes[c.group] = c.argument;
            return ok("route " + c.group + " -> " + c.argument);
        }
        case CommandKind::DeleteRoute: {
            const auto it = state_.routes.find(c.group);
            if (it == state_.routes.end() || it->second != c.argument) {
                return err("no route for \"" + c.group + "\" via " + c.argument);
            }
            state_.routes.erase(it);
            return ok("route " + c.group + " removed");
        }
        case CommandKind::SaveConfig:
            ++saves_;
            return ok("configuration saved");
    }
    return err("unknown command");
}

} // namespace dnsroute::routing
