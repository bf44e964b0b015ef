/**
 * @file planner.cpp
 * @brief Diff of desired vs. existing object-groups and routes.
 */
#include "dnsroute/routing/planner.hpp"

#include <algorithm>

namespace dnsroute::routing {

Plan plan_apply(const config::GroupList& desired,
                const ResolvedDomains& resolved,
                const ExistingGroups& existing_groups,
                const ExistingRoutes& existing_routes) {
    Plan plan;

    for (const auto& group : desired) {
        const auto want_it = resolved.find(group.name);
        if (want_it == resolved.end()) continue;
        const auto& want = want_it->second; // sorted, unique

        const auto have_it = existing_groups.find(group.name);
        if (have_it == existing_groups.end()) {
            plan.commands.push_back(cmd::create_group(group.name));
            ++plan.groups_to_create;
        } else {
            // Drift cleanup before additions keeps the group under the device limit.
            for (const auto& d : have_it->second) {
                if (!std::binary_search(want.begin(), want.end(), d)) {
                    plan.commands.push_back(cmd::remove_domain(group.name, d));
                    ++plan.domains_to_remove;
                }
            }
        }

        for (const auto& d : want) {
            if (have_it != existing_groups.end() && have_it->second.contains(d)) continue;
            plan.commands.push_back(cmd::add_domain(group.name, d));
            ++plan.domains_to_add;
        }
    }

    // Routes reference object-groups, so they go after every group command.
    for (const auto& group : desired) {
        if (!resolved.contains(group.name)) continue;
        const auto route = existing_routes.find(group.name);
        if (route == existing_routes.end() || route->second != group.interface_id) {
            plan.commands.push_back(cmd::set_route(group.name, group.interface_id));
            ++plan.routes_to_set;
        }
    }

    if (!plan.commands.empty()) plan.commands.push_back(cmd::save_config());
    return plan;
}

Plan plan_delete(const config::GroupList& groups) {
    Plan plan;
    if (groups.empty()) return plan;

    for (const auto& g : groups) {
        plan.commands.push_back(cmd::delete_route(g.name, g.interface_id));
        ++plan.routes_to_delete;
    }
    for (const auto& g : groups) {
        plan.commands.push_back(cmd::delete_group(g.name));
        ++plan.groups_to_delete;
    }
    plan.commands.push_back(cmd::save_config());
    return plan;
}

config::GroupList select_groups_on_interfaces(const ExistingGroups& existing_groups,
                                              const ExistingRoutes& existing_routes,
                                              const std::vector<std::string>& interfaces) {
    config::GroupList out;
    for (const auto& [name, domains] : existing_groups) {
        (void)domains;
        const auto route = existing_routes.find(name);
        if (route == existing_routes.end()) continue;
        if (std::find(interfaces.begin(), interfaces.end(), route->second) == interfaces.end()) continue;

        config::DomainGroup g;
        g.name = name;
        g.interface_id = route->second;
        out.push_back(std::move(g));
    }
    return out;
}

} // namespace dnsroute::routing
