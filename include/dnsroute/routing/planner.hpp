#pragma once
/**
 * @file planner.hpp
 * @brief Reconciliation planner: desired vs. existing state -> ordered commands.
 *
 * Apply order:
 *  1. create missing object-groups
 *  2. per group: remove entries no longer desired, then add missing entries
 *  3. create/replace routes whose interface is missing or different
 *  4. save, only if anything precedes it
 *
 * Pure functions: no I/O, deterministic for equal inputs.
 */

#include <cstddef>
#include <string>
#include <vector>

#include "dnsroute/config/group.hpp"
#include "dnsroute/routing/command.hpp"
#include "dnsroute/routing/group_assembler.hpp"
#include "dnsroute/routing/router_api.hpp"

namespace dnsroute::routing {

/** @struct Plan
 *  @brief Ordered batch plus change counters for the summary line.
 */
struct Plan {
    CommandList commands;
    std::size_t groups_to_create{0};
    std::size_t domains_to_add{0};
    std::size_t domains_to_remove{0};
    std::size_t routes_to_set{0};
    std::size_t routes_to_delete{0};
    std::size_t groups_to_delete{0};

    [[nodiscard]] bool empty() const noexcept { return commands.empty(); }
};

/**
 * @brief Plan convergence for `desired`.
 * @param desired Groups in declaration order; groups without an entry in
 *        `resolved` (skipped or excluded) produce no commands.
 */
Plan plan_apply(const config::GroupList& desired,
                const ResolvedDomains& resolved,
                const ExistingGroups& existing_groups,
                const ExistingRoutes& existing_routes);

/// Routes of all groups first, then the object-groups, then save.
Plan plan_delete(const config::GroupList& groups);

/**
 * @brief Existing groups whose route targets one of `interfaces`.
 * @return Groups (name + interface only) in name order; unrouted groups are never selected.
 */
config::GroupList select_groups_on_interfaces(const ExistingGroups& existing_groups,
                                              const ExistingRoutes& existing_routes,
                                              const std::vector<std::string>& interfaces);

} // namespace dnsroute::routing
