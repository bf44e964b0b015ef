/**
 * @file dns_routing.cpp
 * @brief Apply/delete orchestration over the loader, validator, planner and device.
 */
#include "dnsroute/routing/dns_routing.hpp"
#include "dnsroute/routing/version_gate.hpp"

#include <utility>

namespace dnsroute::routing {

static constexpr const char* TOPIC = "dns-routing";

std::optional<Error> ApplyReport::limit_error() const {
    if (excluded.empty()) return std::nullopt;
    return Error{ErrorKind::Limit,
                 std::to_string(excluded.size()) + " group(s) excluded by the per-group entry limit",
                 excluded, {}};
}

DnsRouting::DnsRouting(RouterApi& router,
                       sources::DomainSourceLoader& loader,
                       validate::DomainValidator& validator,
                       obs::Observer& observer,
                       std::size_t group_limit) noexcept
    : router_(router), loader_(loader), validator_(validator), obs_(observer),
      assembler_(observer, group_limit) {}

Result<ResolvedDomains> DnsRouting::resolve(const config::GroupList& groups, ApplyReport& report) {
    ResolvedDomains resolved;
    std::vector<std::string> load_errors;

    for (const auto& group : groups) {
        auto gs = loader_.load_group(group);
        load_errors.insert(load_errors.end(), gs.errors.begin(), gs.errors.end());

        std::vector<std::vector<std::string>> per_source;
        per_source.reserve(gs.sources.size());
        for (const auto& src : gs.sources) {
            auto v = validator_.validate_lines(src.lines, src.label());
            obs_.step(TOPIC, "Loaded " + std::to_string(v.domains.size()) + " domain(s) from " + src.label());
            per_source.push_back(std::move(v.domains));
        }

        auto assembled = assembler_.assemble(group.name, per_source);
        switch (assembled.status) {
            case AssemblyStatus::Empty:
                report.skipped_groups.push_back(group.name);
                continue;
            case AssemblyStatus::OverLimit: {
                auto msg = "group '" + group.name + "': exceeds router limit of " +
                           std::to_string(assembler_.limit()) + " domains (has " +
                           std::to_string(assembled.domains.size()) + " domains)";
                obs_.error(TOPIC, msg);
                report.excluded.push_back(std::move(msg));
                continue;
            }
            case AssemblyStatus::Ok:
                break;
        }
        resolved.emplace(group.name, std::move(assembled.domains));
    }

    if (!load_errors.empty()) {
        const auto n = load_errors.size();
        // Limit findings travel in the same report so nothing is lost on abort.
        load_errors.insert(load_errors.end(), report.excluded.begin(), report.excluded.end());
        return fail(ErrorKind::Load, "failed to load " + std::to_string(n) + " domain source(s)",
                    std::move(load_errors));
    }
    return resolved;
}

Status DnsRouting::fetch_state(ExistingGroups& groups, ExistingRoutes& routes) {
    auto g = router_.existing_groups();
    if (!g) return fail(ErrorKind::StateFetch, "failed to get existing DNS-routing groups: " + g.error());
    auto r = router_.existing_routes();
    if (!r) return fail(ErrorKind::StateFetch, "failed to get existing dns-proxy routes: " + r.error());
    groups = std::move(*g);
    routes = std::move(*r);
    return {};
}

Result<InterfaceIds> DnsRouting::fetch_interfaces() {
    auto ifaces = router_.existing_interfaces();
    if (!ifaces) return fail(ErrorKind::StateFetch, "failed to fetch interfaces: " + ifaces.error());
    return std::move(*ifaces);
}

Status DnsRouting::execute(ApplyReport& report) {
    const auto& commands = report.plan.commands;
    auto results = router_.execute(commands);
    if (!results) return fail(ErrorKind::Execution, "failed to submit command batch: " + results.error());

    report.executed = true;
    report.outcomes = pair_outcomes(commands, *results);
    if (results->size() != commands.size()) {
        Error e{ErrorKind::Execution,
                "device returned " + std::to_string(results->size()) + " result(s) for " +
                std::to_string(commands.size()) + " command(s)", {}, report.outcomes};
        return dnsroute_detail::unexpected<Error>(std::move(e));
    }

    std::vector<std::string> failed;
    for (const auto& o : report.outcomes) {
        if (o.result.status == CommandStatus::Error) {
            obs_.error(TOPIC, o.command + ": " + o.result.message);
            failed.push_back(o.command + ": " + o.result.message);
        } else if (!o.result.message.empty()) {
            obs_.debug(TOPIC, o.result.message);
        }
    }
    if (!failed.empty()) {
        // No rollback: accepted commands stay applied on the device.
        Error e{ErrorKind::PartialApplication,
                std::to_string(failed.size()) + " of " + std::to_string(commands.size()) +
                " command(s) failed", std::move(failed), report.outcomes};
        return dnsroute_detail::unexpected<Error>(std::move(e));
    }
    return {};
}

Result<ApplyReport> DnsRouting::apply(const config::GroupList& groups, ApplyMode mode) {
    ApplyReport report;
    if (groups.empty()) {
        obs_.info(TOPIC, "No DNS-routing groups to add");
        return report;
    }

    if (auto st = config::validate_groups(groups); !st) return dnsroute_detail::unexpected<Error>(st.error());
    if (auto st = check_dns_routing_support(router_.firmware_version()); !st) {
        return dnsroute_detail::unexpected<Error>(st.error());
    }

    auto interfaces = fetch_interfaces();
    if (!interfaces) return dnsroute_detail::unexpected<Error>(std::move(interfaces.error()));
    for (const auto& g : groups) {
        if (!interfaces->contains(g.interface_id)) {
            return fail(ErrorKind::Config,
                        "group '" + g.name + "': interface '" + g.interface_id + "' not found");
        }
    }

    auto resolved = resolve(groups, report);
    if (!resolved) return dnsroute_detail::unexpected<Error>(std::move(resolved.error()));

    report.conflicts = assembler_.find_conflicts(*resolved);
    assembler_.report_conflicts(report.conflicts);

    if (resolved->empty()) {
        obs_.info(TOPIC, "No DNS-routing group has domains to apply");
        return report;
    }

    ExistingGroups existing_groups;
    ExistingRoutes existing_routes;
    if (auto st = fetch_state(existing_groups, existing_routes); !st) {
        return dnsroute_detail::unexpected<Error>(st.error());
    }

    report.plan = plan_apply(groups, *resolved, existing_groups, existing_routes);
    if (report.plan.empty()) {
        obs_.info(TOPIC, "All DNS-routing groups and domains are up to date");
        return report;
    }

    for (const auto& c : report.plan.commands) {
        if (c.kind == CommandKind::RemoveDomain) {
            obs_.step(TOPIC, "Removing domain " + c.argument + " from group " + c.group);
        }
    }
    if (report.plan.domains_to_add > 0 || report.plan.domains_to_remove > 0) {
        obs_.step(TOPIC, "Changes: " + std::to_string(report.plan.domains_to_add) + " domains to add, " +
                         std::to_string(report.plan.domains_to_remove) + " domains to remove");
    }

    if (mode == ApplyMode::DryRun) {
        obs_.info(TOPIC, "Dry run: " + std::to_string(report.plan.commands.size()) +
                         " command(s) planned, nothing submitted");
        return report;
    }

    obs_.info(TOPIC, "Applying " + std::to_string(resolved->size()) + " DNS-routing groups");
    if (auto st = execute(report); !st) return dnsroute_detail::unexpected<Error>(std::move(st.error()));
    obs_.step(TOPIC, "Successfully applied " + std::to_string(resolved->size()) + " DNS-routing groups");
    return report;
}

Result<ApplyReport> DnsRouting::remove(const config::GroupList& groups, ApplyMode mode) {
    ApplyReport report;
    if (groups.empty()) {
        obs_.info(TOPIC, "No DNS-routing groups to delete");
        return report;
    }
    if (auto st = check_dns_routing_support(router_.firmware_version()); !st) {
        return dnsroute_detail::unexpected<Error>(st.error());
    }

    report.plan = plan_delete(groups);
    if (mode == ApplyMode::DryRun) {
        obs_.info(TOPIC, "Dry run: " + std::to_string(report.plan.commands.size()) +
                         " command(s) planned, nothing submitted");
        return report;
    }

    obs_.info(TOPIC, "Deleting " + std::to_string(groups.size()) + " DNS-routing groups");
    if (auto st = execute(report); !st) return dnsroute_detail::unexpected<Error>(std::move(st.error()));
    obs_.step(TOPIC, "Successfully deleted " + std::to_string(groups.size()) + " DNS-routing groups");
    return report;
}

Result<ApplyReport> DnsRouting::remove_on_interfaces(const std::vector<std::string>& interfaces,
                                                     ApplyMode mode) {
    if (auto st = check_dns_routing_support(router_.firmware_version()); !st) {
        return dnsroute_detail::unexpected<Error>(st.error());
    }
    if (interfaces.empty()) {
        obs_.info(TOPIC, "No DNS-routing interfaces defined in configuration");
        return ApplyReport{};
    }

    auto known = fetch_interfaces();
    if (!known) return dnsroute_detail::unexpected<Error>(std::move(known.error()));
    for (const auto& iface : interfaces) {
        if (!known->contains(iface)) return fail(ErrorKind::Config, "interface '" + iface + "' not found");
    }

    ExistingGroups existing_groups;
    ExistingRoutes existing_routes;
    if (auto st = fetch_state(existing_groups, existing_routes); !st) {
        return dnsroute_detail::unexpected<Error>(st.error());
    }
    if (existing_groups.empty()) {
        obs_.info(TOPIC, "No DNS-routing groups found on router");
        return ApplyReport{};
    }

    auto selected = select_groups_on_interfaces(existing_groups, existing_routes, interfaces);
    if (selected.empty()) {
        obs_.info(TOPIC, "No DNS-routing groups found for the target interfaces");
        return ApplyReport{};
    }
    for (const auto& g : selected) {
        obs_.step(TOPIC, "DNS-routing group to delete: " + g.name + " (interface: " + g.interface_id +
                         ", domains: " + std::to_string(existing_groups.at(g.name).size()) + ")");
    }
    return remove(selected, mode);
}

} // namespace dnsroute::routing
