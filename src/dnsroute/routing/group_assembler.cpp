/**
 * @file group_assembler.cpp
 * @brief Per-group merge/dedup/limit and cross-group conflict detection.
 */
#include "dnsroute/routing/group_assembler.hpp"

#include <algorithm>

namespace dnsroute::routing {

AssembledGroup GroupAssembler::assemble(const std::string& group_name,
                                        const std::vector<std::vector<std::string>>& per_source) const {
    AssembledGroup out;
    std::size_t total = 0;
    for (const auto& s : per_source) total += s.size();
    out.domains.reserve(total);
    for (const auto& s : per_source) out.domains.insert(out.domains.end(), s.begin(), s.end());

    if (out.domains.empty()) {
        out.status = AssemblyStatus::Empty;
        obs_.step("assembler", "Skipping group '" + group_name + "': no domains loaded");
        return out;
    }

    // Sorting only makes dedup and the later diff deterministic.
    std::sort(out.domains.begin(), out.domains.end());
    out.domains.erase(std::unique(out.domains.begin(), out.domains.end()), out.domains.end());
    out.duplicates_removed = total - out.domains.size();
    if (out.duplicates_removed > 0) {
        obs_.step("assembler", "Removed " + std::to_string(out.duplicates_removed) +
                               " duplicate domain(s) from group " + group_name);
    }

    if (out.domains.size() > limit_) out.status = AssemblyStatus::OverLimit;
    return out;
}

std::vector<DomainConflict> GroupAssembler::find_conflicts(const ResolvedDomains& resolved) const {
    std::map<std::string, std::vector<std::string>> index;
    for (const auto& [group, domains] : resolved) {
        for (const auto& d : domains) index[d].push_back(group);
    }

    std::vector<DomainConflict> out;
    for (auto& [domain, groups] : index) {
        if (groups.size() > 1) out.push_back(DomainConflict{domain, std::move(groups)});
    }
    return out;
}

void GroupAssembler::report_conflicts(const std::vector<DomainConflict>& conflicts) const {
    if (conflicts.empty()) return;
    obs_.record(obs::Notice{obs::Severity::Warning, "assembler",
                            "Misconfiguration found: domains cannot appear in multiple groups", false});
    for (const auto& c : conflicts) {
        std::string groups;
        for (const auto& g : c.groups) {
            if (!groups.empty()) groups += ", ";
            groups += g;
        }
        obs_.warn("assembler", c.domain + " appears in groups: " + groups);
    }
    obs_.info("assembler", "Each domain must belong to exactly one DNS-routing group to avoid routing conflicts");
    obs_.info("assembler", "Continue anyway - but keep in mind that it should be fixed");
}

} // namespace dnsroute::routing
