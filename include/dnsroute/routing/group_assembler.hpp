#pragma once
/**
 * @file group_assembler.hpp
 * @brief Merges per-source tokens into one sorted, deduplicated set per group
 *        and checks the cross-group invariant.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "dnsroute/config/constants.hpp"
#include "dnsroute/obs/observability.hpp"

namespace dnsroute::routing {

/// Desired domains per group name, sorted and unique.
using ResolvedDomains = std::map<std::string, std::vector<std::string>>;

enum class AssemblyStatus : std::uint8_t {
    Ok,        ///< Group ships
    Empty,     ///< No domain loaded; skipped without error
    OverLimit  ///< More entries than the device accepts; excluded with a Limit error
};

/** @struct AssembledGroup
 *  @brief Outcome for one group.
 */
struct AssembledGroup {
    AssemblyStatus           status{AssemblyStatus::Ok};
    std::vector<std::string> domains;            ///< Sorted, unique
    std::size_t              duplicates_removed{0};
};

/** @struct DomainConflict
 *  @brief A domain claimed by more than one group (groups in name order).
 */
struct DomainConflict {
    std::string              domain;
    std::vector<std::string> groups;

    bool operator==(const DomainConflict&) const = default;
};

class GroupAssembler {
public:
    explicit GroupAssembler(obs::Observer& observer,
                            std::size_t limit = config::constants::MAX_DOMAINS_PER_GROUP) noexcept
        : obs_(observer), limit_(limit) {}

    /**
     * @brief Concatenate sources in declaration order, sort, dedup, check limit.
     * @param per_source Accepted tokens of each source (files first, then URLs).
     */
    AssembledGroup assemble(const std::string& group_name,
                            const std::vector<std::vector<std::string>>& per_source) const;

    /// Reverse index domain -> groups; every domain in more than one group is reported.
    std::vector<DomainConflict> find_conflicts(const ResolvedDomains& resolved) const;

    /// Log conflicts as warnings. Never fails.
    void report_conflicts(const std::vector<DomainConflict>& conflicts) const;

    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

private:
    obs::Observer& obs_;
    std::size_t    limit_;
};

} // namespace dnsroute::routing
