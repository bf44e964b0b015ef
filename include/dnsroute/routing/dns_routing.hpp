#pragma once
/**
 * @file dns_routing.hpp
 * @brief Reconciliation engine: desired DNS-routing groups -> converged device state.
 *
 * Apply pipeline (single-threaded, synchronous):
 *   config checks -> version gate -> interface check -> per group [load -> validate -> assemble]
 *   -> conflict warnings -> state fetch -> plan -> batch execute
 *
 * Fatal errors (Config, VersionGate, Load, StateFetch, Execution) stop the run
 * before any write. A target interface the device does not know is a Config error. Groups over the entry limit are excluded and reported in
 * ApplyReport while the remaining groups still ship.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dnsroute/config/constants.hpp"
#include "dnsroute/config/group.hpp"
#include "dnsroute/error.hpp"
#include "dnsroute/obs/observability.hpp"
#include "dnsroute/routing/group_assembler.hpp"
#include "dnsroute/routing/planner.hpp"
#include "dnsroute/routing/router_api.hpp"
#include "dnsroute/sources/domain_loader.hpp"
#include "dnsroute/validate/domain_validator.hpp"

namespace dnsroute::routing {

/// Execute submits the batch; DryRun stops after planning.
enum class ApplyMode : std::uint8_t { Execute, DryRun };

/** @struct ApplyReport
 *  @brief What a run planned, submitted and skipped.
 */
struct ApplyReport {
    Plan                         plan;
    std::vector<CommandOutcome>  outcomes;        ///< Empty unless the batch was submitted
    std::vector<std::string>     excluded;        ///< Limit findings, one per excluded group
    std::vector<std::string>     skipped_groups;  ///< Groups with no domain loaded
    std::vector<DomainConflict>  conflicts;       ///< Cross-group duplicates (warn-only)
    bool                         executed{false};

    /// Limit error for the excluded groups, if any.
    [[nodiscard]] std::optional<Error> limit_error() const;
};

class DnsRouting {
public:
    DnsRouting(RouterApi& router,
               sources::DomainSourceLoader& loader,
               validate::DomainValidator& validator,
               obs::Observer& observer,
               std::size_t group_limit = config::constants::MAX_DOMAINS_PER_GROUP) noexcept;

    /**
     * @brief Converge the device onto `groups`.
     * @return Report of the run; an empty groups list is a no-op success.
     */
    Result<ApplyReport> apply(const config::GroupList& groups, ApplyMode mode = ApplyMode::Execute);

    /**
     * @brief Remove routes and object-groups for `groups` (name + interface used).
     * @details The domain pipeline is skipped; commands come straight from the list.
     */
    Result<ApplyReport> remove(const config::GroupList& groups, ApplyMode mode = ApplyMode::Execute);

    /// Remove every existing group whose route targets one of `interfaces`.
    Result<ApplyReport> remove_on_interfaces(const std::vector<std::string>& interfaces,
                                             ApplyMode mode = ApplyMode::Execute);

private:
    Result<ResolvedDomains> resolve(const config::GroupList& groups, ApplyReport& report);
    Status fetch_state(ExistingGroups& groups, ExistingRoutes& routes);
    Result<InterfaceIds> fetch_interfaces();
    Status execute(ApplyReport& report);

    RouterApi&                   router_;
    sources::DomainSourceLoader& loader_;
    validate::DomainValidator&   validator_;
    obs::Observer&               obs_;
    GroupAssembler               assembler_;
};

} // namespace dnsroute::routing
