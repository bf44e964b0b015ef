#pragma once
/**
 * @file memory_router.hpp
 * @brief In-process device model implementing RouterApi.
 *
 * Mirrors the observable rules of the device command surface:
 *  - entries can only be added to an existing object-group, up to the limit
 *  - a route requires an existing object-group and interface; setting it again replaces the interface
 *  - a routed object-group cannot be deleted
 *  - commands run in order, each gets its own status, nothing is rolled back
 *
 * Failures can be injected for state reads, batch delivery and single commands.
 */

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "dnsroute/config/constants.hpp"
#include "dnsroute/routing/router_api.hpp"

namespace dnsroute::routing {

    /** @struct RouterState
     *  @brief Full device-side state relevant to DNS routing.
     */
    struct RouterState {
        std::string    firmware;  ///< Firmware title, e.g. "5.0.2"
        ExistingGroups groups;
        ExistingRoutes routes;
        InterfaceIds   interfaces;

        bool operator==(const RouterState&) const = default;
    };

    class MemoryRouter final : public RouterApi {
    public:
        explicit MemoryRouter(RouterState initial = {},
                              std::size_t group_limit = config::constants::MAX_DOMAINS_PER_GROUP);

        std::string firmware_version() const override { return state_.firmware; }
        dnsroute_detail::expected<ExistingGroups, std::string> existing_groups() override;
        dnsroute_detail::expected<ExistingRoutes, std::string> existing_routes() override;
        dnsroute_detail::expected<InterfaceIds, std::string> existing_interfaces() override;
        dnsroute_detail::expected<std::vector<CommandResult>, std::string>
        execute(const CommandList& commands) override;

        [[nodiscard]] const RouterState& state() const noexcept { return state_; }

        /// Number of successful "system configuration save" commands.
        [[nodiscard]] std::size_t saves() const noexcept { return saves_; }
        /// Number of execute() calls that reached the device.
        [[nodiscard]] std::size_t batches() const noexcept { return batches_; }
        /// Number of state reads (groups, routes and interfaces).
        [[nodiscard]] std::size_t reads() const noexcept { return reads_; }

        // failure injection
        void fail_state_reads(std::optional<std::string> message) { read_error_ = std::move(message); }
        void fail_batches(std::optional<std::string> message) { batch_error_ = std::move(message); }
        /// Any command whose rendered text equals `text` is answered with an error.
        void fail_command(std::string text) { failing_.insert(std::move(text)); }

    private:
        CommandResult apply_one(const Command& c);

        RouterState state_;
        std::size_t limit_;
        std::size_t saves_{0};
        std::size_t batches_{0};
        std::size_t reads_{0};
        std::optional<std::string> read_error_;
        std::optional<std::string> batch_error_;
        std::set<std::string> failing_;
    };

} // namespace dnsroute::routing
