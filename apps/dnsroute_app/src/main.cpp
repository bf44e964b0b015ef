// apps/dnsroute_app/src/main.cpp
// dnsroute: offline DNS-routing reconciliation tool
// Runs the engine against a device-state snapshot instead of a live router.
//
// Usage:
//   ./dnsroute_app plan   <config.yaml> <state.yaml>
//   ./dnsroute_app apply  <config.yaml> <state.yaml>
//   ./dnsroute_app delete <config.yaml> <state.yaml> [interface...]
//
// Notes:
// - plan prints the command batch and leaves the snapshot untouched.
// - apply/delete run the batch on the in-memory device and write the result back.
// - delete without interfaces targets every interface named in the config.
// - Remote domain lists are fetched with libcurl and cached under <dataDir>/.dnsroute.
// - The snapshot's interfaces list is what the device knows; groups routed elsewhere are refused.

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dnsroute/config/config_loader.hpp"
#include "dnsroute/obs/observability.hpp"
#include "dnsroute/routing/dns_routing.hpp"
#include "dnsroute/routing/memory_router.hpp"
#include "dnsroute/routing/state_file.hpp"
#include "dnsroute/sources/domain_loader.hpp"
#include "dnsroute/sources/http_fetcher.hpp"
#include "dnsroute/sources/url_cache.hpp"
#include "dnsroute/validate/domain_validator.hpp"
#include "dnsroute/version.hpp"

using namespace dnsroute;

static int usage(const char* argv0) {
    std::cerr << "dnsroute " << dnsroute::version_string << "\n"
              << "usage: " << argv0 << " <plan|apply|delete> <config.yaml> <state.yaml> [interface...]\n";
    return 2;
}

static void print_report(const routing::ApplyReport& report) {
    obs::horizontal_line();
    if (report.outcomes.empty()) {
        for (const auto& c : report.plan.commands) std::cout << c.text() << "\n";
    } else {
        for (const auto& o : report.outcomes) {
            std::cout << "[" << routing::to_string(o.result.status) << "] " << o.command;
            if (!o.result.message.empty()) std::cout << "  (" << o.result.message << ")";
            std::cout << "\n";
        }
    }
    obs::horizontal_line();
}

static std::vector<std::string> config_interfaces(const config::GroupList& groups) {
    std::vector<std::string> out;
    for (const auto& g : groups) {
        if (std::find(out.begin(), out.end(), g.interface_id) == out.end()) out.push_back(g.interface_id);
    }
    return out;
}

int main(int argc, char** argv) {
    if (argc < 4) return usage(argv[0]);
    const std::string_view mode = argv[1];
    if (mode != "plan" && mode != "apply" && mode != "delete") return usage(argv[0]);
    const std::string config_path = argv[2];
    const std::string state_path = argv[3];

    auto cfg = config::Loader::load_from_file(config_path);
    if (!cfg) {
        std::cerr << cfg.error().describe() << "\n";
        return 1;
    }
    auto state = routing::load_state_file(state_path);
    if (!state) {
        std::cerr << state.error().describe() << "\n";
        return 1;
    }

    obs::ConsoleObserver observer(cfg->debug);
    sources::CurlFetcher fetcher;
    sources::FileUrlCache url_cache(config::Loader::cache_directory(*cfg));
    validate::MemoryValidationCache validation_cache;
    sources::DomainSourceLoader loader(fetcher, url_cache, observer,
                                       sources::LoaderOptions{.cache_ttl = cfg->url_cache_ttl});
    validate::DomainValidator validator(validation_cache, observer);
    routing::MemoryRouter router(std::move(*state));
    routing::DnsRouting engine(router, loader, validator, observer);

    Result<routing::ApplyReport> result = [&]() -> Result<routing::ApplyReport> {
        if (mode == "plan") return engine.apply(cfg->groups, routing::ApplyMode::DryRun);
        if (mode == "apply") return engine.apply(cfg->groups);
        std::vector<std::string> interfaces(argv + 4, argv + argc);
        if (interfaces.empty()) interfaces = config_interfaces(cfg->groups);
        return engine.remove_on_interfaces(interfaces);
    }();

    if (!result) {
        std::cerr << result.error().describe() << "\n";
        // Accepted commands stay applied, so the snapshot must follow the device.
        if (result.error().kind == ErrorKind::PartialApplication) {
            if (auto st = routing::save_state_file(state_path, router.state()); !st) {
                std::cerr << st.error().describe() << "\n";
            }
        }
        return 1;
    }

    print_report(*result);

    if (result->executed) {
        if (auto st = routing::save_state_file(state_path, router.state()); !st) {
            std::cerr << st.error().describe() << "\n";
            return 1;
        }
    }
    if (auto limit = result->limit_error()) {
        std::cerr << limit->describe() << "\n";
        return 1;
    }
    return 0;
}
