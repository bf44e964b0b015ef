/**
 * @file group.cpp
 * @brief Structural validation of configured groups.
 */
#include "dnsroute/config/group.hpp"

#include <unordered_map>

namespace dnsroute::config {

    bool is_blank(const std::string& s) noexcept {
        for (char c : s) {
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return false;
        }
        return true;
    }

    Status validate_groups(const GroupList& groups) {
        std::unordered_map<std::string, std::size_t> seen;
        seen.reserve(groups.size());

        for (std::size_t i = 0; i < groups.size(); ++i) {
            const auto& g = groups[i];
            const auto pos = std::to_string(i);
            if (g.name.empty()) {
                return fail(ErrorKind::Config,
                            "DNS-routing group name cannot be empty (position " + pos + ")");
            }
            if (is_blank(g.name)) {
                return fail(ErrorKind::Config,
                            "DNS-routing group name cannot contain only whitespace (position " + pos + ")");
            }
            if (auto [it, inserted] = seen.emplace(g.name, i); !inserted) {
                return fail(ErrorKind::Config,
                            "duplicate DNS-routing group name '" + g.name + "' at positions " +
                            std::to_string(it->second) + " and " + pos);
            }
            if (g.domain_files.empty() && g.domain_urls.empty()) {
                return fail(ErrorKind::Config,
                            "DNS-routing group '" + g.name +
                            "' must contain at least one domain-file or domain-url");
            }
            if (g.interface_id.empty()) {
                return fail(ErrorKind::Config,
                            "interface ID cannot be empty in DNS-routing group '" + g.name + "'");
            }
        }
        return {};
    }

} // namespace dnsroute::config
