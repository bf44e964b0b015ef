/**
 * @file version_gate.cpp
 * @brief Numeric dotted-version comparison for the DNS-routing feature gate.
 */
#include "dnsroute/routing/version_gate.hpp"

#include <algorithm>
#include <charconv>

namespace dnsroute::routing {

namespace {

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// Dot-separated identifiers; numeric ones compare numerically and rank below
// alphanumeric ones, a shorter tag ranks below a longer one with the same head.
std::strong_ordering compare_prerelease(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) {
        if (a.empty() && b.empty()) return std::strong_ordering::equal;
        return a.empty() ? std::strong_ordering::greater : std::strong_ordering::less;
    }
    while (!a.empty() && !b.empty()) {
        const auto da = a.find('.');
        const auto db = b.find('.');
        const auto ia = a.substr(0, da);
        const auto ib = b.substr(0, db);
        a = da == std::string_view::npos ? std::string_view{} : a.substr(da + 1);
        b = db == std::string_view::npos ? std::string_view{} : b.substr(db + 1);

        const bool na = all_digits(ia);
        const bool nb = all_digits(ib);
        if (na && nb) {
            if (ia.size() != ib.size()) return ia.size() <=> ib.size();
            if (const auto c = ia.compare(ib); c != 0) return c <=> 0;
        } else if (na != nb) {
            return na ? std::strong_ordering::less : std::strong_ordering::greater;
        } else if (const auto c = ia.compare(ib); c != 0) {
            return c <=> 0;
        }
    }
    if (a.empty() && b.empty()) return std::strong_ordering::equal;
    return a.empty() ? std::strong_ordering::less : std::strong_ordering::greater;
}

} // namespace

dnsroute_detail::expected<Version, std::string> parse_version(std::string_view text) {
    using dnsroute_detail::unexpected;
    if (text.empty()) return unexpected<std::string>("empty version");

    Version v;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto dot = text.find('.', start);
        if (dot == std::string_view::npos) dot = text.size();
        const auto comp = text.substr(start, dot - start);

        unsigned long value = 0;
        const auto [ptr, ec] = std::from_chars(comp.data(), comp.data() + comp.size(), value);
        if (ec != std::errc{} || ptr == comp.data()) {
            return unexpected<std::string>("invalid version component '" + std::string(comp) +
                                           "' in '" + std::string(text) + "'");
        }
        v.numbers.push_back(value);
        if (ptr != comp.data() + comp.size()) {
            // "5.0.1-beta.2+42" -> prerelease "beta.2", metadata dropped
            auto tail = text.substr(static_cast<std::size_t>(ptr - text.data()));
            if (const auto plus = tail.find('+'); plus != std::string_view::npos) tail = tail.substr(0, plus);
            if (!tail.empty() && tail.front() == '-') tail.remove_prefix(1);
            v.prerelease = std::string(tail);
            break;
        }
        start = dot + 1;
    }
    return v;
}

std::strong_ordering compare_versions(const Version& a, const Version& b) {
    const auto n = std::max(a.numbers.size(), b.numbers.size());
    for (std::size_t i = 0; i < n; ++i) {
        const auto x = i < a.numbers.size() ? a.numbers[i] : 0UL;
        const auto y = i < b.numbers.size() ? b.numbers[i] : 0UL;
        if (x != y) return x <=> y;
    }
    return compare_prerelease(a.prerelease, b.prerelease);
}

Status check_dns_routing_support(std::string_view firmware, std::string_view minimum) {
    if (firmware.empty()) {
        return fail(ErrorKind::VersionGate,
                    "router version information not available. Please authenticate first");
    }
    auto current = parse_version(firmware);
    if (!current) {
        return fail(ErrorKind::VersionGate,
                    "failed to parse router version '" + std::string(firmware) + "': " + current.error());
    }
    auto min = parse_version(minimum);
    if (!min) {
        return fail(ErrorKind::VersionGate,
                    "failed to parse minimum version '" + std::string(minimum) + "': " + min.error());
    }
    if (compare_versions(*current, *min) == std::strong_ordering::less) {
        return fail(ErrorKind::VersionGate,
                    "DNS-routing requires firmware version " + std::string(minimum) +
                    " or higher. Current version: " + std::string(firmware));
    }
    return {};
}

} // namespace dnsroute::routing
