/**
 * @file domain_validator.cpp
 * @brief Domain/IPv4 token validation backed by libidn2 and inet_pton.
 */
#include "dnsroute/validate/domain_validator.hpp"
#include "dnsroute/validate/line_rules.hpp"
#include "dnsroute/config/constants.hpp"

#include <arpa/inet.h>
#include <idn2.h>

namespace dnsroute::validate {
    using namespace dnsroute::config::constants;

//------------------------------- Cache ----------------------------------------

std::optional<Verdict> MemoryValidationCache::find(std::string_view token) const {
    auto it = map_.find(token);
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

void MemoryValidationCache::remember(std::string_view token, const Verdict& v) {
    map_.insert_or_assign(std::string(token), v);
}

//------------------------------- Rules ----------------------------------------

bool DomainValidator::is_ipv4_literal(std::string_view token) {
    if (token.empty() || token.size() > INET_ADDRSTRLEN) return false;
    in_addr addr{};
    return inet_pton(AF_INET, std::string(token).c_str(), &addr) == 1;
}

static constexpr bool is_ldh(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-';
}

std::optional<std::string> DomainValidator::check_ascii_name(std::string_view ascii) {
    if (ascii.size() > DOMAIN_MAX_LENGTH) {
        return "domain exceeds " + std::to_string(DOMAIN_MAX_LENGTH) + " characters";
    }
    if (ascii.find('.') == std::string_view::npos) return std::string("missing TLD (no dot)");

    std::string_view last;
    std::size_t start = 0;
    while (start <= ascii.size()) {
        auto dot = ascii.find('.', start);
        if (dot == std::string_view::npos) dot = ascii.size();
        const auto label = ascii.substr(start, dot - start);

        if (label.empty()) return std::string("empty label");
        if (label.size() > LABEL_MAX_LENGTH) {
            return "label '" + std::string(label) + "' exceeds " +
                   std::to_string(LABEL_MAX_LENGTH) + " characters";
        }
        if (label.front() == '-' || label.back() == '-') {
            return "label '" + std::string(label) + "' starts or ends with a hyphen";
        }
        for (char c : label) {
            if (!is_ldh(c)) return "label '" + std::string(label) + "' has invalid characters";
        }
        last = label;
        start = dot + 1;
    }

    bool numeric = true;
    for (char c : last) {
        if (c < '0' || c > '9') { numeric = false; break; }
    }
    if (numeric) return std::string("numeric top-level label");
    return std::nullopt;
}

Verdict DomainValidator::check_token(std::string_view token) {
    if (token.empty()) return Verdict{false, "empty domain"};
    if (is_ipv4_literal(token)) return Verdict{true, {}};

    // Rejects bare names such as "youtube" before any IDNA work.
    if (token.find('.') == std::string_view::npos) return Verdict{false, "missing TLD (no dot)"};

    const std::string input(token);
    char* ascii = nullptr;
    const int rc = idn2_lookup_u8(reinterpret_cast<const uint8_t*>(input.c_str()),
                                  reinterpret_cast<uint8_t**>(&ascii),
                                  IDN2_NONTRANSITIONAL);
    if (rc != IDN2_OK) {
        return Verdict{false, std::string("IDNA validation failed: ") + idn2_strerror(rc)};
    }
    const std::string ascii_name(ascii);
    idn2_free(ascii);

    if (auto reason = check_ascii_name(ascii_name)) return Verdict{false, std::move(*reason)};
    return Verdict{true, {}};
}

//------------------------------- Validator ------------------------------------

LineVerdict DomainValidator::validate(std::string_view line) {
    const auto token = extract_token(line);
    if (!token) return LineVerdict{LineOutcome::Discarded, {}, {}};

    Verdict v;
    if (auto cached = cache_.find(*token)) {
        v = std::move(*cached);
    } else {
        v = check_token(*token);
        cache_.remember(*token, v);
    }
    return LineVerdict{v.accepted ? LineOutcome::Accepted : LineOutcome::Rejected,
                       std::string(*token), std::move(v.reason)};
}

ValidatedLines DomainValidator::validate_lines(const std::vector<std::string>& lines,
                                               const std::string& source_label) {
    ValidatedLines out;
    out.domains.reserve(lines.size());
    for (const auto& line : lines) {
        auto lv = validate(line);
        switch (lv.outcome) {
            case LineOutcome::Discarded:
                break;
            case LineOutcome::Accepted:
                out.domains.push_back(std::move(lv.token));
                break;
            case LineOutcome::Rejected:
                ++out.rejected;
                obs_.debug("validator", "Skipped invalid domain from " + source_label + ": " +
                                        std::string(trim(line)) + " (" + lv.reason + ")");
                break;
        }
    }
    if (out.rejected > 0) {
        obs_.step("validator", "Skipped " + std::to_string(out.rejected) +
                               " invalid domain(s) from " + source_label);
    }
    return out;
}

} // namespace dnsroute::validate
