/**
 * @file line_rules.cpp
 * @brief Token extraction rules for domain list lines.
 */
#include "dnsroute/validate/line_rules.hpp"

namespace dnsroute::validate {

static constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool is_blank_or_comment(std::string_view trimmed) noexcept {
    return trimmed.empty() || trimmed.front() == '#';
}

std::string_view take_first_field(std::string_view s) noexcept {
    std::size_t i = 0;
    while (i < s.size() && !is_space(s[i])) ++i;
    return s.substr(0, i);
}

std::string_view strip_list_prefix(std::string_view s) noexcept {
    static constexpr std::array<std::string_view, 5> kPrefixes{
        "full", "regexp", "domain", "keyword", "include"};

    const auto idx = s.find(':');
    if (idx == std::string_view::npos || idx == 0) return s;
    const auto prefix = s.substr(0, idx);
    for (auto p : kPrefixes) {
        if (prefix == p) return s.substr(idx + 1);
    }
    return s;
}

std::optional<std::string_view> extract_token(std::string_view line) noexcept {
    auto s = trim(line);
    if (is_blank_or_comment(s)) return std::nullopt;
    for (auto rule : kTokenRules) s = rule(s);
    return s;
}

} // namespace dnsroute::validate
