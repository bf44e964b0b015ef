#pragma once
/**
 * @file line_rules.hpp
 * @brief Small pure rules that reduce a raw list line to a candidate token.
 *
 * Rules run in the order of kTokenRules on a trimmed, non-comment line:
 *  1. take_first_field  : "example.com @cn"   -> "example.com"
 *  2. strip_list_prefix : "full:example.com"  -> "example.com"
 */

#include <array>
#include <optional>
#include <string_view>

namespace dnsroute::validate {

/// Strip ASCII whitespace from both ends.
std::string_view trim(std::string_view s) noexcept;

/// True for an empty (after trim) line or a line starting with '#'.
bool is_blank_or_comment(std::string_view trimmed) noexcept;

/// Keep the first whitespace-separated field.
std::string_view take_first_field(std::string_view s) noexcept;

/// Drop a leading full:/regexp:/domain:/keyword:/include: marker. Other prefixes stay.
std::string_view strip_list_prefix(std::string_view s) noexcept;

using LineRule = std::string_view (*)(std::string_view) noexcept;

/// Rule pipeline applied after trimming.
inline constexpr std::array<LineRule, 2> kTokenRules{&take_first_field, &strip_list_prefix};

/**
 * @brief Run trim + comment filter + kTokenRules.
 * @return Candidate token, or nullopt for lines that are discarded silently.
 */
std::optional<std::string_view> extract_token(std::string_view line) noexcept;

} // namespace dnsroute::validate
