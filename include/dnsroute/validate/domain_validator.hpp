#pragma once
/**
 * @file domain_validator.hpp
 * @brief Structural validation of list tokens as domain names or IPv4 literals.
 *
 * A token is accepted if it is a dotted-decimal IPv4 address, or a name with at
 * least one dot whose IDNA ToASCII form (libidn2, UTS#46 non-transitional)
 * satisfies the LDH label rules. Nothing is resolved.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dnsroute/obs/observability.hpp"

namespace dnsroute::validate {

/** @struct Verdict
 *  @brief Accept/reject decision for one token; reason is empty when accepted.
 */
struct Verdict {
    bool        accepted{false};
    std::string reason;

    bool operator==(const Verdict&) const = default;
};

/** @class ValidationCache
 *  @brief Memo of token -> Verdict. Only affects speed, never results.
 */
class ValidationCache {
public:
    virtual ~ValidationCache() = default;
    virtual std::optional<Verdict> find(std::string_view token) const = 0;
    virtual void remember(std::string_view token, const Verdict& v) = 0;
    /// Manual invalidation hook.
    virtual void clear() noexcept = 0;
    [[nodiscard]] virtual std::size_t size() const noexcept = 0;
};

/** @class MemoryValidationCache
 *  @brief Process-lifetime map with heterogeneous string_view lookup.
 */
class MemoryValidationCache final : public ValidationCache {
public:
    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    std::optional<Verdict> find(std::string_view token) const override;
    void remember(std::string_view token, const Verdict& v) override;
    void clear() noexcept override { map_.clear(); }
    [[nodiscard]] std::size_t size() const noexcept override { return map_.size(); }

private:
    std::unordered_map<std::string, Verdict, SKeyHash, SKeyEq> map_;
};

/// What happened to one input line.
enum class LineOutcome : std::uint8_t {
    Discarded, ///< Blank or comment; not counted
    Accepted,
    Rejected
};

/** @struct LineVerdict
 *  @brief Result of validate(line): token after prefix stripping + outcome + reason.
 */
struct LineVerdict {
    LineOutcome outcome{LineOutcome::Discarded};
    std::string token;
    std::string reason;
};

/** @struct ValidatedLines
 *  @brief Accepted tokens in input order (duplicates kept) + rejected-line count.
 */
struct ValidatedLines {
    std::vector<std::string> domains;
    std::size_t              rejected{0};
};

class DomainValidator {
public:
    DomainValidator(ValidationCache& cache, obs::Observer& observer) noexcept
        : cache_(cache), obs_(observer) {}

    /// Validate one raw line; memoizes the token verdict.
    LineVerdict validate(std::string_view line);

    /**
     * @brief Validate a whole source. Rejections are logged at debug level.
     * @param source_label Used in diagnostics only ("file x.txt", "URL ...").
     */
    ValidatedLines validate_lines(const std::vector<std::string>& lines,
                                  const std::string& source_label);

    /// Uncached decision for an already extracted token.
    static Verdict check_token(std::string_view token);

    /// Dotted-decimal IPv4 (inet_pton rules: four octets, no leading zeros).
    static bool is_ipv4_literal(std::string_view token);

    /// LDH label rules on an ASCII name; returns a reason on failure.
    static std::optional<std::string> check_ascii_name(std::string_view ascii);

private:
    ValidationCache& cache_;
    obs::Observer&   obs_;
};

} // namespace dnsroute::validate
