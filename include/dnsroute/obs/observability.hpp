#pragma once
/**
 * @file observability.hpp
 * @brief Diagnostics facade: human-readable notices + counters.
 * @details Notices are observational only; nothing downstream parses them.
 */

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace dnsroute::obs {

    /** @enum Severity
     *  @brief Importance of a notice. Debug is hidden unless debug logging is on.
     */
    enum class Severity : std::uint8_t { Debug, Info, Warning, Error };

    /** @struct Notice
     *  @brief Payload describing one diagnostic line.
     */
    struct Notice {
        Severity    severity{Severity::Info}; ///< Importance
        std::string topic;                    ///< Emitting stage ("loader", "planner", ...)
        std::string message;                  ///< Human-readable text
        bool        sub_step{false};          ///< Render as an indented detail line
    };

    /** @struct Counters
     *  @brief Process-level counters of recorded notices.
     */
    struct Counters {
        uint64_t notices{0};  ///< Total notices recorded (all severities)
        uint64_t warnings{0}; ///< Notices with Severity::Warning
        uint64_t errors{0};   ///< Notices with Severity::Error
    };

    /** @class Observer
     *  @brief Diagnostics sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single notice.
        virtual void record(const Notice& n) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;

        void info(std::string topic, std::string message);
        void step(std::string topic, std::string message);
        void warn(std::string topic, std::string message);
        void error(std::string topic, std::string message);
        void debug(std::string topic, std::string message);
    };

    /** @class ConsoleObserver
     *  @brief printf-backed sink. Sub-steps are indented under the last headline.
     */
    class ConsoleObserver final : public Observer {
    public:
        explicit ConsoleObserver(bool debug = false, std::FILE* out = stdout) noexcept
            : debug_(debug), out_(out) {}

        void record(const Notice& n) override;
        Counters snapshot() const override;

    private:
        mutable std::mutex mu_;
        Counters ctr_;
        bool debug_;
        std::FILE* out_;
    };

    /// Horizontal separator used between report sections.
    void horizontal_line(std::FILE* out = stdout);

} // namespace dnsroute::obs
