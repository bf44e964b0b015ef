/**
 * @file observability.cpp
 * @brief printf-backed implementation of Observer.
 */
#include "dnsroute/obs/observability.hpp"

#include <utility>

namespace dnsroute::obs {

    void Observer::info(std::string topic, std::string message) {
        record(Notice{Severity::Info, std::move(topic), std::move(message), false});
    }

    void Observer::step(std::string topic, std::string message) {
        record(Notice{Severity::Info, std::move(topic), std::move(message), true});
    }

    void Observer::warn(std::string topic, std::string message) {
        record(Notice{Severity::Warning, std::move(topic), std::move(message), true});
    }

    void Observer::error(std::string topic, std::string message) {
        record(Notice{Severity::Error, std::move(topic), std::move(message), false});
    }

    void Observer::debug(std::string topic, std::string message) {
        record(Notice{Severity::Debug, std::move(topic), std::move(message), true});
    }

    static const char* prefix_of(const Notice& n) noexcept {
        switch (n.severity) {
            case Severity::Warning: return n.sub_step ? "    ! " : "! ";
            case Severity::Error:   return n.sub_step ? "    x " : "x ";
            case Severity::Debug:
            case Severity::Info:    return n.sub_step ? "    - " : "";
        }
        return "";
    }

    void ConsoleObserver::record(const Notice& n) {
        std::lock_guard<std::mutex> lk(mu_);
        ctr_.notices++;
        if (n.severity == Severity::Warning) ctr_.warnings++;
        if (n.severity == Severity::Error) ctr_.errors++;
        if (n.severity == Severity::Debug && !debug_) return;

        std::fprintf(out_, "%s%s\n", prefix_of(n), n.message.c_str());
        std::fflush(out_);
    }

    Counters ConsoleObserver::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

    void horizontal_line(std::FILE* out) {
        std::fprintf(out, "%s\n", "----------");
    }

} // namespace dnsroute::obs
