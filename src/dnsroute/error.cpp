/**
 * @file error.cpp
 * @brief Rendering of Error values.
 */
#include "dnsroute/error.hpp"

namespace dnsroute {

const char* to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::Config:             return "configuration error";
        case ErrorKind::VersionGate:        return "unsupported firmware";
        case ErrorKind::Load:               return "load error";
        case ErrorKind::Limit:              return "limit error";
        case ErrorKind::StateFetch:         return "state fetch error";
        case ErrorKind::Execution:          return "execution error";
        case ErrorKind::PartialApplication: return "partial application";
    }
    return "error";
}

std::string Error::describe() const {
    std::string out = std::string(to_string(kind)) + ": " + message;
    for (const auto& d : details) {
        out += "\n  - ";
        out += d;
    }
    for (const auto& o : outcomes) {
        out += "\n  [";
        out += routing::to_string(o.result.status);
        out += "] ";
        out += o.command;
        if (!o.result.message.empty()) {
            out += ": ";
            out += o.result.message;
        }
    }
    return out;
}

} // namespace dnsroute
