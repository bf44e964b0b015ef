/**
 * @file state_file.cpp
 * @brief yaml-cpp reader/writer for RouterState snapshots.
 */
#include "dnsroute/routing/state_file.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace dnsroute::routing {
    namespace fs = std::filesystem;

    static constexpr const char* KEY_FIRMWARE = "firmware";
    static constexpr const char* KEY_GROUPS   = "object-groups";
    static constexpr const char* KEY_ROUTES   = "routes";
    static constexpr const char* KEY_IFACES   = "interfaces";

    Result<RouterState> parse_state(const std::string& text) {
        RouterState st;
        try {
            const YAML::Node root = YAML::Load(text);
            if (!root || root.IsNull()) return st;
            if (!root.IsMap()) return fail(ErrorKind::StateFetch, "state snapshot root must be a mapping");

            if (const auto fw = root[KEY_FIRMWARE]) st.firmware = fw.as<std::string>();

            if (const auto groups = root[KEY_GROUPS]; groups && !groups.IsNull()) {
                if (!groups.IsMap()) return fail(ErrorKind::StateFetch, "object-groups must be a mapping");
                for (const auto& kv : groups) {
                    auto& domains = st.groups[kv.first.as<std::string>()];
                    if (kv.second.IsNull()) continue;
                    if (!kv.second.IsSequence()) {
                        return fail(ErrorKind::StateFetch,
                                    "object-group '" + kv.first.as<std::string>() + "' must be a list");
                    }
                    for (const auto& d : kv.second) domains.insert(d.as<std::string>());
                }
            }

            if (const auto routes = root[KEY_ROUTES]; routes && !routes.IsNull()) {
                if (!routes.IsMap()) return fail(ErrorKind::StateFetch, "routes must be a mapping");
                for (const auto& kv : routes) {
                    st.routes[kv.first.as<std::string>()] = kv.second.as<std::string>();
                }
            }

            if (const auto ifaces = root[KEY_IFACES]; ifaces && !ifaces.IsNull()) {
                if (!ifaces.IsSequence()) return fail(ErrorKind::StateFetch, "interfaces must be a list");
                for (const auto& i : ifaces) st.interfaces.insert(i.as<std::string>());
            }
        } catch (const YAML::Exception& e) {
            return fail(ErrorKind::StateFetch, std::string("invalid state snapshot: ") + e.what());
        }
        return st;
    }

    std::string emit_state(const RouterState& state) {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << KEY_FIRMWARE << YAML::Value << YAML::DoubleQuoted << state.firmware;

        out << YAML::Key << KEY_GROUPS << YAML::Value << YAML::BeginMap;
        for (const auto& [name, domains] : state.groups) {
            out << YAML::Key << name << YAML::Value << YAML::BeginSeq;
            for (const auto& d : domains) out << d;
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;

        out << YAML::Key << KEY_ROUTES << YAML::Value << YAML::BeginMap;
        for (const auto& [name, iface] : state.routes) {
            out << YAML::Key << name << YAML::Value << iface;
        }
        out << YAML::EndMap;

        out << YAML::Key << KEY_IFACES << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (const auto& iface : state.interfaces) out << iface;
        out << YAML::EndSeq;

        out << YAML::EndMap;
        return std::string(out.c_str()) + "\n";
    }

    Result<RouterState> load_state_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) return fail(ErrorKind::StateFetch, "cannot read state snapshot '" + path + "'");
        std::ostringstream ss;
        ss << in.rdbuf();
        return parse_state(ss.str());
    }

    Status save_state_file(const std::string& path, const RouterState& state) {
        const fs::path target(path);
        auto tmp = target;
        tmp += ".tmp";
        {
            std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
            if (!f) return fail(ErrorKind::Execution, "cannot write state snapshot '" + tmp.string() + "'");
            f << emit_state(state);
            if (!f.good()) return fail(ErrorKind::Execution, "short write to '" + tmp.string() + "'");
        }
        std::error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            return fail(ErrorKind::Execution,
                        "cannot replace state snapshot '" + path + "': " + ec.message());
        }
        return {};
    }

} // namespace dnsroute::routing
