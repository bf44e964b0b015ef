/**
 * @file config_loader.cpp
 * @brief yaml-cpp backed configuration loader.
 */
#include "dnsroute/config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace dnsroute::config {
    namespace fs = std::filesystem;
    using namespace dnsroute::config::constants;

    // Accepts either a scalar or a sequence of scalars.
    static std::vector<std::string> string_list(const YAML::Node& node) {
        std::vector<std::string> out;
        if (!node) return out;
        if (node.IsScalar()) {
            out.push_back(node.as<std::string>());
            return out;
        }
        if (!node.IsSequence()) {
            throw YAML::RepresentationException(node.Mark(), "expected a string or a list of strings");
        }
        out.reserve(node.size());
        for (const auto& item : node) out.push_back(item.as<std::string>());
        return out;
    }

    static std::string resolve_path(const std::string& p, const fs::path& base_dir) {
        fs::path path(p);
        if (path.is_absolute() || base_dir.empty()) return path.lexically_normal().string();
        return (base_dir / path).lexically_normal().string();
    }

    static DomainGroup parse_group(const YAML::Node& node, const fs::path& base_dir) {
        DomainGroup g;
        if (const auto name = node["name"]) g.name = name.as<std::string>();
        if (const auto iface = node["interfaceId"]) g.interface_id = iface.as<std::string>();
        for (const auto& f : string_list(node["domain-file"])) {
            g.domain_files.push_back(resolve_path(f, base_dir));
        }
        g.domain_urls = string_list(node["domain-url"]);
        return g;
    }

    Result<AppConfig> Loader::load_from_string(const std::string& text, const fs::path& base_dir) {
        AppConfig cfg;
        try {
            const YAML::Node root = YAML::Load(text);
            if (!root || root.IsNull()) return cfg;
            if (!root.IsMap()) {
                return fail(ErrorKind::Config, "configuration root must be a mapping");
            }

            if (const auto dir = root["dataDir"]) {
                cfg.data_dir = dir.as<std::string>();
            } else if (const auto alias = root["data-dir"]) {
                cfg.data_dir = alias.as<std::string>();
            }
            if (const auto ttl = root["url-cache-ttl"]) {
                const auto secs = ttl.as<long>();
                if (secs < 0) return fail(ErrorKind::Config, "url-cache-ttl must not be negative");
                cfg.url_cache_ttl = std::chrono::seconds{secs};
            }
            if (const auto logs = root["logs"]) {
                if (const auto dbg = logs["debug"]) cfg.debug = dbg.as<bool>();
            }

            const auto dns = root["dns"];
            if (!dns) return cfg;
            const auto routes = dns["routes"];
            if (!routes) return cfg;
            const auto groups = routes["groups"];
            if (!groups) return cfg;
            if (!groups.IsSequence()) {
                return fail(ErrorKind::Config, "dns.routes.groups must be a list");
            }
            for (const auto& g : groups) cfg.groups.push_back(parse_group(g, base_dir));
        } catch (const YAML::Exception& e) {
            return fail(ErrorKind::Config, std::string("invalid configuration: ") + e.what());
        }
        return cfg;
    }

    Result<AppConfig> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return fail(ErrorKind::Config, "cannot read configuration file '" + path + "'");
        }
        std::ostringstream ss;
        ss << in.rdbuf();

        std::error_code ec;
        auto base = fs::absolute(fs::path(path), ec).parent_path();
        if (ec) base = fs::path(path).parent_path();
        return load_from_string(ss.str(), base);
    }

    fs::path Loader::cache_directory(const AppConfig& cfg) {
        fs::path base;
        if (!cfg.data_dir.empty()) {
            base = fs::path(cfg.data_dir).lexically_normal();
        } else if (const char* home = std::getenv("HOME"); home && *home) {
            base = home;
        } else {
            std::error_code ec;
            base = fs::temp_directory_path(ec);
            if (ec) base = ".";
        }
        return base / DATA_DIR_NAME;
    }

} // namespace dnsroute::config
