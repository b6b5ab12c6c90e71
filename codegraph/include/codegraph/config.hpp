#pragma once
// Config: settings for one codegraph invocation
//
// Layered, later wins:
//   built-in defaults
//   JSON file (--config, else $HOME/.codegraph.json when present)
//   environment: CODEGRAPH_DB, CODEGRAPH_SCIP_BINARY, CODEGRAPH_VERBOSE
//   command-line flags (applied by the CLI)
//
// File format:
//   {
//     "db": "/path/graph.db",
//     "service": "demo", "version": "v1.0.0", "repositoryUrl": "...",
//     "strategy": "native" | "scip",
//     "scipBinary": "scip-go",
//     "deny": ["vendor", ".git"],
//     "verbose": false
//   }

#include "file_tracker.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

namespace codegraph {

enum class Strategy { Native, Scip };

inline const char* strategy_str(Strategy s) {
    return s == Strategy::Scip ? "scip" : "native";
}

inline std::string default_db_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.codegraph/graph.db";
}

inline std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.codegraph.json";
}

struct Config {
    std::string db_path = default_db_path();
    std::string service_name;        // empty: derived from the root directory name
    std::string service_version = "v0.0.0";
    std::string repository_url;
    Strategy strategy = Strategy::Native;
    std::string scip_binary = "scip-go";
    std::vector<std::string> deny = default_deny_list();
    bool verbose = false;
};

struct ConfigResult {
    bool success = true;
    bool loaded = false;    // a file was actually read
    std::string error;
};

inline bool parse_strategy(const std::string& text, Strategy& out) {
    if (text == "native") { out = Strategy::Native; return true; }
    if (text == "scip") { out = Strategy::Scip; return true; }
    return false;
}

inline bool env_truthy(const char* value) {
    if (!value) return false;
    return strcmp(value, "1") == 0 || strcmp(value, "true") == 0 ||
           strcmp(value, "yes") == 0 || strcmp(value, "on") == 0;
}

// Merges a JSON config file into cfg. A missing file is only an error when
// `required` is set (an explicit --config).
inline ConfigResult load_config_file(const std::string& path, Config& cfg, bool required) {
    ConfigResult result;
    std::ifstream in(path);
    if (!in) {
        if (required) {
            result.success = false;
            result.error = "cannot open config file " + path;
        }
        return result;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        result.success = false;
        result.error = "config file " + path + " is not a JSON object";
        return result;
    }

    try {
        if (j.contains("db")) cfg.db_path = j["db"].get<std::string>();
        if (j.contains("service")) cfg.service_name = j["service"].get<std::string>();
        if (j.contains("version")) cfg.service_version = j["version"].get<std::string>();
        if (j.contains("repositoryUrl")) cfg.repository_url = j["repositoryUrl"].get<std::string>();
        if (j.contains("scipBinary")) cfg.scip_binary = j["scipBinary"].get<std::string>();
        if (j.contains("verbose")) cfg.verbose = j["verbose"].get<bool>();
        if (j.contains("deny")) cfg.deny = j["deny"].get<std::vector<std::string>>();
        if (j.contains("strategy")) {
            std::string s = j["strategy"].get<std::string>();
            if (!parse_strategy(s, cfg.strategy)) {
                result.success = false;
                result.error = "unknown strategy '" + s + "' in " + path;
                return result;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        result.success = false;
        result.error = "config file " + path + ": " + e.what();
        return result;
    }

    result.loaded = true;
    return result;
}

inline void apply_environment(Config& cfg) {
    if (const char* db = std::getenv("CODEGRAPH_DB")) {
        if (*db) cfg.db_path = db;
    }
    if (const char* bin = std::getenv("CODEGRAPH_SCIP_BINARY")) {
        if (*bin) cfg.scip_binary = bin;
    }
    if (std::getenv("CODEGRAPH_VERBOSE")) {
        cfg.verbose = env_truthy(std::getenv("CODEGRAPH_VERBOSE"));
    }
}

// Defaults, then file, then environment
inline ConfigResult load_config(const std::string& explicit_path, Config& cfg) {
    cfg = Config{};
    ConfigResult result = explicit_path.empty()
        ? load_config_file(default_config_path(), cfg, false)
        : load_config_file(explicit_path, cfg, true);
    if (!result.success) return result;
    apply_environment(cfg);
    return result;
}

} // namespace codegraph
