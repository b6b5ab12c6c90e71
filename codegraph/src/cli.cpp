// codegraph: Command-line interface for the code property graph
//
// Usage: codegraph <command> [options]
//
// Commands:
//   index <path>       Index a Go project with the native tree-sitter walker
//   index-scip <path>  Index a Go project from a scip-go index
//   status             Show graph statistics
//   files              List indexed files
//   help               Show this help

#include <codegraph/codegraph.hpp>
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <algorithm>

using namespace codegraph;

static std::atomic<SyncEngine*> running_engine{nullptr};

void interrupt_handler(int sig) {
    (void)sig;
    SyncEngine* engine = running_engine.load();
    if (engine) engine->cancel();
}

const char* prog_name(const char* argv0) {
    const char* slash = strrchr(argv0, '/');
    return slash ? slash + 1 : argv0;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "codegraph " << CODEGRAPH_VERSION << " - Code property graph for Go projects\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  index <path>          Index with the native tree-sitter walker\n"
              << "  index-scip <path>     Index from scip-go output\n"
              << "  status                Show node and relationship counts\n"
              << "  files                 List indexed files\n"
              << "  help                  Show this help\n\n"
              << "Options:\n"
              << "  --db PATH             Graph database (default: ~/.codegraph/graph.db)\n"
              << "  --config PATH         JSON config file (default: ~/.codegraph.json)\n"
              << "  --service NAME        Service name (default: project directory name)\n"
              << "  --module-version VER  Version recorded in symbols (default: v0.0.0)\n"
              << "  --repo URL            Repository URL stored on the Service\n"
              << "  --scip-binary PATH    scip-go binary (default: scip-go)\n"
              << "  --json                Output as JSON\n"
              << "  --verbose             Enable verbose debug logging\n"
              << "  -v, --version         Show version\n\n"
              << "Environment:\n"
              << "  CODEGRAPH_DB, CODEGRAPH_SCIP_BINARY, CODEGRAPH_VERBOSE\n";
}

bool open_store(SqliteGraphStore& store) {
    std::error_code ec;
    fs::path parent = fs::path(store.path()).parent_path();
    if (store.path() != ":memory:" && !parent.empty()) {
        fs::create_directories(parent, ec);
    }
    if (!store.open() || !store.create_schema()) {
        std::cerr << "Error: " << store.last_error() << "\n";
        return false;
    }
    log_debug("cli", "store %s", store.path().c_str());
    return true;
}

// Paths are raw bytes and need not be valid UTF-8
std::string to_output(const json& j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

json result_json(const RunResult& result) {
    json errors = json::array();
    for (const auto& [path, message] : result.errors) {
        errors.push_back({{"path", path}, {"error", message}});
    }
    return {
        {"indexed", result.indexed},
        {"skipped", result.skipped},
        {"removed", result.removed},
        {"failed", result.failed},
        {"prunedSymbols", result.pruned_symbols},
        {"prunedModules", result.pruned_modules},
        {"entityErrors", result.entity_errors},
        {"writes", result.writes},
        {"cancelled", result.cancelled},
        {"errors", errors}
    };
}

int cmd_index(const Config& cfg, const std::string& root, bool json_output) {
    if (root.empty()) {
        std::cerr << "Error: index needs a project path\n";
        return 1;
    }

    SqliteGraphStore store(cfg.db_path);
    if (!open_store(store)) return 1;

    GoExtractor native;
    ScipExtractor scip(cfg.scip_binary);
    Extractor& extractor = cfg.strategy == Strategy::Scip
        ? static_cast<Extractor&>(scip) : static_cast<Extractor&>(native);

    ServiceInfo service;
    service.name = cfg.service_name;
    service.version = cfg.service_version;
    service.repository_url = cfg.repository_url;

    SyncEngine engine(store, extractor, service);
    engine.set_deny_list(cfg.deny);

    running_engine = &engine;
    std::signal(SIGINT, interrupt_handler);

    RunResult result;
    try {
        result = engine.run(root);
    } catch (const std::exception& e) {
        running_engine = nullptr;
        std::signal(SIGINT, SIG_DFL);
        log_error("cli", "%s", e.what());
        return 1;
    }
    running_engine = nullptr;
    std::signal(SIGINT, SIG_DFL);

    if (json_output) {
        std::cout << to_output(result_json(result)) << "\n";
        return 0;
    }

    std::cout << "Indexed:  " << result.indexed << "\n"
              << "Skipped:  " << result.skipped << "\n"
              << "Removed:  " << result.removed << "\n"
              << "Failed:   " << result.failed << "\n";
    if (result.cancelled) std::cout << "Run was cancelled before all files were visited\n";
    for (const auto& [path, message] : result.errors) {
        std::cout << "  " << path << ": " << message << "\n";
    }
    return 0;
}

int cmd_status(const Config& cfg, bool json_output) {
    SqliteGraphStore store(cfg.db_path);
    if (!open_store(store)) return 1;

    StoreStats stats;
    try {
        stats = store.stats();
    } catch (const StoreError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (json_output) {
        json nodes = json::object();
        json rels = json::object();
        for (const auto& [label_name, n] : stats.nodes_by_label) nodes[label_name] = n;
        for (const auto& [type, n] : stats.rels_by_type) rels[type] = n;
        std::cout << to_output(json{{"db", store.path()},
                                    {"nodes", nodes},
                                    {"relationships", rels},
                                    {"nodeCount", stats.node_count},
                                    {"relationshipCount", stats.rel_count}}) << "\n";
        return 0;
    }

    std::cout << "Graph: " << store.path() << "\n";
    std::cout << "Nodes: " << stats.node_count << "\n";
    for (const auto& [label_name, n] : stats.nodes_by_label) {
        std::cout << "  " << std::left << std::setw(12) << label_name << n << "\n";
    }
    std::cout << "Relationships: " << stats.rel_count << "\n";
    for (const auto& [type, n] : stats.rels_by_type) {
        std::cout << "  " << std::left << std::setw(12) << type << n << "\n";
    }
    return 0;
}

int cmd_files(const Config& cfg, bool json_output) {
    SqliteGraphStore store(cfg.db_path);
    if (!open_store(store)) return 1;

    std::vector<Record> rows;
    try {
        if (cfg.service_name.empty()) {
            rows = store.execute_query(
                "SELECT json_extract(props, '$.path') AS path, json_extract(props, '$.hash') AS hash, "
                "json_extract(props, '$.lineCount') AS lines, json_extract(props, '$.extractor') AS extractor "
                "FROM nodes WHERE labels = 'File' ORDER BY path", Properties::object());
        } else {
            auto hashes = SyncEngine::file_hashes(store, cfg.service_name);
            for (const auto& [path, hash] : hashes) {
                rows.push_back(Record{{"path", path}, {"hash", hash}});
            }
            std::sort(rows.begin(), rows.end(), [](const Record& a, const Record& b) {
                return a["path"].get<std::string>() < b["path"].get<std::string>();
            });
        }
    } catch (const StoreError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (json_output) {
        std::cout << to_output(json(rows)) << "\n";
        return 0;
    }
    for (const auto& row : rows) {
        std::string hash = row["hash"].is_string() ? row["hash"].get<std::string>() : "";
        std::cout << hash.substr(0, 12) << "  " << row["path"].get<std::string>() << "\n";
    }
    std::cout << rows.size() << " files\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string target;
    std::string config_path;
    bool json_output = false;

    // Flag values override config and environment, so they are kept apart
    std::string db_flag, service_flag, version_flag, repo_flag, scip_flag;
    bool verbose_flag_set = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_flag = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--service") == 0 && i + 1 < argc) {
            service_flag = argv[++i];
        } else if (strcmp(argv[i], "--module-version") == 0 && i + 1 < argc) {
            version_flag = argv[++i];
        } else if (strcmp(argv[i], "--repo") == 0 && i + 1 < argc) {
            repo_flag = argv[++i];
        } else if (strcmp(argv[i], "--scip-binary") == 0 && i + 1 < argc) {
            scip_flag = argv[++i];
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose_flag_set = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "codegraph " << CODEGRAPH_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else if ((command == "index" || command == "index-scip") && target.empty()) {
                target = argv[i];
            } else {
                std::cerr << "Unexpected argument: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    Config cfg;
    ConfigResult loaded = load_config(config_path, cfg);
    if (!loaded.success) {
        std::cerr << "Error: " << loaded.error << "\n";
        return 1;
    }
    if (!db_flag.empty()) cfg.db_path = db_flag;
    if (!service_flag.empty()) cfg.service_name = service_flag;
    if (!version_flag.empty()) cfg.service_version = version_flag;
    if (!repo_flag.empty()) cfg.repository_url = repo_flag;
    if (!scip_flag.empty()) cfg.scip_binary = scip_flag;
    if (verbose_flag_set) cfg.verbose = true;
    logging::set_verbose(cfg.verbose);
    if (loaded.loaded) log_debug("cli", "config loaded");

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }
    if (command == "index") {
        return cmd_index(cfg, target, json_output);
    }
    if (command == "index-scip") {
        cfg.strategy = Strategy::Scip;
        return cmd_index(cfg, target, json_output);
    }
    if (command == "status") {
        return cmd_status(cfg, json_output);
    }
    if (command == "files") {
        return cmd_files(cfg, json_output);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
