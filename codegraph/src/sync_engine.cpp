#include <codegraph/sync_engine.hpp>
#include <codegraph/graph_writer.hpp>
#include <codegraph/log.hpp>

namespace codegraph {

namespace {

// Queries against the SqliteGraphStore layout (nodes / rels, JSON props)

const char* PREVIOUS_HASHES_SQL = R"SQL(
SELECT json_extract(f.props, '$.path') AS path,
       json_extract(f.props, '$.hash') AS hash
FROM nodes s
JOIN rels r ON r.src = s.id AND r.type = 'CONTAINS'
JOIN nodes f ON f.id = r.dst AND f.labels = 'File'
WHERE s.labels = 'Service' AND json_extract(s.props, '$.name') = :service
)SQL";

// Relationships go with their endpoints (ON DELETE CASCADE). Modules and
// Symbols stay until the end-of-run prune so their ids survive an edit.
const char* REMOVE_FILE_SQL = R"SQL(
DELETE FROM nodes
WHERE labels IN ('Function', 'Method', 'Class', 'Interface', 'Variable', 'Parameter', 'Reference')
  AND json_extract(props, '$.filePath') = :path;
DELETE FROM nodes
WHERE labels = 'File' AND json_extract(props, '$.path') = :path;
)SQL";

const char* PRUNE_SYMBOLS_SQL = R"SQL(
DELETE FROM nodes
WHERE labels = 'Symbol'
  AND json_extract(props, '$.isExternal') IS NOT 1
  AND NOT EXISTS (SELECT 1 FROM rels r
                  WHERE r.dst = nodes.id AND r.type IN ('DEFINES', 'REFERENCES'));
SELECT changes() AS n;
)SQL";

const char* PRUNE_MODULES_SQL = R"SQL(
DELETE FROM nodes
WHERE labels = 'Module'
  AND NOT EXISTS (SELECT 1 FROM rels r WHERE r.dst = nodes.id AND r.type = 'CONTAINS');
SELECT changes() AS n;
)SQL";

} // namespace

SyncEngine::SyncEngine(GraphStore& store, Extractor& extractor, ServiceInfo service)
    : store_(store), extractor_(extractor), service_(std::move(service)) {}

std::string SyncEngine::normalize_root(const std::string& root) {
    std::string normalized = fs::path(root).lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') normalized.pop_back();
    return normalized;
}

std::string SyncEngine::default_service_name(const std::string& normalized_root) {
    std::error_code ec;
    fs::path absolute = fs::absolute(normalized_root, ec);
    std::string name = (ec ? fs::path(normalized_root) : absolute).lexically_normal().filename().string();
    if (name.empty() || name == ".") name = "service";
    return name;
}

std::unordered_map<std::string, std::string> SyncEngine::file_hashes(GraphStore& store,
                                                                    const std::string& service) {
    std::unordered_map<std::string, std::string> hashes;
    for (const auto& row : store.execute_query(PREVIOUS_HASHES_SQL, {{"service", service}})) {
        if (!row["path"].is_string()) continue;
        hashes[row["path"].get<std::string>()] =
            row["hash"].is_string() ? row["hash"].get<std::string>() : std::string();
    }
    return hashes;
}

void SyncEngine::remove_file_subgraph(GraphStore& store, const std::string& path) {
    store.execute_query(REMOVE_FILE_SQL, {{"path", path}});
}

void SyncEngine::rollback() {
    try {
        if (store_.in_transaction()) store_.execute_query("ROLLBACK", Properties::object());
    } catch (const StoreError& e) {
        log_warn("sync", "rollback failed: %s", e.what());
    }
}

size_t SyncEngine::prune(const char* sql) {
    auto rows = store_.execute_query(sql, Properties::object());
    if (rows.empty() || !rows.back().contains("n")) return 0;
    return rows.back()["n"].get<size_t>();
}

RunResult SyncEngine::run(const std::string& root_arg) {
    RunResult result;

    std::string root = normalize_root(root_arg);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw FatalError("project root is not a readable directory: " + root_arg);
    }

    RunContext ctx;
    ctx.root = root;
    ctx.service_name = service_.name.empty() ? default_service_name(root) : service_.name;
    ctx.service_version = service_.version;
    ctx.repository_url = service_.repository_url;

    extractor_.prepare(ctx);

    uint64_t writes_before = store_.write_count();
    std::unordered_map<std::string, std::string> previous;
    try {
        ctx.service_id = store_.merge_node({label::SERVICE}, {{"name", ctx.service_name}},
                                           {{"language", "Go"},
                                            {"version", ctx.service_version},
                                            {"repositoryUrl", ctx.repository_url}});
        previous = file_hashes(store_, ctx.service_name);
    } catch (const StoreError& e) {
        throw FatalError(std::string("graph store unavailable: ") + e.what());
    }

    std::vector<std::pair<std::string, std::string>> files;
    try {
        files = walk_go_files(root, deny_);
    } catch (const fs::filesystem_error& e) {
        throw FatalError(std::string("cannot walk ") + root + ": " + e.what());
    }

    log_info("sync", "%s: %zu Go files, %zu known (%s)", ctx.service_name.c_str(), files.size(),
             previous.size(), extractor_.name());

    FileTracker tracker(std::move(previous));
    GraphWriter writer(store_, ctx);

    for (const auto& [path, relative] : files) {
        if (cancel_requested()) {
            result.cancelled = true;
            log_warn("sync", "cancelled after %zu files", result.indexed + result.skipped + result.failed);
            break;
        }

        std::string content;
        FileRecord record;
        try {
            content = read_file(path);
            record = tracker.observe(path, relative, content);
        } catch (const std::runtime_error& e) {
            // Still on disk, so its old subgraph is kept
            tracker.mark_seen(path);
            log_warn("sync", "%s: %s", relative.c_str(), e.what());
            result.errors.emplace_back(path, e.what());
            ++result.failed;
            continue;
        }

        if (!tracker.is_dirty(record)) {
            ++result.skipped;
            continue;
        }

        std::vector<std::string> lines = split_lines(content);
        FileGraph graph;
        try {
            graph = extractor_.extract(FileInput{path, relative, content, lines}, ctx);
        } catch (const ExtractError& e) {
            log_warn("sync", "skipping %s: %s", relative.c_str(), e.what());
            result.errors.emplace_back(path, e.what());
            ++result.failed;
            continue;
        }

        try {
            store_.execute_query("BEGIN", Properties::object());
            remove_file_subgraph(store_, path);
            writer.write(graph, record.hash);
            if (!store_.in_transaction()) {
                throw StoreError("transaction was rolled back by the store");
            }
            store_.execute_query("COMMIT", Properties::object());
        } catch (const std::exception& e) {
            // Cached ids may point at rolled back nodes
            ctx.modules.clear();
            ctx.symbols.clear();
            rollback();
            log_warn("sync", "%s: write failed: %s", relative.c_str(), e.what());
            result.errors.emplace_back(path, e.what());
            ++result.failed;
            continue;
        }

        ++result.indexed;
        log_debug("sync", "indexed %s (%zu definitions, %zu references)", relative.c_str(),
                  graph.definitions.size(), graph.references.size());
    }

    if (!result.cancelled) {
        for (const auto& path : tracker.vanished()) {
            try {
                remove_file_subgraph(store_, path);
                ++result.removed;
                log_debug("sync", "removed %s", path.c_str());
            } catch (const StoreError& e) {
                log_warn("sync", "%s: remove failed: %s", path.c_str(), e.what());
                result.errors.emplace_back(path, e.what());
                ++result.failed;
            }
        }
    }

    auto externals = extractor_.external_symbols();
    for (const auto& [symbol, info] : externals) {
        try {
            writer.declare_symbol(symbol, info);
        } catch (const StoreError& e) {
            log_warn("sync", "external symbol %s: %s", symbol.c_str(), e.what());
            ++ctx.entity_errors;
        }
    }
    if (!externals.empty()) log_debug("sync", "%zu external symbols", externals.size());

    try {
        result.pruned_symbols = prune(PRUNE_SYMBOLS_SQL);
        result.pruned_modules = prune(PRUNE_MODULES_SQL);
    } catch (const StoreError& e) {
        log_warn("sync", "prune failed: %s", e.what());
        result.errors.emplace_back(root, std::string("prune: ") + e.what());
    }

    result.entity_errors = ctx.entity_errors;
    result.writes = store_.write_count() - writes_before;

    log_info("sync", "indexed %zu, skipped %zu, removed %zu, failed %zu%s",
             result.indexed, result.skipped, result.removed, result.failed,
             result.cancelled ? " (cancelled)" : "");
    if (result.pruned_symbols || result.pruned_modules) {
        log_debug("sync", "pruned %zu symbols, %zu modules", result.pruned_symbols,
                  result.pruned_modules);
    }
    return result;
}

} // namespace codegraph
