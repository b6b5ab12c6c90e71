#pragma once
// SyncEngine: incremental synchronization of one project into the graph
//
// A run:
//   1. prepares the extractor (may abort with FatalError)
//   2. merges the Service node and reads path -> hash for its files
//   3. walks the project in sorted order; per file:
//        clean (same hash)  -> no writes
//        dirty              -> extract in memory, then replace the file's
//                              subgraph inside one store transaction
//   4. removes files that vanished from disk (skipped when cancelled)
//   5. merges the extractor's external symbols
//   6. prunes Symbols nobody defines or references (external ones excepted)
//      and Modules nobody contains
//
// Per-file failures are collected in RunResult::errors; the run goes on.

#include "extractor.hpp"
#include "file_tracker.hpp"
#include "graph_store.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codegraph {

struct ServiceInfo {
    std::string name;            // empty: the root directory's name
    std::string version = "v0.0.0";
    std::string repository_url;
};

struct RunResult {
    size_t indexed = 0;          // dirty files written
    size_t skipped = 0;          // clean files
    size_t removed = 0;          // vanished files deleted
    size_t failed = 0;           // files with an error
    size_t pruned_symbols = 0;
    size_t pruned_modules = 0;
    uint64_t entity_errors = 0;  // failed node/edge writes inside written files
    uint64_t writes = 0;         // store rows changed by this run
    bool cancelled = false;
    std::vector<std::pair<std::string, std::string>> errors;  // (path, message)
};

class SyncEngine {
public:
    SyncEngine(GraphStore& store, Extractor& extractor, ServiceInfo service);

    // Throws FatalError when the root is unusable, the extractor cannot be
    // prepared, or the store cannot be reached
    RunResult run(const std::string& root);

    void set_deny_list(std::vector<std::string> deny) { deny_ = std::move(deny); }

    // Checked between files; safe from a signal handler
    void cancel() { cancel_.store(true); }
    void reset_cancel() { cancel_.store(false); }
    bool cancel_requested() const { return cancel_.load(); }

    const ServiceInfo& service() const { return service_; }

    // Trailing separators and dot segments removed
    static std::string normalize_root(const std::string& root);

    // Service name used when none is configured
    static std::string default_service_name(const std::string& normalized_root);

    // Store helpers, also used by the CLI
    static std::unordered_map<std::string, std::string> file_hashes(GraphStore& store,
                                                                    const std::string& service);
    static void remove_file_subgraph(GraphStore& store, const std::string& path);

private:
    GraphStore& store_;
    Extractor& extractor_;
    ServiceInfo service_;
    std::vector<std::string> deny_ = default_deny_list();
    std::atomic<bool> cancel_{false};

    size_t prune(const char* sql);
    void rollback();
};

} // namespace codegraph
