#pragma once
// RunContext: everything one sync run shares across files
//
// Owned by a single SyncEngine::run call and dropped when it returns, so the
// caches never outlive the node ids they hold. Orphan pruning only happens
// at the end of a run, which keeps cached ids valid throughout.

#include "graph_store.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>

namespace codegraph {

struct RunContext {
    std::string root;               // normalized project root
    std::string service_name;       // also the module path prefix
    std::string service_version;
    std::string repository_url;
    NodeId service_id;

    std::unordered_map<std::string, NodeId> modules;   // fqn -> Module node
    std::unordered_map<std::string, NodeId> symbols;   // symbol string -> Symbol node

    uint64_t entity_errors = 0;     // failed node/edge writes that did not abort a file
};

} // namespace codegraph
