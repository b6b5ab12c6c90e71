#pragma once

#define CODEGRAPH_VERSION "0.4.0"
#define CODEGRAPH_SCHEMA_VERSION 1

namespace codegraph {
namespace version {

// Extractor identifiers recorded on File nodes, so a later run can tell
// which strategy produced the persisted subgraph.
constexpr const char* NATIVE_EXTRACTOR = "tree-sitter-go";
constexpr const char* SCIP_EXTRACTOR = "scip-go";

inline bool schema_compatible(int stored) {
    // Older schemas are upgraded in place by create_schema(); newer ones are not understood
    return stored <= CODEGRAPH_SCHEMA_VERSION;
}

} // namespace version
} // namespace codegraph
