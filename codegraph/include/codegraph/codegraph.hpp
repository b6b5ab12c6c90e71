#pragma once
// codegraph: code property graph indexing for Go projects
//
// - Symbol: canonical identifiers shared by both extraction strategies
// - Model: node labels, relationship types, per-file extraction output
// - Store: GraphStore interface and its SQLite implementation
// - Extractors: tree-sitter walker and scip-go adapter
// - SyncEngine: hash-based incremental synchronization

#include "version.hpp"
#include "log.hpp"
#include "config.hpp"
#include "symbol.hpp"
#include "model.hpp"
#include "graph_store.hpp"
#include "sqlite_graph_store.hpp"
#include "file_tracker.hpp"
#include "extractor.hpp"
#include "go_extractor.hpp"
#include "scip_extractor.hpp"
#include "sync_engine.hpp"
