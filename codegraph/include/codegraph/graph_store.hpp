#pragma once
// GraphStore: the graph persistence collaborator
//
// The engine only ever talks to the store through these four primitives:
//   merge_node          create-or-update by natural key (must never duplicate)
//   create_node         plain create, for nodes without a natural key
//   create_relationship directed typed edge between two node ids
//   execute_query       free-form query text with named parameters
//
// Node and relationship ids are opaque strings handed out by the store; the
// engine never holds pointers into the graph.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace codegraph {

using json = nlohmann::json;
using NodeId = std::string;
using RelId = std::string;
using Properties = json;  // JSON object of property name -> scalar
using Record = json;      // JSON object of column name -> value

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// Label/type counts for status output
struct StoreStats {
    std::vector<std::pair<std::string, uint64_t>> nodes_by_label;
    std::vector<std::pair<std::string, uint64_t>> rels_by_type;
    uint64_t node_count = 0;
    uint64_t rel_count = 0;
};

class GraphStore {
public:
    virtual ~GraphStore() = default;

    virtual NodeId merge_node(const std::vector<std::string>& labels,
                              const Properties& match_props,
                              const Properties& set_props) = 0;

    virtual NodeId create_node(const std::vector<std::string>& labels,
                               const Properties& props) = 0;

    virtual RelId create_relationship(const NodeId& from, const NodeId& to,
                                      const std::string& type,
                                      const Properties& props) = 0;

    virtual std::vector<Record> execute_query(const std::string& text,
                                              const Properties& params) = 0;

    // Rows changed by this store since it was opened
    virtual uint64_t write_count() const = 0;

    // False again once a transaction ends, including when the backend
    // rolled it back on its own (disk full, I/O error)
    virtual bool in_transaction() const = 0;

    virtual StoreStats stats() = 0;
};

} // namespace codegraph
