#pragma once
// SqliteGraphStore: GraphStore over a single SQLite database
//
// Layout:
//   nodes(id, labels, merge_key UNIQUE, props)   props is a JSON object
//   rels (id, src, dst, type, props)             cascades with its endpoints
//
// merge_key is "<labels>|<canonical JSON of the match properties>", so the
// UNIQUE index is what keeps concurrent merges from duplicating a node.
// A merge whose properties are already current writes nothing.
//
// Queries passed to execute_query are SQL against this layout; named
// parameters (:name) are bound from the params object.

#include "graph_store.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace codegraph {

class SqliteGraphStore : public GraphStore {
public:
    // path may be ":memory:"
    explicit SqliteGraphStore(std::string path);
    ~SqliteGraphStore() override;

    SqliteGraphStore(const SqliteGraphStore&) = delete;
    SqliteGraphStore& operator=(const SqliteGraphStore&) = delete;

    bool open();
    void close();
    bool is_open() const { return db_ != nullptr; }
    const std::string& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

    // Idempotent; also refuses databases written by a newer schema
    bool create_schema();

    NodeId merge_node(const std::vector<std::string>& labels,
                      const Properties& match_props,
                      const Properties& set_props) override;

    NodeId create_node(const std::vector<std::string>& labels,
                       const Properties& props) override;

    RelId create_relationship(const NodeId& from, const NodeId& to,
                              const std::string& type,
                              const Properties& props) override;

    std::vector<Record> execute_query(const std::string& text,
                                      const Properties& params) override;

    uint64_t write_count() const override;
    bool in_transaction() const override;

    StoreStats stats() override;

    // Properties of a node, null when absent
    json node_props(const NodeId& id);

    static std::string merge_key(const std::vector<std::string>& labels,
                                 const Properties& match_props);
    static std::string join_labels(const std::vector<std::string>& labels);

private:
    std::string path_;
    sqlite3* db_ = nullptr;
    std::string last_error_;
    int64_t baseline_changes_ = 0;
    mutable std::mutex mutex_;

    NodeId merge_node_locked(const std::string& labels, const std::string& key,
                             const Properties& props, bool retry);
    void exec(const char* sql);
    [[noreturn]] void fail(const std::string& context) const;
};

} // namespace codegraph
