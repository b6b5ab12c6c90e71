#include <codegraph/sqlite_graph_store.hpp>
#include <codegraph/log.hpp>
#include <codegraph/version.hpp>
#include <sqlite3.h>
#include <cstring>

namespace codegraph {

namespace {

const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS nodes (
    id        INTEGER PRIMARY KEY,
    labels    TEXT NOT NULL,
    merge_key TEXT UNIQUE,
    props     TEXT NOT NULL DEFAULT '{}'
);
CREATE TABLE IF NOT EXISTS rels (
    id    INTEGER PRIMARY KEY,
    src   INTEGER NOT NULL REFERENCES nodes(id) ON DELETE CASCADE,
    dst   INTEGER NOT NULL REFERENCES nodes(id) ON DELETE CASCADE,
    type  TEXT NOT NULL,
    props TEXT NOT NULL DEFAULT '{}'
);
CREATE INDEX IF NOT EXISTS idx_nodes_labels ON nodes(labels);
CREATE INDEX IF NOT EXISTS idx_nodes_path ON nodes(json_extract(props, '$.path'));
CREATE INDEX IF NOT EXISTS idx_nodes_file_path ON nodes(json_extract(props, '$.filePath'));
CREATE INDEX IF NOT EXISTS idx_rels_src ON rels(src, type);
CREATE INDEX IF NOT EXISTS idx_rels_dst ON rels(dst, type);
)SQL";

// Owns one prepared statement
class Statement {
public:
    Statement(sqlite3* db, const char* sql, const char** tail = nullptr) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, tail);
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_OK;
};

// Invalid UTF-8 in source text (Latin-1 comments) becomes U+FFFD
std::string to_text(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

void bind_value(sqlite3_stmt* stmt, int idx, const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            sqlite3_bind_null(stmt, idx);
            break;
        case json::value_t::boolean:
            sqlite3_bind_int(stmt, idx, value.get<bool>() ? 1 : 0);
            break;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            sqlite3_bind_int64(stmt, idx, value.get<int64_t>());
            break;
        case json::value_t::number_float:
            sqlite3_bind_double(stmt, idx, value.get<double>());
            break;
        case json::value_t::string: {
            const auto& s = value.get_ref<const std::string&>();
            sqlite3_bind_text(stmt, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
            break;
        }
        default: {
            std::string s = to_text(value);
            sqlite3_bind_text(stmt, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
            break;
        }
    }
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& s) {
    sqlite3_bind_text(stmt, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

json column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            return std::string(text, sqlite3_column_bytes(stmt, col));
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text, sqlite3_column_bytes(stmt, col)) : std::string();
}

int64_t parse_id(const std::string& id) {
    if (id.empty()) throw StoreError("empty node id");
    int64_t value = 0;
    for (char c : id) {
        if (c < '0' || c > '9') throw StoreError("invalid node id: " + id);
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

SqliteGraphStore::SqliteGraphStore(std::string path)
    : path_(std::move(path)) {}

SqliteGraphStore::~SqliteGraphStore() {
    close();
}

bool SqliteGraphStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return true;

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        last_error_ = std::string("cannot open ") + path_ + ": " +
                      (db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    try {
        exec("PRAGMA foreign_keys = ON");
        if (path_ != ":memory:") {
            exec("PRAGMA journal_mode = WAL");
            exec("PRAGMA synchronous = NORMAL");
        }
    } catch (const StoreError& e) {
        last_error_ = e.what();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    baseline_changes_ = sqlite3_total_changes(db_);
    log_debug("store", "opened %s", path_.c_str());
    return true;
}

void SqliteGraphStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteGraphStore::create_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "store not open";
        return false;
    }

    int stored = 0;
    {
        Statement stmt(db_, "PRAGMA user_version");
        if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
            stored = sqlite3_column_int(stmt.get(), 0);
        }
    }
    if (!version::schema_compatible(stored)) {
        last_error_ = "database schema v" + std::to_string(stored) +
                      " is newer than supported v" + std::to_string(CODEGRAPH_SCHEMA_VERSION);
        return false;
    }

    char* err = nullptr;
    if (sqlite3_exec(db_, SCHEMA_SQL, nullptr, nullptr, &err) != SQLITE_OK) {
        last_error_ = std::string("schema creation failed: ") + (err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }

    std::string pragma = "PRAGMA user_version = " + std::to_string(CODEGRAPH_SCHEMA_VERSION);
    if (sqlite3_exec(db_, pragma.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        last_error_ = std::string("cannot record schema version: ") + (err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }

    baseline_changes_ = sqlite3_total_changes(db_);
    return true;
}

std::string SqliteGraphStore::join_labels(const std::vector<std::string>& labels) {
    std::string out;
    for (const auto& l : labels) {
        if (!out.empty()) out += ':';
        out += l;
    }
    return out;
}

std::string SqliteGraphStore::merge_key(const std::vector<std::string>& labels,
                                        const Properties& match_props) {
    // json objects keep keys sorted, so the dump is canonical
    return join_labels(labels) + "|" + to_text(match_props);
}

NodeId SqliteGraphStore::merge_node(const std::vector<std::string>& labels,
                                    const Properties& match_props,
                                    const Properties& set_props) {
    if (!match_props.is_object() || match_props.empty()) {
        throw StoreError("merge_node needs a non-empty match property object");
    }

    Properties merged = set_props.is_object() ? set_props : Properties::object();
    for (auto it = match_props.begin(); it != match_props.end(); ++it) {
        merged[it.key()] = it.value();
    }
    // Compared against what is stored, so it must already be the stored form
    Properties props = json::parse(to_text(merged));

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) throw StoreError("store not open");
    return merge_node_locked(join_labels(labels), merge_key(labels, match_props), props, true);
}

NodeId SqliteGraphStore::merge_node_locked(const std::string& labels, const std::string& key,
                                           const Properties& props, bool retry) {
    {
        Statement select(db_, "SELECT id, props FROM nodes WHERE merge_key = ?1");
        if (!select.ok()) fail("prepare merge lookup");
        bind_text(select.get(), 1, key);

        if (sqlite3_step(select.get()) == SQLITE_ROW) {
            int64_t id = sqlite3_column_int64(select.get(), 0);
            json existing = json::parse(column_string(select.get(), 1), nullptr, false);
            if (existing.is_discarded() || !existing.is_object()) existing = json::object();

            json updated = existing;
            updated.update(props);
            if (updated != existing) {
                Statement update(db_, "UPDATE nodes SET props = ?1 WHERE id = ?2");
                if (!update.ok()) fail("prepare merge update");
                bind_text(update.get(), 1, to_text(updated));
                sqlite3_bind_int64(update.get(), 2, id);
                if (sqlite3_step(update.get()) != SQLITE_DONE) fail("merge update");
            }
            return std::to_string(id);
        }
    }

    Statement insert(db_, "INSERT OR IGNORE INTO nodes (labels, merge_key, props) VALUES (?1, ?2, ?3)");
    if (!insert.ok()) fail("prepare merge insert");
    bind_text(insert.get(), 1, labels);
    bind_text(insert.get(), 2, key);
    bind_text(insert.get(), 3, to_text(props));
    if (sqlite3_step(insert.get()) != SQLITE_DONE) fail("merge insert");

    if (sqlite3_changes(db_) == 0) {
        // Another writer inserted the same key between lookup and insert
        if (!retry) throw StoreError("merge_node lost the race twice for key " + key);
        return merge_node_locked(labels, key, props, false);
    }
    return std::to_string(sqlite3_last_insert_rowid(db_));
}

NodeId SqliteGraphStore::create_node(const std::vector<std::string>& labels,
                                     const Properties& props) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) throw StoreError("store not open");

    Statement insert(db_, "INSERT INTO nodes (labels, merge_key, props) VALUES (?1, NULL, ?2)");
    if (!insert.ok()) fail("prepare node insert");
    bind_text(insert.get(), 1, join_labels(labels));
    bind_text(insert.get(), 2, to_text(props.is_object() ? props : Properties::object()));
    if (sqlite3_step(insert.get()) != SQLITE_DONE) fail("node insert");
    return std::to_string(sqlite3_last_insert_rowid(db_));
}

RelId SqliteGraphStore::create_relationship(const NodeId& from, const NodeId& to,
                                            const std::string& type,
                                            const Properties& props) {
    int64_t src = parse_id(from);
    int64_t dst = parse_id(to);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) throw StoreError("store not open");

    Statement insert(db_, "INSERT INTO rels (src, dst, type, props) VALUES (?1, ?2, ?3, ?4)");
    if (!insert.ok()) fail("prepare relationship insert");
    sqlite3_bind_int64(insert.get(), 1, src);
    sqlite3_bind_int64(insert.get(), 2, dst);
    bind_text(insert.get(), 3, type);
    bind_text(insert.get(), 4, to_text(props.is_object() ? props : Properties::object()));
    if (sqlite3_step(insert.get()) != SQLITE_DONE) {
        fail("relationship " + type + " " + from + "->" + to);
    }
    return std::to_string(sqlite3_last_insert_rowid(db_));
}

std::vector<Record> SqliteGraphStore::execute_query(const std::string& text,
                                                    const Properties& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) throw StoreError("store not open");

    std::vector<Record> records;
    const char* sql = text.c_str();

    // Runs every statement in the text; rows from all of them are returned
    while (sql && *sql) {
        const char* tail = nullptr;
        Statement stmt(db_, sql, &tail);
        if (!stmt.ok()) fail("prepare query");
        sql = tail;
        if (!stmt.get()) continue;  // whitespace or comment only

        int count = sqlite3_bind_parameter_count(stmt.get());
        for (int i = 1; i <= count; ++i) {
            const char* name = sqlite3_bind_parameter_name(stmt.get(), i);
            if (!name) throw StoreError("positional parameters are not supported in queries");
            std::string key(name + 1);  // strip ':', '@' or '$'
            if (!params.is_object() || !params.contains(key)) {
                throw StoreError("missing query parameter: " + key);
            }
            bind_value(stmt.get(), i, params[key]);
        }

        int columns = sqlite3_column_count(stmt.get());
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            Record record = Record::object();
            for (int c = 0; c < columns; ++c) {
                record[sqlite3_column_name(stmt.get(), c)] = column_value(stmt.get(), c);
            }
            records.push_back(std::move(record));
        }
        if (rc != SQLITE_DONE) fail("query step");
    }
    return records;
}

bool SqliteGraphStore::in_transaction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

uint64_t SqliteGraphStore::write_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;
    return static_cast<uint64_t>(sqlite3_total_changes(db_) - baseline_changes_);
}

StoreStats SqliteGraphStore::stats() {
    StoreStats stats;
    for (const auto& row : execute_query(
             "SELECT labels AS label, COUNT(*) AS n FROM nodes GROUP BY labels ORDER BY labels",
             Properties::object())) {
        uint64_t n = row["n"].get<uint64_t>();
        stats.nodes_by_label.emplace_back(row["label"].get<std::string>(), n);
        stats.node_count += n;
    }
    for (const auto& row : execute_query(
             "SELECT type, COUNT(*) AS n FROM rels GROUP BY type ORDER BY type",
             Properties::object())) {
        uint64_t n = row["n"].get<uint64_t>();
        stats.rels_by_type.emplace_back(row["type"].get<std::string>(), n);
        stats.rel_count += n;
    }
    return stats;
}

json SqliteGraphStore::node_props(const NodeId& id) {
    auto rows = execute_query("SELECT props FROM nodes WHERE id = :id",
                              {{"id", parse_id(id)}});
    if (rows.empty()) return nullptr;
    return json::parse(rows[0]["props"].get<std::string>(), nullptr, false);
}

void SqliteGraphStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError(std::string(sql) + ": " + message);
    }
}

void SqliteGraphStore::fail(const std::string& context) const {
    throw StoreError(context + ": " + (db_ ? sqlite3_errmsg(db_) : "store not open"));
}

} // namespace codegraph
