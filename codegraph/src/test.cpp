#undef NDEBUG
#include <codegraph/codegraph.hpp>
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace codegraph;

// Scratch project directory, wiped on construction and destruction
class TempProject {
public:
    explicit TempProject(const std::string& name)
        : root_((fs::temp_directory_path() /
                 ("codegraph_test_" + name + "_" + std::to_string(getpid()))).string()) {
        fs::remove_all(root_);
        fs::create_directories(root_);
    }
    ~TempProject() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const std::string& relative, const std::string& content) {
        fs::path p = fs::path(root_) / relative;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
    }
    void remove(const std::string& relative) { fs::remove(fs::path(root_) / relative); }
    std::string path(const std::string& relative) const { return root_ + "/" + relative; }
    const std::string& root() const { return root_; }

private:
    std::string root_;
};

void open_memory(SqliteGraphStore& store) {
    assert(store.open());
    assert(store.create_schema());
}

size_t count_nodes(GraphStore& store, const std::string& label_name) {
    auto rows = store.execute_query("SELECT COUNT(*) AS n FROM nodes WHERE labels = :label",
                                    {{"label", label_name}});
    return rows[0]["n"].get<size_t>();
}

size_t count_rels(GraphStore& store, const std::string& type) {
    auto rows = store.execute_query("SELECT COUNT(*) AS n FROM rels WHERE type = :type",
                                    {{"type", type}});
    return rows[0]["n"].get<size_t>();
}

std::vector<std::string> prop_values(GraphStore& store, const std::string& label_name,
                                     const std::string& prop) {
    std::vector<std::string> out;
    auto rows = store.execute_query(
        "SELECT json_extract(props, :path) AS v FROM nodes WHERE labels = :label ORDER BY v",
        {{"path", "$." + prop}, {"label", label_name}});
    for (const auto& row : rows) out.push_back(row["v"].get<std::string>());
    return out;
}

std::string node_id(GraphStore& store, const std::string& label_name, const std::string& prop,
                    const std::string& value) {
    auto rows = store.execute_query(
        "SELECT id FROM nodes WHERE labels = :label AND json_extract(props, :path) = :value",
        {{"label", label_name}, {"path", "$." + prop}, {"value", value}});
    if (rows.empty()) return "";
    return std::to_string(rows[0]["id"].get<int64_t>());
}

// Label of the CONTAINS parent of the named definition
std::string parent_label(GraphStore& store, const std::string& label_name, const std::string& name) {
    auto rows = store.execute_query(
        "SELECT p.labels AS parent FROM rels r "
        "JOIN nodes p ON p.id = r.src JOIN nodes c ON c.id = r.dst "
        "WHERE r.type = 'CONTAINS' AND c.labels = :label AND json_extract(c.props, '$.name') = :name",
        {{"label", label_name}, {"name", name}});
    assert(rows.size() == 1);
    return rows[0]["parent"].get<std::string>();
}

const DefinitionRecord* find_def(const FileGraph& graph, const std::string& name) {
    for (const auto& def : graph.definitions) {
        if (def.name == name) return &def;
    }
    return nullptr;
}

std::string demo_symbol(const std::string& descriptor) {
    return Symbol::build("demo", "v1.0.0", descriptor).format();
}

ServiceInfo demo_service() {
    ServiceInfo service;
    service.name = "demo";
    service.version = "v1.0.0";
    return service;
}

// ---------------------------------------------------------------------------

void test_symbol_roundtrip() {
    std::cout << "Testing Symbol parse/format..." << std::endl;

    std::string text = "scip-go gomod demo v1.0.0 demo/Server#Start().";
    Symbol s = Symbol::parse(text);
    assert(s.scheme == "scip-go");
    assert(s.manager == "gomod");
    assert(s.package_name == "demo");
    assert(s.package_version == "v1.0.0");
    assert(s.descriptor == "demo/Server#Start().");
    assert(s.format() == text);
    assert(Symbol::build("demo", "v1.0.0", "demo/Server#Start().") == s);

    // Descriptor keeps the spaces after the fourth one
    Symbol p = Symbol::parse("scip-go gomod demo v1.0.0 demo/F().param x");
    assert(p.descriptor == "demo/F().param x");
    assert(p.format() == "scip-go gomod demo v1.0.0 demo/F().param x");

    assert(!Symbol::try_parse("local 3"));
    assert(!Symbol::try_parse("a b c d"));
    assert(!Symbol::try_parse("a  b c d e"));
    assert(!Symbol::try_parse("a b c d "));
    assert(!Symbol::try_parse(""));

    // Spaces in the package fields are doubled, empty ones written as "."
    Symbol spaced = Symbol::build("my project", "v0.0.0", "`my project`/F().");
    assert(spaced.format() == "scip-go gomod my  project v0.0.0 `my project`/F().");
    Symbol reparsed = Symbol::parse(spaced.format());
    assert(reparsed.package_name == "my project");
    assert(reparsed.package_version == "v0.0.0");
    assert(reparsed.descriptor == "`my project`/F().");
    assert(reparsed == spaced);

    Symbol unversioned = Symbol::build("demo", "", "demo/F().");
    assert(unversioned.format() == "scip-go gomod demo . demo/F().");
    auto back = Symbol::try_parse(unversioned.format());
    assert(back && back->package_version.empty() && *back == unversioned);

    bool thrown = false;
    try {
        Symbol::parse("local 3");
    } catch (const MalformedSymbol& e) {
        thrown = true;
        assert(e.input() == "local 3");
    }
    assert(thrown);

    std::cout << "  PASS" << std::endl;
}

void test_descriptors() {
    std::cout << "Testing descriptor helpers..." << std::endl;

    assert(descriptor::escape("Server") == "Server");
    assert(descriptor::escape("example.com/x") == "`example.com/x`");
    assert(descriptor::namespace_("example.com/x") == "`example.com/x`/");
    assert(descriptor::escape("a`b") == "`a``b`");
    assert(descriptor::unescape("`a``b`") == "a`b");
    assert(descriptor::type("Server") == "Server#");
    assert(descriptor::method("Start") == "Start().");
    assert(descriptor::term("addr") == "addr.");
    assert(descriptor::param("x") == "param x");
    assert(descriptor::local("y") == "local y");

    auto m = descriptor::split_last("demo/Server#Start().");
    assert(m && m->kind == SymbolKind::Method && m->name == "Start" && m->owner == "demo/Server#");

    auto f = descriptor::split_last("demo/F().");
    assert(f && f->kind == SymbolKind::Function && f->owner == "demo/");

    auto t = descriptor::split_last("demo/Server#");
    assert(t && t->kind == SymbolKind::Type && t->name == "Server");

    auto field = descriptor::split_last("demo/Server#addr.");
    assert(field && field->kind == SymbolKind::Field && field->owner == "demo/Server#");

    auto var = descriptor::split_last("demo/debug.");
    assert(var && var->kind == SymbolKind::Variable);

    auto param = descriptor::split_last("demo/F().param x");
    assert(param && param->kind == SymbolKind::Parameter && param->owner == "demo/F()." &&
           param->name == "x");

    auto pkg = descriptor::split_last("`example.com/x`/");
    assert(pkg && pkg->kind == SymbolKind::Package && pkg->name == "example.com/x" &&
           pkg->owner.empty());

    auto nested = descriptor::split_last("`example.com/x`/F().");
    assert(nested && nested->owner == "`example.com/x`/" && nested->name == "F");

    assert(descriptor::kind_of("demo/Server#Start().") == SymbolKind::Method);
    assert(descriptor::display_name("demo/Server#Start().") == "Start");

    std::cout << "  PASS" << std::endl;
}

void test_byte_offsets() {
    std::cout << "Testing byte offsets and hashing..." << std::endl;

    std::string content = "package demo\n\nfunc F() {}\n";
    auto lines = split_lines(content);
    assert(lines.size() == 3);
    assert(count_lines(content) == 3);
    assert(byte_offset(lines, 1, 0) == 0);
    assert(byte_offset(lines, 3, 5) == 19);
    assert(content[19] == 'F');
    assert(byte_offset(lines, 0, 0) == -1);
    assert(byte_offset(lines, 10, 0) == -1);

    assert(sha256_hex("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::cout << "  PASS" << std::endl;
}

void test_sqlite_store() {
    std::cout << "Testing SqliteGraphStore..." << std::endl;

    SqliteGraphStore store(":memory:");
    open_memory(store);
    assert(store.write_count() == 0);

    NodeId a = store.merge_node({label::FILE}, {{"path", "/p/a.go"}}, {{"hash", "h1"}});
    NodeId again = store.merge_node({label::FILE}, {{"path", "/p/a.go"}}, {{"hash", "h1"}});
    assert(a == again);
    assert(count_nodes(store, label::FILE) == 1);

    // Unchanged properties write nothing
    uint64_t writes = store.write_count();
    store.merge_node({label::FILE}, {{"path", "/p/a.go"}}, {{"hash", "h1"}});
    assert(store.write_count() == writes);

    store.merge_node({label::FILE}, {{"path", "/p/a.go"}}, {{"hash", "h2"}});
    assert(store.write_count() == writes + 1);
    assert(store.node_props(a)["hash"] == "h2");

    NodeId b = store.create_node({label::REFERENCE}, {{"filePath", "/p/a.go"}});
    store.create_relationship(a, b, rel::CONTAINS, Properties::object());
    assert(count_rels(store, rel::CONTAINS) == 1);

    bool thrown = false;
    try {
        store.create_relationship(a, "999999", rel::CONTAINS, Properties::object());
    } catch (const StoreError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        store.execute_query("SELECT * FROM nodes WHERE id = :id", Properties::object());
    } catch (const StoreError&) {
        thrown = true;
    }
    assert(thrown);

    // Deleting a node takes its relationships along
    store.execute_query("DELETE FROM nodes WHERE id = :id", {{"id", std::stoll(a)}});
    assert(count_rels(store, rel::CONTAINS) == 0);

    StoreStats stats = store.stats();
    assert(stats.node_count == 1);
    assert(stats.rel_count == 0);

    // Latin-1 bytes are stored as U+FFFD, and merging them again is a no-op
    NodeId latin = store.merge_node({label::FUNCTION}, {{"signature", "F()"}, {"filePath", "/p/a.go"}},
                                    {{"docstring", "caf\xe9 helper"}});
    assert(store.node_props(latin)["docstring"] == "caf\xef\xbf\xbd helper");
    writes = store.write_count();
    store.merge_node({label::FUNCTION}, {{"signature", "F()"}, {"filePath", "/p/a.go"}},
                     {{"docstring", "caf\xe9 helper"}});
    assert(store.write_count() == writes);
    store.create_node({label::REFERENCE}, {{"context", "x := \"\xff\""}});

    assert(!store.in_transaction());
    store.execute_query("BEGIN", Properties::object());
    assert(store.in_transaction());
    store.execute_query("ROLLBACK", Properties::object());
    assert(!store.in_transaction());

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing Config..." << std::endl;

    TempProject project("config");
    project.write("codegraph.json",
                  R"({"db": "/tmp/x.db", "service": "svc", "strategy": "scip", "deny": ["vendor"]})");

    Config cfg;
    ConfigResult r = load_config_file(project.path("codegraph.json"), cfg, true);
    assert(r.success && r.loaded);
    assert(cfg.db_path == "/tmp/x.db");
    assert(cfg.service_name == "svc");
    assert(cfg.strategy == Strategy::Scip);
    assert(cfg.deny.size() == 1);

    project.write("bad.json", R"({"strategy": "magic"})");
    Config bad;
    assert(!load_config_file(project.path("bad.json"), bad, true).success);

    Config missing;
    assert(load_config_file(project.path("absent.json"), missing, false).success);
    assert(!load_config_file(project.path("absent.json"), missing, true).success);

    setenv("CODEGRAPH_DB", "/tmp/env.db", 1);
    setenv("CODEGRAPH_VERBOSE", "1", 1);
    apply_environment(cfg);
    assert(cfg.db_path == "/tmp/env.db");
    assert(cfg.verbose);
    unsetenv("CODEGRAPH_DB");
    unsetenv("CODEGRAPH_VERBOSE");

    std::cout << "  PASS" << std::endl;
}

void test_walk() {
    std::cout << "Testing project walk..." << std::endl;

    TempProject project("walk");
    project.write("main.go", "package main\n");
    project.write("main_test.go", "package main\n");
    project.write("pkg/util/util.go", "package util\n");
    project.write("vendor/dep/dep.go", "package dep\n");
    project.write(".git/hooks/x.go", "package x\n");
    project.write("README.md", "# demo\n");

    auto files = walk_go_files(project.root(), default_deny_list());
    assert(files.size() == 2);
    assert(files[0].second == "main.go");
    assert(files[0].first == project.path("main.go"));
    assert(files[1].second == "pkg/util/util.go");

    std::cout << "  PASS" << std::endl;
}

void test_process() {
    std::cout << "Testing process helpers..." << std::endl;

    assert(find_executable("sh").has_value());
    assert(!find_executable("codegraph-no-such-tool").has_value());

    ProcessResult r = run_process("echo hello; exit 3", "/");
    assert(r.exit_status == 3);
    assert(r.output == "hello\n");

    assert(shell_quote("it's") == "'it'\\''s'");

    std::cout << "  PASS" << std::endl;
}

// ---------------------------------------------------------------------------

const char* SERVER_SOURCE = R"(package demo

// Server serves.
type Server struct {
	addr string
	Port int
}

// Start starts the server.
func (s *Server) Start(ctx string, retries int) error {
	return nil
}

func (c *Client) Close() {}

type Client struct{}

type Store interface {
	Get(key string) (string, error)
}

const Limit = 10

var debug bool

func F() {}
)";

void test_native_extraction() {
    std::cout << "Testing native extraction..." << std::endl;

    RunContext ctx;
    ctx.service_name = "demo";
    ctx.service_version = "v1.0.0";

    std::string content = SERVER_SOURCE;
    auto lines = split_lines(content);
    GoExtractor extractor;
    FileGraph graph = extractor.extract(FileInput{"/p/server.go", "server.go", content, lines}, ctx);

    assert(graph.package_name == "demo");
    assert(graph.module_fqn == "demo");
    assert(graph.extractor == std::string(version::NATIVE_EXTRACTOR));

    const auto* server = find_def(graph, "Server");
    assert(server && server->kind == SymbolKind::Type);
    assert(server->signature == "type Server struct");
    assert(server->symbol == demo_symbol("demo/Server#"));
    assert(server->docstring == "Server serves.");
    assert(server->exported);
    assert(server->span.start_line == 4);

    const auto* addr = find_def(graph, "addr");
    assert(addr && addr->kind == SymbolKind::Field);
    assert(addr->signature == "Server.addr string");
    assert(addr->symbol == demo_symbol("demo/Server#addr."));
    assert(!addr->exported);
    assert(graph.definitions[addr->parent].name == "Server");

    const auto* start = find_def(graph, "Start");
    assert(start && start->kind == SymbolKind::Method);
    assert(start->signature == "(*Server) Start(ctx string, retries int) error");
    assert(start->symbol == demo_symbol("demo/Server#Start()."));
    assert(start->return_type == "error");
    assert(start->docstring == "Start starts the server.");
    assert(start->parent >= 0 && graph.definitions[start->parent].name == "Server");
    assert(start->span.start_line == 10);
    assert(start->span.start_column == 0);
    assert(content.compare(start->span.start_byte, 4, "func") == 0);

    const auto* ctx_param = find_def(graph, "ctx");
    assert(ctx_param && ctx_param->kind == SymbolKind::Parameter);
    assert(ctx_param->signature == start->signature + " param ctx");
    assert(ctx_param->symbol == demo_symbol("demo/Server#Start().param ctx"));
    assert(ctx_param->param_index == 0);
    assert(find_def(graph, "retries")->param_index == 1);

    // Client is declared after the method, so Close stays under the module
    const auto* close = find_def(graph, "Close");
    assert(close && close->parent == -1);
    assert(close->symbol == demo_symbol("demo/Client#Close()."));

    const auto* store = find_def(graph, "Store");
    assert(store && store->kind == SymbolKind::Interface);
    assert(store->signature == "type Store interface");

    const auto* get = find_def(graph, "Get");
    assert(get && get->signature == "Store.Get(key string) (string, error)");
    assert(graph.definitions[get->parent].name == "Store");

    const auto* limit = find_def(graph, "Limit");
    assert(limit && limit->kind == SymbolKind::Constant && limit->constant);
    assert(limit->symbol == demo_symbol("demo/Limit."));

    const auto* debug = find_def(graph, "debug");
    assert(debug && debug->kind == SymbolKind::Variable);
    assert(debug->signature == "var debug bool");

    const auto* f = find_def(graph, "F");
    assert(f && f->signature == "F()");
    assert(f->symbol == demo_symbol("demo/F()."));

    bool thrown = false;
    std::string broken = "package demo\n\nfunc {\n";
    auto broken_lines = split_lines(broken);
    try {
        extractor.extract(FileInput{"/p/bad.go", "bad.go", broken, broken_lines}, ctx);
    } catch (const ExtractError&) {
        thrown = true;
    }
    assert(thrown);

    assert(clean_doc_comment("// hello") == "hello");
    assert(clean_doc_comment("/* a\n * b\n */") == "a b");

    std::cout << "  PASS" << std::endl;
}

void test_one_file_scenario() {
    std::cout << "Testing one-file index, re-run and edit..." << std::endl;

    TempProject project("onefile");
    project.write("a.go", "package demo\n\nfunc F() {}\n");

    SqliteGraphStore store(":memory:");
    open_memory(store);
    GoExtractor extractor;
    SyncEngine engine(store, extractor, demo_service());

    RunResult first = engine.run(project.root());
    assert(first.indexed == 1);
    assert(first.failed == 0);
    assert(count_nodes(store, label::SERVICE) == 1);
    assert(count_nodes(store, label::FILE) == 1);
    assert(count_nodes(store, label::MODULE) == 1);
    assert(count_nodes(store, label::FUNCTION) == 1);
    assert(count_nodes(store, label::SYMBOL) == 1);
    assert(count_rels(store, rel::CONTAINS) == 3);
    assert(count_rels(store, rel::DEFINES) == 1);
    assert(prop_values(store, label::SYMBOL, "symbol")[0] == "scip-go gomod demo v1.0.0 demo/F().");
    assert(prop_values(store, label::FILE, "path")[0] == project.path("a.go"));
    assert(prop_values(store, label::FILE, "hash")[0] == sha256_hex("package demo\n\nfunc F() {}\n"));

    std::string service_id = node_id(store, label::SERVICE, "name", "demo");
    std::string module_id = node_id(store, label::MODULE, "fqn", "demo");

    // Nothing changed: nothing written
    RunResult second = engine.run(project.root());
    assert(second.indexed == 0);
    assert(second.skipped == 1);
    assert(second.writes == 0);

    project.write("a.go", "package demo\n\nfunc G() {}\n");
    RunResult third = engine.run(project.root());
    assert(third.indexed == 1);
    assert(third.pruned_symbols == 1);
    assert(count_nodes(store, label::FUNCTION) == 1);
    assert(prop_values(store, label::FUNCTION, "name")[0] == "G");
    assert(count_nodes(store, label::SYMBOL) == 1);
    assert(count_nodes(store, label::FILE) == 1);
    assert(node_id(store, label::SERVICE, "name", "demo") == service_id);
    assert(node_id(store, label::MODULE, "fqn", "demo") == module_id);

    std::cout << "  PASS" << std::endl;
}

void test_incremental() {
    std::cout << "Testing incremental re-index..." << std::endl;

    TempProject project("incremental");
    project.write("a.go", "package demo\n\nfunc A() {}\n");
    project.write("b.go", "package demo\n\nfunc B() {}\n");

    SqliteGraphStore store(":memory:");
    open_memory(store);
    GoExtractor extractor;
    SyncEngine engine(store, extractor, demo_service());

    assert(engine.run(project.root()).indexed == 2);
    std::string a_id = node_id(store, label::FUNCTION, "name", "A");

    project.write("b.go", "package demo\n\nfunc B(x int) {}\n");
    RunResult r = engine.run(project.root());
    assert(r.indexed == 1);
    assert(r.skipped == 1);
    assert(node_id(store, label::FUNCTION, "name", "A") == a_id);
    assert(prop_values(store, label::FUNCTION, "signature") ==
           (std::vector<std::string>{"A()", "B(x int)"}));
    assert(count_nodes(store, label::PARAMETER) == 1);
    assert(parent_label(store, label::PARAMETER, "x") == label::FUNCTION);

    std::cout << "  PASS" << std::endl;
}

void test_deletion() {
    std::cout << "Testing deletion of vanished files..." << std::endl;

    TempProject project("deletion");
    project.write("a.go", "package demo\n\nfunc A() {}\n");
    project.write("b.go", "package demo\n\nvar B = 1\n");
    project.write("sub/c.go", "package sub\n\ntype C struct{}\n");

    SqliteGraphStore store(":memory:");
    open_memory(store);
    GoExtractor extractor;
    SyncEngine engine(store, extractor, demo_service());

    assert(engine.run(project.root()).indexed == 3);
    assert(count_nodes(store, label::MODULE) == 2);
    assert(node_id(store, label::MODULE, "fqn", "demo/sub") != "");
    assert(prop_values(store, label::SYMBOL, "symbol") ==
           (std::vector<std::string>{"scip-go gomod demo v1.0.0 `demo/sub`/C#",
                                     "scip-go gomod demo v1.0.0 demo/A().",
                                     "scip-go gomod demo v1.0.0 demo/B."}));

    project.remove("b.go");
    project.remove("sub/c.go");
    RunResult r = engine.run(project.root());
    assert(r.removed == 2);
    assert(r.skipped == 1);
    assert(count_nodes(store, label::FILE) == 1);
    assert(count_nodes(store, label::VARIABLE) == 0);
    assert(count_nodes(store, label::CLASS) == 0);
    assert(count_nodes(store, label::MODULE) == 1);
    assert(count_nodes(store, label::SYMBOL) == 1);
    assert(r.pruned_modules == 1);

    auto rows = store.execute_query(
        "SELECT COUNT(*) AS n FROM nodes WHERE json_extract(props, '$.filePath') = :path",
        {{"path", project.path("b.go")}});
    assert(rows[0]["n"].get<int64_t>() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_parse_failure() {
    std::cout << "Testing parse failures..." << std::endl;

    TempProject project("parsefail");
    project.write("good.go", "package demo\n\nfunc Good() {}\n");
    project.write("bad.go", "package demo\n\nfunc {\n");

    SqliteGraphStore store(":memory:");
    open_memory(store);
    GoExtractor extractor;
    SyncEngine engine(store, extractor, demo_service());

    RunResult r = engine.run(project.root());
    assert(r.indexed == 1);
    assert(r.failed == 1);
    assert(r.errors.size() == 1);
    assert(r.errors[0].first == project.path("bad.go"));
    assert(count_nodes(store, label::FILE) == 1);

    // Breaking an indexed file keeps what it had, and it is retried next run
    project.write("good.go", "package demo\n\nfunc Good( {}\n");
    r = engine.run(project.root());
    assert(r.failed == 2);
    assert(r.removed == 0);
    assert(node_id(store, label::FUNCTION, "name", "Good") != "");

    project.write("good.go", "package demo\n\nfunc Good() {}\n\nfunc More() {}\n");
    r = engine.run(project.root());
    assert(r.indexed == 1);
    assert(count_nodes(store, label::FUNCTION) == 2);

    std::cout << "  PASS" << std::endl;
}

void test_method_owner() {
    std::cout << "Testing method ownership and duplicate signatures..." << std::endl;

    TempProject project("owner");
    project.write("server.go", SERVER_SOURCE);
    project.write("init.go", "package demo\n\nfunc init() {}\n\nfunc init() {}\n");

    SqliteGraphStore store(":memory:");
    open_memory(store);
    GoExtractor extractor;
    SyncEngine engine(store, extractor, demo_service());

    RunResult r = engine.run(project.root());
    assert(r.indexed == 2);
    assert(r.entity_errors == 0);

    assert(parent_label(store, label::METHOD, "Start") == label::CLASS);
    assert(parent_label(store, label::METHOD, "Close") == label::MODULE);
    assert(parent_label(store, label::METHOD, "Get") == label::INTERFACE);
    assert(parent_label(store, label::VARIABLE, "addr") == label::CLASS);
    assert(parent_label(store, label::CLASS, "Server") == label::MODULE);

    // Two init funcs share a signature: one node, one DEFINES
    assert(count_nodes(store, label::FUNCTION) == 2);
    auto rows = store.execute_query(
        "SELECT COUNT(*) AS n FROM rels r JOIN nodes f ON f.id = r.src "
        "WHERE r.type = 'DEFINES' AND json_extract(f.props, '$.name') = 'init'",
        Properties::object());
    assert(rows[0]["n"].get<int64_t>() == 1);

    // Every definition has exactly one DEFINES
    rows = store.execute_query(
        "SELECT COUNT(*) AS n FROM nodes d WHERE d.labels IN "
        "('Function', 'Method', 'Class', 'Interface', 'Variable', 'Parameter') "
        "AND (SELECT COUNT(*) FROM rels r WHERE r.src = d.id AND r.type = 'DEFINES') != 1",
        Properties::object());
    assert(rows[0]["n"].get<int64_t>() == 0);

    std::cout << "  PASS" << std::endl;
}

// ---------------------------------------------------------------------------

// Forwards to a real store but fails the first DEFINES relationship. With
// abort_transaction the store's transaction is rolled back first, the way
// SQLite does on a full disk or an I/O error.
class FaultyStore : public GraphStore {
public:
    FaultyStore(GraphStore& inner, bool abort_transaction)
        : inner_(inner), abort_transaction_(abort_transaction) {}

    bool armed = true;

    NodeId merge_node(const std::vector<std::string>& labels, const Properties& match_props,
                      const Properties& set_props) override {
        return inner_.merge_node(labels, match_props, set_props);
    }
    NodeId create_node(const std::vector<std::string>& labels, const Properties& props) override {
        return inner_.create_node(labels, props);
    }
    RelId create_relationship(const NodeId& from, const NodeId& to, const std::string& type,
                              const Properties& props) override {
        if (armed && type == rel::DEFINES) {
            armed = false;
            if (abort_transaction_) {
                inner_.execute_query("ROLLBACK", Properties::object());
                throw StoreError("disk I/O error");
            }
            throw StoreError("constraint failed");
        }
        return inner_.create_relationship(from, to, type, props);
    }
    std::vector<Record> execute_query(const std::string& text, const Properties& params) override {
        return inner_.execute_query(text, params);
    }
    uint64_t write_count() const override { return inner_.write_count(); }
    bool in_transaction() const override { return inner_.in_transaction(); }
    StoreStats stats() override { return inner_.stats(); }

private:
    GraphStore& inner_;
    bool abort_transaction_;
};

void test_entity_errors() {
    std::cout << "Testing per-entity write failures..." << std::endl;

    TempProject project("entity");
    project.write("a.go", "package demo\n\nfunc A() {}\n\nfunc B() {}\n");

    SqliteGraphStore sqlite(":memory:");
    open_memory(sqlite);
    FaultyStore store(sqlite, false);
    GoExtractor extractor;
    SyncEngine engine(store, extractor, demo_service());

    RunResult r = engine.run(project.root());
    assert(r.indexed == 1);
    assert(r.failed == 0);
    assert(r.entity_errors == 1);
    assert(!sqlite.in_transaction());

    // The rest of the file is committed
    assert(count_nodes(sqlite, label::FUNCTION) == 2);
    assert(count_rels(sqlite, rel::DEFINES) == 1);
    assert(prop_values(sqlite, label::SYMBOL, "symbol") ==
           (std::vector<std::string>{demo_symbol("demo/B().")}));
    assert(count_nodes(sqlite, label::FILE) == 1);

    std::cout << "  PASS" << std::endl;
}

void test_aborted_transaction() {
    std::cout << "Testing a transaction the store rolled back..." << std::endl;

    TempProject project("aborted");
    project.write("a.go", "package demo\n\nfunc A() {}\n");
    project.write("b.go", "package demo\n\nfunc B() {}\n");

    SqliteGraphStore sqlite(":memory:");
    open_memory(sqlite);
    FaultyStore store(sqlite, true);
    GoExtractor extractor;
    SyncEngine engine(store, extractor, demo_service());

    RunResult r = engine.run(project.root());
    assert(r.failed == 1);
    assert(r.errors.size() == 1);
    assert(r.errors[0].first == project.path("a.go"));
    assert(!sqlite.in_transaction());

    // b.go must not reuse the Module created by a.go's lost transaction
    assert(r.indexed == 1);
    assert(count_nodes(sqlite, label::FILE) == 1);
    assert(count_nodes(sqlite, label::MODULE) == 1);
    assert(prop_values(sqlite, label::FUNCTION, "name") == (std::vector<std::string>{"B"}));
    assert(parent_label(sqlite, label::FUNCTION, "B") == label::MODULE);
    auto rows = sqlite.execute_query(
        "SELECT COUNT(*) AS n FROM nodes WHERE json_extract(props, '$.filePath') = :path",
        {{"path", project.path("a.go")}});
    assert(rows[0]["n"].get<int64_t>() == 0);

    // Nothing was recorded for a.go, so the next run picks it up
    r = engine.run(project.root());
    assert(r.indexed == 1);
    assert(r.skipped == 1);
    assert(count_nodes(sqlite, label::FUNCTION) == 2);

    std::cout << "  PASS" << std::endl;
}

// Native extraction plus Latin-1 text, as left by editors in comments
class Latin1Extractor : public Extractor {
public:
    const char* name() const override { return inner_.name(); }
    void prepare(const RunContext& ctx) override { inner_.prepare(ctx); }
    FileGraph extract(const FileInput& input, const RunContext& ctx) override {
        FileGraph graph = inner_.extract(input, ctx);
        if (!graph.definitions.empty()) {
            graph.definitions[0].docstring = "caf\xe9 helper";
            ReferenceRecord ref;
            ref.symbol = graph.definitions[0].symbol;
            ref.span = graph.definitions[0].span;
            ref.context = "// r\xe9sum\xe9";
            graph.references.push_back(ref);
        }
        return graph;
    }

private:
    GoExtractor inner_;
};

void test_invalid_utf8_text() {
    std::cout << "Testing non-UTF-8 source text..." << std::endl;

    TempProject project("latin1");
    project.write("a.go", "package demo\n\nfunc A() {}\n");
    project.write("b.go", "package demo\n\nfunc B() {}\n");

    SqliteGraphStore store(":memory:");
    open_memory(store);
    Latin1Extractor extractor;
    SyncEngine engine(store, extractor, demo_service());

    RunResult r = engine.run(project.root());
    assert(r.indexed == 2);
    assert(r.failed == 0);
    assert(r.entity_errors == 0);
    assert(!store.in_transaction());
    assert(count_nodes(store, label::REFERENCE) == 2);

    json a = store.node_props(node_id(store, label::FUNCTION, "name", "A"));
    assert(a["docstring"] == "caf\xef\xbf\xbd helper");

    RunResult again = engine.run(project.root());
    assert(again.skipped == 2);
    assert(again.writes == 0);

    std::cout << "  PASS" << std::endl;
}

// ---------------------------------------------------------------------------

scip::Document* add_document(scip::Index& index, const std::string& path) {
    scip::Document* doc = index.add_documents();
    doc->set_relative_path(path);
    doc->set_language("go");
    return doc;
}

void add_occurrence(scip::Document* doc, const std::string& symbol,
                    std::initializer_list<int> range, bool definition) {
    scip::Occurrence* occ = doc->add_occurrences();
    occ->set_symbol(symbol);
    for (int v : range) occ->add_range(v);
    occ->set_symbol_roles(definition ? scip::Definition : scip::ReadAccess);
}

void add_info(google::protobuf::RepeatedPtrField<scip::SymbolInformation>* infos,
              const std::string& symbol, scip::SymbolInformation_Kind kind,
              const std::string& display, const std::string& doc_text = "") {
    scip::SymbolInformation* info = infos->Add();
    info->set_symbol(symbol);
    info->set_kind(kind);
    info->set_display_name(display);
    if (!doc_text.empty()) info->add_documentation(doc_text);
}

const char* SCIP_SOURCE =
    "package demo\n"
    "\n"
    "// F does things.\n"
    "func F() {\n"
    "\tfmt.Println(\"hi\")\n"
    "}\n"
    "\n"
    "func G() { F() }\n";

scip::Index scip_demo_index() {
    scip::Index index;
    index.mutable_metadata()->mutable_tool_info()->set_name("scip-go");

    std::string println = "scip-go gomod github.com/golang/go/src go1.22 fmt/Println().";
    scip::Document* doc = add_document(index, "a.go");
    add_occurrence(doc, demo_symbol("demo/"), {0, 8, 12}, true);
    add_occurrence(doc, demo_symbol("demo/F()."), {3, 5, 6}, true);
    add_occurrence(doc, "local 0", {4, 1, 4}, true);
    add_occurrence(doc, println, {4, 5, 12}, false);
    add_occurrence(doc, demo_symbol("demo/G()."), {7, 5, 6}, true);
    add_occurrence(doc, demo_symbol("demo/F()."), {7, 11, 12}, false);

    add_info(doc->mutable_symbols(), demo_symbol("demo/"), scip::SymbolInformation_Kind_Package, "demo");
    add_info(doc->mutable_symbols(), demo_symbol("demo/F()."), scip::SymbolInformation_Kind_Function,
             "F", "F does things.");
    add_info(doc->mutable_symbols(), demo_symbol("demo/G()."), scip::SymbolInformation_Kind_Function, "G");
    add_info(index.mutable_external_symbols(), println, scip::SymbolInformation_Kind_Function,
             "Println", "Println formats using the default formats.");
    // Declared by the index but used nowhere in the project
    add_info(index.mutable_external_symbols(),
             "scip-go gomod github.com/golang/go/src go1.22 strings/Join().",
             scip::SymbolInformation_Kind_Function, "Join", "Join concatenates the elements.");
    return index;
}

void test_scip_projection() {
    std::cout << "Testing SCIP projection..." << std::endl;

    TempProject project("scip");
    project.write("a.go", SCIP_SOURCE);

    SqliteGraphStore store(":memory:");
    open_memory(store);
    ScipExtractor extractor;
    extractor.set_index(ScipIndex::from_message(scip_demo_index()));
    SyncEngine engine(store, extractor, demo_service());

    RunResult r = engine.run(project.root());
    assert(r.indexed == 1);
    assert(r.failed == 0);
    assert(count_nodes(store, label::FUNCTION) == 2);
    assert(count_nodes(store, label::REFERENCE) == 2);
    assert(count_rels(store, rel::REFERENCES) == 2);
    // F, G and the external Println and Join; the package symbol is not a
    // definition
    assert(count_nodes(store, label::SYMBOL) == 4);
    std::string join_id = node_id(store, label::SYMBOL, "displayName", "Join");
    assert(join_id != "");
    json join = store.node_props(join_id);
    assert(join["kind"] == "Function");
    assert(join["documentation"] == "Join concatenates the elements.");
    assert(join["isExternal"] == true);
    assert(r.pruned_symbols == 0);
    assert(prop_values(store, label::MODULE, "name")[0] == "demo");
    assert(prop_values(store, label::FILE, "extractor")[0] == version::SCIP_EXTRACTOR);

    std::string f_symbol = demo_symbol("demo/F().");
    std::string f_id = node_id(store, label::FUNCTION, "signature", f_symbol);
    assert(f_id != "");
    json f = store.node_props(f_id);
    assert(f["name"] == "F");
    assert(f["startLine"] == 4);
    assert(f["startColumn"] == 5);
    assert(f["startByte"] == byte_offset(split_lines(SCIP_SOURCE), 4, 5));
    assert(f["docstring"] == "F does things.");

    auto refs = store.execute_query(
        "SELECT json_extract(props, '$.startLine') AS line, json_extract(props, '$.context') AS context, "
        "json_extract(props, '$.startByte') AS byte "
        "FROM nodes WHERE labels = 'Reference' ORDER BY line", Properties::object());
    assert(refs.size() == 2);
    assert(refs[0]["line"] == 5);
    assert(refs[0]["context"] == "fmt.Println(\"hi\")");
    assert(static_cast<size_t>(refs[0]["byte"].get<int64_t>()) == std::string(SCIP_SOURCE).find("Println"));
    assert(refs[1]["line"] == 8);

    auto docs = store.execute_query(
        "SELECT json_extract(props, '$.documentation') AS doc FROM nodes "
        "WHERE labels = 'Symbol' AND json_extract(props, '$.displayName') = 'Println'",
        Properties::object());
    assert(docs.size() == 1);
    assert(docs[0]["doc"] == "Println formats using the default formats.");

    // Re-running the same index is a no-op
    RunResult again = engine.run(project.root());
    assert(again.indexed == 0);
    assert(again.writes == 0);
    assert(count_nodes(store, label::SYMBOL) == 4);

    std::cout << "  PASS" << std::endl;
}

void test_cross_strategy_identity() {
    std::cout << "Testing cross-strategy symbol identity..." << std::endl;

    TempProject project("identity");
    project.write("a.go",
                  "package demo\n"
                  "\n"
                  "type Server struct{}\n"
                  "\n"
                  "func (s *Server) Start() {}\n"
                  "\n"
                  "func F() {}\n");

    SqliteGraphStore native_store(":memory:");
    open_memory(native_store);
    GoExtractor native;
    SyncEngine native_engine(native_store, native, demo_service());
    assert(native_engine.run(project.root()).indexed == 1);

    scip::Index index;
    scip::Document* doc = add_document(index, "a.go");
    add_occurrence(doc, demo_symbol("demo/"), {0, 8, 12}, true);
    add_occurrence(doc, demo_symbol("demo/Server#"), {2, 5, 11}, true);
    add_occurrence(doc, demo_symbol("demo/Server#Start()."), {4, 17, 22}, true);
    add_occurrence(doc, demo_symbol("demo/F()."), {6, 5, 6}, true);
    add_info(doc->mutable_symbols(), demo_symbol("demo/Server#"), scip::SymbolInformation_Kind_Struct, "Server");
    add_info(doc->mutable_symbols(), demo_symbol("demo/Server#Start()."), scip::SymbolInformation_Kind_Method, "Start");

    SqliteGraphStore scip_store(":memory:");
    open_memory(scip_store);
    ScipExtractor scip_extractor;
    scip_extractor.set_index(ScipIndex::from_message(std::move(index)));
    SyncEngine scip_engine(scip_store, scip_extractor, demo_service());
    assert(scip_engine.run(project.root()).indexed == 1);

    auto native_symbols = prop_values(native_store, label::SYMBOL, "symbol");
    auto scip_symbols = prop_values(scip_store, label::SYMBOL, "symbol");
    assert(native_symbols.size() == 3);
    assert(native_symbols == scip_symbols);

    // Kind inferred from the descriptor when the index has no information
    assert(count_nodes(scip_store, label::FUNCTION) == 1);
    assert(count_nodes(scip_store, label::METHOD) == 1);
    assert(count_nodes(scip_store, label::CLASS) == 1);
    assert(parent_label(scip_store, label::METHOD, "Start") == label::CLASS);

    std::cout << "  PASS" << std::endl;
}

void test_scip_index_load() {
    std::cout << "Testing SCIP index decoding..." << std::endl;

    TempProject project("scipload");
    {
        std::ofstream out(project.path("index.scip"), std::ios::binary);
        assert(scip_demo_index().SerializeToOstream(&out));
    }
    ScipIndex index = ScipIndex::load(project.path("index.scip"));
    assert(index.document_count() == 1);
    assert(index.document("a.go") != nullptr);
    assert(index.document("b.go") == nullptr);
    assert(index.symbol_info("scip-go gomod github.com/golang/go/src go1.22 fmt/Println().") != nullptr);
    assert(index.metadata() && index.metadata()->tool_info().name() == "scip-go");

    bool thrown = false;
    try {
        ScipIndex::load(project.path("missing.scip"));
    } catch (const FatalError&) {
        thrown = true;
    }
    assert(thrown);

    assert(kind_from_scip(scip::SymbolInformation_Kind_Struct, "demo/S#") == SymbolKind::Type);
    assert(kind_from_scip(0, "demo/S#M().") == SymbolKind::Method);
    assert(kind_from_scip(scip::SymbolInformation_Kind_UnspecifiedKind, "demo/F().") ==
           SymbolKind::Function);
    // A kind Go has no counterpart for is a Variable, whatever the descriptor
    assert(kind_from_scip(scip::SymbolInformation_Kind_Array, "demo/S#M().") == SymbolKind::Variable);
    assert(index.external_symbols().size() == 2);

    std::cout << "  PASS" << std::endl;
}

// ---------------------------------------------------------------------------

// Cancels its engine as soon as one file has been extracted
class CancellingExtractor : public Extractor {
public:
    explicit CancellingExtractor(Extractor& inner) : inner_(inner) {}
    SyncEngine* engine = nullptr;

    const char* name() const override { return inner_.name(); }
    void prepare(const RunContext& ctx) override { inner_.prepare(ctx); }
    FileGraph extract(const FileInput& input, const RunContext& ctx) override {
        FileGraph graph = inner_.extract(input, ctx);
        if (engine) engine->cancel();
        return graph;
    }

private:
    Extractor& inner_;
};

void test_cancellation() {
    std::cout << "Testing cancellation..." << std::endl;

    TempProject project("cancel");
    project.write("a.go", "package demo\n\nfunc A() {}\n");
    project.write("b.go", "package demo\n\nfunc B() {}\n");
    project.write("c.go", "package demo\n\nfunc C() {}\n");

    SqliteGraphStore store(":memory:");
    open_memory(store);
    GoExtractor native;
    CancellingExtractor extractor(native);
    SyncEngine engine(store, extractor, demo_service());
    extractor.engine = &engine;

    RunResult r = engine.run(project.root());
    assert(r.cancelled);
    assert(r.indexed == 1);
    assert(count_nodes(store, label::FILE) == 1);

    extractor.engine = nullptr;
    engine.reset_cancel();
    r = engine.run(project.root());
    assert(!r.cancelled);
    assert(r.indexed == 2);
    assert(r.skipped == 1);

    // A cancelled run leaves vanished files alone
    project.remove("c.go");
    engine.cancel();
    r = engine.run(project.root());
    assert(r.cancelled);
    assert(r.removed == 0);
    assert(count_nodes(store, label::FILE) == 3);

    engine.reset_cancel();
    r = engine.run(project.root());
    assert(r.removed == 1);
    assert(count_nodes(store, label::FILE) == 2);

    std::cout << "  PASS" << std::endl;
}

void test_fatal_errors() {
    std::cout << "Testing fatal errors..." << std::endl;

    TempProject project("fatal");
    project.write("a.go", "package demo\n");

    SqliteGraphStore store(":memory:");
    open_memory(store);

    ScipExtractor missing("codegraph-no-such-scip-binary");
    SyncEngine engine(store, missing, demo_service());
    bool thrown = false;
    try {
        engine.run(project.root());
    } catch (const FatalError& e) {
        thrown = true;
        assert(std::string(e.what()).find("not found") != std::string::npos);
    }
    assert(thrown);
    assert(count_nodes(store, label::SERVICE) == 0);
    assert(store.write_count() == 0);

    if (find_executable("false")) {
        ScipExtractor failing("false");
        SyncEngine failing_engine(store, failing, demo_service());
        thrown = false;
        try {
            failing_engine.run(project.root());
        } catch (const FatalError&) {
            thrown = true;
        }
        assert(thrown);
        assert(count_nodes(store, label::SERVICE) == 0);
    }

    GoExtractor native;
    SyncEngine native_engine(store, native, demo_service());
    thrown = false;
    try {
        native_engine.run(project.path("does-not-exist"));
    } catch (const FatalError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== codegraph Tests ===" << std::endl;
    std::cout << "version " << CODEGRAPH_VERSION << ", schema v" << CODEGRAPH_SCHEMA_VERSION << std::endl;
    std::cout << std::endl;

    test_symbol_roundtrip();
    test_descriptors();
    test_byte_offsets();
    test_sqlite_store();
    test_config();
    test_walk();
    test_process();

    std::cout << std::endl;
    std::cout << "=== Extraction and sync ===" << std::endl;
    test_native_extraction();
    test_one_file_scenario();
    test_incremental();
    test_deletion();
    test_parse_failure();
    test_method_owner();
    test_entity_errors();
    test_aborted_transaction();
    test_invalid_utf8_text();
    test_scip_projection();
    test_cross_strategy_identity();
    test_scip_index_load();
    test_cancellation();
    test_fatal_errors();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
