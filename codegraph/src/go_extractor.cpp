#include <codegraph/go_extractor.hpp>
#include <codegraph/log.hpp>
#include <codegraph/version.hpp>
#include <tree_sitter/api.h>
#include <cstring>
#include <unordered_map>

extern "C" {
    const TSLanguage* tree_sitter_go();
}

namespace codegraph {

namespace {

std::string get_node_text(TSNode node, const std::string& source) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (end > source.size()) end = static_cast<uint32_t>(source.size());
    if (start >= end) return "";
    return source.substr(start, end - start);
}

TSNode find_child_by_field(TSNode node, const char* field) {
    return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(strlen(field)));
}

bool is_type(TSNode node, const char* type) {
    return !ts_node_is_null(node) && strcmp(ts_node_type(node), type) == 0;
}

// All children stored under `field` ("name" repeats in `a, b int`)
std::vector<TSNode> children_by_field(TSNode node, const char* field) {
    std::vector<TSNode> out;
    TSTreeCursor cursor = ts_tree_cursor_new(node);
    if (ts_tree_cursor_goto_first_child(&cursor)) {
        do {
            const char* name = ts_tree_cursor_current_field_name(&cursor);
            if (name && strcmp(name, field) == 0) {
                out.push_back(ts_tree_cursor_current_node(&cursor));
            }
        } while (ts_tree_cursor_goto_next_sibling(&cursor));
    }
    ts_tree_cursor_delete(&cursor);
    return out;
}

// `type (...)`, `var (...)`, `const (...)`
bool is_grouped(TSNode decl) {
    uint32_t count = ts_node_child_count(decl);
    for (uint32_t i = 0; i < count; i++) {
        TSNode child = ts_node_child(decl, i);
        if (strcmp(ts_node_type(child), "(") == 0 || strcmp(ts_node_type(child), "var_spec_list") == 0) {
            return true;
        }
    }
    return false;
}

std::vector<TSNode> named_children(TSNode node) {
    std::vector<TSNode> out;
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        out.push_back(ts_node_named_child(node, i));
    }
    return out;
}

// Collapses whitespace runs so multi-line types read as one line
std::string squash(const std::string& text) {
    std::string out;
    bool space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            space = !out.empty();
            continue;
        }
        if (space) out += ' ';
        space = false;
        out += c;
    }
    return out;
}

Span span_of(TSNode node) {
    Span span;
    TSPoint start = ts_node_start_point(node);
    TSPoint end = ts_node_end_point(node);
    span.start_line = static_cast<int>(start.row) + 1;
    span.end_line = static_cast<int>(end.row) + 1;
    span.start_column = static_cast<int>(start.column);
    span.end_column = static_cast<int>(end.column);
    span.start_byte = ts_node_start_byte(node);
    span.end_byte = ts_node_end_byte(node);
    return span;
}

// First type_identifier under a receiver or embedded type (*T, T[K], pkg.T)
std::string base_type_name(TSNode node, const std::string& source) {
    if (ts_node_is_null(node)) return "";
    if (is_type(node, "type_identifier")) return get_node_text(node, source);
    if (is_type(node, "qualified_type")) {
        return base_type_name(find_child_by_field(node, "name"), source);
    }
    if (is_type(node, "generic_type")) {
        return base_type_name(find_child_by_field(node, "type"), source);
    }
    for (TSNode child : named_children(node)) {
        std::string name = base_type_name(child, source);
        if (!name.empty()) return name;
    }
    return "";
}

enum class DeclKind { Function, Method, Type, Var, Const };

struct ParamInfo {
    std::string name;
    std::string type;
    TSNode name_node;
    bool has_name;
};

class FileWalker {
public:
    FileWalker(const std::string& source, FileGraph& graph, const RunContext& ctx)
        : source_(source), graph_(graph), ctx_(ctx)
        , ns_(descriptor::namespace_(graph.module_fqn)) {}

    void walk(TSNode root) {
        struct Entry {
            const char* node_type;
            DeclKind kind;
        };
        static const Entry table[] = {
            {"function_declaration", DeclKind::Function},
            {"method_declaration", DeclKind::Method},
            {"type_declaration", DeclKind::Type},
            {"var_declaration", DeclKind::Var},
            {"const_declaration", DeclKind::Const},
        };
        static const std::unordered_map<std::string, DeclKind> dispatch = [] {
            std::unordered_map<std::string, DeclKind> m;
            for (const auto& e : table) m.emplace(e.node_type, e.kind);
            return m;
        }();

        for (TSNode node : named_children(root)) {
            auto it = dispatch.find(ts_node_type(node));
            if (it == dispatch.end()) continue;
            switch (it->second) {
                case DeclKind::Function: on_function(node); break;
                case DeclKind::Method: on_method(node); break;
                case DeclKind::Type: on_type_declaration(node); break;
                case DeclKind::Var: on_value_declaration(node, false); break;
                case DeclKind::Const: on_value_declaration(node, true); break;
            }
        }
    }

private:
    const std::string& source_;
    FileGraph& graph_;
    const RunContext& ctx_;
    std::string ns_;
    std::unordered_map<std::string, int> types_;  // type name -> definition index

    std::string text(TSNode node) const {
        return ts_node_is_null(node) ? std::string() : get_node_text(node, source_);
    }

    std::string symbol_for(const std::string& desc) const {
        return Symbol::build(ctx_.service_name, ctx_.service_version, desc).format();
    }

    // Contiguous comments right above `node` (trailing comments of the
    // previous line do not count)
    std::string doc_comment(TSNode node) const {
        std::vector<std::string> parts;
        uint32_t expected_row = ts_node_start_point(node).row;
        TSNode prev = ts_node_prev_named_sibling(node);
        while (is_type(prev, "comment")) {
            if (ts_node_end_point(prev).row + 1 != expected_row) break;
            TSNode before = ts_node_prev_named_sibling(prev);
            if (!ts_node_is_null(before) && !is_type(before, "comment") &&
                ts_node_end_point(before).row == ts_node_start_point(prev).row) {
                break;
            }
            parts.push_back(text(prev));
            expected_row = ts_node_start_point(prev).row;
            prev = ts_node_prev_named_sibling(prev);
        }

        std::string out;
        for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
            std::string cleaned = clean_doc_comment(*it);
            if (cleaned.empty()) continue;
            if (!out.empty()) out += ' ';
            out += cleaned;
        }
        return out;
    }

    std::vector<ParamInfo> params_of(TSNode list) const {
        std::vector<ParamInfo> params;
        if (ts_node_is_null(list)) return params;
        for (TSNode decl : named_children(list)) {
            bool variadic = is_type(decl, "variadic_parameter_declaration");
            if (!variadic && !is_type(decl, "parameter_declaration")) continue;

            std::string type = squash(text(find_child_by_field(decl, "type")));
            if (variadic) type = "..." + type;

            auto names = children_by_field(decl, "name");
            if (names.empty()) {
                params.push_back({"", type, TSNode{}, false});
                continue;
            }
            for (TSNode name : names) {
                params.push_back({text(name), type, name, true});
            }
        }
        return params;
    }

    static std::string render_params(const std::vector<ParamInfo>& params) {
        std::string out = "(";
        for (size_t i = 0; i < params.size(); ++i) {
            if (i) out += ", ";
            if (params[i].has_name) {
                out += params[i].name;
                if (!params[i].type.empty()) out += " " + params[i].type;
            } else {
                out += params[i].type;
            }
        }
        return out + ")";
    }

    std::string result_of(TSNode decl) const {
        return squash(text(find_child_by_field(decl, "result")));
    }

    static std::string with_result(std::string sig, const std::string& result) {
        if (!result.empty()) sig += " " + result;
        return sig;
    }

    void add_params(const std::vector<ParamInfo>& params, int owner,
                    const std::string& owner_desc, const std::string& owner_sig) {
        int index = 0;
        for (const auto& p : params) {
            if (!p.has_name || p.name == "_") {
                ++index;
                continue;
            }
            DefinitionRecord def;
            def.kind = SymbolKind::Parameter;
            def.name = p.name;
            def.signature = owner_sig + " param " + p.name;
            def.symbol = symbol_for(owner_desc + descriptor::param(p.name));
            def.type_text = p.type;
            def.span = span_of(p.name_node);
            def.param_index = index++;
            def.parent = owner;
            graph_.add_definition(std::move(def));
        }
    }

    void on_function(TSNode node) {
        TSNode name_node = find_child_by_field(node, "name");
        if (ts_node_is_null(name_node)) return;
        std::string name = text(name_node);

        auto params = params_of(find_child_by_field(node, "parameters"));
        std::string result = result_of(node);

        DefinitionRecord def;
        def.kind = SymbolKind::Function;
        def.name = name;
        def.signature = with_result(name + render_params(params), result);
        std::string desc = ns_ + descriptor::method(name);
        def.symbol = symbol_for(desc);
        def.return_type = result;
        def.docstring = doc_comment(node);
        def.span = span_of(node);
        def.exported = is_exported_name(name);

        std::string sig = def.signature;
        int index = graph_.add_definition(std::move(def));
        add_params(params, index, desc, sig);
    }

    void on_method(TSNode node) {
        TSNode name_node = find_child_by_field(node, "name");
        TSNode receiver = find_child_by_field(node, "receiver");
        if (ts_node_is_null(name_node) || ts_node_is_null(receiver)) return;
        std::string name = text(name_node);

        std::string recv_type;
        std::string recv_name;
        for (TSNode decl : named_children(receiver)) {
            if (!is_type(decl, "parameter_declaration")) continue;
            TSNode type = find_child_by_field(decl, "type");
            recv_type = squash(text(type));
            recv_name = base_type_name(type, source_);
            break;
        }
        if (recv_name.empty()) return;

        auto params = params_of(find_child_by_field(node, "parameters"));
        std::string result = result_of(node);

        DefinitionRecord def;
        def.kind = SymbolKind::Method;
        def.name = name;
        def.signature = with_result("(" + recv_type + ") " + name + render_params(params), result);
        std::string desc = ns_ + descriptor::type(recv_name) + descriptor::method(name);
        def.symbol = symbol_for(desc);
        def.return_type = result;
        def.type_text = recv_type;
        def.docstring = doc_comment(node);
        def.span = span_of(node);
        def.exported = is_exported_name(name);

        auto owner = types_.find(recv_name);
        def.parent = owner != types_.end() ? owner->second : -1;

        std::string sig = def.signature;
        int index = graph_.add_definition(std::move(def));
        add_params(params, index, desc, sig);
    }

    void on_type_declaration(TSNode node) {
        bool grouped = is_grouped(node);
        for (TSNode spec : named_children(node)) {
            if (!is_type(spec, "type_spec") && !is_type(spec, "type_alias")) continue;
            // A lone spec is documented above the `type` keyword
            std::string doc = doc_comment(spec);
            if (doc.empty() && !grouped) doc = doc_comment(node);
            on_type_spec(spec, is_type(spec, "type_alias"), doc);
        }
    }

    void on_type_spec(TSNode spec, bool alias, const std::string& doc) {
        TSNode name_node = find_child_by_field(spec, "name");
        TSNode type_node = find_child_by_field(spec, "type");
        if (ts_node_is_null(name_node)) return;
        std::string name = text(name_node);

        bool is_struct = is_type(type_node, "struct_type");
        bool is_iface = is_type(type_node, "interface_type");

        DefinitionRecord def;
        def.kind = is_iface ? SymbolKind::Interface : SymbolKind::Type;
        def.name = name;
        if (is_struct) def.signature = "type " + name + " struct";
        else if (is_iface) def.signature = "type " + name + " interface";
        else if (alias) def.signature = "type " + name + " = " + squash(text(type_node));
        else def.signature = "type " + name + " " + squash(text(type_node));
        std::string desc = ns_ + descriptor::type(name);
        def.symbol = symbol_for(desc);
        def.docstring = doc;
        def.span = span_of(spec);
        def.exported = is_exported_name(name);
        if (!is_struct && !is_iface) def.type_text = squash(text(type_node));

        int index = graph_.add_definition(std::move(def));
        types_[name] = index;

        if (is_struct) add_fields(type_node, index, name, desc);
        if (is_iface) add_interface_methods(type_node, index, name, desc);
    }

    void add_fields(TSNode struct_type, int owner, const std::string& type_name,
                    const std::string& type_desc) {
        TSNode list{};
        bool found = false;
        for (TSNode child : named_children(struct_type)) {
            if (is_type(child, "field_declaration_list")) {
                list = child;
                found = true;
                break;
            }
        }
        if (!found) return;

        for (TSNode field : named_children(list)) {
            if (!is_type(field, "field_declaration")) continue;
            TSNode type_node = find_child_by_field(field, "type");
            std::string type = squash(text(type_node));
            std::string doc = doc_comment(field);

            auto names = children_by_field(field, "name");
            if (names.empty()) {
                // Embedded field, named after its type
                std::string embedded = base_type_name(type_node, source_);
                if (embedded.empty()) continue;
                add_field(embedded, type, span_of(field), doc, owner, type_name, type_desc);
                continue;
            }
            for (TSNode name : names) {
                add_field(text(name), type, span_of(name), doc, owner, type_name, type_desc);
            }
        }
    }

    void add_field(const std::string& name, const std::string& type, const Span& span,
                   const std::string& doc, int owner, const std::string& type_name,
                   const std::string& type_desc) {
        if (name == "_") return;
        DefinitionRecord def;
        def.kind = SymbolKind::Field;
        def.name = name;
        def.signature = type_name + "." + name + (type.empty() ? "" : " " + type);
        def.symbol = symbol_for(type_desc + descriptor::term(name));
        def.type_text = type;
        def.docstring = doc;
        def.span = span;
        def.exported = is_exported_name(name);
        def.parent = owner;
        graph_.add_definition(std::move(def));
    }

    void add_interface_methods(TSNode iface, int owner, const std::string& iface_name,
                               const std::string& iface_desc) {
        for (TSNode elem : named_children(iface)) {
            if (!is_type(elem, "method_elem") && !is_type(elem, "method_spec")) continue;
            TSNode name_node = find_child_by_field(elem, "name");
            if (ts_node_is_null(name_node)) continue;
            std::string name = text(name_node);

            auto params = params_of(find_child_by_field(elem, "parameters"));
            std::string result = result_of(elem);

            DefinitionRecord def;
            def.kind = SymbolKind::Method;
            def.name = name;
            def.signature = with_result(iface_name + "." + name + render_params(params), result);
            def.symbol = symbol_for(iface_desc + descriptor::method(name));
            def.return_type = result;
            def.type_text = iface_name;
            def.docstring = doc_comment(elem);
            def.span = span_of(elem);
            def.exported = is_exported_name(name);
            def.parent = owner;
            graph_.add_definition(std::move(def));
        }
    }

    void on_value_declaration(TSNode node, bool constant) {
        const char* spec_type = constant ? "const_spec" : "var_spec";
        bool grouped = is_grouped(node);

        for (TSNode child : named_children(node)) {
            if (is_type(child, "var_spec_list")) {
                for (TSNode spec : named_children(child)) {
                    if (is_type(spec, spec_type)) on_value_spec(spec, constant, doc_comment(spec));
                }
                continue;
            }
            if (!is_type(child, spec_type)) continue;
            std::string doc = doc_comment(child);
            if (doc.empty() && !grouped) doc = doc_comment(node);
            on_value_spec(child, constant, doc);
        }
    }

    void on_value_spec(TSNode spec, bool constant, const std::string& doc) {
        std::string type = squash(text(find_child_by_field(spec, "type")));
        for (TSNode name_node : children_by_field(spec, "name")) {
            std::string name = text(name_node);
            if (name == "_") continue;

            DefinitionRecord def;
            def.kind = constant ? SymbolKind::Constant : SymbolKind::Variable;
            def.name = name;
            def.signature = std::string(constant ? "const " : "var ") + name +
                            (type.empty() ? "" : " " + type);
            def.symbol = symbol_for(ns_ + descriptor::term(name));
            def.type_text = type;
            def.docstring = doc;
            def.span = span_of(name_node);
            def.exported = is_exported_name(name);
            def.constant = constant;
            graph_.add_definition(std::move(def));
        }
    }
};

} // namespace

std::string clean_doc_comment(const std::string& raw) {
    std::string body = raw;
    if (body.compare(0, 2, "//") == 0) {
        body = body.substr(2);
    } else if (body.compare(0, 2, "/*") == 0) {
        body = body.substr(2);
        if (body.size() >= 2 && body.compare(body.size() - 2, 2, "*/") == 0) {
            body.resize(body.size() - 2);
        }
    }

    std::string out;
    size_t start = 0;
    while (start <= body.size()) {
        size_t nl = body.find('\n', start);
        std::string line = body.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        size_t b = line.find_first_not_of(" \t\r");
        size_t e = line.find_last_not_of(" \t\r");
        if (b != std::string::npos) {
            line = line.substr(b, e - b + 1);
            if (line[0] == '*') {
                line = line.substr(1);
                size_t s = line.find_first_not_of(" \t");
                line = s == std::string::npos ? "" : line.substr(s);
            }
            if (!line.empty()) {
                if (!out.empty()) out += ' ';
                out += line;
            }
        }
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return out;
}

GoExtractor::GoExtractor() {
    parser_ = ts_parser_new();
    ts_parser_set_language(parser_, tree_sitter_go());
}

GoExtractor::~GoExtractor() {
    if (parser_) ts_parser_delete(parser_);
}

const char* GoExtractor::name() const {
    return version::NATIVE_EXTRACTOR;
}

FileGraph GoExtractor::extract(const FileInput& input, const RunContext& ctx) {
    TSTree* tree = ts_parser_parse_string(parser_, nullptr, input.content.c_str(),
                                          static_cast<uint32_t>(input.content.size()));
    if (!tree) {
        throw ExtractError("tree-sitter could not parse " + input.relative_path);
    }

    TSNode root = ts_tree_root_node(tree);
    if (ts_node_has_error(root)) {
        ts_tree_delete(tree);
        throw ExtractError("syntax errors in " + input.relative_path);
    }

    std::string package;
    for (TSNode child : named_children(root)) {
        if (!is_type(child, "package_clause")) continue;
        for (TSNode id : named_children(child)) {
            if (is_type(id, "package_identifier")) package = get_node_text(id, input.content);
        }
        break;
    }
    if (package.empty()) {
        ts_tree_delete(tree);
        throw ExtractError("no package clause in " + input.relative_path);
    }

    FileGraph graph;
    graph.path = input.path;
    graph.relative_path = input.relative_path;
    graph.extractor = name();
    graph.package_name = package;
    graph.module_fqn = module_fqn(ctx.service_name, relative_dir(input.relative_path));
    graph.line_count = static_cast<int>(input.lines.size());
    graph.size = input.content.size();

    FileWalker walker(input.content, graph, ctx);
    walker.walk(root);
    ts_tree_delete(tree);

    log_debug("native", "%s: package %s, %zu definitions", input.relative_path.c_str(),
              package.c_str(), graph.definitions.size());
    return graph;
}

} // namespace codegraph
