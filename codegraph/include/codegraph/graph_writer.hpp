#pragma once
// GraphWriter: persists one extracted FileGraph
//
//   Service -CONTAINS-> File -CONTAINS-> Module -CONTAINS-> Definition
//   Definition -CONTAINS-> sub-Definition (fields, params, methods)
//   Definition -DEFINES-> Symbol
//   File -CONTAINS-> Reference -REFERENCES-> Symbol
//
// The caller has already removed the file's previous subgraph, so every
// relationship written here is new. Failing to write the File or its Module
// fails the file; a failing definition or reference is logged and counted.

#include "graph_store.hpp"
#include "log.hpp"
#include "model.hpp"
#include "run_context.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace codegraph {

struct WriteStats {
    size_t definitions = 0;
    size_t references = 0;
    size_t entity_errors = 0;
};

class GraphWriter {
public:
    GraphWriter(GraphStore& store, RunContext& ctx) : store_(store), ctx_(ctx) {}

    // Throws StoreError when the File or Module cannot be written, or when
    // the store abandoned the surrounding transaction mid-file
    WriteStats write(const FileGraph& graph, const std::string& hash) {
        WriteStats stats;
        bool transactional = store_.in_transaction();

        NodeId file_id = store_.merge_node(
            {label::FILE}, {{"path", graph.path}},
            {{"hash", hash},
             {"lineCount", graph.line_count},
             {"language", graph.language},
             {"relativePath", graph.relative_path},
             {"size", graph.size},
             {"extractor", graph.extractor}});
        store_.create_relationship(ctx_.service_id, file_id, rel::CONTAINS, Properties::object());

        NodeId module_id = ensure_module(graph);
        store_.create_relationship(file_id, module_id, rel::CONTAINS, Properties::object());

        std::vector<NodeId> ids(graph.definitions.size());
        std::unordered_set<NodeId> written;
        for (size_t i = 0; i < graph.definitions.size(); ++i) {
            const auto& def = graph.definitions[i];
            try {
                NodeId id = store_.merge_node({definition_label(def.kind)},
                                              {{"signature", def.signature}, {"filePath", graph.path}},
                                              definition_props(def));
                ids[i] = id;
                // Same signature twice in one file (several init funcs) is one node
                if (!written.insert(id).second) continue;

                NodeId parent = module_id;
                if (def.parent >= 0 && static_cast<size_t>(def.parent) < i && !ids[def.parent].empty()) {
                    parent = ids[def.parent];
                }
                store_.create_relationship(parent, id, rel::CONTAINS, Properties::object());

                NodeId symbol_id = ensure_symbol(def.symbol, graph, true);
                store_.create_relationship(id, symbol_id, rel::DEFINES,
                                           {{"isExported", def.exported}});
                ++stats.definitions;
            } catch (const StoreError& e) {
                if (transactional && !store_.in_transaction()) throw;
                log_warn("sync", "%s: definition %s: %s", graph.path.c_str(),
                         def.signature.c_str(), e.what());
                ++stats.entity_errors;
            }
        }

        for (const auto& ref : graph.references) {
            try {
                NodeId symbol_id = ensure_symbol(ref.symbol, graph, false);
                NodeId ref_id = store_.create_node(
                    {label::REFERENCE},
                    {{"filePath", graph.path},
                     {"symbol", ref.symbol},
                     {"startLine", ref.span.start_line},
                     {"endLine", ref.span.end_line},
                     {"startColumn", ref.span.start_column},
                     {"endColumn", ref.span.end_column},
                     {"startByte", ref.span.start_byte},
                     {"endByte", ref.span.end_byte},
                     {"context", ref.context}});
                store_.create_relationship(file_id, ref_id, rel::CONTAINS, Properties::object());
                store_.create_relationship(ref_id, symbol_id, rel::REFERENCES,
                                           {{"line", ref.span.start_line},
                                            {"column", ref.span.start_column},
                                            {"isDefinition", ref.is_definition}});
                ++stats.references;
            } catch (const StoreError& e) {
                if (transactional && !store_.in_transaction()) throw;
                log_warn("sync", "%s:%d: reference to %s: %s", graph.path.c_str(),
                         ref.span.start_line, ref.symbol.c_str(), e.what());
                ++stats.entity_errors;
            }
        }

        ctx_.entity_errors += stats.entity_errors;
        return stats;
    }

    // Symbol declared by the whole index rather than a file (SCIP external
    // symbols). Marked external so the end-of-run prune keeps it.
    NodeId declare_symbol(const std::string& symbol, const SymbolInfo& info) {
        NodeId id = store_.merge_node({label::SYMBOL}, {{"symbol", symbol}},
                                      {{"kind", symbol_kind_str(info.kind)},
                                       {"displayName", info.display_name},
                                       {"documentation", info.documentation},
                                       {"isExternal", true}});
        ctx_.symbols[symbol] = id;
        return id;
    }

private:
    GraphStore& store_;
    RunContext& ctx_;

    NodeId ensure_module(const FileGraph& graph) {
        auto it = ctx_.modules.find(graph.module_fqn);
        if (it != ctx_.modules.end()) return it->second;

        std::string name = graph.package_name;
        if (name.empty()) {
            size_t slash = graph.module_fqn.rfind('/');
            name = slash == std::string::npos ? graph.module_fqn : graph.module_fqn.substr(slash + 1);
        }
        NodeId id = store_.merge_node({label::MODULE}, {{"fqn", graph.module_fqn}},
                                      {{"name", name},
                                       {"type", "package"},
                                       {"isExported", name != "main" && name != "internal"}});
        ctx_.modules.emplace(graph.module_fqn, id);
        return id;
    }

    // A defining file always refreshes the Symbol's info; a referencing one
    // only makes sure the node exists
    NodeId ensure_symbol(const std::string& symbol, const FileGraph& graph, bool defining) {
        auto it = ctx_.symbols.find(symbol);
        if (it != ctx_.symbols.end() && !defining) return it->second;

        // Symbols only seen through references carry no info, and must not
        // wipe what their defining file recorded
        Properties set = Properties::object();
        auto info = graph.symbols.find(symbol);
        if (info != graph.symbols.end()) {
            set["kind"] = symbol_kind_str(info->second.kind);
            set["displayName"] = info->second.display_name;
            set["documentation"] = info->second.documentation;
        }
        NodeId id = store_.merge_node({label::SYMBOL}, {{"symbol", symbol}}, set);
        ctx_.symbols[symbol] = id;
        return id;
    }

    static Properties definition_props(const DefinitionRecord& def) {
        Properties props = {
            {"name", def.name},
            {"symbol", def.symbol},
            {"startLine", def.span.start_line},
            {"endLine", def.span.end_line},
            {"startColumn", def.span.start_column},
            {"endColumn", def.span.end_column},
            {"startByte", def.span.start_byte},
            {"endByte", def.span.end_byte},
            {"isExported", def.exported},
            {"docstring", def.docstring}
        };
        switch (def.kind) {
            case SymbolKind::Function:
                props["returnType"] = def.return_type;
                break;
            case SymbolKind::Method:
                props["returnType"] = def.return_type;
                props["receiverType"] = def.type_text;
                break;
            case SymbolKind::Parameter:
                props["type"] = def.type_text;
                props["index"] = def.param_index;
                break;
            case SymbolKind::Field:
                props["type"] = def.type_text;
                props["isConstant"] = false;
                props["scope"] = "field";
                break;
            case SymbolKind::Variable:
            case SymbolKind::Constant:
                props["type"] = def.type_text;
                props["isConstant"] = def.constant || def.kind == SymbolKind::Constant;
                props["scope"] = "package";
                break;
            case SymbolKind::Type:
            case SymbolKind::Interface:
            case SymbolKind::Package:
            case SymbolKind::Local:
                break;
        }
        return props;
    }
};

} // namespace codegraph
