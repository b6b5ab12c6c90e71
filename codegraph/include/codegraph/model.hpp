#pragma once
// Entity model: node labels, relationship types, merge keys, and the
// in-memory graph an extraction strategy produces for one file.
//
// Node vocabulary and natural keys:
//   Service    {name}
//   File       {path}
//   Module     {fqn}
//   Function / Method / Class / Interface / Variable / Parameter
//              {signature, filePath}
//   Symbol     {symbol}
//   Reference  (no natural key, created per usage site)
//
// Relationships: CONTAINS, DEFINES, REFERENCES

#include "symbol.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace codegraph {

namespace label {
constexpr const char* SERVICE = "Service";
constexpr const char* FILE = "File";
constexpr const char* MODULE = "Module";
constexpr const char* FUNCTION = "Function";
constexpr const char* METHOD = "Method";
constexpr const char* CLASS = "Class";
constexpr const char* INTERFACE = "Interface";
constexpr const char* VARIABLE = "Variable";
constexpr const char* PARAMETER = "Parameter";
constexpr const char* SYMBOL = "Symbol";
constexpr const char* REFERENCE = "Reference";
} // namespace label

namespace rel {
constexpr const char* CONTAINS = "CONTAINS";
constexpr const char* DEFINES = "DEFINES";
constexpr const char* REFERENCES = "REFERENCES";
} // namespace rel

// Definition node label for a symbol kind
inline const char* definition_label(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Function: return label::FUNCTION;
        case SymbolKind::Method: return label::METHOD;
        case SymbolKind::Type: return label::CLASS;
        case SymbolKind::Interface: return label::INTERFACE;
        case SymbolKind::Parameter: return label::PARAMETER;
        case SymbolKind::Field:
        case SymbolKind::Variable:
        case SymbolKind::Constant:
        case SymbolKind::Package:
        case SymbolKind::Local:
            return label::VARIABLE;
    }
    return label::VARIABLE;
}

// Labels whose nodes belong to exactly one file (carry filePath)
inline const std::vector<std::string>& file_scoped_labels() {
    static const std::vector<std::string> labels = {
        label::FUNCTION, label::METHOD, label::CLASS, label::INTERFACE,
        label::VARIABLE, label::PARAMETER, label::REFERENCE
    };
    return labels;
}

// Source span. Lines are 1-based, columns are 0-based byte columns.
// Byte offsets are -1 when unknown.
struct Span {
    int start_line = 0;
    int end_line = 0;
    int start_column = 0;
    int end_column = 0;
    int64_t start_byte = -1;
    int64_t end_byte = -1;
};

struct DefinitionRecord {
    SymbolKind kind = SymbolKind::Variable;
    std::string name;
    std::string signature;      // merge key together with the file path
    std::string symbol;         // formatted canonical symbol
    std::string docstring;
    std::string return_type;    // functions and methods
    std::string type_text;      // variables, fields, parameters
    Span span;
    bool exported = false;
    bool constant = false;
    int param_index = -1;
    int parent = -1;            // index into FileGraph::definitions, -1 = module
};

struct ReferenceRecord {
    std::string symbol;
    Span span;
    bool is_definition = false;
    std::string context;        // source line around the usage
};

// What a Symbol node carries besides its key
struct SymbolInfo {
    SymbolKind kind = SymbolKind::Variable;
    std::string display_name;
    std::string documentation;
};

// Extraction output for one file, built completely before any store write.
struct FileGraph {
    std::string path;
    std::string relative_path;
    std::string language = "Go";
    std::string extractor;
    std::string package_name;
    std::string module_fqn;
    int line_count = 0;
    uint64_t size = 0;

    std::vector<DefinitionRecord> definitions;
    std::vector<ReferenceRecord> references;
    std::unordered_map<std::string, SymbolInfo> symbols;  // keyed by formatted symbol

    int add_definition(DefinitionRecord def) {
        SymbolInfo& info = symbols[def.symbol];
        info.kind = def.kind;
        info.display_name = def.name;
        if (info.documentation.empty()) info.documentation = def.docstring;
        definitions.push_back(std::move(def));
        return static_cast<int>(definitions.size()) - 1;
    }
};

// Go exports identifiers that start with an upper-case letter
inline bool is_exported_name(const std::string& name) {
    if (name.empty()) return false;
    unsigned char c = static_cast<unsigned char>(name[0]);
    return c >= 'A' && c <= 'Z';
}

// Import path of the package living in `relative_dir` of a module
inline std::string module_fqn(const std::string& service, const std::string& relative_dir) {
    if (relative_dir.empty() || relative_dir == ".") return service;
    return service + "/" + relative_dir;
}

} // namespace codegraph
