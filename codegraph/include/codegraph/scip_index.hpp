#pragma once
// ScipIndex: a decoded SCIP index with lookup tables
//
// scip-go writes one protobuf `scip.Index` per run. Documents are looked up
// by project-relative path, symbol information by symbol string across both
// per-document and external symbols.

#include "extractor.hpp"
#include "model.hpp"
#include "scip.pb.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace codegraph {

class ScipIndex {
public:
    ScipIndex() = default;

    // Decodes an index file. Throws FatalError.
    static ScipIndex load(const std::string& path);

    // Takes ownership of an already built message
    static ScipIndex from_message(scip::Index index);

    bool empty() const { return !index_; }
    size_t document_count() const { return documents_.size(); }
    size_t symbol_count() const { return symbols_.size(); }

    const scip::Metadata* metadata() const;
    const scip::Document* document(const std::string& relative_path) const;
    const scip::SymbolInformation* symbol_info(const std::string& symbol) const;

    // Index.external_symbols, in index order
    const std::vector<const scip::SymbolInformation*>& external_symbols() const {
        return externals_;
    }

private:
    std::unique_ptr<scip::Index> index_;
    std::unordered_map<std::string, const scip::Document*> documents_;
    std::unordered_map<std::string, const scip::SymbolInformation*> symbols_;
    std::vector<const scip::SymbolInformation*> externals_;

    void build_tables();
};

// Entity kind for a SCIP kind. An unspecified kind (or 0 for a symbol with
// no information) is read off the descriptor's suffix; kinds Go has no
// counterpart for map to Variable.
SymbolKind kind_from_scip(int scip_kind, const std::string& descriptor);

// Converts a 3- or 4-element zero-based SCIP range to a Span with 1-based
// lines. Returns false for any other shape.
bool span_from_scip_range(const google::protobuf::RepeatedField<int32_t>& range, Span& span);

} // namespace codegraph
