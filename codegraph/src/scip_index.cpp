#include <codegraph/scip_index.hpp>
#include <codegraph/log.hpp>
#include <fstream>

namespace codegraph {

ScipIndex ScipIndex::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FatalError("cannot open SCIP index " + path);
    }

    scip::Index index;
    if (!index.ParseFromIstream(&in)) {
        throw FatalError("cannot decode SCIP index " + path);
    }
    return from_message(std::move(index));
}

ScipIndex ScipIndex::from_message(scip::Index index) {
    ScipIndex out;
    out.index_ = std::make_unique<scip::Index>(std::move(index));
    out.build_tables();
    log_debug("scip", "index: %zu documents, %zu symbols", out.documents_.size(),
              out.symbols_.size());
    return out;
}

void ScipIndex::build_tables() {
    documents_.clear();
    symbols_.clear();
    externals_.clear();

    for (const auto& info : index_->external_symbols()) {
        symbols_[info.symbol()] = &info;
        externals_.push_back(&info);
    }
    for (const auto& doc : index_->documents()) {
        documents_[doc.relative_path()] = &doc;
        // Project symbols win over external entries with the same name
        for (const auto& info : doc.symbols()) {
            symbols_[info.symbol()] = &info;
        }
    }
}

const scip::Metadata* ScipIndex::metadata() const {
    if (!index_ || !index_->has_metadata()) return nullptr;
    return &index_->metadata();
}

const scip::Document* ScipIndex::document(const std::string& relative_path) const {
    auto it = documents_.find(relative_path);
    return it != documents_.end() ? it->second : nullptr;
}

const scip::SymbolInformation* ScipIndex::symbol_info(const std::string& symbol) const {
    auto it = symbols_.find(symbol);
    return it != symbols_.end() ? it->second : nullptr;
}

SymbolKind kind_from_scip(int scip_kind, const std::string& descriptor) {
    switch (scip_kind) {
        case scip::SymbolInformation_Kind_Namespace:
        case scip::SymbolInformation_Kind_Package:
        case scip::SymbolInformation_Kind_PackageObject:
        case scip::SymbolInformation_Kind_Module:
            return SymbolKind::Package;
        case scip::SymbolInformation_Kind_Type:
        case scip::SymbolInformation_Kind_Class:
        case scip::SymbolInformation_Kind_Struct:
        case scip::SymbolInformation_Kind_TypeAlias:
        case scip::SymbolInformation_Kind_Enum:
            return SymbolKind::Type;
        case scip::SymbolInformation_Kind_Interface:
            return SymbolKind::Interface;
        case scip::SymbolInformation_Kind_Function:
        case scip::SymbolInformation_Kind_Constructor:
            return SymbolKind::Function;
        case scip::SymbolInformation_Kind_Method:
        case scip::SymbolInformation_Kind_AbstractMethod:
        case scip::SymbolInformation_Kind_MethodSpecification:
            return SymbolKind::Method;
        case scip::SymbolInformation_Kind_Field:
        case scip::SymbolInformation_Kind_Property:
            return SymbolKind::Field;
        case scip::SymbolInformation_Kind_Constant:
        case scip::SymbolInformation_Kind_EnumMember:
            return SymbolKind::Constant;
        case scip::SymbolInformation_Kind_Variable:
            return SymbolKind::Variable;
        case scip::SymbolInformation_Kind_Parameter:
        case scip::SymbolInformation_Kind_TypeParameter:
        case scip::SymbolInformation_Kind_MethodReceiver:
            return SymbolKind::Parameter;
        case scip::SymbolInformation_Kind_UnspecifiedKind:
            return descriptor::kind_of(descriptor);
        default:
            return SymbolKind::Variable;
    }
}

bool span_from_scip_range(const google::protobuf::RepeatedField<int32_t>& range, Span& span) {
    if (range.size() == 3) {
        span.start_line = range.Get(0) + 1;
        span.end_line = span.start_line;
        span.start_column = range.Get(1);
        span.end_column = range.Get(2);
        return true;
    }
    if (range.size() == 4) {
        span.start_line = range.Get(0) + 1;
        span.start_column = range.Get(1);
        span.end_line = range.Get(2) + 1;
        span.end_column = range.Get(3);
        return true;
    }
    return false;
}

} // namespace codegraph
