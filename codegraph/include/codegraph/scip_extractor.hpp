#pragma once
// ScipExtractor: external-tool strategy over scip-go
//
// prepare() runs scip-go once for the whole project and decodes the index;
// extract() projects one document of it onto the entity model:
//   definition occurrence     -> DefinitionRecord (package kinds skipped)
//   any other occurrence      -> ReferenceRecord
// Index.external_symbols become Symbol nodes once per run whether or not a
// document uses them.
// Occurrences whose symbol does not parse (locals) are ignored. Symbol
// strings are taken verbatim from the index, which is what makes them
// line up with the native strategy's.

#include "extractor.hpp"
#include "file_tracker.hpp"
#include "log.hpp"
#include "process.hpp"
#include "scip_index.hpp"
#include "version.hpp"
#include <unistd.h>
#include <algorithm>
#include <filesystem>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codegraph {

class ScipExtractor : public Extractor {
public:
    explicit ScipExtractor(std::string binary = "scip-go")
        : binary_(std::move(binary)) {}

    // Use an index built elsewhere; prepare() then skips running the tool
    void set_index(ScipIndex index) {
        index_ = std::move(index);
        preloaded_ = true;
    }

    const ScipIndex& index() const { return index_; }
    const std::string& binary() const { return binary_; }

    const char* name() const override { return version::SCIP_EXTRACTOR; }

    void prepare(const RunContext& ctx) override {
        if (preloaded_) return;

        auto resolved = find_executable(binary_);
        if (!resolved) {
            throw FatalError(binary_ + " not found in PATH. Install with: "
                             "go install github.com/sourcegraph/scip-go/cmd/scip-go@latest");
        }

        namespace fs = std::filesystem;
        std::error_code ec;
        fs::path output = fs::temp_directory_path(ec);
        if (ec) output = ctx.root;
        output /= "codegraph-" + std::to_string(getpid()) + ".scip";

        std::string command = shell_quote(*resolved) +
            " --module-name " + shell_quote(ctx.service_name) +
            " --module-version " + shell_quote(ctx.service_version) +
            " --output " + shell_quote(output.string());

        log_info("scip", "running %s in %s", resolved->c_str(), ctx.root.c_str());
        ProcessResult result = run_process(command, ctx.root);
        if (result.exit_status != 0) {
            fs::remove(output, ec);
            throw FatalError(binary_ + " failed with status " + std::to_string(result.exit_status) +
                             (result.output.empty() ? "" : ":\n" + result.output));
        }
        log_debug("scip", "%s output: %s", binary_.c_str(), result.output.c_str());

        try {
            index_ = ScipIndex::load(output.string());
        } catch (const FatalError&) {
            fs::remove(output, ec);
            throw;
        }
        fs::remove(output, ec);
        log_info("scip", "index has %zu documents", index_.document_count());
    }

    FileGraph extract(const FileInput& input, const RunContext& ctx) override {
        FileGraph graph;
        graph.path = input.path;
        graph.relative_path = input.relative_path;
        graph.extractor = name();
        graph.module_fqn = module_fqn(ctx.service_name, relative_dir(input.relative_path));
        graph.line_count = static_cast<int>(input.lines.size());
        graph.size = input.content.size();

        const scip::Document* doc = index_.document(input.relative_path);
        if (!doc) {
            // Excluded by build constraints, or the index predates the file
            log_debug("scip", "%s: not in index", input.relative_path.c_str());
            return graph;
        }

        struct Occ {
            const scip::Occurrence* occ;
            Symbol symbol;
            Span span;
        };
        std::vector<Occ> occurrences;
        occurrences.reserve(doc->occurrences_size());
        for (const auto& occ : doc->occurrences()) {
            auto symbol = Symbol::try_parse(occ.symbol());
            if (!symbol) continue;
            Span span;
            if (!span_from_scip_range(occ.range(), span)) {
                log_debug("scip", "%s: bad range for %s", input.relative_path.c_str(),
                          occ.symbol().c_str());
                continue;
            }
            span.start_byte = byte_offset(input.lines, span.start_line, span.start_column);
            span.end_byte = byte_offset(input.lines, span.end_line, span.end_column);
            occurrences.push_back({&occ, std::move(*symbol), span});
        }
        // Owners come before members in source order
        std::stable_sort(occurrences.begin(), occurrences.end(), [](const Occ& a, const Occ& b) {
            if (a.span.start_line != b.span.start_line) return a.span.start_line < b.span.start_line;
            return a.span.start_column < b.span.start_column;
        });

        std::unordered_map<std::string, int> defined;  // symbol string -> definition index
        for (const auto& o : occurrences) {
            const std::string& text = o.occ->symbol();
            bool is_def = (o.occ->symbol_roles() & scip::Definition) != 0;
            const scip::SymbolInformation* info = index_.symbol_info(text);

            if (!is_def) {
                ReferenceRecord ref;
                ref.symbol = text;
                ref.span = o.span;
                ref.context = trimmed(line_at(input.lines, o.span.start_line));
                graph.references.push_back(std::move(ref));
                if (info && !graph.symbols.count(text)) graph.symbols[text] = symbol_info_of(*info, o.symbol);
                continue;
            }

            SymbolKind kind = kind_from_scip(info ? static_cast<int>(info->kind()) : 0, o.symbol.descriptor);
            if (kind == SymbolKind::Package) {
                if (graph.package_name.empty() && info && !info->display_name().empty()) {
                    graph.package_name = info->display_name();
                }
                continue;
            }
            if (kind == SymbolKind::Local || defined.count(text)) continue;

            DefinitionRecord def;
            def.kind = kind;
            def.name = info && !info->display_name().empty()
                ? info->display_name() : descriptor::display_name(o.symbol.descriptor);
            def.signature = text;
            def.symbol = text;
            def.docstring = info ? join_documentation(*info) : "";
            def.span = o.span;
            def.exported = is_exported_name(def.name);
            def.constant = kind == SymbolKind::Constant;

            auto component = descriptor::split_last(o.symbol.descriptor);
            if (component && !component->owner.empty()) {
                Symbol owner = o.symbol;
                owner.descriptor = component->owner;
                auto parent = defined.find(owner.format());
                if (parent != defined.end()) def.parent = parent->second;
            }

            defined[text] = graph.add_definition(std::move(def));
        }

        log_debug("scip", "%s: %zu definitions, %zu references", input.relative_path.c_str(),
                  graph.definitions.size(), graph.references.size());
        return graph;
    }

    std::vector<std::pair<std::string, SymbolInfo>> external_symbols() const override {
        std::vector<std::pair<std::string, SymbolInfo>> out;
        for (const scip::SymbolInformation* info : index_.external_symbols()) {
            auto symbol = Symbol::try_parse(info->symbol());
            if (!symbol) continue;
            out.emplace_back(info->symbol(), symbol_info_of(*info, *symbol));
        }
        return out;
    }

private:
    std::string binary_;
    ScipIndex index_;
    bool preloaded_ = false;

    static std::string trimmed(const std::string& s) {
        size_t b = s.find_first_not_of(" \t");
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    }

    static std::string join_documentation(const scip::SymbolInformation& info) {
        std::string out;
        for (const auto& part : info.documentation()) {
            if (part.empty()) continue;
            if (!out.empty()) out += ' ';
            out += part;
        }
        return out;
    }

    static SymbolInfo symbol_info_of(const scip::SymbolInformation& info, const Symbol& symbol) {
        SymbolInfo out;
        out.kind = kind_from_scip(info.kind(), symbol.descriptor);
        out.display_name = info.display_name().empty()
            ? descriptor::display_name(symbol.descriptor) : info.display_name();
        out.documentation = join_documentation(info);
        return out;
    }
};

} // namespace codegraph
