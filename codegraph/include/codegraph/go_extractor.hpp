#pragma once
// GoExtractor: native strategy, walks the tree-sitter Go syntax tree
//
// Top-level declarations are dispatched on their node type through a
// closed table (function, method, type, var, const). Positions come
// straight from the tree; the byte-offset fallback is never needed here.
//
// Methods hang under their receiver's Class only when that type was
// declared earlier in the same file; otherwise under the Module.

#include "extractor.hpp"

struct TSParser;

namespace codegraph {

class GoExtractor : public Extractor {
public:
    GoExtractor();
    ~GoExtractor() override;

    GoExtractor(const GoExtractor&) = delete;
    GoExtractor& operator=(const GoExtractor&) = delete;

    const char* name() const override;

    // Nothing to prepare; parsing is per file
    void prepare(const RunContext&) override {}

    // Throws ExtractError on syntax errors or a missing package clause
    FileGraph extract(const FileInput& input, const RunContext& ctx) override;

private:
    TSParser* parser_ = nullptr;
};

// Comment text with markers stripped, lines joined by single spaces
std::string clean_doc_comment(const std::string& raw);

} // namespace codegraph
