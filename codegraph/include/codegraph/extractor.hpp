#pragma once
// Extractor: one strategy for turning a Go source file into a FileGraph
//
// prepare() runs once per sync before any file is touched and may abort the
// run with FatalError. extract() is pure with respect to the store: it only
// builds the in-memory FileGraph, and throws ExtractError when the file must
// be skipped.

#include "model.hpp"
#include "run_context.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace codegraph {

// Aborts a whole run before (further) writes
class FatalError : public std::runtime_error {
public:
    explicit FatalError(const std::string& what) : std::runtime_error(what) {}
};

// Skips one file
class ExtractError : public std::runtime_error {
public:
    explicit ExtractError(const std::string& what) : std::runtime_error(what) {}
};

struct FileInput {
    std::string path;               // root joined with relative_path
    std::string relative_path;      // '/'-separated
    const std::string& content;
    const std::vector<std::string>& lines;
};

// Directory part of a '/'-separated relative path, "" for the root
inline std::string relative_dir(const std::string& relative_path) {
    size_t slash = relative_path.rfind('/');
    return slash == std::string::npos ? std::string() : relative_path.substr(0, slash);
}

// Source line (without terminator) for reference context, "" when out of range
inline std::string line_at(const std::vector<std::string>& lines, int line) {
    if (line < 1 || static_cast<size_t>(line) > lines.size()) return "";
    std::string text = lines[line - 1];
    if (!text.empty() && text.back() == '\r') text.pop_back();
    return text;
}

class Extractor {
public:
    virtual ~Extractor() = default;

    // Identifier recorded on File nodes (version::NATIVE_EXTRACTOR, ...)
    virtual const char* name() const = 0;

    virtual void prepare(const RunContext& ctx) = 0;

    virtual FileGraph extract(const FileInput& input, const RunContext& ctx) = 0;

    // Symbols declared for the run as a whole, not by any one file
    virtual std::vector<std::pair<std::string, SymbolInfo>> external_symbols() const {
        return {};
    }
};

} // namespace codegraph
