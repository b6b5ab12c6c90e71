#pragma once
// Symbol: canonical five-field identifier for a code entity
//
// Format: <scheme> <manager> <package-name> <package-version> <descriptor>
// Example: scip-go gomod demo v1.0.0 demo/Server#Start().
//
// Spaces inside the first four fields are written twice ("my  project"), and
// an empty manager, name or version is written as ".".
//
// The formatted string is the natural key of a Symbol node. Both extraction
// strategies must produce byte-identical strings for the same entity.

#include <optional>
#include <stdexcept>
#include <string>

namespace codegraph {

constexpr const char* DEFAULT_SCHEME = "scip-go";
constexpr const char* DEFAULT_MANAGER = "gomod";

class MalformedSymbol : public std::runtime_error {
public:
    explicit MalformedSymbol(const std::string& input)
        : std::runtime_error("malformed symbol: '" + input + "'")
        , input_(input) {}

    const std::string& input() const { return input_; }

private:
    std::string input_;
};

// Kind of entity a symbol or definition denotes
enum class SymbolKind {
    Package,
    Type,
    Interface,
    Function,
    Method,
    Field,
    Variable,
    Constant,
    Parameter,
    Local
};

inline const char* symbol_kind_str(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Package: return "Package";
        case SymbolKind::Type: return "Type";
        case SymbolKind::Interface: return "Interface";
        case SymbolKind::Function: return "Function";
        case SymbolKind::Method: return "Method";
        case SymbolKind::Field: return "Field";
        case SymbolKind::Variable: return "Variable";
        case SymbolKind::Constant: return "Constant";
        case SymbolKind::Parameter: return "Parameter";
        case SymbolKind::Local: return "Local";
    }
    return "Variable";
}

struct Symbol {
    std::string scheme;
    std::string manager;
    std::string package_name;
    std::string package_version;
    std::string descriptor;

    static Symbol build(const std::string& package_name, const std::string& version,
                        const std::string& descriptor) {
        return Symbol{DEFAULT_SCHEME, DEFAULT_MANAGER, package_name, version, descriptor};
    }

    // Splits on the first four unescaped spaces; the descriptor keeps any
    // further spaces ("param x", "local y"). Throws MalformedSymbol.
    static Symbol parse(const std::string& input) {
        auto parsed = try_parse(input);
        if (!parsed) throw MalformedSymbol(input);
        return *parsed;
    }

    static std::optional<Symbol> try_parse(const std::string& input) {
        std::string fields[4];
        size_t pos = 0;
        for (int i = 0; i < 4; ++i) {
            std::string raw;
            bool closed = false;
            while (pos < input.size()) {
                if (input[pos] != ' ') {
                    raw += input[pos++];
                    continue;
                }
                if (pos + 1 < input.size() && input[pos + 1] == ' ') {
                    raw += ' ';
                    pos += 2;
                    continue;
                }
                ++pos;
                closed = true;
                break;
            }
            if (!closed || raw.empty()) return std::nullopt;
            // "." stands for an empty manager, package name or version
            fields[i] = (i > 0 && raw == ".") ? std::string() : raw;
        }
        if (fields[0].empty() || pos >= input.size()) return std::nullopt;
        return Symbol{fields[0], fields[1], fields[2], fields[3], input.substr(pos)};
    }

    // Header fields double their spaces and write "" as "."
    static std::string escape_field(const std::string& field) {
        if (field.empty()) return ".";
        std::string out;
        out.reserve(field.size());
        for (char c : field) {
            if (c == ' ') out += ' ';
            out += c;
        }
        return out;
    }

    std::string format() const {
        std::string out;
        out.reserve(scheme.size() + manager.size() + package_name.size() +
                    package_version.size() + descriptor.size() + 4);
        out += escape_field(scheme);
        out += ' ';
        out += escape_field(manager);
        out += ' ';
        out += escape_field(package_name);
        out += ' ';
        out += escape_field(package_version);
        out += ' ';
        out += descriptor;
        return out;
    }

    bool operator==(const Symbol& other) const {
        return scheme == other.scheme && manager == other.manager &&
               package_name == other.package_name &&
               package_version == other.package_version &&
               descriptor == other.descriptor;
    }
    bool operator!=(const Symbol& other) const { return !(*this == other); }
};

namespace descriptor {

inline bool is_simple_identifier_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '+' || c == '-' || c == '$';
}

// Names with characters outside the simple set are wrapped in backticks,
// with embedded backticks doubled.
inline std::string escape(const std::string& name) {
    bool simple = !name.empty();
    for (char c : name) {
        if (!is_simple_identifier_char(c)) {
            simple = false;
            break;
        }
    }
    if (simple) return name;

    std::string out = "`";
    for (char c : name) {
        if (c == '`') out += '`';
        out += c;
    }
    out += '`';
    return out;
}

inline std::string unescape(const std::string& name) {
    if (name.size() < 2 || name.front() != '`' || name.back() != '`') return name;
    std::string out;
    for (size_t i = 1; i + 1 < name.size(); ++i) {
        if (name[i] == '`' && i + 2 < name.size() && name[i + 1] == '`') ++i;
        out += name[i];
    }
    return out;
}

inline std::string namespace_(const std::string& path) { return escape(path) + "/"; }
inline std::string type(const std::string& name) { return escape(name) + "#"; }
inline std::string method(const std::string& name) { return escape(name) + "()."; }
inline std::string term(const std::string& name) { return escape(name) + "."; }
inline std::string local(const std::string& name) { return "local " + name; }
inline std::string param(const std::string& name) { return "param " + name; }

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Position where the trailing name (before `suffix_len` suffix characters) starts
inline size_t trailing_name_start(const std::string& d, size_t suffix_len) {
    if (d.size() < suffix_len) return std::string::npos;
    size_t end = d.size() - suffix_len;
    if (end == 0) return std::string::npos;
    if (d[end - 1] == '`') {
        // Escaped name: scan back to the opening backtick, skipping doubled ones
        size_t i = end - 1;
        while (i > 0) {
            --i;
            if (d[i] == '`') {
                if (i > 0 && d[i - 1] == '`') {
                    --i;
                    continue;
                }
                return i;
            }
        }
        return std::string::npos;
    }
    size_t i = end;
    while (i > 0 && is_simple_identifier_char(d[i - 1])) --i;
    return i == end ? std::string::npos : i;
}

struct Component {
    std::string owner;  // descriptor prefix this component hangs off
    std::string name;   // unescaped short name
    SymbolKind kind = SymbolKind::Variable;
};

// Splits the last component off a descriptor.
inline std::optional<Component> split_last(const std::string& d) {
    size_t p = d.rfind("param ");
    if (p != std::string::npos && d.find(' ', p + 6) == std::string::npos) {
        return Component{d.substr(0, p), d.substr(p + 6), SymbolKind::Parameter};
    }
    p = d.rfind("local ");
    if (p != std::string::npos && d.find(' ', p + 6) == std::string::npos) {
        return Component{d.substr(0, p), d.substr(p + 6), SymbolKind::Local};
    }

    struct Suffix {
        const char* text;
        size_t len;
    };
    static const Suffix suffixes[] = {{"().", 3}, {"#", 1}, {"/", 1}, {".", 1}};
    for (const auto& suffix : suffixes) {
        if (!ends_with(d, suffix.text)) continue;
        size_t start = trailing_name_start(d, suffix.len);
        if (start == std::string::npos) return std::nullopt;
        std::string owner = d.substr(0, start);
        std::string name = unescape(d.substr(start, d.size() - suffix.len - start));

        SymbolKind kind = SymbolKind::Variable;
        if (suffix.len == 3) {
            kind = ends_with(owner, "#") ? SymbolKind::Method : SymbolKind::Function;
        } else if (suffix.text[0] == '#') {
            kind = SymbolKind::Type;
        } else if (suffix.text[0] == '/') {
            kind = SymbolKind::Package;
        } else {
            kind = ends_with(owner, "#") ? SymbolKind::Field : SymbolKind::Variable;
        }
        return Component{owner, name, kind};
    }
    return std::nullopt;
}

// Kind implied by the descriptor suffix; Variable when nothing matches
inline SymbolKind kind_of(const std::string& d) {
    auto component = split_last(d);
    return component ? component->kind : SymbolKind::Variable;
}

inline std::string display_name(const std::string& d) {
    auto component = split_last(d);
    return component ? component->name : d;
}

} // namespace descriptor

} // namespace codegraph
