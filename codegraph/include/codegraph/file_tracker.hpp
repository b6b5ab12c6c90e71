#pragma once
// FileTracker: content-hash change detection for one sync run
//
// The previous state is whatever the store holds (path -> hash on File
// nodes); nothing is persisted on the side. During the walk each file is
// observed with its fresh hash, and whatever was known but never observed
// has vanished from disk.

#include <openssl/evp.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace codegraph {

namespace fs = std::filesystem;

// Directories never descended into
inline const std::vector<std::string>& default_deny_list() {
    static const std::vector<std::string> dirs = {
        "vendor", ".git", ".github", "node_modules", ".vscode",
        "bin", "build", "dist", "tmp", ".idea"
    };
    return dirs;
}

// File observed during the walk
struct FileRecord {
    std::string path;           // root joined with relative_path
    std::string relative_path;
    std::string hash;           // SHA-256 hex of the raw bytes
    uint64_t size = 0;
};

// Reads the whole file byte-exact. Throws std::runtime_error.
inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw std::runtime_error("read error on " + path);
    return content;
}

inline std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("sha256 digest failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0f];
    }
    return out;
}

// Source split on '\n'; a trailing '\r' stays part of its line
inline std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            if (start < content.size()) lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

inline int count_lines(const std::string& content) {
    return static_cast<int>(split_lines(content).size());
}

// Byte offset of (line, column), line 1-based and column 0-based: every
// earlier line contributes its length plus one terminator byte.
// Returns -1 when the line is outside the file.
inline int64_t byte_offset(const std::vector<std::string>& lines, int line, int column) {
    if (line < 1 || column < 0) return -1;
    if (static_cast<size_t>(line) > lines.size() + 1) return -1;
    int64_t offset = 0;
    for (int i = 0; i < line - 1; ++i) {
        offset += static_cast<int64_t>(lines[i].size()) + 1;
    }
    return offset + column;
}

inline bool is_go_source(const fs::path& path) {
    std::string name = path.filename().string();
    if (path.extension() != ".go") return false;
    return !(name.size() >= 8 && name.compare(name.size() - 8, 8, "_test.go") == 0);
}

// Go sources under root in sorted order, deny-listed directories pruned.
// Throws std::filesystem::filesystem_error when root cannot be listed.
inline std::vector<std::pair<std::string, std::string>> walk_go_files(
        const std::string& root, const std::vector<std::string>& deny) {
    std::set<std::string> denied(deny.begin(), deny.end());
    std::vector<std::pair<std::string, std::string>> files;  // (path, relative)

    fs::path base(root);
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied);
    for (auto end = fs::recursive_directory_iterator(); it != end; ++it) {
        std::error_code ec;
        if (it->is_directory(ec)) {
            if (denied.count(it->path().filename().string())) it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec) || !is_go_source(it->path())) continue;

        std::string relative = fs::relative(it->path(), base, ec).generic_string();
        if (ec) relative = it->path().filename().string();
        files.emplace_back((base / relative).string(), relative);
    }

    std::sort(files.begin(), files.end());
    return files;
}

class FileTracker {
public:
    FileTracker() = default;
    explicit FileTracker(std::unordered_map<std::string, std::string> previous)
        : previous_(std::move(previous)) {}

    // Hash a file and remember that the walk saw it
    FileRecord observe(const std::string& path, const std::string& relative_path,
                       const std::string& content) {
        FileRecord record;
        record.path = path;
        record.relative_path = relative_path;
        record.hash = sha256_hex(content);
        record.size = content.size();
        seen_.insert(path);
        return record;
    }

    // Seen on disk but not hashed (unreadable); keeps its old subgraph
    void mark_seen(const std::string& path) { seen_.insert(path); }

    // Dirty when never indexed or the content changed
    bool is_dirty(const FileRecord& record) const {
        auto it = previous_.find(record.path);
        return it == previous_.end() || it->second != record.hash;
    }

    // Known paths the walk did not observe, sorted
    std::vector<std::string> vanished() const {
        std::vector<std::string> out;
        for (const auto& [path, hash] : previous_) {
            if (!seen_.count(path)) out.push_back(path);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    const std::string* previous_hash(const std::string& path) const {
        auto it = previous_.find(path);
        return it != previous_.end() ? &it->second : nullptr;
    }

    size_t known() const { return previous_.size(); }
    size_t observed() const { return seen_.size(); }

private:
    std::unordered_map<std::string, std::string> previous_;
    std::unordered_set<std::string> seen_;
};

} // namespace codegraph
