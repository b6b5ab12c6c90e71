#pragma once
// Process helpers for running external tools synchronously

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

namespace codegraph {

struct ProcessResult {
    int exit_status = -1;   // -1 when the process could not be started
    std::string output;     // stdout and stderr combined
};

// Single-quote a word for /bin/sh
inline std::string shell_quote(const std::string& word) {
    std::string out = "'";
    for (char c : word) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

inline bool is_executable_file(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

// Resolves a binary name against $PATH. Names containing '/' are checked as given.
inline std::optional<std::string> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }

    const char* path_env = getenv("PATH");
    if (!path_env) return std::nullopt;

    std::string path_list(path_env);
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t colon = path_list.find(':', start);
        std::string dir = path_list.substr(start, colon == std::string::npos ? std::string::npos
                                                                             : colon - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) return candidate;
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return std::nullopt;
}

// Runs `command` through the shell in `cwd`, capturing combined output
inline ProcessResult run_process(const std::string& command, const std::string& cwd) {
    ProcessResult result;
    std::string cmd = "cd " + shell_quote(cwd) + " && " + command + " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return result;

    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.exit_status = -1;
    } else if (WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    } else {
        result.exit_status = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

} // namespace codegraph
