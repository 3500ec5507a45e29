#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dd::util {

namespace fs = std::filesystem;

inline fs::path stripLeadingSlash(const fs::path& path) {
    if (path.empty()) return "/";
    auto norm = path.lexically_normal();
    if (norm.empty() || norm == "/") return "/";
    if (norm.string().front() == '/') return { norm.string().substr(1) };
    return norm;
}

// Trailing separators are dropped except for the bare root.
inline std::string trimTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
}

// Ensures exactly one leading '/' on a relative remainder.
inline std::string withLeadingSlash(std::string_view rest) {
    while (!rest.empty() && rest.front() == '/') rest.remove_prefix(1);
    std::string out;
    out.reserve(rest.size() + 1);
    out.push_back('/');
    out.append(rest);
    return out;
}

// Maps an absolute path under base to its base-relative form ("/etc/foo").
// The base itself maps to "/".
inline std::string relativeTo(const std::string& base, const std::string& path) {
    const auto trimmedBase = trimTrailingSlash(base);
    if (trimmedBase == "/") return withLeadingSlash(path);
    if (path.compare(0, trimmedBase.size(), trimmedBase) == 0)
        return trimTrailingSlash(withLeadingSlash(std::string_view(path).substr(trimmedBase.size())));
    return trimTrailingSlash(withLeadingSlash(path));
}

// Joins a base-relative path back onto an absolute base.
inline fs::path underBase(const fs::path& base, const std::string& relPath) {
    const auto rel = stripLeadingSlash(relPath);
    if (rel == "/") return base;
    return base / rel;
}

// True when a manifest-style path is in the form the inventories compare by.
inline bool isNormalizedPath(std::string_view path) {
    if (path.empty() || path.front() != '/') return false;
    return path.size() == 1 || path.back() != '/';
}

}
