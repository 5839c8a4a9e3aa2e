#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace swi {

inline constexpr std::string_view kLatestToken = ":latest";

inline bool IsDevPath(std::string_view s) {
    return s.rfind("/dev/", 0) == 0;
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Collapse duplicate slashes and drop a trailing slash (except for "/").
inline std::string NormalizeDir(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

// Returns the part of `path` below `dir` ("" when equal), or nullopt when
// `dir` is not a whole-component prefix of `path`.
inline std::optional<std::string> StripDirPrefix(std::string_view path, std::string_view dir) {
    const std::string p = NormalizeDir(path);
    const std::string d = NormalizeDir(dir);
    if (d.empty()) return std::nullopt;
    if (p == d) return std::string();
    if (d == "/") return p.substr(1);
    if (p.size() <= d.size() || p.compare(0, d.size(), d) != 0 || p[d.size()] != '/') {
        return std::nullopt;
    }
    return p.substr(d.size() + 1);
}

// "images/:latest" -> "images", ":latest" -> ""; nullopt when the last
// component is not the latest token. The result is always relative, so
// "/images/:latest" -> "images".
inline std::optional<std::string> LatestSubdir(std::string_view rel) {
    if (rel == kLatestToken) return std::string();
    if (!EndsWith(rel, kLatestToken)) return std::nullopt;
    const std::string_view head = rel.substr(0, rel.size() - kLatestToken.size());
    if (head.empty() || head.back() != '/') return std::nullopt;
    std::string dir = NormalizeDir(head);
    while (!dir.empty() && dir.front() == '/') dir.erase(0, 1);
    return dir;
}

// Single-quote `s` for a POSIX shell.
inline std::string ShellQuote(std::string_view s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

} // namespace swi
