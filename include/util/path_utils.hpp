#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace fwfleet {

// Normalize tar path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeTarPath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// Drop the first |n| path components of an already normalized path, the way
// `tar --strip-components=n` does. Returns an empty string when nothing is
// left (the entry is the stripped directory itself).
inline std::string StripLeadingComponents(std::string_view path, std::size_t n) {
    while (n > 0 && !path.empty()) {
        const auto pos = path.find('/');
        if (pos == std::string_view::npos) return {};
        path.remove_prefix(pos + 1);
        --n;
    }
    while (!path.empty() && path.back() == '/') path.remove_suffix(1);
    return std::string(path);
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace fwfleet
