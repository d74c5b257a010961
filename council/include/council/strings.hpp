#pragma once
// String helpers shared by the artifact reader, migrator and stages

#include <algorithm>
#include <cctype>
#include <string>

namespace council {

inline bool str_starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

inline bool str_ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool str_contains(const std::string& str, const std::string& needle) {
    return str.find(needle) != std::string::npos;
}

inline std::string trim(const std::string& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

inline std::string trim_end(const std::string& str) {
    size_t end = str.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(0, end);
}

// Strip every leading/trailing occurrence of `c`
inline std::string trim_char(const std::string& str, char c) {
    size_t begin = str.find_first_not_of(c);
    if (begin == std::string::npos) return "";
    size_t end = str.find_last_not_of(c);
    return str.substr(begin, end - begin + 1);
}

inline std::string replace_all(std::string str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }
    return str;
}

// ASCII case-insensitive equality
inline bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace council
