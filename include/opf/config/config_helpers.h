#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace opf::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

/**
 * Parse a non-negative integer. Rejects trailing garbage, signs and overflow.
 */
std::optional<unsigned long long> parseUnsigned(std::string_view s);

/**
 * Parse a simple TOML file into a flat key-value map.
 *
 * Supports [section] headers (flattened as "section.key"), key = value
 * assignments with optional quotes, and # comments. Nested tables, arrays and
 * multi-line strings are not supported. A missing file yields an empty map.
 */
std::map<std::string, std::string> parseSimpleTomlFlat(const std::filesystem::path& path);

/**
 * Resolve the default config file path.
 *
 * Search order:
 * 1. OPF_CONFIG_PATH environment variable
 * 2. $XDG_CONFIG_HOME/opf/config.toml
 * 3. $HOME/.config/opf/config.toml
 *
 * @return Path to an existing config file, empty path otherwise
 */
std::filesystem::path resolveDefaultConfigPath();

} // namespace opf::config
