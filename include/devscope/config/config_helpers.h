#pragma once

#include <devscope/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace devscope::config {

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

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Flat view of a TOML-subset file: "section.key" -> unquoted value
using ConfigValues = std::map<std::string, std::string>;

// Reads every `[section]` / `key = value` pair; a missing file yields an empty map.
Result<ConfigValues> load_config_values(const std::filesystem::path& config_path);

// Get standard config path: override, else $XDG_CONFIG_HOME/devscope/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Typed value parsing; nullopt when the text is not a valid value of that type
std::optional<bool> parse_bool(std::string_view s);
std::optional<long long> parse_integer(std::string_view s);
std::optional<double> parse_double(std::string_view s);

} // namespace devscope::config
