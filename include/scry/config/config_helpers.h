#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scry::config {

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
            return std::filesystem::path(home) / (path.size() > 2 ? path.substr(2) : "");
        }
    }
    return path;
}

// Parse a value from a TOML config file. Accepts both "[section] key = v" and
// "section.key = v". Returns an empty string when the file or key is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Read every key = value pair of one section, values unquoted, in file order.
std::vector<std::pair<std::string, std::string>>
parse_config_section(const std::filesystem::path& config_path, const std::string& section);

// Parse a comma- or TOML-array-separated list into trimmed, unquoted items.
// Accepts forms like "a,b" or ["a", "b"].
std::vector<std::string> parse_list(const std::string& raw);

/// Returns the user config directory: $XDG_CONFIG_HOME/scry or ~/.config/scry
std::filesystem::path get_config_dir();

/// Returns the user data directory: $XDG_DATA_HOME/scry or ~/.local/share/scry
std::filesystem::path get_data_dir();

/// Returns the user-level config file, honouring the SCRY_CONFIG override
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace scry::config
