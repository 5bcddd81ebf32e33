#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>

namespace peek::config {

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

// All key/value pairs of one section (unquoted, inline comments removed).
// "section.key = v" at top level counts as part of the section too.
std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                         const std::string& section);

/// Returns the user config directory
/// $XDG_CONFIG_HOME/peek or ~/.config/peek
std::filesystem::path get_config_dir();

// Get standard config path: override, then $PEEK_CONFIG, then <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace peek::config
