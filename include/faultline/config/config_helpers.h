// Copyright (c) 2025 Faultline Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <faultline/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace faultline::config {

// Section name -> (key -> raw value). Keys outside any section land under "".
using SectionMap = std::map<std::string, std::map<std::string, std::string>>;

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

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse the TOML subset used by faultline config files: [section] headers,
// key = value pairs, '#' comments, quoted strings and flat arrays kept raw.
Result<SectionMap> parse_toml_sections(const std::filesystem::path& path);

// Same parser over an in-memory document.
SectionMap parse_toml_text(std::string_view text);

// Split "a,b" or ["a", "b"] into trimmed, unquoted, non-empty items.
std::vector<std::string> parse_list(const std::string& raw);

bool parse_bool(std::string value, bool fallback);

// Standard config path: $XDG_CONFIG_HOME/faultline/config.toml or ~/.config/...
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace faultline::config
