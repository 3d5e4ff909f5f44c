#include <faultline/config/config_helpers.h>

#include <fstream>
#include <sstream>

namespace faultline::config {

SectionMap parse_toml_text(std::string_view text) {
    SectionMap config;
    std::istringstream in{std::string(text)};
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#')
            continue;

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);

        // Inline comments only outside quoted values
        if (!value.empty() && value.front() != '"' && value.front() != '\'') {
            size_t comment = value.find('#');
            if (comment != std::string::npos) {
                value = value.substr(0, comment);
                trim(value);
            }
        }

        config[currentSection][key] = unquote(value);
    }
    return config;
}

Result<SectionMap> parse_toml_sections(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::NotFound, "Cannot open config file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_toml_text(buffer.str());
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (!s.empty() && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

bool parse_bool(std::string value, bool fallback) {
    trim(value);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on")
        return true;
    if (value == "false" || value == "0" || value == "no" || value == "off")
        return false;
    return fallback;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "faultline" / "config.toml";
    }

    return configHome / "faultline" / "config.toml";
}

} // namespace faultline::config
