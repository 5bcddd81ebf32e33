#include <fstream>
#include <peek/config/config_helpers.h>

namespace peek::config {

namespace {

// Strip a trailing "# comment" that is not inside quotes
std::string strip_inline_comment(std::string v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
    return v;
}

} // namespace

std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                         const std::string& section) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();
    const std::string dotted_prefix = section.empty() ? "" : section + ".";

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        v = unquote(strip_inline_comment(v));

        // Support both "viewer.chunk_size" and "[viewer] chunk_size"
        if (in_target_section) {
            values[k] = v;
        } else if (currentSection.empty() && !dotted_prefix.empty() &&
                   k.rfind(dotted_prefix, 0) == 0) {
            values[k.substr(dotted_prefix.size())] = v;
        }
    }

    return values;
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
        xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "peek";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "peek";
    }
    return std::filesystem::path("~/.config") / "peek";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* cfg_env = std::getenv("PEEK_CONFIG"); cfg_env && *cfg_env) {
        return expand_tilde(cfg_env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace peek::config
