#include <fstream>
#include <map>
#include <dsm/config/config_helpers.h>

namespace dsm::config {

namespace {

// Strip an inline comment that is not inside a quoted string.
std::string strip_inline_comment(const std::string& value) {
    char quote = '\0';
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return value.substr(0, i);
        }
    }
    return value;
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    if (it == values.end()) {
        return "";
    }
    return it->second;
}

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> config;
    std::ifstream file(config_path);
    if (!file) {
        return config;
    }

    std::string line;
    std::string currentSection;

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
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = strip_inline_comment(line.substr(eq + 1));
        trim(k);

        // "paths.base = ..." outside a section is the same as [paths] base = ...
        std::string fullKey = currentSection.empty() ? k : currentSection + "." + k;
        config[fullKey] = unquote(v);
    }

    return config;
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
        xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "dsm";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "dsm";
    }
    return std::filesystem::path("~/.config") / "dsm";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* cfgEnv = std::getenv("DSM_CONFIG"); cfgEnv && *cfgEnv) {
        return expand_tilde(cfgEnv);
    }
    return get_config_dir() / "config.toml";
}

} // namespace dsm::config
