#include <docsift/config/config_helpers.h>

#include <fstream>

namespace docsift::config {

namespace {

struct KeyValue {
    std::string key;
    std::string value;
};

// Splits `key = value # comment` into its parts; returns false for non-assignments.
bool splitAssignment(const std::string& line, KeyValue& out) {
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return false;
    }
    std::string k = line.substr(0, eq);
    std::string v = line.substr(eq + 1);
    trim(k);
    trim(v);

    // Remove inline comments outside of quotes
    bool inQuotes = false;
    char quote = '\0';
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if ((c == '"' || c == '\'') && (!inQuotes || c == quote)) {
            inQuotes = !inQuotes;
            quote = inQuotes ? c : '\0';
        } else if (c == '#' && !inQuotes) {
            v = v.substr(0, i);
            trim(v);
            break;
        }
    }

    out.key = std::move(k);
    out.value = unquote(v);
    return !out.key.empty();
}

} // namespace

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
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

        KeyValue kv;
        if (!splitAssignment(line, kv)) {
            continue;
        }
        // Support both "ingest.max_tokens" and "[ingest] max_tokens"
        if (currentSection.empty() || kv.key.find('.') != std::string::npos) {
            values[kv.key] = kv.value;
        } else {
            values[currentSection + "." + kv.key] = kv.value;
        }
    }
    return values;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* env = std::getenv("DOCSIFT_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "docsift" / "config.toml";
    }

    return configHome / "docsift" / "config.toml";
}

} // namespace docsift::config
