#include "yankring/config.hpp"
#include "yankring/entry.hpp"
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace yankring {

static constexpr int kMaxEntriesLimit = 10000;
static constexpr int64_t kMaxContentLimit = 64ll * 1024 * 1024;

static std::string trim(const std::string& str) {
    const char* ws = " \t\r\n";
    size_t start = str.find_first_not_of(ws);
    size_t end = str.find_last_not_of(ws);
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

static std::string parseString(const std::string& value) {
    std::string v = trim(value);
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        std::string out;
        for (size_t i = 1; i + 1 < v.size(); ++i) {
            if (v[i] == '\\' && i + 2 < v.size()) {
                out += v[++i];
                continue;
            }
            out += v[i];
        }
        return out;
    }
    return v;
}

static bool parseInt(const std::string& value, long long& out) {
    try {
        size_t used = 0;
        std::string v = trim(value);
        out = std::stoll(v, &used);
        return used == v.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseBool(const std::string& value, bool& out) {
    std::string v = trim(value);
    if (v == "true" || v == "1") {
        out = true;
        return true;
    }
    if (v == "false" || v == "0") {
        out = false;
        return true;
    }
    return false;
}

static std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

std::set<std::string> Config::trackedChannels() const {
    std::set<std::string> out;
    // registers are single characters
    for (char c : registerKeys) out.insert(std::string(1, c));
    out.insert(kUnnamedChannel);
    return out;
}

std::string getConfigPath() {
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    std::string configDir;
    if (xdgConfig && *xdgConfig) {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        configDir = home ? std::string(home) + "/.config" : "/tmp";
    }
    return configDir + "/yankring/yankring.conf";
}

std::string getDataDir() {
    const char* xdgData = std::getenv("XDG_DATA_HOME");
    std::string dataDir;
    if (xdgData && *xdgData) {
        dataDir = xdgData;
    } else {
        const char* home = std::getenv("HOME");
        dataDir = home ? std::string(home) + "/.local/share" : "/tmp";
    }
    return dataDir + "/yankring";
}

Config loadConfig(const std::string& path, std::vector<std::string>* warnings) {
    Config config;
    config.configPath = path.empty() ? getConfigPath() : path;
    config.persistPath = getDataDir();

    auto warn = [&](const std::string& msg) {
        if (warnings) warnings->push_back(msg);
    };

    std::ifstream file(config.configPath);
    if (!file.is_open()) {
        return config;
    }

    std::string line;
    int lineno = 0;
    while (std::getline(file, line)) {
        ++lineno;
        line = trim(line);

        // Skip comments, section headers and empty lines
        if (line.empty() || line[0] == '#' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            warn("line " + std::to_string(lineno) + ": expected key = value");
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        long long n = 0;
        bool b = false;

        if (key == "persist_path") {
            std::string p = parseString(value);
            if (!p.empty()) config.persistPath = p;
        } else if (key == "register_keys") {
            config.registerKeys = parseString(value);
        } else if (key == "max_entries" || key == "max_data_size" || key == "lock_timeout_ms") {
            if (!parseInt(value, n)) {
                warn("line " + std::to_string(lineno) + ": " + key + " is not an integer");
                continue;
            }
            // out-of-range ints become -1 and are corrected by validateConfig
            const int as_int = (n < INT_MIN || n > INT_MAX) ? -1 : static_cast<int>(n);
            if (key == "max_entries") config.maxEntries = as_int;
            else if (key == "max_data_size") config.maxContentSize = n;
            else config.lockTimeoutMs = as_int;
        } else if (key == "debug" || key == "use_region_hl" || key == "smart_indent") {
            if (!parseBool(value, b)) {
                warn("line " + std::to_string(lineno) + ": " + key + " is not a boolean");
                continue;
            }
            if (key == "debug") config.debug = b;
            else if (key == "use_region_hl") config.useRegionHighlight = b;
            else config.smartIndent = b;
        } else {
            warn("line " + std::to_string(lineno) + ": unknown key " + key);
        }
    }

    for (auto& note : validateConfig(config)) warn(note);
    return config;
}

bool saveConfig(const Config& config) {
    std::error_code ec;
    fs::create_directories(fs::path(config.configPath).parent_path(), ec);
    if (ec) return false;

    std::ofstream file(config.configPath);
    if (!file.is_open()) {
        return false;
    }

    file << "# yankring configuration\n\n";
    file << "[history]\n";
    file << "persist_path = " << quote(config.persistPath) << "\n";
    file << "max_entries = " << config.maxEntries << "\n";
    file << "max_data_size = " << config.maxContentSize << "\n";
    file << "register_keys = " << quote(config.registerKeys) << "\n";
    file << "lock_timeout_ms = " << config.lockTimeoutMs << "\n\n";

    file << "[presentation]\n";
    file << "use_region_hl = " << (config.useRegionHighlight ? "true" : "false") << "\n";
    file << "smart_indent = " << (config.smartIndent ? "true" : "false") << "\n\n";

    file << "[debug]\n";
    file << "debug = " << (config.debug ? "true" : "false") << "\n";

    return static_cast<bool>(file);
}

std::vector<std::string> validateConfig(Config& config) {
    const Config defaults;
    std::vector<std::string> notes;
    if (config.maxEntries < 1 || config.maxEntries > kMaxEntriesLimit) {
        notes.push_back("max_entries out of range, using " + std::to_string(defaults.maxEntries));
        config.maxEntries = defaults.maxEntries;
    }
    if (config.maxContentSize < 1 || config.maxContentSize > kMaxContentLimit) {
        notes.push_back("max_data_size out of range, using " + std::to_string(defaults.maxContentSize));
        config.maxContentSize = defaults.maxContentSize;
    }
    if (config.lockTimeoutMs < 0) {
        notes.push_back("lock_timeout_ms is negative, using " + std::to_string(defaults.lockTimeoutMs));
        config.lockTimeoutMs = defaults.lockTimeoutMs;
    }
    if (config.persistPath.empty()) {
        config.persistPath = getDataDir();
    }
    return notes;
}

} // namespace yankring
