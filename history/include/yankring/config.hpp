#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace yankring {

struct Config {
    // Paths
    std::string configPath;
    std::string persistPath; // data directory holding history.db

    // History
    int maxEntries = 100;
    int64_t maxContentSize = 1048576;
    std::string registerKeys =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789\"-=.:%/#*+~_";
    int lockTimeoutMs = 5000;

    // Presentation
    bool useRegionHighlight = true;
    bool smartIndent = true;

    bool debug = false;

    // Channels to monitor; the unnamed channel is always included
    std::set<std::string> trackedChannels() const;
};

// $XDG_CONFIG_HOME/yankring/yankring.conf (or ~/.config/...)
std::string getConfigPath();

// $XDG_DATA_HOME/yankring (or ~/.local/share/...); not created here
std::string getDataDir();

// Loads path (default location when empty). Missing file gives defaults.
// Problems with individual values are appended to warnings.
Config loadConfig(const std::string& path = {}, std::vector<std::string>* warnings = nullptr);

bool saveConfig(const Config& config);

// Clamps out-of-range values to defaults; returns a note per correction.
std::vector<std::string> validateConfig(Config& config);

} // namespace yankring
