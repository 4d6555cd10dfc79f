#pragma once

#include <hoard/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace hoard::config {

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
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Value of `key` in `[section]` (or a top-level "section.key"); empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// $HOARD_CONFIG, else $XDG_CONFIG_HOME/hoard/config.toml, else ~/.config/hoard/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory (progress file, default library)
/// $HOARD_DATA_DIR, else $XDG_DATA_HOME/hoard, else ~/.local/share/hoard
std::filesystem::path get_data_dir();

/**
 * Settings read from config.toml. Unset keys stay empty so the CLI can apply
 * flag > file > default precedence.
 */
struct FileConfig {
    std::optional<int> concurrency;
    std::optional<int> retryCount;
    std::optional<double> retryDelaySeconds;
    std::optional<double> timeoutSeconds;
    std::optional<double> verifyWaitSeconds;
    std::optional<double> minFreeSpaceGB;
    std::optional<std::filesystem::path> stateFile;
    std::optional<std::filesystem::path> libraryDir;
    std::optional<std::filesystem::path> manifest;
    std::optional<std::string> sort;
    std::optional<std::string> mediaType;
    std::optional<std::size_t> saveEvery;
    std::optional<std::uint64_t> minConfirmedBytes;

    std::optional<std::string> logLevel;
    std::optional<std::filesystem::path> logFile;
};

// A missing file yields an empty FileConfig; a malformed number is an error
Result<FileConfig> load_file_config(const std::filesystem::path& config_path);

} // namespace hoard::config
