#include <fstream>
#include <hoard/config/config_helpers.h>

#include <charconv>
#include <stdexcept>
#include <system_error>
#include <type_traits>

namespace hoard::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

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
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "retrieval.concurrency" and "[retrieval] concurrency"
        if ((in_target_section && k == key) ||
            (currentSection.empty() && !section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("HOARD_CONFIG"); env && *env) {
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
        return std::filesystem::path("~/.config") / "hoard" / "config.toml";
    }

    return configHome / "hoard" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* env = std::getenv("HOARD_DATA_DIR"); env && *env) {
        return expand_tilde(env);
    }
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "hoard";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "hoard";
    }
    return std::filesystem::current_path() / "hoard_data";
}

namespace {

template <typename T>
Result<void> read_number(const std::filesystem::path& path, const char* section, const char* key,
                         std::optional<T>& out) {
    const auto raw = parse_config_value(path, section, key);
    if (raw.empty()) {
        return {};
    }
    T value{};
    const auto* first = raw.data();
    const auto* last = raw.data() + raw.size();
    std::from_chars_result res;
    if constexpr (std::is_floating_point_v<T>) {
        // from_chars for double is not available on every libstdc++ we target
        try {
            std::size_t used = 0;
            value = static_cast<T>(std::stod(raw, &used));
            res = {first + used, used == raw.size() ? std::errc{} : std::errc::invalid_argument};
        } catch (const std::exception&) {
            res = {first, std::errc::invalid_argument};
        }
    } else {
        res = std::from_chars(first, last, value);
    }
    if (res.ec != std::errc{} || res.ptr != last) {
        return Error{ErrorCode::InvalidArgument, std::string("Invalid value for [") + section +
                                                     "] " + key + ": '" + raw + "'"};
    }
    out = value;
    return {};
}

void read_string(const std::filesystem::path& path, const char* section, const char* key,
                 std::optional<std::string>& out) {
    auto raw = parse_config_value(path, section, key);
    if (!raw.empty()) {
        out = std::move(raw);
    }
}

void read_path(const std::filesystem::path& path, const char* section, const char* key,
               std::optional<std::filesystem::path>& out) {
    auto raw = parse_config_value(path, section, key);
    if (!raw.empty()) {
        out = expand_tilde(raw);
    }
}

} // namespace

Result<FileConfig> load_file_config(const std::filesystem::path& config_path) {
    FileConfig cfg;
    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec)) {
        return cfg;
    }

    for (auto r : {read_number(config_path, "retrieval", "concurrency", cfg.concurrency),
                   read_number(config_path, "retrieval", "retry_count", cfg.retryCount),
                   read_number(config_path, "retrieval", "retry_delay_s", cfg.retryDelaySeconds),
                   read_number(config_path, "retrieval", "timeout_s", cfg.timeoutSeconds),
                   read_number(config_path, "retrieval", "verify_wait_s", cfg.verifyWaitSeconds),
                   read_number(config_path, "retrieval", "min_free_space_gb", cfg.minFreeSpaceGB),
                   read_number(config_path, "retrieval", "save_every", cfg.saveEvery),
                   read_number(config_path, "retrieval", "min_confirmed_bytes",
                               cfg.minConfirmedBytes)}) {
        if (!r) {
            return r.error();
        }
    }

    read_path(config_path, "retrieval", "state_file", cfg.stateFile);
    read_path(config_path, "retrieval", "library_dir", cfg.libraryDir);
    read_path(config_path, "retrieval", "manifest", cfg.manifest);
    read_string(config_path, "retrieval", "sort", cfg.sort);
    read_string(config_path, "retrieval", "media_type", cfg.mediaType);
    read_string(config_path, "logging", "level", cfg.logLevel);
    read_path(config_path, "logging", "file", cfg.logFile);
    return cfg;
}

} // namespace hoard::config
