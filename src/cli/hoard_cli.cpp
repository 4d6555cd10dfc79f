#include <hoard/cli/command_registry.h>
#include <hoard/cli/hoard_cli.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cctype>
#include <csignal>
#include <iostream>

namespace hoard::cli {

namespace fs = std::filesystem;

namespace {

// Signal handlers may only touch lock-free atomics
std::atomic<retrieval::CancellationToken*> g_signalToken{nullptr};

extern "C" void handle_stop_signal(int) {
    if (auto* token = g_signalToken.load(); token != nullptr && !token->stopRequested()) {
        token->requestStopFromSignal();
    }
}

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

HoardCLI::HoardCLI() {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>(
        "Fetch every asset of a media collection into local storage, resumably", "hoard");
    app_->require_subcommand(1);
    app_->set_version_flag("--version", HOARD_VERSION_STRING);

    // Global options
    app_->add_option("--config", configPathOpt_,
                     "Config file (default: $HOARD_CONFIG or ~/.config/hoard/config.toml)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_option("--log-level", logLevel_, "Log level: trace|debug|info|warn|error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "critical",
                               "off"}));
    app_->add_option("--log-file", logFile_, "Also write logs to this file (rotated)");

    CommandRegistry::registerAllCommands(this);
}

HoardCLI::~HoardCLI() {
    if (g_signalToken.load() == &cancel_) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        g_signalToken.store(nullptr);
    }
}

void HoardCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

fs::path HoardCLI::resolveStateFile(const std::optional<std::string>& flag) const {
    if (flag && !flag->empty())
        return config::expand_tilde(*flag);
    if (fileConfig_.stateFile)
        return *fileConfig_.stateFile;
    return config::get_data_dir() / "download_progress.json";
}

fs::path HoardCLI::resolveLibraryDir(const std::optional<std::string>& flag) const {
    if (flag && !flag->empty())
        return config::expand_tilde(*flag);
    if (fileConfig_.libraryDir)
        return *fileConfig_.libraryDir;
    return config::get_data_dir() / "library";
}

void HoardCLI::installSignalHandlers() {
    g_signalToken.store(&cancel_);
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
}

void HoardCLI::configureLogging() {
    // Precedence: --log-level > --verbose > HOARD_LOG_LEVEL > [logging] level > warn
    spdlog::level::level_enum level = spdlog::level::warn;
    if (auto lvl = parseLevel(logLevel_)) {
        level = *lvl;
    } else if (verbose_) {
        level = spdlog::level::info;
    } else if (const char* envLvl = std::getenv("HOARD_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto envParsed = parseLevel(envLvl))
            level = *envParsed;
    } else if (fileConfig_.logLevel) {
        if (auto cfgLvl = parseLevel(*fileConfig_.logLevel))
            level = *cfgLvl;
        else
            spdlog::warn("Ignoring unknown [logging] level '{}'", *fileConfig_.logLevel);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    fs::path logFile = logFile_.empty() ? fileConfig_.logFile.value_or(fs::path{})
                                        : config::expand_tilde(logFile_);
    if (!logFile.empty()) {
        try {
            std::error_code ec;
            if (logFile.has_parent_path())
                fs::create_directories(logFile.parent_path(), ec);
            // Use rotating file sink to preserve logs across runs
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;               // Keep 5 rotated files
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), max_size, max_files));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "[WARN] Cannot open log file " << logFile.string() << ": " << e.what()
                      << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("hoard", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
}

int HoardCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        resolvedConfigPath_ = config::get_config_path(configPathOpt_);
        auto loaded = config::load_file_config(resolvedConfigPath_);
        if (!loaded) {
            std::cerr << "[FAIL] " << resolvedConfigPath_.string() << ": "
                      << loaded.error().message << "\n";
            return 1;
        }
        fileConfig_ = std::move(loaded).value();

        configureLogging();
        spdlog::debug("Using config {}", resolvedConfigPath_.string());

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                spdlog::error("{} failed: {}", pendingCommand_->getName(), result.error().message);
                std::cerr << "[FAIL] " << errorToString(result.error().code) << ": "
                          << result.error().message << "\n";
                return 1;
            }
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace hoard::cli
