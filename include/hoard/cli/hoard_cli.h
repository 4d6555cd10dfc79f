#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <hoard/cli/command.h>
#include <hoard/config/config_helpers.h>
#include <hoard/retrieval/cancellation.h>

namespace hoard::cli {

/**
 * Top-level `hoard` application: global options, logging, config and the
 * registered subcommands.
 */
class HoardCLI {
public:
    HoardCLI();
    ~HoardCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    // Commands call this from their CLI11 callback; run() executes it after logging is set up
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    const config::FileConfig& fileConfig() const { return fileConfig_; }
    const std::filesystem::path& configPath() const { return resolvedConfigPath_; }

    // Flag, else [retrieval] state_file, else <data dir>/download_progress.json
    std::filesystem::path resolveStateFile(const std::optional<std::string>& flag) const;
    // Flag, else [retrieval] library_dir, else <data dir>/library
    std::filesystem::path resolveLibraryDir(const std::optional<std::string>& flag) const;

    bool isVerbose() const { return verbose_; }

    retrieval::CancellationToken& cancellation() { return cancel_; }

    /**
     * Route SIGINT/SIGTERM to the cancellation token. Repeated signals are
     * ignored until the run has persisted its state.
     */
    void installSignalHandlers();

    CLI::App& app() { return *app_; }

private:
    void configureLogging();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::string configPathOpt_;
    std::filesystem::path resolvedConfigPath_;
    config::FileConfig fileConfig_;
    bool verbose_{false};
    std::string logLevel_;
    std::string logFile_;

    retrieval::CancellationToken cancel_;
};

} // namespace hoard::cli
