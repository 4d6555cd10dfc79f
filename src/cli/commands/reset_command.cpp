#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <hoard/cli/command.h>
#include <hoard/cli/hoard_cli.h>
#include <hoard/retrieval/progress_store.h>

#include <filesystem>
#include <optional>
#include <string>

namespace hoard::cli {

namespace fs = std::filesystem;

class ResetCommand : public ICommand {
public:
    std::string getName() const override { return "reset"; }

    std::string getDescription() const override {
        return "Delete the progress file so the next pull starts from scratch.";
    }

    void registerCommand(CLI::App& app, HoardCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("reset", getDescription());
        cmd->add_option("--state-file", stateFile_, "Progress file to delete.");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
        cmd->footer("Downloaded files in the library directory are left untouched.");
    }

    Result<void> execute() override {
        const fs::path statePath = cli_->resolveStateFile(stateFile_);
        std::error_code ec;
        const bool existed = fs::exists(statePath, ec);

        retrieval::ProgressStore store(statePath);
        if (auto r = store.reset(); !r)
            return r;

        if (existed) {
            spdlog::info("Removed progress file {}", statePath.string());
            fmt::print("Progress reset: {}\n", statePath.string());
        } else {
            fmt::print("Nothing to reset ({} does not exist)\n", statePath.string());
        }
        return Result<void>();
    }

private:
    HoardCLI* cli_{nullptr};
    std::optional<std::string> stateFile_;
};

// Factory function
std::unique_ptr<ICommand> createResetCommand() {
    return std::make_unique<ResetCommand>();
}

} // namespace hoard::cli
