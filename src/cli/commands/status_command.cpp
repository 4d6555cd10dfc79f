#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <hoard/cli/command.h>
#include <hoard/cli/hoard_cli.h>
#include <hoard/core/time_utils.h>
#include <hoard/retrieval/progress_store.h>
#include <hoard/retrieval/summary_report.h>

#include <chrono>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>

namespace hoard::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Show what the progress file records about previous runs.";
    }

    void registerCommand(CLI::App& app, HoardCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("status", getDescription());
        cmd->add_option("--state-file", stateFile_, "Progress file to inspect.");
        cmd->add_flag("--json", jsonOutput_, "Output as JSON.");
        cmd->add_flag("--failures", showFailures_, "List failed assets with their reasons.");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const fs::path statePath = cli_->resolveStateFile(stateFile_);
        std::error_code ec;
        if (!fs::exists(statePath, ec)) {
            if (jsonOutput_) {
                fmt::print("{}\n", json{{"stateFile", statePath.string()}, {"exists", false}}.dump(2));
            } else {
                fmt::print("No progress recorded yet ({} does not exist)\n", statePath.string());
            }
            return Result<void>();
        }

        retrieval::ProgressStore store(statePath);
        const auto state = store.load();
        const auto speed = store.throughput().summary();
        const auto now = std::chrono::system_clock::now();

        if (jsonOutput_) {
            json out;
            out["stateFile"] = statePath.string();
            out["exists"] = true;
            out["completed"] = state.completed.size();
            out["failed"] = state.failed.size();
            out["stats"] = retrieval::runStatsToJson(state.stats);
            out["elapsed"] = store.elapsedText(now);
            if (speed)
                out["speed"] = retrieval::speedSummaryToJson(*speed);
            if (showFailures_) {
                json failures = json::object();
                for (const auto& [id, rec] : state.failed)
                    failures[id] = {{"reason", rec.reason}, {"timestamp", rec.timestamp}};
                out["failures"] = std::move(failures);
            }
            fmt::print("{}\n", out.dump(2));
            return Result<void>();
        }

        std::string text;
        auto it = std::back_inserter(text);
        fmt::format_to(it, "Progress file: {}\n", statePath.string());
        fmt::format_to(it, "  Completed:      {}\n", state.completed.size());
        fmt::format_to(it, "  Failed:         {}\n", state.failed.size());
        fmt::format_to(it, "  Catalog total:  {}\n", state.stats.total);
        fmt::format_to(it, "  Already local:  {}\n", state.stats.alreadyLocal);
        fmt::format_to(it, "  Downloaded:     {} ({:.2f} GB)\n", state.stats.downloaded,
                       static_cast<double>(state.stats.bytesDownloaded) / BYTES_PER_GB);
        if (state.stats.startTime) {
            fmt::format_to(it, "  First run:      {} ({} ago)\n",
                           time_utils::formatIsoUtc(*state.stats.startTime),
                           store.elapsedText(now));
        }
        if (state.stats.lastAssetId)
            fmt::format_to(it, "  Last asset:     {}\n", *state.stats.lastAssetId);
        if (speed)
            fmt::format_to(it, "\n{}", retrieval::formatSpeedSummary(*speed));
        if (showFailures_ && !state.failed.empty()) {
            fmt::format_to(it, "\nFailed assets:\n");
            for (const auto& [id, rec] : state.failed)
                fmt::format_to(it, "  {}  {}  {}\n", id, rec.timestamp, rec.reason);
        }
        fmt::print("{}", text);
        return Result<void>();
    }

private:
    HoardCLI* cli_{nullptr};
    std::optional<std::string> stateFile_;
    bool jsonOutput_{false};
    bool showFailures_{false};
};

// Factory function
std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace hoard::cli
