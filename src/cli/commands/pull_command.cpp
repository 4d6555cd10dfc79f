#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <hoard/catalog/manifest_catalog.h>
#include <hoard/cli/command.h>
#include <hoard/cli/hoard_cli.h>
#include <hoard/core/time_utils.h>
#include <hoard/retrieval/orchestrator.h>
#include <hoard/retrieval/progress_store.h>
#include <hoard/retrieval/storage_guard.h>
#include <hoard/retrieval/summary_report.h>
#include <hoard/transport/curl_transport.h>
#include <hoard/transport/library_layout.h>
#include <hoard/transport/local_availability.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

namespace hoard::cli {

namespace fs = std::filesystem;

namespace {

std::chrono::milliseconds secondsToMs(double seconds) {
    return std::chrono::milliseconds{static_cast<std::int64_t>(seconds * 1000.0)};
}

} // namespace

class PullCommand : public ICommand {
public:
    std::string getName() const override { return "pull"; }

    std::string getDescription() const override {
        return "Fetch every asset in the manifest that is not yet stored locally.";
    }

    void registerCommand(CLI::App& app, HoardCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("pull", getDescription());

        // Inputs and locations
        cmd->add_option("--manifest", manifest_, "JSON manifest listing the collection's assets.");
        cmd->add_option("--library-dir", libraryDir_, "Directory assets are stored under.");
        cmd->add_option("--state-file", stateFile_, "Progress file used to resume runs.");

        // Selection
        cmd->add_option("--sort", sort_, "Processing order (default: oldest).")
            ->check(CLI::IsMember({"oldest", "newest", "smallest", "largest", "random"}));
        cmd->add_option("--media-type", mediaType_, "Media kinds to fetch (default: all).")
            ->check(CLI::IsMember({"all", "photo", "video"}));
        cmd->add_option("--from-date", fromDate_, "Only assets created on or after YYYY-MM-DD.")
            ->check(CLI::Validator(
                [](std::string& s) {
                    return time_utils::parseTimestamp(s)
                               ? std::string{}
                               : std::string{"invalid date (expected YYYY-MM-DD)"};
                },
                "DATE"));
        cmd->add_option("--limit", limit_, "Consider at most N catalog items.")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--seed", seed_, "Seed for --sort random.");

        // Transfer policy
        cmd->add_option("--timeout", timeoutSeconds_, "Per-attempt timeout in seconds (default 300).")
            ->check(CLI::PositiveNumber);
        cmd->add_option("--retry-count", retryCount_, "Attempts per asset (default 3).")
            ->check(CLI::Range(1, 100));
        cmd->add_option("--retry-delay", retryDelaySeconds_,
                        "Seconds to wait before each retry (default 10).")
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--verify-wait", verifyWaitSeconds_,
                        "Seconds to wait before re-checking a fetched asset (default 3).")
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--min-free-space", minFreeSpaceGB_,
                        "Stop when free space drops below this many GB (default 10).")
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--concurrent", concurrency_, "Parallel transfers, 1-10 (default 1).")
            ->check(CLI::Range(1, 10));

        // Run shape
        cmd->add_flag("--no-scan", noScan_,
                      "Stream the catalog instead of scanning it before fetching.");
        cmd->add_flag("--dry-run", dryRun_, "List what would be fetched; change nothing.");
        cmd->add_flag("--final-verify", finalVerify_,
                      "Re-check every asset completed this run before exiting.");
        cmd->add_flag("--reset", reset_, "Delete the progress file before starting.");
        cmd->add_flag("--force", force_,
                      "Re-process assets already recorded in the progress file.");
        cmd->add_flag("--json", jsonOutput_, "Emit the run summary as JSON on stdout.");

        cmd->callback([this]() { cli_->setPendingCommand(this); });

        cmd->footer(R"(Behavior:
  - Completed and failed assets are recorded in the progress file and skipped on later runs.
  - Ctrl-C stops scheduling new work; transfers in flight finish and progress is saved.
  - Values not given on the command line come from [retrieval] in the config file.)");
    }

    Result<void> execute() override {
        const auto& fc = cli_->fileConfig();

        // Flag > config file > default
        const fs::path statePath = cli_->resolveStateFile(stateFile_);
        const fs::path libraryDir = cli_->resolveLibraryDir(libraryDir_);
        fs::path manifestPath;
        if (manifest_)
            manifestPath = config::expand_tilde(*manifest_);
        else if (fc.manifest)
            manifestPath = *fc.manifest;
        else
            return Error{ErrorCode::InvalidArgument,
                         "No manifest given (use --manifest or [retrieval] manifest)"};

        retrieval::OrchestratorConfig cfg;
        cfg.mode = noScan_ ? retrieval::RunMode::Streaming : retrieval::RunMode::ScanFirst;
        cfg.dryRun = dryRun_;
        cfg.finalVerify = finalVerify_;
        cfg.force = force_;
        cfg.concurrency = concurrency_.value_or(fc.concurrency.value_or(1));
        cfg.retry.maxAttempts = retryCount_.value_or(fc.retryCount.value_or(3));
        cfg.retry.initialBackoff =
            secondsToMs(retryDelaySeconds_.value_or(fc.retryDelaySeconds.value_or(10.0)));
        cfg.retry.maxBackoff = std::max(cfg.retry.maxBackoff, cfg.retry.initialBackoff);
        cfg.timeout = secondsToMs(timeoutSeconds_.value_or(fc.timeoutSeconds.value_or(300.0)));
        cfg.verifyWait =
            secondsToMs(verifyWaitSeconds_.value_or(fc.verifyWaitSeconds.value_or(3.0)));
        cfg.minFreeGB = minFreeSpaceGB_.value_or(fc.minFreeSpaceGB.value_or(10.0));
        if (fc.minConfirmedBytes)
            cfg.availability.minConfirmedBytes = *fc.minConfirmedBytes;
        if (limit_)
            cfg.limit = *limit_;

        if (cfg.retry.maxAttempts < 1)
            return Error{ErrorCode::InvalidArgument, "retry_count must be at least 1"};

        const std::string sortText = sort_.value_or(fc.sort.value_or("oldest"));
        auto order = retrieval::parseSortOrder(sortText);
        if (!order)
            return Error{ErrorCode::InvalidArgument, fmt::format("Unknown sort '{}'", sortText)};
        cfg.order = *order;

        const std::string mediaText = mediaType_.value_or(fc.mediaType.value_or("all"));
        auto media = retrieval::parseMediaFilter(mediaText);
        if (!media)
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Unknown media type '{}'", mediaText)};
        cfg.filter.media = *media;
        if (fromDate_) {
            cfg.filter.fromDate = time_utils::parseTimestamp(*fromDate_);
        }

        auto catalogRes = catalog::ManifestCatalog::fromFile(manifestPath, seed_);
        if (!catalogRes)
            return catalogRes.error();
        auto catalog = std::move(catalogRes).value();
        spdlog::info("Manifest {} lists {} assets", manifestPath.string(), catalog->size());

        std::error_code ec;
        if (!dryRun_) {
            fs::create_directories(libraryDir, ec);
            if (ec)
                return Error{ErrorCode::PermissionDenied,
                             fmt::format("Cannot create library directory {}: {}",
                                         libraryDir.string(), ec.message())};
            if (statePath.has_parent_path()) {
                fs::create_directories(statePath.parent_path(), ec);
                if (ec)
                    return Error{ErrorCode::PermissionDenied,
                                 fmt::format("Cannot create state directory {}: {}",
                                             statePath.parent_path().string(), ec.message())};
            }
        }

        retrieval::ProgressStore store(statePath, fc.saveEvery.value_or(10));
        if (reset_ && !dryRun_) {
            if (auto r = store.reset(); !r)
                return r.error();
            spdlog::info("Progress file {} reset", statePath.string());
        }

        transport::LibraryLayout layout(libraryDir);
        transport::CurlTransport transport(layout);
        transport::LocalAvailability availability(
            layout,
            transport::LocalAvailability::readLimitFor(cfg.availability.minConfirmedBytes));
        retrieval::StorageGuard guard(libraryDir);

        // A live progress line only makes sense for one transfer at a time
        retrieval::ProgressCallback onProgress;
        if (cfg.concurrency == 1 && !jsonOutput_) {
            onProgress = [](const retrieval::TransferProgress& p) {
                if (p.fraction) {
                    fmt::print(stderr, "\r  {} {:5.1f}% ({:.1f} MB)", p.assetId,
                               *p.fraction * 100.0,
                               static_cast<double>(p.bytesSoFar) / BYTES_PER_MB);
                } else {
                    fmt::print(stderr, "\r  {} {:.1f} MB", p.assetId,
                               static_cast<double>(p.bytesSoFar) / BYTES_PER_MB);
                }
                std::fflush(stderr);
            };
        }

        cli_->installSignalHandlers();

        retrieval::Orchestrator orchestrator(cfg, *catalog, transport, availability, store, guard,
                                             cli_->cancellation(), onProgress);
        auto result = orchestrator.run();
        if (onProgress)
            fmt::print(stderr, "\n");
        if (!result)
            return result.error();

        const auto& summary = result.value();
        if (jsonOutput_) {
            fmt::print("{}\n", retrieval::summaryToJson(summary).dump(2));
        } else {
            fmt::print("{}", retrieval::formatSummary(summary));
        }
        return Result<void>();
    }

private:
    HoardCLI* cli_{nullptr};

    std::optional<std::string> manifest_;
    std::optional<std::string> libraryDir_;
    std::optional<std::string> stateFile_;
    std::optional<std::string> sort_;
    std::optional<std::string> mediaType_;
    std::optional<std::string> fromDate_;
    std::optional<std::size_t> limit_;
    std::optional<std::uint64_t> seed_;

    std::optional<double> timeoutSeconds_;
    std::optional<int> retryCount_;
    std::optional<double> retryDelaySeconds_;
    std::optional<double> verifyWaitSeconds_;
    std::optional<double> minFreeSpaceGB_;
    std::optional<int> concurrency_;

    bool noScan_{false};
    bool dryRun_{false};
    bool finalVerify_{false};
    bool reset_{false};
    bool force_{false};
    bool jsonOutput_{false};
};

// Factory function
std::unique_ptr<ICommand> createPullCommand() {
    return std::make_unique<PullCommand>();
}

} // namespace hoard::cli
