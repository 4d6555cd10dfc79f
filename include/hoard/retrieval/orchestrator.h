#pragma once

#include <hoard/retrieval/availability_checker.h>
#include <hoard/retrieval/batch_scheduler.h>
#include <hoard/retrieval/cancellation.h>
#include <hoard/retrieval/progress_store.h>
#include <hoard/retrieval/retrieval.hpp>
#include <hoard/retrieval/storage_guard.h>
#include <hoard/retrieval/throughput_tracker.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hoard::retrieval {

struct OrchestratorConfig {
    RunMode mode{RunMode::ScanFirst};
    CatalogFilter filter{};
    SortOrder order{SortOrder::Oldest};
    std::optional<std::size_t> limit{}; // cap on catalog items considered
    bool dryRun{false};
    int concurrency{1};
    RetryPolicy retry{};
    std::chrono::milliseconds timeout{std::chrono::seconds{300}};
    std::chrono::milliseconds verifyWait{std::chrono::seconds{3}};
    double minFreeGB{10.0};
    bool finalVerify{false};
    bool force{false};
    AvailabilityPolicy availability{};
};

struct RunSummary {
    RunMode mode{RunMode::ScanFirst};
    bool dryRun{false};
    std::size_t considered{0};        // catalog items looked at this run
    std::size_t alreadyProcessed{0};  // skipped because of the ledger
    std::size_t alreadyLocal{0};      // found local by the scan this run
    std::size_t queued{0};            // handed to the scheduler (or would be, in a dry run)
    std::vector<AssetId> wouldFetch;  // dry run only
    ScheduleReport schedule;
    std::size_t verified{0};          // final sweep
    std::size_t unverified{0};        // final sweep, unmarked for the next run
    HaltReason halt{HaltReason::None};
    RunStats stats;
    std::size_t completedTotal{0};
    std::size_t failedTotal{0};
    std::optional<SpeedSummary> speed;
    std::string elapsed{"00:00:00"};
    std::optional<double> freeSpaceGB;
};

/**
 * Drives one retrieval run: enumerate, filter what is already done or local,
 * schedule the rest, persist, optionally re-verify, and summarize.
 *
 * ScanFirst materializes the candidate list before fetching; Streaming hands
 * batches to the scheduler as they fill. Both leave the store in the same
 * state for the same catalog.
 */
class Orchestrator {
public:
    Orchestrator(OrchestratorConfig config, ICatalogProvider& catalog,
                 ITransportProvider& transport, IAvailabilityProvider& availability,
                 ProgressStore& store, const StorageGuard& guard, CancellationToken& cancel,
                 ProgressCallback onProgress = {});

    Result<RunSummary> run();

    const OrchestratorConfig& config() const { return config_; }

private:
    Result<void> scanFirst(const AvailabilityChecker& checker, BatchScheduler& scheduler,
                           RunSummary& summary);
    Result<void> streaming(const AvailabilityChecker& checker, BatchScheduler& scheduler,
                           RunSummary& summary);
    void finalVerification(const AvailabilityChecker& checker, RunSummary& summary);
    void finish(RunSummary& summary) const;

    OrchestratorConfig config_;
    ICatalogProvider& catalog_;
    ITransportProvider& transport_;
    IAvailabilityProvider& availability_;
    ProgressStore& store_;
    const StorageGuard& guard_;
    CancellationToken& cancel_;
    ProgressCallback onProgress_;
};

} // namespace hoard::retrieval
