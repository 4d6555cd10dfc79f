#pragma once

#include <hoard/retrieval/availability_checker.h>
#include <hoard/retrieval/cancellation.h>
#include <hoard/retrieval/progress_store.h>
#include <hoard/retrieval/retrieval.hpp>
#include <hoard/retrieval/retrieval_worker.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace hoard::retrieval {

enum class OutcomeKind {
    Completed, // transferred and verified local
    Failed,    // attempts exhausted; recorded in the store
    Stopped,   // cancellation observed; never recorded
    Skipped    // already processed in a prior run
};

const char* toString(OutcomeKind kind);

struct WorkItem {
    Asset asset;
    int attemptsSoFar{0};
};

struct AssetOutcome {
    AssetId assetId;
    OutcomeKind kind{OutcomeKind::Skipped};
    std::uint64_t bytes{0};
    double durationSeconds{0.0};
    int attempts{0};
    std::string reason;
};

struct ControllerOptions {
    RetryPolicy retry{};
    std::chrono::milliseconds timeout{std::chrono::seconds{300}};
    std::chrono::milliseconds verifyWait{std::chrono::seconds{3}};
    bool force{false};
};

/**
 * Per-asset attempt/verify state machine:
 *
 *   Pending -> Attempting -> (Verifying | Failed) -> (Completed | Attempting)
 *
 * A verification miss consumes an attempt. The controller never writes to the
 * store; the scheduler records the returned outcome.
 */
class RetryVerifyController {
public:
    RetryVerifyController(const RetrievalWorker& worker, const AvailabilityChecker& checker,
                          const ProgressStore& store, const CancellationToken& cancel,
                          ControllerOptions options);

    AssetOutcome run(WorkItem& item) const;

    const ControllerOptions& options() const { return options_; }

private:
    const RetrievalWorker& worker_;
    const AvailabilityChecker& checker_;
    const ProgressStore& store_;
    const CancellationToken& cancel_;
    ControllerOptions options_;
};

/**
 * Apply a terminal outcome to the store. Stopped and Skipped leave it unchanged.
 */
void recordOutcome(ProgressStore& store, const AssetOutcome& outcome);

} // namespace hoard::retrieval
