#include <hoard/retrieval/retry_controller.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace hoard::retrieval {

const char* toString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Completed: return "completed";
        case OutcomeKind::Failed: return "failed";
        case OutcomeKind::Stopped: return "stopped";
        case OutcomeKind::Skipped: return "skipped";
    }
    return "skipped";
}

RetryVerifyController::RetryVerifyController(const RetrievalWorker& worker,
                                             const AvailabilityChecker& checker,
                                             const ProgressStore& store,
                                             const CancellationToken& cancel,
                                             ControllerOptions options)
    : worker_(worker), checker_(checker), store_(store), cancel_(cancel),
      options_(std::move(options)) {}

AssetOutcome RetryVerifyController::run(WorkItem& item) const {
    const auto& asset = item.asset;
    AssetOutcome outcome;
    outcome.assetId = asset.id;

    if (!options_.force && store_.isProcessed(asset.id)) {
        outcome.kind = OutcomeKind::Skipped;
        return outcome;
    }

    const int maxAttempts = std::max(1, options_.retry.maxAttempts);
    bool lastWasVerification = false;
    std::string lastError;

    while (item.attemptsSoFar < maxAttempts) {
        if (item.attemptsSoFar > 0) {
            spdlog::info("Retry {}/{} for {}", item.attemptsSoFar, maxAttempts - 1, asset.id);
            if (!cancel_.waitFor(backoffFor(options_.retry, item.attemptsSoFar))) {
                outcome.kind = OutcomeKind::Stopped;
                outcome.attempts = item.attemptsSoFar;
                return outcome;
            }
        }
        if (cancel_.stopRequested()) {
            outcome.kind = OutcomeKind::Stopped;
            outcome.attempts = item.attemptsSoFar;
            return outcome;
        }

        ++item.attemptsSoFar;
        const auto report = worker_.fetch(asset, options_.timeout);
        if (!report.success) {
            lastWasVerification = false;
            lastError = report.error ? report.error->message : "unknown transfer error";
            spdlog::warn("Attempt {}/{} for {} failed: {}", item.attemptsSoFar, maxAttempts,
                         asset.id, lastError);
            continue;
        }

        if (!cancel_.waitFor(options_.verifyWait)) {
            outcome.kind = OutcomeKind::Stopped;
            outcome.attempts = item.attemptsSoFar;
            return outcome;
        }
        if (checker_.isLocal(asset)) {
            outcome.kind = OutcomeKind::Completed;
            outcome.bytes = report.bytesTransferred;
            outcome.durationSeconds = report.durationSeconds;
            outcome.attempts = item.attemptsSoFar;
            return outcome;
        }
        lastWasVerification = true;
        spdlog::warn("Verification failed for {} after attempt {}/{}", asset.id,
                     item.attemptsSoFar, maxAttempts);
    }

    outcome.kind = OutcomeKind::Failed;
    outcome.attempts = item.attemptsSoFar;
    outcome.reason = lastWasVerification
                         ? fmt::format("verification failed after {} attempts", item.attemptsSoFar)
                         : fmt::format("exhausted retries after {} attempts: {}",
                                       item.attemptsSoFar, lastError);
    return outcome;
}

void recordOutcome(ProgressStore& store, const AssetOutcome& outcome) {
    switch (outcome.kind) {
        case OutcomeKind::Completed:
            store.markCompleted(outcome.assetId, outcome.bytes, outcome.durationSeconds);
            break;
        case OutcomeKind::Failed:
            store.markFailed(outcome.assetId, outcome.reason);
            break;
        case OutcomeKind::Stopped:
        case OutcomeKind::Skipped:
            break;
    }
}

} // namespace hoard::retrieval
