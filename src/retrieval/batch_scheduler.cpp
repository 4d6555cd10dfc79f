#include <hoard/retrieval/batch_scheduler.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hoard::retrieval {

const char* toString(HaltReason reason) {
    switch (reason) {
        case HaltReason::None: return "none";
        case HaltReason::Cancelled: return "cancelled";
        case HaltReason::StorageExhausted: return "storage-exhausted";
    }
    return "none";
}

ScheduleReport& ScheduleReport::operator+=(const ScheduleReport& other) {
    completed += other.completed;
    failed += other.failed;
    skipped += other.skipped;
    stopped += other.stopped;
    bytes += other.bytes;
    if (halt == HaltReason::None) {
        halt = other.halt;
    }
    return *this;
}

int clampConcurrency(int requested) {
    if (requested < kMinConcurrency || requested > kMaxConcurrency) {
        spdlog::warn("Concurrency {} outside [{}, {}]; using 1", requested, kMinConcurrency,
                     kMaxConcurrency);
        return 1;
    }
    return requested;
}

BatchScheduler::BatchScheduler(const RetryVerifyController& controller, ProgressStore& store,
                               const StorageGuard& guard, double minFreeGB,
                               const CancellationToken& cancel, int concurrency)
    : controller_(controller), store_(store), guard_(guard), minFreeGB_(minFreeGB),
      cancel_(cancel), concurrency_(clampConcurrency(concurrency)) {
    if (concurrency_ > 1) {
        pool_ = std::make_unique<TransferPool>(static_cast<std::size_t>(concurrency_));
    }
}

BatchScheduler::~BatchScheduler() {
    if (pool_) {
        pool_->stop();
    }
}

std::size_t BatchScheduler::batchSize() const {
    return concurrency_ == 1 ? 1 : static_cast<std::size_t>(2 * concurrency_);
}

void BatchScheduler::tally(ScheduleReport& report, const AssetOutcome& outcome) {
    recordOutcome(store_, outcome);
    switch (outcome.kind) {
        case OutcomeKind::Completed:
            ++report.completed;
            report.bytes += outcome.bytes;
            spdlog::info("Downloaded {} ({} bytes, {:.1f}s, attempt {})", outcome.assetId,
                         outcome.bytes, outcome.durationSeconds, outcome.attempts);
            break;
        case OutcomeKind::Failed:
            ++report.failed;
            spdlog::error("Failed {}: {}", outcome.assetId, outcome.reason);
            break;
        case OutcomeKind::Stopped:
            ++report.stopped;
            break;
        case OutcomeKind::Skipped:
            ++report.skipped;
            break;
    }
}

ScheduleReport BatchScheduler::run(const std::vector<Asset>& assets) {
    if (concurrency_ == 1) {
        return runSequential(assets);
    }

    ScheduleReport total;
    const std::size_t size = batchSize();
    const std::size_t batches = (assets.size() + size - 1) / size;
    std::span<const Asset> all(assets);
    for (std::size_t offset = 0, index = 1; offset < all.size(); offset += size, ++index) {
        if (cancel_.stopRequested()) {
            total.halt = HaltReason::Cancelled;
            break;
        }
        spdlog::info("Batch {}/{}", index, batches);
        total += runBatch(all.subspan(offset, std::min(size, all.size() - offset)));
        if (total.halt != HaltReason::None) {
            break;
        }
    }
    return total;
}

ScheduleReport BatchScheduler::runBatch(std::span<const Asset> assets) {
    return concurrency_ == 1 ? runSequential(assets) : runConcurrent(assets);
}

ScheduleReport BatchScheduler::runSequential(std::span<const Asset> assets) {
    ScheduleReport report;
    for (const auto& asset : assets) {
        if (cancel_.stopRequested()) {
            report.halt = HaltReason::Cancelled;
            break;
        }
        WorkItem item{asset, 0};
        const auto outcome = controller_.run(item);
        tally(report, outcome);
        if (outcome.kind == OutcomeKind::Stopped) {
            report.halt = HaltReason::Cancelled;
            break;
        }
        if (outcome.kind == OutcomeKind::Skipped) {
            continue;
        }
        // Non-fatal; logged by the store
        (void)store_.flushIfDue();
        if (!guard_.hasSufficientSpace(minFreeGB_)) {
            report.halt = HaltReason::StorageExhausted;
            break;
        }
    }
    return report;
}

ScheduleReport BatchScheduler::runConcurrent(std::span<const Asset> assets) {
    ScheduleReport report;

    for (const auto& asset : assets) {
        if (cancel_.stopRequested()) {
            report.halt = HaltReason::Cancelled;
            break;
        }
        const bool accepted = pool_->submit(asset.id, [this, item = WorkItem{asset, 0}]() mutable {
            return controller_.run(item);
        });
        if (!accepted) {
            spdlog::error("Worker pool is stopping; {} not scheduled", asset.id);
            report.halt = HaltReason::Cancelled;
            break;
        }
    }

    // Started work always finishes; record outcomes as they arrive
    while (auto outcome = pool_->nextCompleted()) {
        tally(report, *outcome);
    }
    if (report.stopped > 0 && report.halt == HaltReason::None) {
        report.halt = HaltReason::Cancelled;
    }

    (void)store_.save();
    if (report.halt == HaltReason::None && !guard_.hasSufficientSpace(minFreeGB_)) {
        report.halt = HaltReason::StorageExhausted;
    }
    return report;
}

} // namespace hoard::retrieval
