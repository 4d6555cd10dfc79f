#include <hoard/retrieval/orchestrator.h>
#include <hoard/retrieval/retrieval_worker.h>
#include <hoard/retrieval/retry_controller.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace hoard::retrieval {

Orchestrator::Orchestrator(OrchestratorConfig config, ICatalogProvider& catalog,
                           ITransportProvider& transport, IAvailabilityProvider& availability,
                           ProgressStore& store, const StorageGuard& guard,
                           CancellationToken& cancel, ProgressCallback onProgress)
    : config_(std::move(config)), catalog_(catalog), transport_(transport),
      availability_(availability), store_(store), guard_(guard), cancel_(cancel),
      onProgress_(std::move(onProgress)) {
    config_.concurrency = clampConcurrency(config_.concurrency);
}

Result<RunSummary> Orchestrator::run() {
    RunSummary summary;
    summary.mode = config_.mode;
    summary.dryRun = config_.dryRun;

    const auto loaded = store_.load();
    if (!loaded.completed.empty() || !loaded.failed.empty()) {
        spdlog::info("Resuming previous session ({} completed, {} failed)",
                     loaded.completed.size(), loaded.failed.size());
    }

    if (!config_.dryRun && !guard_.hasSufficientSpace(config_.minFreeGB)) {
        spdlog::error("Insufficient free space to start (minimum {:.1f} GB)", config_.minFreeGB);
        summary.halt = HaltReason::StorageExhausted;
        finish(summary);
        return summary;
    }
    if (!config_.dryRun) {
        store_.ensureStartTime(std::chrono::system_clock::now());
    }

    const AvailabilityChecker checker(availability_, config_.availability);
    const RetrievalWorker worker(transport_, onProgress_);
    ControllerOptions options;
    options.retry = config_.retry;
    options.timeout = config_.timeout;
    options.verifyWait = config_.verifyWait;
    options.force = config_.force;
    const RetryVerifyController controller(worker, checker, store_, cancel_, options);
    BatchScheduler scheduler(controller, store_, guard_, config_.minFreeGB, cancel_,
                             config_.concurrency);

    spdlog::info("Starting {} run (concurrency {}, sort {}, media {})", toString(config_.mode),
                 config_.concurrency, toString(config_.order), toString(config_.filter.media));

    auto result = config_.mode == RunMode::Streaming ? streaming(checker, scheduler, summary)
                                                     : scanFirst(checker, scheduler, summary);
    if (summary.halt == HaltReason::None) {
        summary.halt = summary.schedule.halt;
    }

    if (config_.dryRun) {
        finish(summary);
        if (!result) {
            return result.error();
        }
        return summary;
    }

    // Non-fatal; the store logs failures
    (void)store_.save();
    if (!result) {
        return result.error();
    }

    if (config_.finalVerify && summary.halt != HaltReason::Cancelled) {
        finalVerification(checker, summary);
    }

    finish(summary);
    return summary;
}

Result<void> Orchestrator::scanFirst(const AvailabilityChecker& checker,
                                     BatchScheduler& scheduler, RunSummary& summary) {
    auto listed = catalog_.listAssets(config_.filter, config_.order);
    if (!listed) {
        spdlog::error("Could not enumerate catalog: {}", listed.error().message);
        return listed.error();
    }
    auto assets = std::move(listed).value();
    if (config_.limit && assets.size() > *config_.limit) {
        assets.resize(*config_.limit);
    }
    store_.setTotal(assets.size());
    spdlog::info("Scanning {} assets", assets.size());

    std::vector<Asset> pending;
    for (std::size_t i = 0; i < assets.size(); ++i) {
        const auto& asset = assets[i];
        if (cancel_.stopRequested()) {
            summary.halt = HaltReason::Cancelled;
            break;
        }
        ++summary.considered;
        if (!config_.force && store_.isProcessed(asset.id)) {
            ++summary.alreadyProcessed;
            continue;
        }
        if (checker.isLocalWithRecheck(asset, cancel_)) {
            ++summary.alreadyLocal;
            if (!config_.dryRun) {
                store_.markAlreadyLocal(asset.id);
                (void)store_.flushIfDue();
            }
        } else if (cancel_.stopRequested()) {
            summary.halt = HaltReason::Cancelled;
            break;
        } else {
            pending.push_back(asset);
        }
        if ((i + 1) % 100 == 0) {
            spdlog::info("Checked {}/{} assets", i + 1, assets.size());
        }
    }
    summary.queued = pending.size();
    spdlog::info("Scan complete: {} already local, {} need downloading", summary.alreadyLocal,
                 pending.size());

    if (config_.dryRun) {
        for (const auto& a : pending) {
            summary.wouldFetch.push_back(a.id);
        }
        return {};
    }
    if (summary.halt != HaltReason::None || pending.empty()) {
        return {};
    }
    summary.schedule = scheduler.run(pending);
    return {};
}

Result<void> Orchestrator::streaming(const AvailabilityChecker& checker,
                                     BatchScheduler& scheduler, RunSummary& summary) {
    std::vector<Asset> batch;
    const std::size_t batchSize = scheduler.batchSize();
    batch.reserve(batchSize);

    auto enumerated = catalog_.forEachAsset(
        config_.filter, config_.order, [&](const Asset& asset) {
            if (config_.limit && summary.considered >= *config_.limit) {
                return false;
            }
            if (cancel_.stopRequested()) {
                summary.halt = HaltReason::Cancelled;
                return false;
            }
            ++summary.considered;
            if (!config_.force && store_.isProcessed(asset.id)) {
                ++summary.alreadyProcessed;
                return true;
            }
            if (checker.isLocal(asset)) {
                ++summary.alreadyLocal;
                if (!config_.dryRun) {
                    store_.markAlreadyLocal(asset.id);
                    (void)store_.flushIfDue();
                }
                return true;
            }
            ++summary.queued;
            if (config_.dryRun) {
                summary.wouldFetch.push_back(asset.id);
                return true;
            }
            batch.push_back(asset);
            if (batch.size() >= batchSize) {
                summary.schedule += scheduler.runBatch(batch);
                batch.clear();
                return summary.schedule.halt == HaltReason::None;
            }
            return true;
        });

    if (!batch.empty() && summary.halt == HaltReason::None &&
        summary.schedule.halt == HaltReason::None) {
        summary.schedule += scheduler.runBatch(batch);
        batch.clear();
    }
    store_.setTotal(summary.considered);

    if (!enumerated) {
        spdlog::error("Catalog enumeration failed: {}", enumerated.error().message);
        return enumerated.error();
    }
    return {};
}

void Orchestrator::finalVerification(const AvailabilityChecker& checker, RunSummary& summary) {
    const auto settle = config_.verifyWait * 2;
    spdlog::info("Final verification: waiting {} ms before re-checking completed assets",
                 settle.count());
    if (!cancel_.waitFor(settle)) {
        return;
    }

    const auto completed = store_.snapshot().completed;
    for (const auto& id : completed) {
        if (cancel_.stopRequested()) {
            break;
        }
        std::optional<Asset> asset;
        try {
            asset = catalog_.findAsset(id);
        } catch (const std::exception& e) {
            spdlog::warn("Catalog lookup for {} failed: {}", id, e.what());
            continue;
        }
        if (!asset) {
            continue;
        }
        if (checker.isLocal(*asset)) {
            ++summary.verified;
        } else {
            spdlog::warn("{} is no longer local; it will be fetched again on the next run", id);
            store_.unmarkCompleted(id);
            ++summary.unverified;
        }
    }
    if (summary.unverified > 0) {
        (void)store_.save();
        spdlog::warn("{} assets may still be downloading; run again later", summary.unverified);
    }
}

void Orchestrator::finish(RunSummary& summary) const {
    const auto now = std::chrono::system_clock::now();
    summary.stats = store_.stats();
    summary.completedTotal = store_.completedCount();
    summary.failedTotal = store_.failedCount();
    summary.speed = store_.throughput().summary();
    summary.elapsed = store_.elapsedText(now);
    if (auto free = guard_.freeSpaceGB()) {
        summary.freeSpaceGB = free.value();
    }
}

} // namespace hoard::retrieval
