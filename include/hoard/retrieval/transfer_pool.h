#pragma once

#include <hoard/retrieval/retry_controller.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace hoard::retrieval {

/**
 * Fixed set of workers that run one asset's job each and hand back its
 * AssetOutcome in completion order. Created once per run and reused for
 * every batch.
 *
 * A job that throws still produces exactly one outcome (Failed), so a caller
 * draining with nextCompleted() never waits on work that will not report.
 */
class TransferPool {
public:
    using Job = std::function<AssetOutcome()>;

    explicit TransferPool(std::size_t workers);
    ~TransferPool();

    TransferPool(const TransferPool&) = delete;
    TransferPool& operator=(const TransferPool&) = delete;

    // false once stop() has been called; the job is not run
    bool submit(AssetId assetId, Job job);

    // Blocks for the next finished outcome; empty when nothing is outstanding
    std::optional<AssetOutcome> nextCompleted();

    // Rejects new jobs, lets queued ones finish and joins the workers
    void stop();

    std::size_t size() const { return workerCount_; }

private:
    struct Pending {
        AssetId assetId;
        Job job;
    };

    void workerLoop();
    static AssetOutcome runGuarded(Pending& pending);

    std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable outcomeReady_;
    std::deque<Pending> queue_;
    std::deque<AssetOutcome> finished_;
    std::size_t outstanding_{0};
    bool stopping_{false};

    std::size_t workerCount_;
    std::vector<std::jthread> workers_;
};

} // namespace hoard::retrieval
