#pragma once

#include <hoard/retrieval/cancellation.h>
#include <hoard/retrieval/progress_store.h>
#include <hoard/retrieval/retry_controller.h>
#include <hoard/retrieval/storage_guard.h>
#include <hoard/retrieval/transfer_pool.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace hoard::retrieval {

enum class HaltReason { None, Cancelled, StorageExhausted };

const char* toString(HaltReason reason);

struct ScheduleReport {
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t skipped{0};
    std::size_t stopped{0};
    std::uint64_t bytes{0};
    HaltReason halt{HaltReason::None};

    ScheduleReport& operator+=(const ScheduleReport& other);
};

inline constexpr int kMinConcurrency = 1;
inline constexpr int kMaxConcurrency = 10;

// Values outside [1, 10] fall back to 1
int clampConcurrency(int requested);

/**
 * Runs controllers over assets with bounded concurrency.
 *
 * With concurrency 1 assets run strictly in order on the calling thread and
 * the store is flushed every saveEvery marks. Otherwise batches of
 * 2 x concurrency go to one pool that lives as long as the scheduler;
 * outcomes are recorded in completion order, then the store is saved and free
 * space is checked before the next batch.
 */
class BatchScheduler {
public:
    BatchScheduler(const RetryVerifyController& controller, ProgressStore& store,
                   const StorageGuard& guard, double minFreeGB, const CancellationToken& cancel,
                   int concurrency);
    ~BatchScheduler();

    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    ScheduleReport run(const std::vector<Asset>& assets);

    // One batch (or, sequentially, one run of assets) followed by the storage check
    ScheduleReport runBatch(std::span<const Asset> assets);

    std::size_t batchSize() const;
    int concurrency() const { return concurrency_; }

private:
    ScheduleReport runSequential(std::span<const Asset> assets);
    ScheduleReport runConcurrent(std::span<const Asset> assets);
    void tally(ScheduleReport& report, const AssetOutcome& outcome);

    const RetryVerifyController& controller_;
    ProgressStore& store_;
    const StorageGuard& guard_;
    double minFreeGB_;
    const CancellationToken& cancel_;
    int concurrency_;
    std::unique_ptr<TransferPool> pool_;
};

} // namespace hoard::retrieval
