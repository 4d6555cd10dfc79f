#include <hoard/retrieval/transfer_pool.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace hoard::retrieval {

TransferPool::TransferPool(std::size_t workers) : workerCount_(workers == 0 ? 1 : workers) {
    workers_.reserve(workerCount_);
    for (std::size_t i = 0; i < workerCount_; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }
    spdlog::debug("TransferPool: started {} workers", workerCount_);
}

TransferPool::~TransferPool() {
    stop();
}

bool TransferPool::submit(AssetId assetId, Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(Pending{std::move(assetId), std::move(job)});
        ++outstanding_;
    }
    workAvailable_.notify_one();
    return true;
}

std::optional<AssetOutcome> TransferPool::nextCompleted() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (outstanding_ == 0 && finished_.empty()) {
        return std::nullopt;
    }
    outcomeReady_.wait(lock, [this] { return !finished_.empty(); });
    auto outcome = std::move(finished_.front());
    finished_.pop_front();
    --outstanding_;
    return outcome;
}

void TransferPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    workAvailable_.notify_all();

    // Workers drain the queue before exiting
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

AssetOutcome TransferPool::runGuarded(Pending& pending) {
    AssetOutcome failed;
    failed.assetId = pending.assetId;
    failed.kind = OutcomeKind::Failed;
    try {
        return pending.job();
    } catch (const std::exception& e) {
        spdlog::error("Job for {} threw: {}", pending.assetId, e.what());
        failed.reason = std::string("unexpected error: ") + e.what();
    } catch (...) {
        spdlog::error("Job for {} threw a non-standard exception", pending.assetId);
        failed.reason = "unexpected error: unknown exception";
    }
    return failed;
}

void TransferPool::workerLoop() {
    while (true) {
        Pending pending;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            workAvailable_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            pending = std::move(queue_.front());
            queue_.pop_front();
        }

        auto outcome = runGuarded(pending);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_.push_back(std::move(outcome));
        }
        outcomeReady_.notify_one();
    }
}

} // namespace hoard::retrieval
