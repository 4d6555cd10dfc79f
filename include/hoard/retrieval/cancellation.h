#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace hoard::retrieval {

/**
 * Process-wide cooperative stop flag.
 *
 * requestStop() may be called from any thread. A signal handler must use
 * requestStopFromSignal(), which only touches a lock-free atomic; waiters poll
 * the flag in short slices so they observe it without a notification.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void requestStop() noexcept;
    void requestStopFromSignal() noexcept { stop_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool stopRequested() const noexcept {
        return stop_.load(std::memory_order_relaxed);
    }

    /**
     * Sleep for up to `duration`. Returns false if a stop was requested before
     * or during the wait.
     */
    bool waitFor(std::chrono::milliseconds duration) const;

    void reset() noexcept { stop_.store(false, std::memory_order_relaxed); }

private:
    static constexpr std::chrono::milliseconds kPollSlice{50};

    std::atomic<bool> stop_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace hoard::retrieval
