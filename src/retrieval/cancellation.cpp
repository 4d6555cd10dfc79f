#include <hoard/retrieval/cancellation.h>

#include <algorithm>

namespace hoard::retrieval {

void CancellationToken::requestStop() noexcept {
    stop_.store(true, std::memory_order_relaxed);
    cv_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    if (stopRequested()) {
        return false;
    }
    const auto deadline = std::chrono::steady_clock::now() + duration;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return !stopRequested();
        }
        const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                                          kPollSlice);
        if (cv_.wait_for(lock, slice, [this] { return stopRequested(); })) {
            return false;
        }
    }
}

} // namespace hoard::retrieval
