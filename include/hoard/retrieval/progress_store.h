#pragma once

#include <hoard/core/types.h>
#include <hoard/retrieval/retrieval.hpp>
#include <hoard/retrieval/throughput_tracker.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace hoard::retrieval {

struct FailureRecord {
    std::string reason;
    std::string timestamp; // ISO-8601 UTC
};

struct RunStats {
    std::uint64_t total{0};
    std::uint64_t alreadyLocal{0};
    std::uint64_t downloaded{0};
    std::uint64_t failed{0};
    std::uint64_t bytesDownloaded{0};
    std::optional<TimePoint> startTime;
    std::optional<AssetId> lastAssetId;
};

// Persisted/reported form of RunStats; startTime as ISO-8601 UTC
nlohmann::json runStatsToJson(const RunStats& stats);

struct ProgressState {
    std::set<AssetId> completed;
    std::map<AssetId, FailureRecord> failed;
    RunStats stats;
};

/**
 * Durable ledger of completed and failed assets plus run statistics.
 *
 * Marks mutate memory immediately; persistence is caller-driven through save()
 * or flushIfDue(). `completed` and `failed` are kept disjoint. All members are
 * safe to call from scheduler worker threads.
 */
class ProgressStore {
public:
    explicit ProgressStore(std::filesystem::path path, std::size_t saveEvery = 10);

    ProgressStore(const ProgressStore&) = delete;
    ProgressStore& operator=(const ProgressStore&) = delete;

    /**
     * Merge the persisted file into memory. A missing file keeps the defaults;
     * an unreadable or corrupt file is logged and yields a fresh state.
     */
    ProgressState load();

    /**
     * Write the current state to `<path>.tmp` and rename it over `<path>`.
     * Failures are logged and returned; in-memory state stays authoritative.
     */
    Result<void> save();

    // Saves when at least saveEvery marks happened since the last save
    Result<void> flushIfDue();

    bool isProcessed(const AssetId& id) const;
    bool isCompleted(const AssetId& id) const;
    bool isFailed(const AssetId& id) const;

    void markCompleted(const AssetId& id, std::uint64_t bytes, double durationSeconds);
    void markFailed(const AssetId& id, const std::string& reason);
    void markAlreadyLocal(const AssetId& id);
    bool unmarkCompleted(const AssetId& id);

    void setTotal(std::uint64_t total);
    // Records the start time unless an earlier run already did
    void ensureStartTime(TimePoint now);

    ProgressState snapshot() const;
    RunStats stats() const;
    std::size_t completedCount() const;
    std::size_t failedCount() const;

    // "HH:MM:SS" since stats.startTime, "00:00:00" when unset
    std::string elapsedText(TimePoint now) const;

    ThroughputTracker& throughput() { return tracker_; }
    const ThroughputTracker& throughput() const { return tracker_; }

    const std::filesystem::path& path() const { return path_; }

    /**
     * Delete the persisted file and clear memory.
     */
    Result<void> reset();

private:
    Result<void> saveLocked();

    std::filesystem::path path_;
    std::size_t saveEvery_;
    mutable std::mutex mutex_;
    ProgressState state_;
    ThroughputTracker tracker_;
    std::size_t dirtyMarks_{0};
};

} // namespace hoard::retrieval
