#pragma once

#include <hoard/retrieval/retrieval.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace hoard::retrieval {

struct SpeedSample {
    AssetId assetId;
    std::uint64_t bytes{0};
    double durationSeconds{0.0};

    double sizeMB() const { return static_cast<double>(bytes) / BYTES_PER_MB; }
    double speedMBps() const { return durationSeconds > 0.0 ? sizeMB() / durationSeconds : 0.0; }
};

struct SpeedExtreme {
    AssetId assetId;
    double speedMBps{0.0};
    double sizeMB{0.0};
};

// Counts of rated samples per speed band (MB/s)
struct SpeedDistribution {
    std::size_t below1{0};
    std::size_t from1To5{0};
    std::size_t from5To10{0};
    std::size_t atLeast10{0};
};

struct SpeedSummary {
    double avgMBps{0.0};
    double medianMBps{0.0};
    double minMBps{0.0};
    double maxMBps{0.0};
    double p25MBps{0.0}; // 0 unless more than 3 samples
    double p75MBps{0.0}; // 0 unless more than 3 samples
    double overallAvgMBps{0.0};
    std::optional<SpeedExtreme> fastest;
    std::optional<SpeedExtreme> slowest;
    std::size_t count{0};

    std::uint64_t totalBytes{0};
    double totalSeconds{0.0};
    double avgSizeMB{0.0};
    double avgDurationSeconds{0.0};
    SpeedDistribution distribution;
};

/**
 * Append-only record of completed transfers.
 *
 * Samples with a non-positive duration contribute to totalBytes only; every
 * rate statistic is computed over the remaining ("rated") samples.
 */
class ThroughputTracker {
public:
    void recordSample(const AssetId& assetId, std::uint64_t bytes, double durationSeconds);

    std::optional<SpeedSummary> summary() const;

    // Mean speed of the last `n` rated samples, 0 when there are none
    double recentAverage(std::size_t n = 10) const;

    std::size_t sampleCount() const;

    nlohmann::json toJson() const;
    void loadJson(const nlohmann::json& j);

    void clear();

private:
    void accept(SpeedSample sample);

    mutable std::mutex mutex_;
    std::vector<SpeedSample> samples_;
    std::uint64_t totalBytes_{0};
    std::uint64_t ratedBytes_{0};
    double totalSeconds_{0.0};
    std::optional<SpeedExtreme> fastest_;
    std::optional<SpeedExtreme> slowest_;
};

} // namespace hoard::retrieval
