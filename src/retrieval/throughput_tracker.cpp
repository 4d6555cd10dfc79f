#include <hoard/retrieval/throughput_tracker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace hoard::retrieval {

using json = nlohmann::json;

namespace {

json extremeToJson(const std::optional<SpeedExtreme>& e) {
    if (!e)
        return nullptr;
    return json{{"assetId", e->assetId}, {"speedMBps", e->speedMBps}, {"sizeMB", e->sizeMB}};
}

// Hand-edited or older files may carry strings or negatives where numbers belong
std::optional<std::uint64_t> readBytes(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end())
        return std::uint64_t{0};
    if (it->is_number_unsigned())
        return it->get<std::uint64_t>();
    if (it->is_number_integer() && it->get<std::int64_t>() >= 0)
        return static_cast<std::uint64_t>(it->get<std::int64_t>());
    return std::nullopt;
}

std::optional<double> readNumber(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end())
        return 0.0;
    if (it->is_number())
        return it->get<double>();
    return std::nullopt;
}

std::optional<SpeedExtreme> extremeFromJson(const json& j) {
    if (!j.is_object() || !j.contains("assetId") || !j["assetId"].is_string())
        return std::nullopt;
    SpeedExtreme e;
    e.assetId = j["assetId"].get<std::string>();
    const auto speed = readNumber(j, "speedMBps");
    const auto size = readNumber(j, "sizeMB");
    if (!speed || !size)
        return std::nullopt;
    e.speedMBps = *speed;
    e.sizeMB = *size;
    return e;
}

} // namespace

void ThroughputTracker::recordSample(const AssetId& assetId, std::uint64_t bytes,
                                     double durationSeconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    accept(SpeedSample{assetId, bytes, durationSeconds});
}

void ThroughputTracker::accept(SpeedSample sample) {
    totalBytes_ += sample.bytes;
    if (sample.durationSeconds <= 0.0) {
        return;
    }
    ratedBytes_ += sample.bytes;
    totalSeconds_ += sample.durationSeconds;

    const double speed = sample.speedMBps();
    if (!fastest_ || speed > fastest_->speedMBps) {
        fastest_ = SpeedExtreme{sample.assetId, speed, sample.sizeMB()};
    }
    if (!slowest_ || speed < slowest_->speedMBps) {
        slowest_ = SpeedExtreme{sample.assetId, speed, sample.sizeMB()};
    }
    samples_.push_back(std::move(sample));
}

std::optional<SpeedSummary> ThroughputTracker::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.empty()) {
        return std::nullopt;
    }

    std::vector<double> speeds;
    speeds.reserve(samples_.size());
    double sizeSum = 0.0;
    SpeedSummary s;
    for (const auto& sample : samples_) {
        const double v = sample.speedMBps();
        speeds.push_back(v);
        sizeSum += sample.sizeMB();
        if (v < 1.0)
            ++s.distribution.below1;
        else if (v < 5.0)
            ++s.distribution.from1To5;
        else if (v < 10.0)
            ++s.distribution.from5To10;
        else
            ++s.distribution.atLeast10;
    }
    std::sort(speeds.begin(), speeds.end());
    const std::size_t n = speeds.size();

    s.count = n;
    s.avgMBps = std::accumulate(speeds.begin(), speeds.end(), 0.0) / static_cast<double>(n);
    s.medianMBps = speeds[n / 2];
    s.minMBps = speeds.front();
    s.maxMBps = speeds.back();
    if (n > 3) {
        s.p25MBps = speeds[n / 4];
        s.p75MBps = speeds[(3 * n) / 4];
    }
    s.totalBytes = totalBytes_;
    s.totalSeconds = totalSeconds_;
    s.overallAvgMBps =
        totalSeconds_ > 0.0 ? (static_cast<double>(ratedBytes_) / BYTES_PER_MB) / totalSeconds_
                            : 0.0;
    s.avgSizeMB = sizeSum / static_cast<double>(n);
    s.avgDurationSeconds = totalSeconds_ / static_cast<double>(n);
    s.fastest = fastest_;
    s.slowest = slowest_;
    return s;
}

double ThroughputTracker::recentAverage(std::size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.empty() || n == 0) {
        return 0.0;
    }
    const std::size_t take = std::min(n, samples_.size());
    double sum = 0.0;
    for (auto it = samples_.end() - static_cast<std::ptrdiff_t>(take); it != samples_.end(); ++it) {
        sum += it->speedMBps();
    }
    return sum / static_cast<double>(take);
}

std::size_t ThroughputTracker::sampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

json ThroughputTracker::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json samples = json::array();
    for (const auto& s : samples_) {
        samples.push_back(json{{"assetId", s.assetId},
                               {"bytes", s.bytes},
                               {"durationSeconds", s.durationSeconds}});
    }
    return json{{"samples", std::move(samples)},
                {"totals",
                 {{"bytes", totalBytes_}, {"ratedBytes", ratedBytes_}, {"seconds", totalSeconds_}}},
                {"fastest", extremeToJson(fastest_)},
                {"slowest", extremeToJson(slowest_)}};
}

void ThroughputTracker::loadJson(const json& j) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
    totalBytes_ = 0;
    ratedBytes_ = 0;
    totalSeconds_ = 0.0;
    fastest_.reset();
    slowest_.reset();

    if (!j.is_object()) {
        return;
    }
    if (j.contains("samples") && j["samples"].is_array()) {
        for (const auto& e : j["samples"]) {
            if (!e.is_object() || !e.contains("assetId") || !e["assetId"].is_string()) {
                spdlog::debug("Skipping malformed speed sample");
                continue;
            }
            const auto bytes = readBytes(e, "bytes");
            const auto seconds = readNumber(e, "durationSeconds");
            if (!bytes || !seconds) {
                spdlog::warn("Skipping speed sample for {} with non-numeric fields",
                             e["assetId"].get<std::string>());
                continue;
            }
            accept(SpeedSample{e["assetId"].get<std::string>(), *bytes, *seconds});
        }
    }
    // Persisted totals also cover zero-duration samples that were not kept
    if (j.contains("totals") && j["totals"].is_object()) {
        const auto& t = j["totals"];
        totalBytes_ = std::max(totalBytes_, readBytes(t, "bytes").value_or(0));
    }
    if (auto f = j.contains("fastest") ? extremeFromJson(j["fastest"]) : std::nullopt) {
        if (!fastest_ || f->speedMBps > fastest_->speedMBps)
            fastest_ = f;
    }
    if (auto s = j.contains("slowest") ? extremeFromJson(j["slowest"]) : std::nullopt) {
        if (!slowest_ || s->speedMBps < slowest_->speedMBps)
            slowest_ = s;
    }
}

void ThroughputTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
    totalBytes_ = 0;
    ratedBytes_ = 0;
    totalSeconds_ = 0.0;
    fastest_.reset();
    slowest_.reset();
}

} // namespace hoard::retrieval
