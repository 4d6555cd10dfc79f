#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <hoard/retrieval/throughput_tracker.h>

#include <cstdint>

using namespace hoard;
using namespace hoard::retrieval;
using Catch::Matchers::WithinAbs;

namespace {
constexpr std::uint64_t MB = 1024 * 1024;
}

TEST_CASE("ThroughputTracker: Empty tracker has no summary", "[retrieval][throughput]") {
    ThroughputTracker tracker;
    CHECK_FALSE(tracker.summary().has_value());
    CHECK(tracker.sampleCount() == 0);
    CHECK(tracker.recentAverage() == 0.0);
}

TEST_CASE("ThroughputTracker: Per-download and overall averages", "[retrieval][throughput]") {
    ThroughputTracker tracker;
    tracker.recordSample("a", 10 * MB, 2.0);
    tracker.recordSample("b", 20 * MB, 4.0);

    auto s = tracker.summary();
    REQUIRE(s.has_value());
    CHECK(s->count == 2);
    CHECK_THAT(s->avgMBps, WithinAbs(5.0, 1e-9));
    CHECK_THAT(s->overallAvgMBps, WithinAbs(5.0, 1e-9));
    CHECK_THAT(s->minMBps, WithinAbs(5.0, 1e-9));
    CHECK_THAT(s->maxMBps, WithinAbs(5.0, 1e-9));
    CHECK(s->totalBytes == 30 * MB);
    CHECK_THAT(s->totalSeconds, WithinAbs(6.0, 1e-9));
    CHECK_THAT(s->avgSizeMB, WithinAbs(15.0, 1e-9));
    CHECK_THAT(s->avgDurationSeconds, WithinAbs(3.0, 1e-9));
    // Too few samples for quartiles
    CHECK(s->p25MBps == 0.0);
    CHECK(s->p75MBps == 0.0);
}

TEST_CASE("ThroughputTracker: Overall average weights by bytes", "[retrieval][throughput]") {
    ThroughputTracker tracker;
    tracker.recordSample("fast", 90 * MB, 1.0); // 90 MB/s
    tracker.recordSample("slow", 10 * MB, 9.0); // ~1.11 MB/s

    auto s = tracker.summary();
    REQUIRE(s.has_value());
    CHECK_THAT(s->overallAvgMBps, WithinAbs(10.0, 1e-9));
    CHECK_THAT(s->avgMBps, WithinAbs((90.0 + 10.0 / 9.0) / 2.0, 1e-9));
    REQUIRE(s->fastest.has_value());
    REQUIRE(s->slowest.has_value());
    CHECK(s->fastest->assetId == "fast");
    CHECK(s->slowest->assetId == "slow");
    CHECK_THAT(s->fastest->sizeMB, WithinAbs(90.0, 1e-9));
}

TEST_CASE("ThroughputTracker: Median, quartiles and distribution", "[retrieval][throughput]") {
    ThroughputTracker tracker;
    // Speeds 0.5, 2, 4, 6, 8, 12, 20, 40 MB/s (all 1-second transfers)
    const double speeds[] = {6.0, 0.5, 40.0, 2.0, 12.0, 4.0, 20.0, 8.0};
    int i = 0;
    for (double v : speeds) {
        tracker.recordSample("s" + std::to_string(i++), static_cast<std::uint64_t>(v * MB), 1.0);
    }

    auto s = tracker.summary();
    REQUIRE(s.has_value());
    CHECK(s->count == 8);
    CHECK_THAT(s->medianMBps, WithinAbs(8.0, 1e-9)); // sorted[4]
    CHECK_THAT(s->p25MBps, WithinAbs(4.0, 1e-9));    // sorted[2]
    CHECK_THAT(s->p75MBps, WithinAbs(20.0, 1e-9));   // sorted[6]
    CHECK_THAT(s->minMBps, WithinAbs(0.5, 1e-9));
    CHECK_THAT(s->maxMBps, WithinAbs(40.0, 1e-9));

    CHECK(s->distribution.below1 == 1);
    CHECK(s->distribution.from1To5 == 2);
    CHECK(s->distribution.from5To10 == 2);
    CHECK(s->distribution.atLeast10 == 3);
}

TEST_CASE("ThroughputTracker: Zero-duration samples count bytes only", "[retrieval][throughput]") {
    ThroughputTracker tracker;
    tracker.recordSample("instant", 50 * MB, 0.0);
    CHECK_FALSE(tracker.summary().has_value());

    tracker.recordSample("timed", 10 * MB, 2.0);
    auto s = tracker.summary();
    REQUIRE(s.has_value());
    CHECK(s->count == 1);
    CHECK(s->totalBytes == 60 * MB);
    CHECK_THAT(s->overallAvgMBps, WithinAbs(5.0, 1e-9));
}

TEST_CASE("ThroughputTracker: Recent average covers the last samples", "[retrieval][throughput]") {
    ThroughputTracker tracker;
    tracker.recordSample("a", 1 * MB, 1.0);
    tracker.recordSample("b", 3 * MB, 1.0);
    tracker.recordSample("c", 5 * MB, 1.0);

    CHECK_THAT(tracker.recentAverage(2), WithinAbs(4.0, 1e-9));
    CHECK_THAT(tracker.recentAverage(10), WithinAbs(3.0, 1e-9));
    CHECK(tracker.recentAverage(0) == 0.0);
}

TEST_CASE("ThroughputTracker: JSON persistence restores statistics", "[retrieval][throughput]") {
    ThroughputTracker tracker;
    tracker.recordSample("a", 10 * MB, 2.0);
    tracker.recordSample("b", 20 * MB, 4.0);
    tracker.recordSample("z", 5 * MB, 0.0);

    auto j = tracker.toJson();
    REQUIRE(j.contains("samples"));
    CHECK(j["samples"].size() == 2);
    CHECK(j["totals"]["bytes"].get<std::uint64_t>() == 35 * MB);

    ThroughputTracker restored;
    restored.loadJson(j);
    auto s = restored.summary();
    REQUIRE(s.has_value());
    CHECK(s->count == 2);
    CHECK(s->totalBytes == 35 * MB);
    CHECK_THAT(s->overallAvgMBps, WithinAbs(5.0, 1e-9));

    SECTION("Malformed input leaves the tracker empty") {
        restored.loadJson(nlohmann::json::array({1, 2, 3}));
        CHECK_FALSE(restored.summary().has_value());
    }

    SECTION("Clear drops everything") {
        restored.clear();
        CHECK(restored.sampleCount() == 0);
        CHECK_FALSE(restored.summary().has_value());
    }
}
