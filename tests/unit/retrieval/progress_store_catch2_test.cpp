#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <nlohmann/json.hpp>
#include <hoard/core/time_utils.h>
#include <hoard/retrieval/progress_store.h>

#include "../../common/test_helpers_catch2.h"
#include "../../support/temp_dir_scope.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace hoard;
using namespace hoard::retrieval;
using hoard::test::read_file;
using hoard::test::write_file;
using hoard::test_support::TempDirScope;
using json = nlohmann::json;
namespace fs = std::filesystem;

TEST_CASE("ProgressStore: Missing file starts fresh", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    ProgressStore store(dir.path() / "progress.json");

    auto state = store.load();
    CHECK(state.completed.empty());
    CHECK(state.failed.empty());
    CHECK(state.stats.downloaded == 0);
    CHECK_FALSE(state.stats.startTime.has_value());
    CHECK(store.elapsedText(std::chrono::system_clock::now()) == "00:00:00");
}

TEST_CASE("ProgressStore: Save and load round-trip", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    const auto path = dir.path() / "progress.json";
    const auto start = time_utils::fromEpochSeconds(1700000000);

    {
        ProgressStore store(path);
        store.load();
        store.ensureStartTime(start);
        store.setTotal(4);
        store.markCompleted("a", 10 * 1024 * 1024, 2.0);
        store.markAlreadyLocal("b");
        store.markFailed("c", "exhausted retries after 3 attempts: connection reset");
        REQUIRE(store.save());
        CHECK_FALSE(fs::exists(fs::path(path.string() + ".tmp")));
    }

    auto doc = json::parse(read_file(path));
    CHECK(doc.contains("completedAssets"));
    CHECK(doc.contains("failedAssets"));
    CHECK(doc.contains("stats"));
    CHECK(doc.contains("speedStats"));
    CHECK(doc.contains("savedAt"));

    ProgressStore reloaded(path);
    auto state = reloaded.load();
    CHECK(state.completed == std::set<AssetId>{"a", "b"});
    REQUIRE(state.failed.count("c") == 1);
    CHECK(state.failed.at("c").reason == "exhausted retries after 3 attempts: connection reset");
    CHECK_FALSE(state.failed.at("c").timestamp.empty());
    CHECK(state.stats.total == 4);
    CHECK(state.stats.downloaded == 1);
    CHECK(state.stats.alreadyLocal == 1);
    CHECK(state.stats.failed == 1);
    CHECK(state.stats.bytesDownloaded == 10 * 1024 * 1024);
    REQUIRE(state.stats.startTime.has_value());
    CHECK(time_utils::toEpochSeconds(*state.stats.startTime) == 1700000000);
    CHECK(state.stats.lastAssetId == std::optional<AssetId>("c"));

    auto speed = reloaded.throughput().summary();
    REQUIRE(speed.has_value());
    CHECK_THAT(speed->overallAvgMBps, Catch::Matchers::WithinAbs(5.0, 1e-9));

    CHECK(reloaded.elapsedText(start + std::chrono::seconds(3725)) == "01:02:05");
}

TEST_CASE("ProgressStore: Completed and failed stay disjoint", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    ProgressStore store(dir.path() / "progress.json");

    SECTION("Completing a failed asset clears the failure") {
        store.markFailed("x", "boom");
        REQUIRE(store.isFailed("x"));
        store.markCompleted("x", 100, 1.0);
        CHECK(store.isCompleted("x"));
        CHECK_FALSE(store.isFailed("x"));
    }

    SECTION("Failing a completed asset is ignored") {
        store.markCompleted("x", 100, 1.0);
        store.markFailed("x", "late failure");
        CHECK(store.isCompleted("x"));
        CHECK_FALSE(store.isFailed("x"));
        CHECK(store.stats().failed == 0);
    }

    SECTION("Already-local clears a prior failure") {
        store.markFailed("x", "boom");
        store.markAlreadyLocal("x");
        CHECK(store.isCompleted("x"));
        CHECK_FALSE(store.isFailed("x"));
    }

    SECTION("Processed covers both sets") {
        store.markFailed("f", "boom");
        store.markCompleted("c", 1, 1.0);
        CHECK(store.isProcessed("f"));
        CHECK(store.isProcessed("c"));
        CHECK_FALSE(store.isProcessed("other"));
    }
}

TEST_CASE("ProgressStore: Completion is counted once", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    ProgressStore store(dir.path() / "progress.json");

    store.markCompleted("a", 1000, 1.0);
    store.markCompleted("a", 1000, 1.0);
    store.markAlreadyLocal("a");

    auto stats = store.stats();
    CHECK(stats.downloaded == 1);
    CHECK(stats.bytesDownloaded == 1000);
    CHECK(stats.alreadyLocal == 0);
    CHECK(store.completedCount() == 1);
    CHECK(store.throughput().sampleCount() == 1);
}

TEST_CASE("ProgressStore: Unmark returns an asset to pending", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    ProgressStore store(dir.path() / "progress.json");

    store.markCompleted("a", 1000, 1.0);
    CHECK(store.unmarkCompleted("a"));
    CHECK_FALSE(store.isProcessed("a"));
    CHECK_FALSE(store.unmarkCompleted("a"));
}

TEST_CASE("ProgressStore: flushIfDue saves every N marks", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    const auto path = dir.path() / "progress.json";
    ProgressStore store(path, 3);

    store.markCompleted("a", 1, 1.0);
    store.markCompleted("b", 1, 1.0);
    REQUIRE(store.flushIfDue());
    CHECK_FALSE(fs::exists(path));

    store.markFailed("c", "boom");
    REQUIRE(store.flushIfDue());
    REQUIRE(fs::exists(path));

    auto doc = json::parse(read_file(path));
    CHECK(doc["completedAssets"].size() == 2);
    CHECK(doc["failedAssets"].size() == 1);
}

TEST_CASE("ProgressStore: Corrupt file yields a fresh state", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    const auto path = dir.path() / "progress.json";

    SECTION("Truncated JSON") {
        write_file(path, R"({"completedAssets": ["a", "b")");
    }
    SECTION("Not an object") {
        write_file(path, R"(["a", "b"])");
    }

    ProgressStore store(path);
    auto state = store.load();
    CHECK(state.completed.empty());
    CHECK(state.failed.empty());

    // The store still works and overwrites the bad file
    store.markCompleted("c", 1, 1.0);
    REQUIRE(store.save());
    ProgressStore reloaded(path);
    CHECK(reloaded.load().completed == std::set<AssetId>{"c"});
}

TEST_CASE("ProgressStore: Badly typed speed history keeps the ledger", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    const auto path = dir.path() / "progress.json";
    write_file(path, R"({
        "completedAssets": ["a", "b", "c"],
        "failedAssets": {"d": {"reason": "timed out", "timestamp": "2024-03-01T12:00:00Z"}},
        "stats": {"downloaded": 3, "failed": 1},
        "speedStats": {
            "samples": [
                {"assetId": "a", "bytes": 1048576, "durationSeconds": 1.0},
                {"assetId": "b", "bytes": "lots", "durationSeconds": 2.0},
                {"assetId": "c", "bytes": 2048, "durationSeconds": "slow"}
            ],
            "totals": {"bytes": "many"},
            "fastest": {"assetId": "b", "speedMBps": "fast", "sizeMB": 1.0}
        }
    })");

    ProgressStore store(path);
    auto state = store.load();
    CHECK(state.completed == std::set<AssetId>{"a", "b", "c"});
    CHECK(state.failed.count("d") == 1);
    CHECK(state.stats.downloaded == 3);
    CHECK(store.throughput().sampleCount() == 1);
    auto summary = store.throughput().summary();
    REQUIRE(summary.has_value());
    REQUIRE(summary->fastest.has_value());
    CHECK(summary->fastest->assetId == "a");
}

TEST_CASE("ProgressStore: Saves taken during completions stay consistent",
          "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    const auto path = dir.path() / "progress.json";
    ProgressStore store(path);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::atomic<bool> done{false};
    std::atomic<int> mismatches{0};

    std::thread saver([&] {
        while (!done.load()) {
            if (!store.save())
                continue;
            auto doc = json::parse(read_file(path));
            if (doc["speedStats"]["samples"].size() != doc["completedAssets"].size())
                ++mismatches;
        }
    });
    std::vector<std::thread> markers;
    for (int t = 0; t < kThreads; ++t) {
        markers.emplace_back([&store, t] {
            for (int i = 0; i < kPerThread; ++i)
                store.markCompleted("t" + std::to_string(t) + "-" + std::to_string(i), 1024, 0.5);
        });
    }
    for (auto& m : markers)
        m.join();
    done = true;
    saver.join();

    CHECK(mismatches.load() == 0);
    REQUIRE(store.save());
    ProgressStore reloaded(path);
    auto state = reloaded.load();
    CHECK(state.completed.size() == kThreads * kPerThread);
    CHECK(reloaded.throughput().sampleCount() == state.completed.size());
}

TEST_CASE("ProgressStore: Legacy snake_case file is accepted", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    const auto path = dir.path() / "download_progress.json";
    write_file(path, R"({
        "completed_assets": ["p1", "p2"],
        "failed_assets": {
            "p3": {"error": "Failed after 3 attempts", "timestamp": "2024-03-01T12:00:00"},
            "p1": {"error": "stale failure"}
        },
        "stats": {
            "total_assets": 10,
            "already_local": 1,
            "downloaded": 1,
            "failed": 1,
            "bytes_downloaded": 4096,
            "start_time": "2024-03-01T10:00:00.123456",
            "last_asset_id": "p3"
        }
    })");

    ProgressStore store(path);
    auto state = store.load();
    CHECK(state.completed == std::set<AssetId>{"p1", "p2"});
    REQUIRE(state.failed.size() == 1);
    CHECK(state.failed.at("p3").reason == "Failed after 3 attempts");
    CHECK(state.stats.total == 10);
    CHECK(state.stats.alreadyLocal == 1);
    CHECK(state.stats.bytesDownloaded == 4096);
    REQUIRE(state.stats.startTime.has_value());
    CHECK(time_utils::formatIsoUtc(*state.stats.startTime) == "2024-03-01T10:00:00Z");
    CHECK(state.stats.lastAssetId == std::optional<AssetId>("p3"));
    CHECK_FALSE(store.throughput().summary().has_value());
}

TEST_CASE("ProgressStore: Reset deletes the file and clears memory", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    const auto path = dir.path() / "progress.json";
    ProgressStore store(path);
    store.markCompleted("a", 1, 1.0);
    REQUIRE(store.save());
    REQUIRE(fs::exists(path));

    REQUIRE(store.reset());
    CHECK_FALSE(fs::exists(path));
    CHECK(store.completedCount() == 0);
    CHECK_FALSE(store.throughput().summary().has_value());

    // Resetting again is harmless
    CHECK(store.reset());
}

TEST_CASE("ProgressStore: Save failure is reported, not thrown", "[retrieval][progress]") {
    auto dir = TempDirScope::unique_under("hoard-progress");
    // Parent is a regular file, so the temp file cannot be created
    const auto blocker = write_file(dir.path() / "blocker", "x");
    ProgressStore store(blocker / "progress.json");
    store.markCompleted("a", 1, 1.0);

    auto r = store.save();
    CHECK_FALSE(r);
    CHECK(store.isCompleted("a"));
}
