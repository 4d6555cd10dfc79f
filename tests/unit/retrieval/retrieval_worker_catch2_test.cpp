#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <hoard/retrieval/retrieval_worker.h>

#include "../../common/fake_providers.h"

#include <chrono>
#include <vector>

using namespace hoard;
using namespace hoard::retrieval;
using namespace hoard::test;
using namespace std::chrono_literals;

TEST_CASE("RetrievalWorker: Successful transfer", "[retrieval][worker]") {
    FakeLibrary library;
    ScriptedTransport transport(library);
    std::vector<TransferProgress> seen;
    RetrievalWorker worker(transport, [&](const TransferProgress& p) { seen.push_back(p); });

    auto report = worker.fetch(makeAsset("a"), 5s);
    CHECK(report.success);
    CHECK(report.bytesTransferred == kDefaultAssetBytes);
    CHECK(report.durationSeconds >= 0.0);
    CHECK(report.durationSeconds < 5.0);
    CHECK_FALSE(report.error.has_value());
    CHECK(library.contains("a"));
    REQUIRE(seen.size() == 1);
    CHECK(seen.front().assetId == "a");
}

TEST_CASE("RetrievalWorker: Transport errors are reported", "[retrieval][worker]") {
    FakeLibrary library;
    ScriptedTransport transport(library);
    RetrievalWorker worker(transport);

    SECTION("Error result") {
        transport.script("a", {ScriptedTransport::Step::Fail});
        auto report = worker.fetch(makeAsset("a"), 5s);
        CHECK_FALSE(report.success);
        REQUIRE(report.error.has_value());
        CHECK(report.error->code == ErrorCode::NetworkError);
    }

    SECTION("Exception becomes an error") {
        transport.script("a", {ScriptedTransport::Step::Throw});
        auto report = worker.fetch(makeAsset("a"), 5s);
        CHECK_FALSE(report.success);
        REQUIRE(report.error.has_value());
        CHECK(report.error->code == ErrorCode::InternalError);
    }

    SECTION("Non-standard throw becomes an error") {
        transport.script("a", {ScriptedTransport::Step::ThrowForeign});
        auto report = worker.fetch(makeAsset("a"), 5s);
        CHECK_FALSE(report.success);
        REQUIRE(report.error.has_value());
        CHECK(report.error->code == ErrorCode::InternalError);
        CHECK(report.error->message == "transport threw a non-standard exception");
    }
}

TEST_CASE("RetrievalWorker: Deadline abandons a stalled transfer", "[retrieval][worker]") {
    FakeLibrary library;
    ScriptedTransport transport(library);
    transport.script("a", {ScriptedTransport::Step::Hang});
    RetrievalWorker worker(transport);

    const auto timeout = 30ms;
    auto report = worker.fetch(makeAsset("a"), timeout);
    CHECK_FALSE(report.success);
    REQUIRE(report.error.has_value());
    CHECK(report.error->code == ErrorCode::Timeout);
    CHECK_THAT(report.durationSeconds, Catch::Matchers::WithinAbs(0.030, 1e-9));
    CHECK_FALSE(library.contains("a"));
}

TEST_CASE("RetrievalWorker: Late success still times out", "[retrieval][worker]") {
    FakeLibrary library;
    ScriptedTransport transport(library);
    transport.delay = 40ms;
    RetrievalWorker worker(transport);

    auto report = worker.fetch(makeAsset("a"), 10ms);
    CHECK_FALSE(report.success);
    REQUIRE(report.error.has_value());
    CHECK(report.error->code == ErrorCode::Timeout);
}
