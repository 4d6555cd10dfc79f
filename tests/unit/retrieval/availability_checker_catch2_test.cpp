#include <catch2/catch_test_macros.hpp>

#include <hoard/retrieval/availability_checker.h>

#include "../../common/fake_providers.h"

#include <chrono>

using namespace hoard;
using namespace hoard::retrieval;
using namespace hoard::test;

namespace {

AvailabilityPolicy fastPolicy() {
    AvailabilityPolicy p;
    p.recheckDelay = std::chrono::milliseconds(0);
    return p;
}

} // namespace

TEST_CASE("AvailabilityChecker: Threshold on confirmed bytes", "[retrieval][availability]") {
    FakeLibrary library;
    FakeAvailability provider(library);
    AvailabilityChecker checker(provider, fastPolicy());

    SECTION("Absent asset is not local") {
        CHECK_FALSE(checker.isLocal(makeAsset("a")));
    }

    SECTION("More than 1 MiB confirmed is local") {
        library.put("a", 1024 * 1024 + 1);
        CHECK(checker.isLocal(makeAsset("a")));
    }

    SECTION("Exactly 1 MiB of a larger asset is not enough") {
        library.put("a", 1024 * 1024);
        CHECK_FALSE(checker.isLocal(makeAsset("a", 1600000000, 5 * 1024 * 1024)));
    }
}

TEST_CASE("AvailabilityChecker: Small assets", "[retrieval][availability]") {
    FakeLibrary library;
    FakeAvailability provider(library);
    const auto small = makeAsset("tiny", 1600000000, 200 * 1024);
    library.put("tiny", 200 * 1024);

    SECTION("Accepted when fully confirmed") {
        AvailabilityChecker checker(provider, fastPolicy());
        CHECK(checker.isLocal(small));
    }

    SECTION("Rejected when only partly confirmed") {
        library.put("tiny", 100 * 1024);
        AvailabilityChecker checker(provider, fastPolicy());
        CHECK_FALSE(checker.isLocal(small));
    }

    SECTION("Strict threshold rejects them") {
        auto policy = fastPolicy();
        policy.acceptCompleteSmallAssets = false;
        AvailabilityChecker checker(provider, policy);
        CHECK_FALSE(checker.isLocal(small));
    }

    SECTION("Unknown size falls back to the threshold") {
        auto unsized = small;
        unsized.sizeHint.reset();
        AvailabilityChecker checker(provider, fastPolicy());
        CHECK_FALSE(checker.isLocal(unsized));
    }

    SECTION("Tunable threshold") {
        auto policy = fastPolicy();
        policy.minConfirmedBytes = 64 * 1024;
        policy.acceptCompleteSmallAssets = false;
        AvailabilityChecker checker(provider, policy);
        CHECK(checker.isLocal(small));
    }
}

TEST_CASE("AvailabilityChecker: Probe failures are not local", "[retrieval][availability]") {
    FakeLibrary library;
    FakeAvailability provider(library);
    AvailabilityChecker checker(provider, fastPolicy());
    library.put("a", 5 * 1024 * 1024);

    SECTION("Unfinished probe") {
        provider.hideFor("a", 1);
        CHECK_FALSE(checker.isLocal(makeAsset("a")));
        CHECK(checker.isLocal(makeAsset("a")));
    }

    SECTION("Probe error") {
        provider.errorFor("a");
        CHECK_FALSE(checker.isLocal(makeAsset("a")));
    }

    SECTION("Probe throws") {
        provider.throwFor("a");
        CHECK_FALSE(checker.isLocal(makeAsset("a")));
    }

    SECTION("Provider throws a non-standard value") {
        provider.throwFor("a", true);
        CHECK_FALSE(checker.isLocal(makeAsset("a")));
        CHECK(provider.probeCount("a") == 1);
    }
}

TEST_CASE("AvailabilityChecker: Recheck probes twice", "[retrieval][availability]") {
    FakeLibrary library;
    FakeAvailability provider(library);
    AvailabilityChecker checker(provider, fastPolicy());
    CancellationToken cancel;
    library.put("a", 5 * 1024 * 1024);

    SECTION("Second probe confirms") {
        provider.hideFor("a", 1);
        CHECK(checker.isLocalWithRecheck(makeAsset("a"), cancel));
        CHECK(provider.probeCount("a") == 2);
    }

    SECTION("Local on first probe skips the recheck") {
        CHECK(checker.isLocalWithRecheck(makeAsset("a"), cancel));
        CHECK(provider.probeCount("a") == 1);
    }

    SECTION("Cancellation skips the recheck") {
        provider.hideFor("a", 1);
        cancel.requestStop();
        CHECK_FALSE(checker.isLocalWithRecheck(makeAsset("a"), cancel));
        CHECK(provider.probeCount("a") == 1);
    }
}
