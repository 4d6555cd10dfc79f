#pragma once

#include <hoard/retrieval/cancellation.h>
#include <hoard/retrieval/retrieval.hpp>

#include <chrono>
#include <cstdint>

namespace hoard::retrieval {

/**
 * When a probe counts as "fully local".
 *
 * A probe that finished without error must confirm more than
 * minConfirmedBytes. With acceptCompleteSmallAssets, an asset whose known size
 * is below that threshold is also accepted once the probe confirmed all of it.
 */
struct AvailabilityPolicy {
    std::uint64_t minConfirmedBytes{1024 * 1024};
    bool acceptCompleteSmallAssets{true};
    std::chrono::milliseconds recheckDelay{1000};
};

class AvailabilityChecker {
public:
    AvailabilityChecker(IAvailabilityProvider& provider, AvailabilityPolicy policy = {});

    bool isLocal(const Asset& asset) const;

    // Probes once more after policy.recheckDelay when the first probe says no
    bool isLocalWithRecheck(const Asset& asset, const CancellationToken& cancel) const;

    const AvailabilityPolicy& policy() const { return policy_; }

private:
    bool accepts(const Asset& asset, const AvailabilityProbe& probe) const;

    IAvailabilityProvider& provider_;
    AvailabilityPolicy policy_;
};

} // namespace hoard::retrieval
