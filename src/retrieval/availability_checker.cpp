#include <hoard/retrieval/availability_checker.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace hoard::retrieval {

AvailabilityChecker::AvailabilityChecker(IAvailabilityProvider& provider, AvailabilityPolicy policy)
    : provider_(provider), policy_(policy) {}

bool AvailabilityChecker::accepts(const Asset& asset, const AvailabilityProbe& probe) const {
    if (!probe.finished || probe.error) {
        return false;
    }
    if (probe.confirmedBytes > policy_.minConfirmedBytes) {
        return true;
    }
    return policy_.acceptCompleteSmallAssets && asset.sizeHint &&
           *asset.sizeHint <= policy_.minConfirmedBytes && probe.confirmedBytes >= *asset.sizeHint;
}

bool AvailabilityChecker::isLocal(const Asset& asset) const {
    try {
        const auto probe = provider_.probe(asset);
        if (probe.error) {
            spdlog::debug("Availability probe for {} failed: {}", asset.id, probe.error->message);
        }
        return accepts(asset, probe);
    } catch (const std::exception& e) {
        spdlog::warn("Availability probe for {} threw: {}", asset.id, e.what());
        return false;
    } catch (...) {
        spdlog::warn("Availability probe for {} threw a non-standard exception", asset.id);
        return false;
    }
}

bool AvailabilityChecker::isLocalWithRecheck(const Asset& asset,
                                             const CancellationToken& cancel) const {
    if (isLocal(asset)) {
        return true;
    }
    if (!cancel.waitFor(policy_.recheckDelay)) {
        return false;
    }
    return isLocal(asset);
}

} // namespace hoard::retrieval
