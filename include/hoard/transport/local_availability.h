#pragma once

#include <hoard/retrieval/retrieval.hpp>
#include <hoard/transport/library_layout.h>

#include <cstdint>

namespace hoard::transport {

/**
 * Availability probe over the library directory. Reads the final file for
 * an asset (never the network) up to `readLimit` bytes. A file shorter
 * than the asset's known size is reported as unfinished.
 */
class LocalAvailability final : public retrieval::IAvailabilityProvider {
public:
    // Default limit reads just past the checker's 1 MiB threshold
    explicit LocalAvailability(LibraryLayout layout, std::uint64_t readLimit = 1024 * 1024 + 1);

    // Smallest read limit that lets a complete file clear `minConfirmedBytes`
    static std::uint64_t readLimitFor(std::uint64_t minConfirmedBytes) {
        return minConfirmedBytes + 1;
    }

    retrieval::AvailabilityProbe probe(const retrieval::Asset& asset) override;

private:
    LibraryLayout layout_;
    std::uint64_t readLimit_;
};

} // namespace hoard::transport
