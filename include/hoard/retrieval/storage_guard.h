#pragma once

#include <hoard/core/types.h>

#include <cstdint>
#include <filesystem>
#include <functional>

namespace hoard::retrieval {

// Returns free bytes on the monitored volume
using FreeSpaceProbe = std::function<Result<std::uint64_t>()>;

/**
 * Free-space floor check for the volume holding the library.
 */
class StorageGuard {
public:
    // Monitors the filesystem holding `path` (or its nearest existing ancestor)
    explicit StorageGuard(std::filesystem::path path);
    explicit StorageGuard(FreeSpaceProbe probe);

    Result<double> freeSpaceGB() const;

    // False when free space is below minGB or cannot be determined
    bool hasSufficientSpace(double minGB) const;

private:
    FreeSpaceProbe probe_;
};

} // namespace hoard::retrieval
