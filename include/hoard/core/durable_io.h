#pragma once

#include <hoard/core/types.h>

#include <filesystem>

namespace hoard::durable_io {

// Flush file contents to stable storage
Result<void> fsyncFile(const std::filesystem::path& p);

// Persist directory entries (new names after a rename)
Result<void> fsyncDir(const std::filesystem::path& dir);

/**
 * Sync `staging`, rename it over `target` and sync the target directory.
 * Falls back to copy + sync + remove when the rename crosses devices.
 * On failure `target` is left untouched; `staging` is not removed.
 */
Result<void> commitStaged(const std::filesystem::path& staging,
                          const std::filesystem::path& target);

} // namespace hoard::durable_io
