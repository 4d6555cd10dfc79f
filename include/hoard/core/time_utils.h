#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <hoard/core/types.h>

namespace hoard::time_utils {

/**
 * Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" (optionally suffixed with "Z") or a
 * Unix timestamp in seconds. Dates without an offset are interpreted as UTC.
 */
std::optional<TimePoint> parseTimestamp(std::string_view text);

// "2025-03-01T12:00:00Z"
std::string formatIsoUtc(TimePoint tp);

std::string nowIsoUtc();

std::int64_t toEpochSeconds(TimePoint tp);
TimePoint fromEpochSeconds(std::int64_t seconds);

// "HH:MM:SS", hours are not wrapped at 24
std::string formatHms(std::chrono::seconds elapsed);

} // namespace hoard::time_utils
