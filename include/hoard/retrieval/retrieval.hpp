#pragma once

/*
 * hoard retrieval engine - public types and collaborator interfaces (C++20)
 *
 * The engine fetches every asset of a remote-backed media collection into local
 * storage. It never decides which assets exist (ICatalogProvider), never moves
 * bytes itself (ITransportProvider) and never inspects local files directly
 * (IAvailabilityProvider). Everything here is implementation-free.
 */

#include <hoard/core/types.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hoard::retrieval {

// ================================
// Fundamental enums and constants
// ================================

using AssetId = std::string;

enum class MediaKind { Photo, Video };

/**
 * Catalog-side media filter.
 */
enum class MediaFilter { All, Photo, Video };

/**
 * Catalog enumeration order. Size orders need a full pass over the catalog;
 * Random materializes and shuffles.
 */
enum class SortOrder { Oldest, Newest, Smallest, Largest, Random };

/**
 * ScanFirst filters the whole candidate list before scheduling; Streaming
 * interleaves enumeration, filtering and scheduling.
 */
enum class RunMode { ScanFirst, Streaming };

// ===================
// Small data objects
// ===================

/**
 * One media item. Identity is `id`; `location` is opaque to the engine and
 * only meaningful to the transport (a URL for the HTTP transport).
 */
struct Asset {
    AssetId id;
    TimePoint createdAt{};
    MediaKind kind{MediaKind::Photo};
    std::optional<std::uint64_t> sizeHint{};
    std::string location;
};

struct CatalogFilter {
    MediaFilter media{MediaFilter::All};
    std::optional<TimePoint> fromDate{};
};

/**
 * Retry/backoff policy. The delay before retry k (k >= 1) is
 * initialBackoff * multiplier^(k-1), capped at maxBackoff.
 */
struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds initialBackoff{10000};
    double multiplier{1.0};
    std::chrono::milliseconds maxBackoff{60000};
};

/**
 * Transfer telemetry; consumed by UI only, never by scheduling decisions.
 */
struct TransferProgress {
    AssetId assetId;
    std::uint64_t bytesSoFar{0};
    std::optional<double> fraction{}; // 0.0 - 1.0
};

/**
 * Result of a local-presence probe made with network access disabled.
 * `finished` is false when the probe could not run to completion (content
 * partially present, probe interrupted).
 */
struct AvailabilityProbe {
    bool finished{false};
    std::uint64_t confirmedBytes{0};
    std::optional<Error> error{};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const TransferProgress&)>;
using ShouldCancel = std::function<bool()>; // return true to abandon the transfer
using AssetVisitor = std::function<bool(const Asset&)>; // return false to stop enumeration

// ==========================
// Collaborator interfaces
// ==========================

/**
 * Asset catalog. Owns enumeration, filtering and ordering.
 */
class ICatalogProvider {
public:
    virtual ~ICatalogProvider() = default;

    virtual Result<std::vector<Asset>> listAssets(const CatalogFilter& filter,
                                                  SortOrder order) = 0;

    /**
     * Streaming enumeration. The default walks listAssets(); catalogs that can
     * enumerate lazily should override it.
     */
    virtual Result<void> forEachAsset(const CatalogFilter& filter, SortOrder order,
                                      const AssetVisitor& visit) {
        auto assets = listAssets(filter, order);
        if (!assets) {
            return assets.error();
        }
        for (const auto& asset : assets.value()) {
            if (!visit(asset)) {
                break;
            }
        }
        return Result<void>{};
    }

    virtual std::optional<Asset> findAsset(std::string_view id) = 0;
};

/**
 * Byte transport for one asset. Must stop early once shouldCancel() turns
 * true; returns the number of bytes transferred on success.
 */
class ITransportProvider {
public:
    virtual ~ITransportProvider() = default;

    virtual Result<std::uint64_t> fetch(const Asset& asset, std::chrono::milliseconds timeout,
                                        const ProgressCallback& onProgress,
                                        const ShouldCancel& shouldCancel) = 0;
};

/**
 * Local-presence probe. Implementations must not touch the network.
 */
class IAvailabilityProvider {
public:
    virtual ~IAvailabilityProvider() = default;

    virtual AvailabilityProbe probe(const Asset& asset) = 0;
};

// ======================
// Helpers
// ======================

[[nodiscard]] inline std::chrono::milliseconds backoffFor(const RetryPolicy& policy,
                                                          int retryIndex) {
    if (retryIndex <= 0) {
        return std::chrono::milliseconds{0};
    }
    double delay = static_cast<double>(policy.initialBackoff.count());
    for (int i = 1; i < retryIndex; ++i) {
        delay *= policy.multiplier;
        if (delay >= static_cast<double>(policy.maxBackoff.count())) {
            break;
        }
    }
    const auto capped = std::min(delay, static_cast<double>(policy.maxBackoff.count()));
    return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, capped))};
}

const char* toString(MediaKind kind);
const char* toString(MediaFilter filter);
const char* toString(SortOrder order);
const char* toString(RunMode mode);

std::optional<MediaKind> parseMediaKind(std::string_view text);
std::optional<MediaFilter> parseMediaFilter(std::string_view text);
std::optional<SortOrder> parseSortOrder(std::string_view text);

[[nodiscard]] inline bool matchesFilter(const Asset& asset, const CatalogFilter& filter) {
    if (filter.media == MediaFilter::Photo && asset.kind != MediaKind::Photo)
        return false;
    if (filter.media == MediaFilter::Video && asset.kind != MediaKind::Video)
        return false;
    if (filter.fromDate && asset.createdAt < *filter.fromDate)
        return false;
    return true;
}

} // namespace hoard::retrieval
