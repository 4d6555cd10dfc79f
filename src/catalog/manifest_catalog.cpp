#include <hoard/catalog/manifest_catalog.h>
#include <hoard/core/time_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace hoard::catalog {

using json = nlohmann::json;
using retrieval::Asset;
using retrieval::SortOrder;

namespace {

std::optional<Asset> parse_entry(const json& e, std::size_t position) {
    if (!e.is_object()) {
        spdlog::warn("Manifest entry {} is not an object; skipping", position);
        return std::nullopt;
    }
    Asset a;
    if (!e.contains("id") || !e["id"].is_string() || e["id"].get<std::string>().empty()) {
        spdlog::warn("Manifest entry {} has no id; skipping", position);
        return std::nullopt;
    }
    a.id = e["id"].get<std::string>();

    std::optional<TimePoint> created;
    if (e.contains("created")) {
        const auto& c = e["created"];
        if (c.is_string()) {
            created = time_utils::parseTimestamp(c.get<std::string>());
        } else if (c.is_number_integer()) {
            created = time_utils::fromEpochSeconds(c.get<std::int64_t>());
        }
    }
    if (!created) {
        spdlog::warn("Manifest entry {} ({}) has no valid 'created'; skipping", position, a.id);
        return std::nullopt;
    }
    a.createdAt = *created;

    if (e.contains("kind")) {
        auto kind = e["kind"].is_string() ? retrieval::parseMediaKind(e["kind"].get<std::string>())
                                          : std::nullopt;
        if (!kind) {
            spdlog::warn("Manifest entry {} ({}) has unknown kind; skipping", position, a.id);
            return std::nullopt;
        }
        a.kind = *kind;
    }
    if (e.contains("size") && e["size"].is_number_unsigned()) {
        a.sizeHint = e["size"].get<std::uint64_t>();
    }
    if (e.contains("url") && e["url"].is_string()) {
        a.location = e["url"].get<std::string>();
    }
    return a;
}

} // namespace

ManifestCatalog::ManifestCatalog(std::vector<Asset> assets, std::optional<std::uint64_t> seed)
    : rng_(seed ? *seed : std::random_device{}()) {
    assets_.reserve(assets.size());
    for (auto& a : assets) {
        if (index_.count(a.id)) {
            spdlog::warn("Duplicate asset id {} in manifest; keeping the first", a.id);
            continue;
        }
        index_.emplace(a.id, assets_.size());
        assets_.push_back(std::move(a));
    }
}

Result<std::unique_ptr<ManifestCatalog>> ManifestCatalog::fromJson(const json& root,
                                                                   std::optional<std::uint64_t> seed) {
    if (!root.is_object() || !root.contains("assets") || !root["assets"].is_array()) {
        return Error{ErrorCode::InvalidData, "Manifest must be an object with an 'assets' array"};
    }
    std::vector<Asset> assets;
    const auto& list = root["assets"];
    assets.reserve(list.size());
    for (std::size_t i = 0; i < list.size(); ++i) {
        if (auto a = parse_entry(list[i], i)) {
            assets.push_back(std::move(*a));
        }
    }
    spdlog::debug("Manifest lists {} usable assets of {}", assets.size(), list.size());
    return std::make_unique<ManifestCatalog>(std::move(assets), seed);
}

Result<std::unique_ptr<ManifestCatalog>>
ManifestCatalog::fromFile(const std::filesystem::path& path, std::optional<std::uint64_t> seed) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open manifest " + path.string()};
    }
    json root;
    try {
        in >> root;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     "Manifest " + path.string() + " is not valid JSON: " + e.what()};
    }
    return fromJson(root, seed);
}

Result<std::vector<Asset>> ManifestCatalog::listAssets(const retrieval::CatalogFilter& filter,
                                                       SortOrder order) {
    std::vector<Asset> out;
    out.reserve(assets_.size());
    for (const auto& a : assets_) {
        if (retrieval::matchesFilter(a, filter)) {
            out.push_back(a);
        }
    }

    const auto size_of = [](const Asset& a) { return a.sizeHint.value_or(0); };
    switch (order) {
        case SortOrder::Oldest:
            std::stable_sort(out.begin(), out.end(), [](const Asset& l, const Asset& r) {
                return l.createdAt < r.createdAt;
            });
            break;
        case SortOrder::Newest:
            std::stable_sort(out.begin(), out.end(), [](const Asset& l, const Asset& r) {
                return l.createdAt > r.createdAt;
            });
            break;
        case SortOrder::Smallest:
            std::stable_sort(out.begin(), out.end(), [&](const Asset& l, const Asset& r) {
                return size_of(l) < size_of(r);
            });
            break;
        case SortOrder::Largest:
            std::stable_sort(out.begin(), out.end(), [&](const Asset& l, const Asset& r) {
                return size_of(l) > size_of(r);
            });
            break;
        case SortOrder::Random:
            std::shuffle(out.begin(), out.end(), rng_);
            break;
    }
    return out;
}

std::optional<Asset> ManifestCatalog::findAsset(std::string_view id) {
    auto it = index_.find(std::string(id));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return assets_[it->second];
}

} // namespace hoard::catalog
