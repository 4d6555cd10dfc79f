#pragma once

#include <hoard/retrieval/retrieval.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <random>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hoard::catalog {

/**
 * Catalog backed by a JSON manifest:
 *
 *   { "assets": [ { "id": "...", "created": "2021-06-01T10:00:00Z", "kind": "photo",
 *                   "size": 1234, "url": "https://..." } ] }
 *
 * `created` may also be epoch seconds. Entries without an id or a parseable
 * `created` are skipped with a warning, as are duplicate ids.
 */
class ManifestCatalog final : public retrieval::ICatalogProvider {
public:
    explicit ManifestCatalog(std::vector<retrieval::Asset> assets,
                             std::optional<std::uint64_t> seed = std::nullopt);

    static Result<std::unique_ptr<ManifestCatalog>>
    fromFile(const std::filesystem::path& path, std::optional<std::uint64_t> seed = std::nullopt);

    static Result<std::unique_ptr<ManifestCatalog>>
    fromJson(const nlohmann::json& root, std::optional<std::uint64_t> seed = std::nullopt);

    Result<std::vector<retrieval::Asset>> listAssets(const retrieval::CatalogFilter& filter,
                                                     retrieval::SortOrder order) override;

    std::optional<retrieval::Asset> findAsset(std::string_view id) override;

    std::size_t size() const { return assets_.size(); }

private:
    std::vector<retrieval::Asset> assets_;
    std::unordered_map<std::string, std::size_t> index_;
    std::mt19937_64 rng_;
};

} // namespace hoard::catalog
