#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <hoard/catalog/manifest_catalog.h>
#include <hoard/core/time_utils.h>

#include "../../common/test_helpers_catch2.h"
#include "../../support/temp_dir_scope.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace hoard;
using namespace hoard::catalog;
using hoard::retrieval::Asset;
using hoard::retrieval::CatalogFilter;
using hoard::retrieval::MediaFilter;
using hoard::retrieval::MediaKind;
using hoard::retrieval::SortOrder;
using hoard::test_support::TempDirScope;
using json = nlohmann::json;

namespace {

const json kManifest = json::parse(R"({
    "assets": [
        {"id": "p-2021", "created": "2021-06-01T10:00:00Z", "kind": "photo", "size": 3000,
         "url": "https://cdn.example.com/p-2021.jpg"},
        {"id": "v-2019", "created": "2019-01-15", "kind": "video", "size": 90000,
         "url": "https://cdn.example.com/v-2019.mov"},
        {"id": "p-2020", "created": 1590000000, "kind": "image", "size": 500,
         "url": "https://cdn.example.com/p-2020.heic"},
        {"id": "nosize", "created": "2022-03-03", "url": "https://cdn.example.com/nosize"}
    ]
})");

std::vector<std::string> ids(const std::vector<Asset>& assets) {
    std::vector<std::string> out;
    for (const auto& a : assets)
        out.push_back(a.id);
    return out;
}

std::unique_ptr<ManifestCatalog> load(std::optional<std::uint64_t> seed = std::nullopt) {
    auto res = ManifestCatalog::fromJson(kManifest, seed);
    REQUIRE(res);
    return std::move(res).value();
}

} // namespace

TEST_CASE("ManifestCatalog: Parses entries", "[catalog][manifest]") {
    auto catalog = load();
    REQUIRE(catalog->size() == 4);

    auto p = catalog->findAsset("p-2021");
    REQUIRE(p.has_value());
    CHECK(p->kind == MediaKind::Photo);
    CHECK(p->sizeHint == std::optional<std::uint64_t>(3000));
    CHECK(p->location == "https://cdn.example.com/p-2021.jpg");
    CHECK(time_utils::formatIsoUtc(p->createdAt) == "2021-06-01T10:00:00Z");

    auto v = catalog->findAsset("v-2019");
    REQUIRE(v.has_value());
    CHECK(v->kind == MediaKind::Video);

    auto e = catalog->findAsset("p-2020");
    REQUIRE(e.has_value());
    CHECK(time_utils::toEpochSeconds(e->createdAt) == 1590000000);

    auto n = catalog->findAsset("nosize");
    REQUIRE(n.has_value());
    CHECK(n->kind == MediaKind::Photo);
    CHECK_FALSE(n->sizeHint.has_value());

    CHECK_FALSE(catalog->findAsset("missing").has_value());
}

TEST_CASE("ManifestCatalog: Sort orders", "[catalog][manifest]") {
    auto catalog = load();
    CatalogFilter all;

    CHECK(ids(catalog->listAssets(all, SortOrder::Oldest).value()) ==
          std::vector<std::string>{"v-2019", "p-2020", "p-2021", "nosize"});
    CHECK(ids(catalog->listAssets(all, SortOrder::Newest).value()) ==
          std::vector<std::string>{"nosize", "p-2021", "p-2020", "v-2019"});
    // Missing size sorts as 0
    CHECK(ids(catalog->listAssets(all, SortOrder::Smallest).value()) ==
          std::vector<std::string>{"nosize", "p-2020", "p-2021", "v-2019"});
    CHECK(ids(catalog->listAssets(all, SortOrder::Largest).value()) ==
          std::vector<std::string>{"v-2019", "p-2021", "p-2020", "nosize"});
}

TEST_CASE("ManifestCatalog: Random order is a seeded permutation", "[catalog][manifest]") {
    auto a = load(42);
    auto b = load(42);
    CatalogFilter all;

    auto first = ids(a->listAssets(all, SortOrder::Random).value());
    auto second = ids(b->listAssets(all, SortOrder::Random).value());
    CHECK(first == second);

    auto sorted = first;
    std::sort(sorted.begin(), sorted.end());
    CHECK(sorted == std::vector<std::string>{"nosize", "p-2020", "p-2021", "v-2019"});
}

TEST_CASE("ManifestCatalog: Filters", "[catalog][manifest]") {
    auto catalog = load();

    SECTION("Media kind") {
        CatalogFilter videos{MediaFilter::Video, std::nullopt};
        CHECK(ids(catalog->listAssets(videos, SortOrder::Oldest).value()) ==
              std::vector<std::string>{"v-2019"});
        CatalogFilter photos{MediaFilter::Photo, std::nullopt};
        CHECK(catalog->listAssets(photos, SortOrder::Oldest).value().size() == 3);
    }

    SECTION("From date is inclusive") {
        CatalogFilter recent{MediaFilter::All, time_utils::parseTimestamp("2021-06-01T10:00:00")};
        CHECK(ids(catalog->listAssets(recent, SortOrder::Oldest).value()) ==
              std::vector<std::string>{"p-2021", "nosize"});
    }

    SECTION("Streaming enumeration honours filter and early stop") {
        std::vector<std::string> seen;
        auto r = catalog->forEachAsset(CatalogFilter{}, SortOrder::Oldest, [&](const Asset& a) {
            seen.push_back(a.id);
            return seen.size() < 2;
        });
        CHECK(r);
        CHECK(seen == std::vector<std::string>{"v-2019", "p-2020"});
    }
}

TEST_CASE("ManifestCatalog: Malformed entries are skipped", "[catalog][manifest]") {
    auto root = json::parse(R"({
        "assets": [
            {"id": "ok", "created": "2020-01-01"},
            {"created": "2020-01-01"},
            {"id": "", "created": "2020-01-01"},
            {"id": "bad-date", "created": "yesterday"},
            {"id": "bad-kind", "created": "2020-01-01", "kind": "hologram"},
            "not an object",
            {"id": "ok", "created": "2021-01-01"}
        ]
    })");
    auto res = ManifestCatalog::fromJson(root);
    REQUIRE(res);
    CHECK(res.value()->size() == 1);
    auto ok = res.value()->findAsset("ok");
    REQUIRE(ok.has_value());
    // The first of a duplicated id wins
    CHECK(time_utils::formatIsoUtc(ok->createdAt) == "2020-01-01T00:00:00Z");
}

TEST_CASE("ManifestCatalog: File errors", "[catalog][manifest]") {
    auto dir = TempDirScope::unique_under("hoard-manifest");

    SECTION("Missing file") {
        auto res = ManifestCatalog::fromFile(dir.path() / "absent.json");
        REQUIRE_FALSE(res);
        CHECK(res.error().code == ErrorCode::FileNotFound);
    }

    SECTION("Invalid JSON") {
        auto path = hoard::test::write_file(dir.path() / "bad.json", "{ assets: [");
        auto res = ManifestCatalog::fromFile(path);
        REQUIRE_FALSE(res);
        CHECK(res.error().code == ErrorCode::InvalidData);
    }

    SECTION("Wrong shape") {
        auto path = hoard::test::write_file(dir.path() / "shape.json", R"(["a", "b"])");
        auto res = ManifestCatalog::fromFile(path);
        REQUIRE_FALSE(res);
        CHECK(res.error().code == ErrorCode::InvalidData);
    }

    SECTION("Valid file") {
        auto path = hoard::test::write_file(dir.path() / "m.json", kManifest.dump());
        auto res = ManifestCatalog::fromFile(path);
        REQUIRE(res);
        CHECK(res.value()->size() == 4);
    }
}
