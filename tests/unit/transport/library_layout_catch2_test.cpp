#include <catch2/catch_test_macros.hpp>

#include <hoard/transport/library_layout.h>

#include "../../common/fake_providers.h"

using namespace hoard;
using namespace hoard::transport;
using hoard::retrieval::MediaKind;

TEST_CASE("LibraryLayout: Sanitized ids", "[transport][layout]") {
    CHECK(LibraryLayout::sanitizeId("ABC-123_x.y") == "ABC-123_x.y");
    CHECK(LibraryLayout::sanitizeId("9F2A/L0/001") == "9F2A_L0_001");
    CHECK(LibraryLayout::sanitizeId("../../etc/passwd") == "_._.._etc_passwd");
    CHECK(LibraryLayout::sanitizeId(".hidden") == "_hidden");
    CHECK(LibraryLayout::sanitizeId("a b:c") == "a_b_c");
    CHECK(LibraryLayout::sanitizeId("") == "_");
}

TEST_CASE("LibraryLayout: Extension from the URL path", "[transport][layout]") {
    CHECK(LibraryLayout::extensionFromLocation("https://cdn.example.com/a/b/IMG_0001.JPG") ==
          ".jpg");
    CHECK(LibraryLayout::extensionFromLocation("https://cdn.example.com/clip.mov?sig=abc.def") ==
          ".mov");
    CHECK(LibraryLayout::extensionFromLocation("https://cdn.example.com/x.heic#frag") == ".heic");
    CHECK(LibraryLayout::extensionFromLocation("https://cdn.example.com/noext").empty());
    CHECK(LibraryLayout::extensionFromLocation("https://cdn.example.com").empty());
    CHECK(LibraryLayout::extensionFromLocation("https://cdn.example.com/archive.toolongext").empty());
    CHECK(LibraryLayout::extensionFromLocation("https://cdn.example.com/.profile").empty());
    CHECK(LibraryLayout::extensionFromLocation("file:///tmp/photo.png") == ".png");
    CHECK(LibraryLayout::extensionFromLocation("").empty());
}

TEST_CASE("LibraryLayout: Final and staging paths", "[transport][layout]") {
    LibraryLayout layout("/lib");

    auto photo = hoard::test::makeAsset("P/1");
    photo.location = "https://cdn.example.com/p1.jpg";
    CHECK(layout.finalPath(photo) == std::filesystem::path("/lib/photos/P_1.jpg"));
    CHECK(layout.stagingPath(photo) == std::filesystem::path("/lib/photos/P_1.jpg.part"));

    auto video = hoard::test::makeAsset("v1", 1600000000, 10, MediaKind::Video);
    video.location = "https://cdn.example.com/v1";
    CHECK(layout.finalPath(video) == std::filesystem::path("/lib/videos/v1"));
    CHECK(layout.root() == std::filesystem::path("/lib"));
}
