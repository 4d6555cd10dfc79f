#pragma once

#include <hoard/retrieval/retrieval.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace hoard::transport {

/**
 * Where an asset lives on disk:
 *
 *   <libraryDir>/<photos|videos>/<sanitized id><ext>
 *
 * The extension comes from the last path segment of the asset location, if it
 * has one. In-flight transfers write to `<final>.part`.
 */
class LibraryLayout {
public:
    explicit LibraryLayout(std::filesystem::path libraryDir);

    std::filesystem::path finalPath(const retrieval::Asset& asset) const;
    std::filesystem::path stagingPath(const retrieval::Asset& asset) const;

    const std::filesystem::path& root() const { return root_; }

    // Characters outside [A-Za-z0-9._-] become '_'; a leading '.' does too
    static std::string sanitizeId(std::string_view id);

    // ".jpg" for "https://host/a/IMG_1.JPG?sig=x"; empty when there is none
    static std::string extensionFromLocation(std::string_view location);

private:
    std::filesystem::path root_;
};

} // namespace hoard::transport
