#include <hoard/transport/library_layout.h>

#include <algorithm>
#include <cctype>

namespace hoard::transport {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

} // namespace

LibraryLayout::LibraryLayout(std::filesystem::path libraryDir) : root_(std::move(libraryDir)) {}

std::string LibraryLayout::sanitizeId(std::string_view id) {
    std::string out;
    out.reserve(id.size());
    for (unsigned char c : id) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-')
            out.push_back(static_cast<char>(c));
        else
            out.push_back('_');
    }
    if (out.empty())
        return "_";
    if (out.front() == '.')
        out.front() = '_';
    return out;
}

std::string LibraryLayout::extensionFromLocation(std::string_view location) {
    auto end = location.find_first_of("?#");
    if (end != std::string_view::npos)
        location = location.substr(0, end);
    // Skip "scheme://host" so a dotted hostname is never mistaken for an extension
    if (auto scheme = location.find("://"); scheme != std::string_view::npos) {
        auto pathStart = location.find('/', scheme + 3);
        location = pathStart == std::string_view::npos ? std::string_view{}
                                                       : location.substr(pathStart);
    }
    auto slash = location.find_last_of('/');
    auto segment = slash == std::string_view::npos ? location : location.substr(slash + 1);
    auto dot = segment.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == segment.size())
        return {};
    auto ext = segment.substr(dot + 1);
    if (ext.size() > 5 ||
        !std::all_of(ext.begin(), ext.end(), [](unsigned char c) { return std::isalnum(c); }))
        return {};
    return "." + to_lower(ext);
}

std::filesystem::path LibraryLayout::finalPath(const retrieval::Asset& asset) const {
    const char* bucket = asset.kind == retrieval::MediaKind::Video ? "videos" : "photos";
    return root_ / bucket / (sanitizeId(asset.id) + extensionFromLocation(asset.location));
}

std::filesystem::path LibraryLayout::stagingPath(const retrieval::Asset& asset) const {
    auto p = finalPath(asset);
    p += ".part";
    return p;
}

} // namespace hoard::transport
