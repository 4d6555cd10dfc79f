#include <hoard/retrieval/retrieval.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace hoard::retrieval {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

} // namespace

const char* toString(MediaKind kind) {
    switch (kind) {
        case MediaKind::Photo: return "photo";
        case MediaKind::Video: return "video";
    }
    return "photo";
}

const char* toString(MediaFilter filter) {
    switch (filter) {
        case MediaFilter::All: return "all";
        case MediaFilter::Photo: return "photo";
        case MediaFilter::Video: return "video";
    }
    return "all";
}

const char* toString(SortOrder order) {
    switch (order) {
        case SortOrder::Oldest: return "oldest";
        case SortOrder::Newest: return "newest";
        case SortOrder::Smallest: return "smallest";
        case SortOrder::Largest: return "largest";
        case SortOrder::Random: return "random";
    }
    return "oldest";
}

const char* toString(RunMode mode) {
    return mode == RunMode::Streaming ? "streaming" : "scan-first";
}

std::optional<MediaKind> parseMediaKind(std::string_view text) {
    const auto v = to_lower(text);
    if (v == "photo" || v == "image")
        return MediaKind::Photo;
    if (v == "video")
        return MediaKind::Video;
    return std::nullopt;
}

std::optional<MediaFilter> parseMediaFilter(std::string_view text) {
    const auto v = to_lower(text);
    if (v == "all")
        return MediaFilter::All;
    if (v == "photo")
        return MediaFilter::Photo;
    if (v == "video")
        return MediaFilter::Video;
    return std::nullopt;
}

std::optional<SortOrder> parseSortOrder(std::string_view text) {
    const auto v = to_lower(text);
    if (v == "oldest")
        return SortOrder::Oldest;
    if (v == "newest")
        return SortOrder::Newest;
    if (v == "smallest")
        return SortOrder::Smallest;
    if (v == "largest")
        return SortOrder::Largest;
    if (v == "random")
        return SortOrder::Random;
    return std::nullopt;
}

} // namespace hoard::retrieval
