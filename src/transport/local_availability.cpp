#include <hoard/transport/local_availability.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>

namespace hoard::transport {

namespace fs = std::filesystem;

LocalAvailability::LocalAvailability(LibraryLayout layout, std::uint64_t readLimit)
    : layout_(std::move(layout)), readLimit_(readLimit) {}

retrieval::AvailabilityProbe LocalAvailability::probe(const retrieval::Asset& asset) {
    retrieval::AvailabilityProbe result;
    const auto path = layout_.finalPath(asset);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        result.finished = true;
        return result;
    }
    const auto onDisk = fs::file_size(path, ec);
    if (ec) {
        result.error = Error{ErrorCode::IoError, "file_size failed: " + ec.message()};
        return result;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        result.error = Error{ErrorCode::PermissionDenied, "Cannot open " + path.string()};
        return result;
    }

    // Reading proves the bytes are materialized, not just allocated
    std::array<char, 64 * 1024> buf{};
    std::uint64_t confirmed = 0;
    while (confirmed < readLimit_ && in) {
        const auto want = static_cast<std::streamsize>(
            std::min<std::uint64_t>(buf.size(), readLimit_ - confirmed));
        in.read(buf.data(), want);
        confirmed += static_cast<std::uint64_t>(in.gcount());
    }
    if (in.bad()) {
        result.error = Error{ErrorCode::IoError, "Read failed for " + path.string()};
        return result;
    }

    result.confirmedBytes = confirmed;
    result.finished = !(asset.sizeHint && onDisk < *asset.sizeHint);
    if (!result.finished) {
        spdlog::debug("{} is partial ({} of {} bytes)", asset.id, onDisk, *asset.sizeHint);
    }
    return result;
}

} // namespace hoard::transport
