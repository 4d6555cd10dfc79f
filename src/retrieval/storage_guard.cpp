#include <hoard/retrieval/storage_guard.h>

#include <spdlog/spdlog.h>

#include <system_error>

namespace hoard::retrieval {

namespace fs = std::filesystem;

namespace {

fs::path nearest_existing(fs::path p) {
    std::error_code ec;
    if (p.empty())
        p = fs::current_path(ec);
    while (!p.empty() && !fs::exists(p, ec)) {
        auto parent = p.parent_path();
        if (parent == p)
            break;
        p = std::move(parent);
    }
    return p.empty() ? fs::path(".") : p;
}

} // namespace

StorageGuard::StorageGuard(fs::path path)
    : probe_([path = std::move(path)]() -> Result<std::uint64_t> {
          std::error_code ec;
          const auto target = nearest_existing(path);
          const auto info = fs::space(target, ec);
          if (ec) {
              return Error{ErrorCode::IoError,
                           "space() failed for " + target.string() + ": " + ec.message()};
          }
          return static_cast<std::uint64_t>(info.available);
      }) {}

StorageGuard::StorageGuard(FreeSpaceProbe probe) : probe_(std::move(probe)) {}

Result<double> StorageGuard::freeSpaceGB() const {
    if (!probe_) {
        return Error{ErrorCode::InvalidState, "No free-space probe configured"};
    }
    auto bytes = probe_();
    if (!bytes) {
        return bytes.error();
    }
    return static_cast<double>(bytes.value()) / BYTES_PER_GB;
}

bool StorageGuard::hasSufficientSpace(double minGB) const {
    auto free = freeSpaceGB();
    if (!free) {
        spdlog::error("Could not determine free space: {}", free.error().message);
        return false;
    }
    if (free.value() < minGB) {
        spdlog::warn("Low storage: {:.1f} GB free, minimum is {:.1f} GB", free.value(), minGB);
        return false;
    }
    spdlog::debug("Free space: {:.1f} GB", free.value());
    return true;
}

} // namespace hoard::retrieval
