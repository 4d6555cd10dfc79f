#include <hoard/core/durable_io.h>

#include <spdlog/spdlog.h>

#include <system_error>

#if defined(_WIN32)
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace hoard::durable_io {

namespace fs = std::filesystem;

Result<void> fsyncFile(const fs::path& p) {
#if defined(_WIN32)
    HANDLE h = CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return Error{ErrorCode::IoError, "CreateFile failed for fsync: " + p.string()};
    }
    if (!FlushFileBuffers(h)) {
        CloseHandle(h);
        return Error{ErrorCode::IoError, "FlushFileBuffers failed for: " + p.string()};
    }
    CloseHandle(h);
    return {};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
#if defined(__APPLE__)
    // F_FULLFSYNC is stricter than fsync on macOS; do both, tolerating failures
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
#endif
    ::close(fd);
    return {};
#endif
}

Result<void> fsyncDir(const fs::path& dir) {
#if defined(_WIN32)
    // Directory entries are durable once the rename returns on NTFS
    (void)dir;
    return {};
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return {};
#endif
}

Result<void> commitStaged(const fs::path& staging, const fs::path& target) {
    if (auto r = fsyncFile(staging); !r) {
        return Error{r.error().code, "Failed to fsync staging: " + staging.string()};
    }

    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        if (ec != std::errc::cross_device_link) {
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 staging.string() + " to " + target.string()};
        }
        spdlog::warn("Cross-device rename detected; performing copy+fsync+replace for {}",
                     target.string());
        fs::copy_file(staging, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Error{ErrorCode::IoError, "copy_file() failed: " + ec.message()};
        }
        if (auto r = fsyncFile(target); !r) {
            return r.error();
        }
        fs::remove(staging, ec);
    }

    if (target.has_parent_path()) {
        if (auto rd = fsyncDir(target.parent_path()); !rd) {
            spdlog::debug("fsync on directory failed (continuing): {}", rd.error().message);
        }
    }
    return {};
}

} // namespace hoard::durable_io
