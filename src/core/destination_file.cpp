/**
 * @file destination_file.cpp
 * @brief Implementation of destination_file
 */

#include "kcenon/delta_fetch/core/destination_file.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace kcenon::delta_fetch {

namespace {

auto io_error(int err, const std::string& what) -> error {
    auto code = err == ENOSPC || err == EDQUOT ? error_code::disk_full
                                               : error_code::file_write_error;
    return error(code, what + ": " + std::strerror(err));
}

}  // namespace

auto destination_file::open(const std::filesystem::path& path, uint64_t size, bool sync_on_close)
    -> result<std::shared_ptr<destination_file>> {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return unexpected(error(error_code::directory_create_failed,
                "failed to create " + path.parent_path().string() + ": " + ec.message()));
        }
    }

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return unexpected(io_error(errno, "failed to open " + path.string()));
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        auto err = io_error(errno, "failed to stat " + path.string());
        ::close(fd);
        return unexpected(err);
    }

    if (static_cast<uint64_t>(st.st_size) != size &&
        ::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        auto err = io_error(errno, "failed to size " + path.string());
        ::close(fd);
        return unexpected(err);
    }

    return std::shared_ptr<destination_file>(
        new destination_file(path, fd, size, sync_on_close));
}

destination_file::destination_file(std::filesystem::path path, int fd, uint64_t size,
                                   bool sync_on_close)
    : path_(std::move(path))
    , fd_(fd)
    , size_(size)
    , sync_on_close_(sync_on_close) {
}

destination_file::~destination_file() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

auto destination_file::write_at(uint64_t offset, std::span<const std::byte> data) -> result<void> {
    if (fd_ < 0) {
        return unexpected(error(error_code::file_write_error, "file is closed: " + path_.string()));
    }
    if (offset + data.size() > size_) {
        return unexpected(error(error_code::invalid_range,
            "write past end of " + path_.string()));
    }

    const auto* cursor = reinterpret_cast<const char*>(data.data());
    std::size_t remaining = data.size();
    auto position = static_cast<off_t>(offset);

    while (remaining > 0) {
        auto written = ::pwrite(fd_, cursor, remaining, position);
        if (written < 0) {
            if (errno == EINTR) continue;
            return unexpected(io_error(errno, "failed to write " + path_.string()));
        }
        cursor += written;
        position += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return {};
}

auto destination_file::sync() -> result<void> {
    if (fd_ < 0) {
        return {};
    }
    if (::fdatasync(fd_) != 0) {
        return unexpected(io_error(errno, "failed to sync " + path_.string()));
    }
    return {};
}

auto destination_file::close() -> result<void> {
    if (fd_ < 0) {
        return {};
    }
    result<void> synced;
    if (sync_on_close_) {
        synced = sync();
    }
    int rc = ::close(fd_);
    int err = errno;
    fd_ = -1;
    if (!synced) {
        return synced;
    }
    if (rc != 0) {
        return unexpected(io_error(err, "failed to close " + path_.string()));
    }
    return {};
}

}  // namespace kcenon::delta_fetch
