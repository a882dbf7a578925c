/**
 * @file destination_file.cpp
 * @brief POSIX implementation of the download part file
 */

#include "dx/transfer/engine/destination_file.h"

#include "dx/transfer/core/logging.h"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dx::transfer {

namespace {

auto errno_message(const std::string& what, const std::filesystem::path& path) -> std::string {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

}  // namespace

destination_file::destination_file(std::filesystem::path path, int fd)
    : path_(std::move(path)), fd_(fd) {}

destination_file::~destination_file() {
    close();
}

auto destination_file::open(const std::filesystem::path& path, uint64_t size, bool truncate)
    -> result<std::unique_ptr<destination_file>> {
    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }

    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        auto code = errno == EACCES ? error_code::file_access_denied : error_code::file_write_error;
        return unexpected(error(code, errno_message("cannot open", path)));
    }

    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        auto msg = errno_message("cannot size", path);
        ::close(fd);
        return unexpected(error(error_code::file_write_error, msg));
    }

    DXT_LOG_DEBUG(log_category::orchestrator,
                  "Opened part file " + path.string() + " (" + std::to_string(size) +
                      " bytes" + (truncate ? ", truncated)" : ")"));
    return std::unique_ptr<destination_file>(new destination_file(path, fd));
}

auto destination_file::write_at(uint64_t offset, std::span<const std::byte> data)
    -> result<void> {
    if (fd_ < 0) {
        return unexpected(error(error_code::file_write_error, "part file is closed"));
    }

    const auto* ptr = data.data();
    std::size_t remaining = data.size();
    auto pos = static_cast<off_t>(offset);

    while (remaining > 0) {
        auto written = ::pwrite(fd_, ptr, remaining, pos);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return unexpected(error(error_code::file_write_error,
                                    errno_message("write failed on", path_)));
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
        pos += written;
    }
    return {};
}

auto destination_file::read_at(uint64_t offset, uint64_t length) const
    -> result<std::vector<std::byte>> {
    if (fd_ < 0) {
        return unexpected(error(error_code::file_read_error, "part file is closed"));
    }

    std::vector<std::byte> buffer(static_cast<std::size_t>(length));
    std::size_t filled = 0;
    auto pos = static_cast<off_t>(offset);

    while (filled < buffer.size()) {
        auto got = ::pread(fd_, buffer.data() + filled, buffer.size() - filled, pos);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            return unexpected(error(error_code::file_read_error,
                                    errno_message("read failed on", path_)));
        }
        if (got == 0) {
            return unexpected(error(error_code::file_read_error,
                                    "unexpected end of " + path_.string()));
        }
        filled += static_cast<std::size_t>(got);
        pos += got;
    }
    return buffer;
}

auto destination_file::sync() -> result<void> {
    if (fd_ < 0) {
        return unexpected(error(error_code::file_write_error, "part file is closed"));
    }
    if (::fsync(fd_) != 0) {
        return unexpected(error(error_code::file_write_error,
                                errno_message("fsync failed on", path_)));
    }
    return {};
}

auto destination_file::commit(const std::filesystem::path& final_path) -> result<void> {
    auto synced = sync();
    if (!synced) {
        return synced;
    }
    if (::close(fd_) != 0) {
        fd_ = -1;
        return unexpected(error(error_code::file_write_error,
                                errno_message("close failed on", path_)));
    }
    fd_ = -1;

    std::error_code ec;
    std::filesystem::rename(path_, final_path, ec);
    if (ec) {
        return unexpected(error(error_code::file_write_error,
                                "cannot rename " + path_.string() + " to " +
                                    final_path.string() + ": " + ec.message()));
    }
    DXT_LOG_DEBUG(log_category::orchestrator, "Committed " + final_path.string());
    return {};
}

void destination_file::discard() {
    close();
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        DXT_LOG_WARN(log_category::orchestrator,
                     "Cannot remove part file " + path_.string() + ": " + ec.message());
    }
}

void destination_file::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace dx::transfer
