/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors
 *
 * The descriptor is closed on every exit path, including cancellation and
 * error returns from the middle of an overwrite pass.
 */

#pragma once

#include "util/Error.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Move-only owner of a POSIX file descriptor
 */
class FileDescriptor {
public:
    /**
     * @brief Construct from raw file descriptor
     * @param fd Raw file descriptor (may be invalid)
     */
    explicit FileDescriptor(int fd = -1) noexcept : fd_(fd) {}

    ~FileDescriptor() {
        if (is_valid()) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            if (is_valid()) {
                ::close(fd_);
            }
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    /**
     * @brief Open an existing path without following a final symlink
     * @param path File to open
     * @param flags O_RDONLY, O_WRONLY or O_RDWR plus any extra flags
     * @return Owned descriptor, or an error classified from errno
     */
    [[nodiscard]] static auto open_existing(const std::filesystem::path& path, int flags)
        -> Result<FileDescriptor> {
        int fd = ::open(path.c_str(), flags | O_CLOEXEC | O_NOFOLLOW);
        if (fd < 0) {
            const int err = errno;
            const auto kind = err == ELOOP ? ErrorKind::SymlinkUnsupported : kind_from_errno(err);
            return std::unexpected(
                Error{kind, std::format("Failed to open {}: {}", path.string(), std::strerror(err)),
                      err});
        }
        return FileDescriptor{fd};
    }

    /**
     * @brief Close now and report the result
     *
     * close() can surface deferred write errors, so callers that wrote data
     * check this instead of relying on the destructor.
     */
    [[nodiscard]] auto close() -> Result<void> {
        if (!is_valid()) {
            return {};
        }
        const int fd = std::exchange(fd_, -1);
        if (::close(fd) != 0) {
            const int err = errno;
            return std::unexpected(
                Error{ErrorKind::IoError, std::format("close failed: {}", std::strerror(err)), err});
        }
        return {};
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

private:
    int fd_;
};

}  // namespace util
