/**
 * @file WriteHelpers.hpp
 * @brief EINTR-safe wrappers around write(), read() and fsync()
 */

#pragma once

#include <cerrno>
#include <cstddef>
#include <unistd.h>

namespace util {

/**
 * @brief Write until the whole buffer is accepted or an error occurs
 * @return Bytes written; less than size means the device stopped accepting
 *         data (short write), -1 means write() failed with errno set
 */
inline auto write_with_retry(int fd, const void* buffer, size_t size) -> ssize_t {
    const auto* bytes = static_cast<const unsigned char*>(buffer);
    size_t done = 0;
    while (done < size) {
        const auto result = ::write(fd, bytes + done, size - done);
        if (result < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return done > 0 ? static_cast<ssize_t>(done) : -1;
        }
        if (result == 0) {
            break;
        }
        done += static_cast<size_t>(result);
    }
    return static_cast<ssize_t>(done);
}

inline auto read_with_retry(int fd, void* buffer, size_t count) -> ssize_t {
    while (true) {
        const auto result = ::read(fd, buffer, count);
        if (result >= 0 || errno != EINTR) {
            return result;
        }
    }
}

inline auto fsync_with_retry(int fd) -> int {
    while (true) {
        const int result = ::fsync(fd);
        if (result == 0 || errno != EINTR) {
            return result;
        }
    }
}

}  // namespace util
