/**
 * @file Error.hpp
 * @brief Error type for consistent error handling
 *
 * Every fallible engine step returns util::Result<T>, which carries either
 * the success value or an Error describing what kind of failure occurred.
 */

#pragma once

#include <cerrno>
#include <expected>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum ErrorKind
 * @brief Failure classes reported by the shredding engine
 */
enum class ErrorKind {
    NotFound,            ///< Target does not exist
    SymlinkUnsupported,  ///< Target is a symbolic link
    SystemPathRefused,   ///< Target lies in a protected system location
    NotAFile,            ///< File operation requested on a non-regular file
    NotADirectory,       ///< Directory operation requested on a non-directory
    PermissionDenied,    ///< EACCES / EPERM from the filesystem
    IoError,             ///< Short write, fsync failure or other filesystem error
    RenameFailed,        ///< First obfuscating rename (or relocation) failed
    ConsistencyError,    ///< Target still exists after unlink
    Cancelled,           ///< Caller requested cancellation
    NoFilesFound         ///< Directory walk produced no eligible files
};

/**
 * @struct Error
 * @brief Represents an error with a kind, a message and optional errno
 */
struct Error {
    ErrorKind kind = ErrorKind::IoError;
    std::string message;
    int code = 0;

    Error() = default;
    Error(ErrorKind err_kind, std::string msg, int err_code = 0)
        : kind(err_kind), message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Map an errno value onto the matching error kind
 * @param err errno captured right after the failing call
 * @param fallback Kind used when errno has no dedicated mapping
 */
[[nodiscard]] inline auto kind_from_errno(int err, ErrorKind fallback = ErrorKind::IoError)
    -> ErrorKind {
    switch (err) {
        case ENOENT:
            return ErrorKind::NotFound;
        case EACCES:
        case EPERM:
            return ErrorKind::PermissionDenied;
        default:
            return fallback;
    }
}

[[nodiscard]] constexpr auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::SymlinkUnsupported:
            return "SymlinkUnsupported";
        case ErrorKind::SystemPathRefused:
            return "SystemPathRefused";
        case ErrorKind::NotAFile:
            return "NotAFile";
        case ErrorKind::NotADirectory:
            return "NotADirectory";
        case ErrorKind::PermissionDenied:
            return "PermissionDenied";
        case ErrorKind::IoError:
            return "IoError";
        case ErrorKind::RenameFailed:
            return "RenameFailed";
        case ErrorKind::ConsistencyError:
            return "ConsistencyError";
        case ErrorKind::Cancelled:
            return "Cancelled";
        case ErrorKind::NoFilesFound:
            return "NoFilesFound";
    }
    return "Unknown";
}

}  // namespace util
