#include "services/WindowsTimestampObfuscator.hpp"

#include "util/SecureRandom.hpp"

#include <windows.h>

#include <algorithm>
#include <array>
#include <format>
#include <memory>

namespace {

// Seconds between 1601-01-01 and 1970-01-01
constexpr int64_t EPOCH_DIFFERENCE_SECONDS = 11'644'473'600LL;
constexpr int64_t TICKS_PER_SECOND = 10'000'000LL;

struct HandleCloser {
    void operator()(HANDLE handle) const {
        if (handle != nullptr && handle != INVALID_HANDLE_VALUE) {
            ::CloseHandle(handle);
        }
    }
};

using UniqueHandle = std::unique_ptr<std::remove_pointer_t<HANDLE>, HandleCloser>;

auto to_file_ticks(int64_t unix_seconds) -> int64_t {
    const auto sub_second = static_cast<int64_t>(util::SecureRandom::uniform(TICKS_PER_SECOND));
    return (unix_seconds + EPOCH_DIFFERENCE_SECONDS) * TICKS_PER_SECOND + sub_second;
}

auto to_filetime(int64_t ticks) -> FILETIME {
    FILETIME ft{};
    ft.dwLowDateTime = static_cast<DWORD>(ticks & 0xFFFFFFFF);
    ft.dwHighDateTime = static_cast<DWORD>(static_cast<uint64_t>(ticks) >> 32);
    return ft;
}

auto open_for_attributes(const std::filesystem::path& path) -> UniqueHandle {
    constexpr std::array<DWORD, 3> access_modes{
        FILE_WRITE_ATTRIBUTES,
        FILE_WRITE_ATTRIBUTES | SYNCHRONIZE,
        GENERIC_WRITE,
    };

    for (DWORD access : access_modes) {
        HANDLE handle = ::CreateFileW(path.c_str(), access,
                                      FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                                      nullptr, OPEN_EXISTING,
                                      FILE_FLAG_BACKUP_SEMANTICS | FILE_FLAG_OPEN_REPARSE_POINT,
                                      nullptr);
        if (handle != INVALID_HANDLE_VALUE) {
            return UniqueHandle{handle};
        }
    }
    return UniqueHandle{};
}

auto enable_privilege(HANDLE token, const wchar_t* name) -> bool {
    LUID luid{};
    if (!::LookupPrivilegeValueW(nullptr, name, &luid)) {
        return false;
    }

    TOKEN_PRIVILEGES privileges{};
    privileges.PrivilegeCount = 1;
    privileges.Privileges[0].Luid = luid;
    privileges.Privileges[0].Attributes = SE_PRIVILEGE_ENABLED;

    if (!::AdjustTokenPrivileges(token, FALSE, &privileges, sizeof(privileges), nullptr,
                                 nullptr)) {
        return false;
    }
    return ::GetLastError() != ERROR_NOT_ALL_ASSIGNED;
}

}  // namespace

WindowsTimestampObfuscator::WindowsTimestampObfuscator(std::shared_ptr<util::ILogger> logger)
    : logger_(logger ? std::move(logger) : util::NullLogger::shared()) {}

auto WindowsTimestampObfuscator::enable_backup_privileges() -> bool {
    HANDLE raw_token = nullptr;
    if (!::OpenProcessToken(::GetCurrentProcess(), TOKEN_ADJUST_PRIVILEGES | TOKEN_QUERY,
                            &raw_token)) {
        return false;
    }
    UniqueHandle token{raw_token};

    const bool backup = enable_privilege(token.get(), SE_BACKUP_NAME);
    const bool restore = enable_privilege(token.get(), SE_RESTORE_NAME);
    return backup && restore;
}

auto WindowsTimestampObfuscator::obfuscate(const std::filesystem::path& path) -> TimestampReport {
    TimestampReport report{};
    report.fields_attempted = 4;
    report.privileged = enable_backup_privileges();

    auto handle = open_for_attributes(path);
    if (!handle) {
        logger_->warning("Timestamps", std::format("Cannot open {} for attribute writes: error {}",
                                                   path.string(), ::GetLastError()));
        return report;
    }

    for (int i = 0; i < ITERATIONS; ++i) {
        const std::array<int64_t, 4> seconds{
            timestamps::random_past_time(), timestamps::random_past_time(),
            timestamps::random_past_time(), timestamps::random_past_time()};

        FILE_BASIC_INFO info{};
        if (::GetFileInformationByHandleEx(handle.get(), FileBasicInfo, &info, sizeof(info))) {
            info.CreationTime.QuadPart = to_file_ticks(seconds[0]);
            info.LastAccessTime.QuadPart = to_file_ticks(seconds[1]);
            info.LastWriteTime.QuadPart = to_file_ticks(seconds[2]);
            info.ChangeTime.QuadPart = to_file_ticks(seconds[3]);
            if (::SetFileInformationByHandle(handle.get(), FileBasicInfo, &info, sizeof(info))) {
                report.fields_written = 4;
                report.applied_times.insert(report.applied_times.end(), seconds.begin(),
                                            seconds.end());
                continue;
            }
        }

        const FILETIME creation = to_filetime(to_file_ticks(seconds[0]));
        const FILETIME access = to_filetime(to_file_ticks(seconds[1]));
        const FILETIME write = to_filetime(to_file_ticks(seconds[2]));
        if (::SetFileTime(handle.get(), &creation, &access, &write)) {
            report.fields_written = std::max(report.fields_written, 3);
            report.applied_times.insert(report.applied_times.end(), seconds.begin(),
                                        seconds.begin() + 3);
        }
    }

    if (report.fields_written == 0) {
        logger_->warning("Timestamps", std::format("No timestamp of {} could be changed: error {}",
                                                   path.string(), ::GetLastError()));
    }

    return report;
}
