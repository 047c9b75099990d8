/**
 * @file WindowsTimestampObfuscator.hpp
 * @brief NTFS timestamp obfuscation through the Win32 file APIs
 */

#pragma once

#include "services/ITimestampObfuscator.hpp"

/**
 * @class WindowsTimestampObfuscator
 * @brief Rewrites creation, access, write and change times
 *
 * Tries to enable SeBackupPrivilege and SeRestorePrivilege first so files
 * with restrictive ACLs can still be opened for attribute writes. Writes go
 * through SetFileInformationByHandle (all four $STANDARD_INFORMATION times)
 * and fall back to SetFileTime (three times) when that is refused. Missing
 * privileges only narrow what gets written.
 */
class WindowsTimestampObfuscator : public ITimestampObfuscator {
public:
    explicit WindowsTimestampObfuscator(std::shared_ptr<util::ILogger> logger);

    auto obfuscate(const std::filesystem::path& path) -> TimestampReport override;

    std::string get_name() const override { return "SetFileInformationByHandle"; }

private:
    static constexpr int ITERATIONS = 5;

    /**
     * @brief Enable backup/restore privileges on the process token
     * @return true if both privileges are now held
     */
    [[nodiscard]] static auto enable_backup_privileges() -> bool;

    std::shared_ptr<util::ILogger> logger_;
};
