/**
 * @file ITimestampObfuscator.hpp
 * @brief Interface for randomizing file timestamps
 */

#pragma once

#include "util/Logger.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

/**
 * @struct TimestampReport
 * @brief What a timestamp obfuscation pass managed to write
 */
struct TimestampReport {
    int fields_attempted = 0;           ///< Timestamp fields the platform exposes
    int fields_written = 0;             ///< Fields successfully randomized at least once
    bool privileged = false;            ///< Elevated privileges were available
    std::vector<int64_t> applied_times; ///< Unix seconds written, in order
};

/**
 * @class ITimestampObfuscator
 * @brief Platform capability that scrambles a file's timestamps
 *
 * obfuscate() is best-effort and never fails the shred: whatever subset of
 * fields the platform lets us write is written, the rest is reported.
 */
class ITimestampObfuscator {
public:
    virtual ~ITimestampObfuscator() = default;

    /**
     * @brief Randomize every writable timestamp of the file
     * @param path File to modify (must not be a symlink)
     */
    virtual auto obfuscate(const std::filesystem::path& path) -> TimestampReport = 0;

    virtual std::string get_name() const = 0;
};

namespace timestamps {

/// Timestamps land within this many seconds before now (about 20 years)
inline constexpr int64_t MAX_AGE_SECONDS = 20LL * 365 * 24 * 60 * 60;

/**
 * @brief Draw a random Unix time within the obfuscation window
 */
[[nodiscard]] auto random_past_time() -> int64_t;

/**
 * @brief Create the implementation for the running platform
 */
[[nodiscard]] auto make_platform_obfuscator(std::shared_ptr<util::ILogger> logger)
    -> std::unique_ptr<ITimestampObfuscator>;

}  // namespace timestamps
