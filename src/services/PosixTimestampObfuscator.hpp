/**
 * @file PosixTimestampObfuscator.hpp
 * @brief utimensat()-based timestamp obfuscation
 */

#pragma once

#include "services/ITimestampObfuscator.hpp"

/**
 * @class PosixTimestampObfuscator
 * @brief Rewrites access and modification times with random values
 *
 * POSIX exposes no way to set the change time or the birth time; the
 * change time is reset by the kernel on every metadata update, so only
 * atime and mtime are counted as written.
 */
class PosixTimestampObfuscator : public ITimestampObfuscator {
public:
    explicit PosixTimestampObfuscator(std::shared_ptr<util::ILogger> logger);

    auto obfuscate(const std::filesystem::path& path) -> TimestampReport override;

    std::string get_name() const override { return "utimensat"; }

private:
    static constexpr int ITERATIONS = 10;

    std::shared_ptr<util::ILogger> logger_;
};
