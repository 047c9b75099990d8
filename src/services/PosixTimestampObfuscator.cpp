#include "services/PosixTimestampObfuscator.hpp"

#include "util/SecureRandom.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

namespace {

auto random_timespec() -> timespec {
    timespec ts{};
    ts.tv_sec = static_cast<time_t>(timestamps::random_past_time());
    ts.tv_nsec = static_cast<long>(util::SecureRandom::uniform(1'000'000'000));
    return ts;
}

}  // namespace

PosixTimestampObfuscator::PosixTimestampObfuscator(std::shared_ptr<util::ILogger> logger)
    : logger_(logger ? std::move(logger) : util::NullLogger::shared()) {}

auto PosixTimestampObfuscator::obfuscate(const std::filesystem::path& path) -> TimestampReport {
    TimestampReport report{};
    report.fields_attempted = 2;
    report.privileged = ::geteuid() == 0;

    int successes = 0;
    int last_errno = 0;

    for (int i = 0; i < ITERATIONS; ++i) {
        // atime and mtime are drawn independently
        const std::array<timespec, 2> times{random_timespec(), random_timespec()};
        if (::utimensat(AT_FDCWD, path.c_str(), times.data(), AT_SYMLINK_NOFOLLOW) != 0) {
            last_errno = errno;
            continue;
        }
        ++successes;
        report.applied_times.push_back(static_cast<int64_t>(times[0].tv_sec));
        report.applied_times.push_back(static_cast<int64_t>(times[1].tv_sec));
    }

    if (successes > 0) {
        report.fields_written = 2;
    } else {
        logger_->warning("Timestamps", std::format("utimensat failed for {}: {}", path.string(),
                                                   std::strerror(last_errno)));
    }

    return report;
}
