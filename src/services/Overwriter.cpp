#include "services/Overwriter.hpp"

#include "algorithms/VerificationHelper.hpp"
#include "util/FileDescriptor.hpp"
#include "util/WriteHelpers.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>

namespace {

constexpr const char* CANCELLED_MESSAGE = "Operation cancelled by user";

auto cancelled() -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorKind::Cancelled, CANCELLED_MESSAGE});
}

auto errno_error(const std::string& what, int err) -> std::unexpected<util::Error> {
    return std::unexpected(
        util::Error{util::kind_from_errno(err), std::format("{}: {}", what, std::strerror(err)), err});
}

}  // namespace

Overwriter::Overwriter(std::shared_ptr<util::ILogger> logger)
    : logger_(logger ? std::move(logger) : util::NullLogger::shared()) {}

auto Overwriter::overwrite(const std::filesystem::path& path, const PatternSchedule& schedule,
                           const ProgressCallback& progress, const util::CancellationToken& cancel)
    -> util::Result<void> {
    auto fd = util::FileDescriptor::open_existing(path, O_RDWR);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    struct stat st {};
    if (::fstat(fd->get(), &st) != 0) {
        return errno_error("fstat failed", errno);
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(util::Error{util::ErrorKind::NotAFile,
                                           std::format("{} is not a regular file", path.string())});
    }

    // Captured once; later passes never re-read the size
    const auto original_size = static_cast<uint64_t>(st.st_size);
    const auto total_passes = static_cast<int>(schedule.size());

    std::vector<uint8_t> buffer(
        static_cast<size_t>(std::min<uint64_t>(chunk_size_for(original_size), original_size)));

    logger_->info("Overwriter", std::format("Starting secure overwrite: {} bytes, {} passes",
                                            original_size, total_passes));

    for (int i = 0; i < total_passes; ++i) {
        const int pass = i + 1;

        if (cancel.is_cancelled()) {
            return cancelled();
        }

        if (progress) {
            ShredProgress event{
                .current_step = pass,
                .total_steps = total_passes,
                .status = std::format("PASS {}/{} - GUTMANN METHOD", pass, total_passes),
                .bytes_processed = original_size,
            };
            if (!progress(event)) {
                return cancelled();
            }
        }

        if (auto result = write_pass(fd->get(), schedule[static_cast<size_t>(i)], pass,
                                     total_passes, original_size, buffer, progress, cancel);
            !result) {
            return result;
        }

        if (util::fsync_with_retry(fd->get()) != 0) {
            return errno_error(std::format("fsync failed after pass {}", pass), errno);
        }

        logger_->debug("Overwriter", std::format("Pass {}/{} ({}) committed", pass, total_passes,
                                                 schedule[static_cast<size_t>(i)].describe()));
    }

    verify_prefix(fd->get(), original_size);

    if (auto closed = fd->close(); !closed) {
        return std::unexpected(closed.error());
    }

    logger_->info("Overwriter",
                  std::format("Secure overwrite completed - {} passes", total_passes));
    return {};
}

auto Overwriter::write_pass(int fd, const PassPattern& pattern, int pass, int total_passes,
                            uint64_t size, std::vector<uint8_t>& buffer,
                            const ProgressCallback& progress, const util::CancellationToken& cancel)
    -> util::Result<void> {
    if (::lseek(fd, 0, SEEK_SET) == -1) {
        return errno_error("lseek failed", errno);
    }

    uint64_t written = 0;
    uint64_t last_report = 0;

    while (written < size) {
        if (cancel.is_cancelled()) {
            return cancelled();
        }

        const auto to_write = static_cast<size_t>(std::min<uint64_t>(buffer.size(), size - written));
        std::span<uint8_t> chunk(buffer.data(), to_write);
        pattern.fill(chunk, written);

        const ssize_t result = util::write_with_retry(fd, chunk.data(), chunk.size());
        if (result < 0) {
            return errno_error(std::format("Write failed in pass {}", pass), errno);
        }
        if (static_cast<size_t>(result) != to_write) {
            return std::unexpected(util::Error{
                util::ErrorKind::IoError,
                std::format("Write incomplete in pass {}: {} of {} bytes", pass, result, to_write)});
        }

        written += to_write;

        const bool pass_done = written == size;
        if (progress && (written - last_report >= PROGRESS_INTERVAL || pass_done)) {
            last_report = written;
            const double percent =
                static_cast<double>(written) / static_cast<double>(size) * 100.0;
            ShredProgress event{
                .current_step = pass,
                .total_steps = total_passes,
                .status = std::format("PASS {}/{} - {:.1f}%", pass, total_passes, percent),
                .bytes_processed = written,
            };
            if (!progress(event)) {
                return cancelled();
            }
        }
    }

    return {};
}

void Overwriter::verify_prefix(int fd, uint64_t size) {
    const auto limit = static_cast<size_t>(std::min<uint64_t>(VERIFY_PREFIX_BYTES, size));
    if (limit == 0) {
        return;
    }

    auto prefix = verification::read_prefix(fd, limit);
    if (!prefix) {
        logger_->warning("Overwriter",
                         std::format("Final verification skipped: {}", prefix.error().message));
        return;
    }

    if (!verification::looks_random(*prefix)) {
        logger_->warning("Overwriter", "Final verification: prefix does not look random");
    } else {
        logger_->debug("Overwriter",
                       std::format("Final verification passed on {} bytes", prefix->size()));
    }
}
