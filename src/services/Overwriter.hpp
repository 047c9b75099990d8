/**
 * @file Overwriter.hpp
 * @brief In-place multi-pass overwrite of a single file
 */

#pragma once

#include "algorithms/PassPattern.hpp"
#include "models/ShredTypes.hpp"
#include "util/CancellationToken.hpp"
#include "util/Error.hpp"
#include "util/Logger.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

/**
 * @class Overwriter
 * @brief Writes every pass of a schedule over the full original length
 *
 * The file size is captured once before the first pass. Each pass starts at
 * offset 0, is written in chunks and is fsync'ed before the next begins, so
 * an interrupted run leaves passes 1..k committed and nothing torn.
 */
class Overwriter {
public:
    static constexpr uint64_t PROGRESS_INTERVAL = 10ULL * 1024 * 1024;
    static constexpr size_t VERIFY_PREFIX_BYTES = 4096;
    static constexpr size_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

    explicit Overwriter(std::shared_ptr<util::ILogger> logger = nullptr);

    /**
     * @brief Overwrite path with every pattern of schedule in order
     * @param path Regular file to overwrite (not followed if a symlink)
     * @param schedule Patterns, one per pass
     * @param progress Optional sink; returning false cancels
     * @param cancel Token polled before every pass and every chunk
     * @return Success, Cancelled, or an IoError / PermissionDenied
     */
    [[nodiscard]] auto overwrite(const std::filesystem::path& path, const PatternSchedule& schedule,
                                 const ProgressCallback& progress,
                                 const util::CancellationToken& cancel) -> util::Result<void>;

    /**
     * @brief Chunk buffer size for a file of the given size
     *
     * 128 KiB up to 10 MiB, 1 MiB up to 100 MiB, 4 MiB up to 1 GiB,
     * MAX_CHUNK_SIZE above that.
     */
    [[nodiscard]] static constexpr auto chunk_size_for(uint64_t file_size) -> size_t {
        constexpr uint64_t MiB = 1024 * 1024;
        if (file_size > 1024 * MiB) {
            return MAX_CHUNK_SIZE;
        }
        if (file_size > 100 * MiB) {
            return 4 * MiB;
        }
        if (file_size > 10 * MiB) {
            return 1 * MiB;
        }
        return 128 * 1024;
    }

private:
    [[nodiscard]] auto write_pass(int fd, const PassPattern& pattern, int pass, int total_passes,
                                  uint64_t size, std::vector<uint8_t>& buffer,
                                  const ProgressCallback& progress,
                                  const util::CancellationToken& cancel) -> util::Result<void>;

    void verify_prefix(int fd, uint64_t size);

    std::shared_ptr<util::ILogger> logger_;
};
