/**
 * @file DirectoryShredOperation.hpp
 * @brief Recursive shred of every eligible file under a directory
 */

#pragma once

#include "algorithms/IShredMethod.hpp"
#include "models/ShredTypes.hpp"
#include "services/IPathClassifier.hpp"
#include "services/ITimestampObfuscator.hpp"
#include "util/CancellationToken.hpp"
#include "util/Logger.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

/**
 * @class DirectoryShredOperation
 * @brief Shreds the regular files of a tree one by one, then removes it
 *
 * Symlinks and descendants the classifier refuses are skipped without
 * failing the run. A failing file is logged and the walk continues;
 * cancellation stops the run at once. The emptied tree is removed only when
 * files are not kept and every file was shredded. Trees holding skipped
 * protected entries are left in place.
 */
class DirectoryShredOperation {
public:
    struct Candidate {
        std::filesystem::path path;
        uint64_t size = 0;
    };

    DirectoryShredOperation(std::shared_ptr<IPathClassifier> classifier,
                            std::shared_ptr<ITimestampObfuscator> timestamps,
                            std::shared_ptr<IShredMethod> method,
                            std::shared_ptr<util::ILogger> logger = nullptr);

    /**
     * @brief Shred a directory tree
     * @param directory Target directory
     * @param options Keep mode applies to every file
     * @param progress Optional sink receiving file-index progress
     * @param cancel Token shared with the caller
     * @return Result naming the number of eligible files
     */
    auto run(const std::filesystem::path& directory, const ShredOptions& options,
             const ProgressCallback& progress, const util::CancellationToken& cancel)
        -> OperationResult;

    /**
     * @brief Files found by the last run, in processing order
     */
    [[nodiscard]] auto candidates() const -> const std::vector<Candidate>& { return candidates_; }

    [[nodiscard]] auto failed_files() const -> const std::vector<std::filesystem::path>& {
        return failed_;
    }

    /**
     * @brief Regular files the classifier refused during the last walk
     */
    [[nodiscard]] auto skipped_count() const -> size_t { return skipped_; }

private:
    [[nodiscard]] auto collect(const std::filesystem::path& directory,
                               const util::CancellationToken& cancel, util::ILogger& log)
        -> util::Result<std::vector<Candidate>>;

    std::shared_ptr<IPathClassifier> classifier_;
    std::shared_ptr<ITimestampObfuscator> timestamps_;
    std::shared_ptr<IShredMethod> method_;
    std::shared_ptr<util::ILogger> logger_;

    std::vector<Candidate> candidates_;
    std::vector<std::filesystem::path> failed_;
    size_t skipped_ = 0;
};
