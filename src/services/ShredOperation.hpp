/**
 * @file ShredOperation.hpp
 * @brief Single-file shred: validate, rename, overwrite, obfuscate, dispose
 */

#pragma once

#include "algorithms/IShredMethod.hpp"
#include "models/ShredTypes.hpp"
#include "services/IPathClassifier.hpp"
#include "services/ITimestampObfuscator.hpp"
#include "util/CancellationToken.hpp"
#include "util/Logger.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

/**
 * @enum ShredState
 * @brief Position of a ShredOperation in its fixed sequence
 */
enum class ShredState {
    Idle,
    Validating,
    Renaming,
    Overwriting,
    ObfuscatingTimestamps,
    Disposing,
    Destroyed,    ///< Terminal: file unlinked
    Preserved,    ///< Terminal: wiped file kept under an obfuscated name
    Interrupted,  ///< Terminal: cancellation observed
    Failed        ///< Terminal: any other error
};

[[nodiscard]] constexpr auto to_string(ShredState state) -> std::string_view {
    switch (state) {
        case ShredState::Idle:
            return "Idle";
        case ShredState::Validating:
            return "Validating";
        case ShredState::Renaming:
            return "Renaming";
        case ShredState::Overwriting:
            return "Overwriting";
        case ShredState::ObfuscatingTimestamps:
            return "ObfuscatingTimestamps";
        case ShredState::Disposing:
            return "Disposing";
        case ShredState::Destroyed:
            return "Destroyed";
        case ShredState::Preserved:
            return "Preserved";
        case ShredState::Interrupted:
            return "Interrupted";
        case ShredState::Failed:
            return "Failed";
    }
    return "Unknown";
}

/**
 * @class ShredOperation
 * @brief Runs the shred sequence on one regular file
 *
 * Steps never reorder or skip: the file is renamed before any byte is
 * overwritten, timestamps are scrambled even when the file is about to be
 * unlinked, and a failure after renaming leaves the file at its obfuscated
 * name. Cancellation during the overwrite deletes the partially wiped file
 * unless keep mode was requested.
 */
class ShredOperation {
public:
    /// Reports whether a path is still present after unlink
    using ExistenceCheck = std::function<bool(const std::filesystem::path&)>;

    ShredOperation(std::shared_ptr<IPathClassifier> classifier,
                   std::shared_ptr<ITimestampObfuscator> timestamps,
                   std::shared_ptr<IShredMethod> method,
                   std::shared_ptr<util::ILogger> logger = nullptr);

    /**
     * @brief Shred one file
     * @param path Target file
     * @param options Keep mode and optional preserve directory
     * @param progress Optional sink; returning false cancels
     * @param cancel Token shared with the caller
     * @return Terminal result; never throws
     */
    auto run(const std::filesystem::path& path, const ShredOptions& options,
             const ProgressCallback& progress, const util::CancellationToken& cancel)
        -> OperationResult;

    [[nodiscard]] auto state() const -> ShredState { return state_; }

    [[nodiscard]] auto record() const -> const ObfuscationRecord& { return record_; }

    /**
     * @brief Where the wiped file now lives (keep mode only)
     */
    [[nodiscard]] auto preserved_path() const -> std::optional<std::filesystem::path> {
        if (state_ != ShredState::Preserved) {
            return std::nullopt;
        }
        return record_.current_path();
    }

    [[nodiscard]] auto operation_id() const -> const std::string& { return operation_id_; }

    /**
     * @brief Replace the post-unlink existence check (lstat by default)
     */
    void set_existence_check(ExistenceCheck check);

private:
    auto execute(const std::filesystem::path& path, const ShredOptions& options,
                 const ProgressCallback& progress, const util::CancellationToken& cancel,
                 const std::shared_ptr<util::ILogger>& log) -> util::Result<std::string>;

    void transition(ShredState next, util::ILogger& log);

    void discard_interrupted(const ShredOptions& options, util::ILogger& log);

    std::shared_ptr<IPathClassifier> classifier_;
    std::shared_ptr<ITimestampObfuscator> timestamps_;
    std::shared_ptr<IShredMethod> method_;
    std::shared_ptr<util::ILogger> logger_;
    ExistenceCheck still_exists_;

    ShredState state_ = ShredState::Idle;
    ObfuscationRecord record_;
    std::string operation_id_;
};
