/**
 * @file IShredService.hpp
 * @brief Interface for secure file and directory shredding
 *
 * The synchronous entry points run on the caller's thread. start() runs one
 * operation at a time on a worker thread owned by the service.
 */

#pragma once

#include "models/ShredTypes.hpp"
#include "util/CancellationToken.hpp"

#include <filesystem>
#include <map>
#include <string>

/**
 * @class IShredService
 * @brief Abstract interface for shredding operations
 */
class IShredService {
public:
    virtual ~IShredService() = default;

    /**
     * @brief Shred one regular file
     * @param path File to shred
     * @param options keep_file preserves the wiped file under a random name
     * @param progress Optional sink; returning false cancels
     * @param cancel Token the caller may set at any time
     */
    virtual auto shred_file(const std::filesystem::path& path, const ShredOptions& options,
                            const ProgressCallback& progress,
                            const util::CancellationToken& cancel) -> OperationResult = 0;

    /**
     * @brief Shred every eligible file under a directory
     */
    virtual auto shred_directory(const std::filesystem::path& path, const ShredOptions& options,
                                 const ProgressCallback& progress,
                                 const util::CancellationToken& cancel) -> OperationResult = 0;

    /**
     * @brief Pre-flight safety check; never modifies anything
     * @return success is the is-safe verdict, message explains it
     */
    [[nodiscard]] virtual auto validate_shredding_path(const std::filesystem::path& path)
        -> OperationResult = 0;

    /**
     * @brief Overwrite methods keyed by method id
     */
    [[nodiscard]] virtual auto get_available_methods() const
        -> std::map<std::string, MethodInfo> = 0;

    /**
     * @brief Shred a file or directory on the worker thread
     * @return false if another operation is still running
     */
    virtual auto start(const std::filesystem::path& path, const ShredOptions& options,
                       ProgressCallback progress, CompletionCallback completion) -> bool = 0;

    virtual auto cancel_current_operation() -> bool = 0;

    [[nodiscard]] virtual auto is_busy() const -> bool = 0;
};
