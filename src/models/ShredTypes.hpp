/**
 * @file ShredTypes.hpp
 * @brief Data types for shredding operations
 */

#pragma once

#include "util/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * @enum TargetKind
 * @brief What a shred operation expects to find at its target path
 */
enum class TargetKind {
    File,
    Directory
};

/**
 * @struct ShredTarget
 * @brief A validated target: absolute path, kind, and size for files
 */
struct ShredTarget {
    std::filesystem::path path;
    TargetKind kind = TargetKind::File;
    uint64_t size = 0;  ///< Bytes; always 0 for directories
};

/**
 * @struct ShredProgress
 * @brief Progress event delivered synchronously from the worker
 *
 * For single files current_step is the pass index (0 before the first
 * pass); in directory mode it is the 1-based file index.
 */
struct ShredProgress {
    int current_step = 0;
    int total_steps = 0;
    std::string status;
    uint64_t bytes_processed = 0;

    auto operator==(const ShredProgress&) const -> bool = default;
};

/**
 * @brief Callback type for progress reporting
 *
 * Return true to continue, false to request cancellation. Runs on the worker
 * thread and must not block.
 */
using ProgressCallback = std::function<bool(const ShredProgress&)>;

/**
 * @struct ShredOptions
 * @brief Per-invocation choices made by the caller
 */
struct ShredOptions {
    bool keep_file = false;  ///< Preserve the wiped file instead of unlinking it
    std::optional<std::filesystem::path> preserve_directory;  ///< Keep mode only
};

/**
 * @struct ObfuscationRecord
 * @brief Rename chain and timestamps applied to one target, for diagnosis
 */
struct ObfuscationRecord {
    std::filesystem::path original_path;
    std::vector<std::filesystem::path> renames;  ///< Every successful intermediate path
    std::vector<int64_t> applied_timestamps;     ///< Unix seconds written to the file

    [[nodiscard]] auto current_path() const -> const std::filesystem::path& {
        return renames.empty() ? original_path : renames.back();
    }
};

/**
 * @struct OperationResult
 * @brief Terminal value returned to the caller of an entry point
 */
struct OperationResult {
    bool success = false;
    std::string message;
    std::optional<util::ErrorKind> kind;  ///< Empty on success

    [[nodiscard]] static auto ok(std::string msg) -> OperationResult {
        return {.success = true, .message = std::move(msg), .kind = std::nullopt};
    }

    [[nodiscard]] static auto failure(const util::Error& err) -> OperationResult {
        return {.success = false, .message = err.message, .kind = err.kind};
    }

    [[nodiscard]] auto is_cancelled() const -> bool {
        return kind == util::ErrorKind::Cancelled;
    }
};

/**
 * @brief Called once on the worker thread when an asynchronous operation ends
 */
using CompletionCallback = std::function<void(const OperationResult&)>;

/**
 * @struct MethodInfo
 * @brief Description of one overwrite method for display and selection
 */
struct MethodInfo {
    std::string name;
    int passes = 0;
    std::string security;

    auto operator==(const MethodInfo&) const -> bool = default;
};
