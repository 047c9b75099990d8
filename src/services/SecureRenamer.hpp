/**
 * @file SecureRenamer.hpp
 * @brief Rename chain that hides a file's original name
 */

#pragma once

#include "models/ShredTypes.hpp"
#include "util/Error.hpp"
#include "util/Logger.hpp"

#include <filesystem>
#include <memory>
#include <string>

/**
 * @class SecureRenamer
 * @brief Replaces a file name with random tokens before any byte is touched
 *
 * Each rename draws a fresh name of the form <prefix><64 hex chars>.tmp in
 * the file's own directory. Only the first rename of the chain must succeed;
 * later failures end the chain at the last good name.
 */
class SecureRenamer {
public:
    static constexpr int RENAME_ITERATIONS = 10;
    static constexpr size_t TOKEN_BYTES = 32;
    static constexpr size_t PRESERVED_TOKEN_BYTES = 16;
    static constexpr const char* NAME_PREFIX = "shred_";
    static constexpr const char* PRESERVED_PREFIX = "PRESERVED_";
    static constexpr const char* NAME_EXTENSION = ".tmp";

    explicit SecureRenamer(std::shared_ptr<util::ILogger> logger = nullptr);

    /**
     * @brief Run the rename chain on path
     * @param path Current file location
     * @param record Receives every intermediate path
     * @return Final obfuscated path, or RenameFailed if the first rename
     *         could not be made after one retry
     */
    [[nodiscard]] auto secure_rename(const std::filesystem::path& path, ObfuscationRecord& record)
        -> util::Result<std::filesystem::path>;

    /**
     * @brief Move a wiped file into another directory under a fresh name
     * @param path Current (already obfuscated) file location
     * @param directory Destination, created if missing
     * @param record Receives the destination path
     * @return Destination path, or RenameFailed
     *
     * Moves across filesystems fall back to copy and unlink of the source.
     */
    [[nodiscard]] auto relocate(const std::filesystem::path& path,
                                const std::filesystem::path& directory, ObfuscationRecord& record)
        -> util::Result<std::filesystem::path>;

    /**
     * @brief Generate one random file name (no directory part)
     */
    [[nodiscard]] static auto random_name(const std::string& prefix, size_t token_bytes)
        -> std::string;

private:
    [[nodiscard]] static auto try_rename(const std::filesystem::path& from,
                                         const std::filesystem::path& to) -> std::error_code;

    std::shared_ptr<util::ILogger> logger_;
};
