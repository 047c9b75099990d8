/**
 * @file IPathClassifier.hpp
 * @brief Interface for deciding whether a path may be shredded
 */

#pragma once

#include "models/ShredTypes.hpp"
#include "util/Error.hpp"

#include <filesystem>

/**
 * @class IPathClassifier
 * @brief Abstract safety gate consulted before any destructive step
 *
 * Implementations must fail closed: any doubt about a path classifies it
 * as sensitive.
 */
class IPathClassifier {
public:
    virtual ~IPathClassifier() = default;

    /**
     * @brief Check whether a path is a protected system location
     * @param path Path to check (relative paths resolve against the cwd)
     * @return true to refuse the path
     */
    [[nodiscard]] virtual auto is_sensitive(const std::filesystem::path& path) const -> bool = 0;

    /**
     * @brief Full pre-flight validation of a shred target
     * @param path Target path
     * @param kind Kind the caller is about to operate on
     * @return The validated target, or NotFound / SymlinkUnsupported /
     *         SystemPathRefused / NotAFile / NotADirectory
     */
    [[nodiscard]] virtual auto validate(const std::filesystem::path& path, TargetKind kind) const
        -> util::Result<ShredTarget> = 0;
};
