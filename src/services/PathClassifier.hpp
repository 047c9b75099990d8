/**
 * @file PathClassifier.hpp
 * @brief Denylist-based classifier for system and critical paths
 */

#pragma once

#include "services/IPathClassifier.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * @enum PathStyle
 * @brief Which filesystem conventions and denylist table to apply
 */
enum class PathStyle {
    Posix,
    Windows
};

/**
 * @class PathClassifier
 * @brief The single authoritative safety classifier
 *
 * Matching is done on the resolved absolute path, lower-cased and with
 * separators normalized. A path is sensitive when it:
 * - cannot be resolved
 * - is a filesystem or volume root, or a mount point
 * - equals a denylisted root or the home directory itself
 * - falls under one of the caller's extra denied prefixes
 * - lies outside the home directory and either carries an
 *   administrative extension or falls under a denylisted tree
 *
 * Paths strictly inside the home directory are allowed.
 */
class PathClassifier : public IPathClassifier {
public:
    struct Options {
        PathStyle style = default_style();
        std::optional<std::filesystem::path> home_directory;  ///< Detected when empty
        std::vector<std::string> extra_denied_prefixes;
        bool check_mount_points = true;  ///< Consult /proc/mounts (POSIX style)
    };

    PathClassifier();
    explicit PathClassifier(Options options);

    [[nodiscard]] auto is_sensitive(const std::filesystem::path& path) const -> bool override;

    [[nodiscard]] auto validate(const std::filesystem::path& path, TargetKind kind) const
        -> util::Result<ShredTarget> override;

    [[nodiscard]] auto style() const -> PathStyle { return options_.style; }

    /**
     * @brief Normalized form of the home directory used for the carve-out
     * @return Empty if no usable home directory was found
     */
    [[nodiscard]] auto home_key() const -> const std::string& { return home_key_; }

    [[nodiscard]] static constexpr auto default_style() -> PathStyle {
#ifdef _WIN32
        return PathStyle::Windows;
#else
        return PathStyle::Posix;
#endif
    }

    /**
     * @brief Detect the caller's home directory ($HOME, then the passwd entry)
     */
    [[nodiscard]] static auto detect_home_directory() -> std::optional<std::filesystem::path>;

    /**
     * @brief Mount directories currently listed in /proc/mounts
     */
    [[nodiscard]] static auto read_mount_points() -> std::set<std::string>;

private:
    /**
     * @brief Resolve and normalize a path into its matching key
     * @return Lower-cased absolute path with style separators, no trailing
     *         separator except for roots; nullopt if resolution fails
     */
    [[nodiscard]] auto normalize(const std::filesystem::path& path) const
        -> std::optional<std::string>;

    [[nodiscard]] auto is_volume_root(const std::string& key) const -> bool;
    [[nodiscard]] auto is_denylisted_root(const std::string& key) const -> bool;
    [[nodiscard]] auto is_under_denylisted_tree(const std::string& key) const -> bool;
    [[nodiscard]] auto is_under_extra_prefix(const std::string& key) const -> bool;
    [[nodiscard]] auto is_under_home(const std::string& key) const -> bool;
    [[nodiscard]] static auto has_admin_extension(const std::string& key) -> bool;

    Options options_;
    std::vector<std::string> denied_prefixes_;
    std::vector<std::string> extra_prefixes_;
    std::set<std::string> mount_points_;
    std::string home_key_;
};
