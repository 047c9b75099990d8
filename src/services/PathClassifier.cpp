#include "services/PathClassifier.hpp"

#ifndef _WIN32
#include <mntent.h>
#include <pwd.h>
#include <unistd.h>
#endif

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <format>
#include <memory>
#include <string_view>

namespace rng = std::ranges;

namespace {

// Entries ending in a separator deny the whole tree and the root itself;
// entries without one deny anything starting with that text.
constexpr std::array POSIX_DENYLIST{
    std::string_view{"/bin/"},         std::string_view{"/sbin/"},
    std::string_view{"/etc/"},         std::string_view{"/usr/"},
    std::string_view{"/var/"},         std::string_view{"/sys/"},
    std::string_view{"/proc/"},        std::string_view{"/dev/"},
    std::string_view{"/lib/"},         std::string_view{"/lib32/"},
    std::string_view{"/lib64/"},       std::string_view{"/libx32/"},
    std::string_view{"/boot/"},        std::string_view{"/root/"},
    std::string_view{"/opt/"},         std::string_view{"/mnt/"},
    std::string_view{"/media/"},       std::string_view{"/lost+found/"},
    std::string_view{"/run/"},         std::string_view{"/snap/"},
    std::string_view{"/initrd"},       std::string_view{"/vmlinuz"},
    std::string_view{"/system/"},      std::string_view{"/library/"},
    std::string_view{"/applications/"},
};

constexpr std::array WINDOWS_DENYLIST{
    std::string_view{"c:\\windows\\"},
    std::string_view{"c:\\windows.old\\"},
    std::string_view{"c:\\program files\\"},
    std::string_view{"c:\\program files (x86)\\"},
    std::string_view{"c:\\programdata\\"},
    std::string_view{"c:\\system32\\"},
    std::string_view{"c:\\$windows.~bt\\"},
    std::string_view{"c:\\$windows.~ws\\"},
    std::string_view{"c:\\$recycle.bin\\"},
    std::string_view{"c:\\boot\\"},
    std::string_view{"c:\\recovery\\"},
    std::string_view{"c:\\system volume information\\"},
    std::string_view{"c:\\config.msi\\"},
    std::string_view{"c:\\pagefile.sys"},
    std::string_view{"c:\\hiberfil.sys"},
    std::string_view{"c:\\swapfile.sys"},
};

constexpr std::array ADMIN_EXTENSIONS{
    std::string_view{".sys"},
    std::string_view{".drv"},
    std::string_view{".efi"},
    std::string_view{".ko"},
};

auto separator(PathStyle style) -> char {
    return style == PathStyle::Windows ? '\\' : '/';
}

auto to_lower(std::string text) -> std::string {
    rng::transform(text, text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

auto strip_trailing_separator(std::string key, char sep, size_t root_length) -> std::string {
    while (key.size() > root_length && key.back() == sep) {
        key.pop_back();
    }
    return key;
}

auto normalize_windows(std::string raw) -> std::optional<std::string> {
    rng::replace(raw, '/', '\\');

    // Device namespaces and UNC shares are never valid targets
    if (raw.starts_with("\\\\")) {
        return std::nullopt;
    }

    raw = to_lower(std::move(raw));
    const bool has_drive = raw.size() >= 3 && std::isalpha(static_cast<unsigned char>(raw[0])) &&
                           raw[1] == ':' && raw[2] == '\\';
    if (!has_drive) {
        return std::nullopt;
    }

    // Fold "." and ".." lexically using the generic form
    std::string generic = raw;
    rng::replace(generic, '\\', '/');
    std::string folded = std::filesystem::path(generic).lexically_normal().generic_string();
    rng::replace(folded, '/', '\\');

    // lexically_normal must not climb above the drive
    if (folded.size() < 3 || folded.compare(0, 3, raw, 0, 3) != 0) {
        return std::nullopt;
    }

    return strip_trailing_separator(std::move(folded), '\\', 3);
}

}  // namespace

PathClassifier::PathClassifier() : PathClassifier(Options{}) {}

PathClassifier::PathClassifier(Options options) : options_(std::move(options)) {
    const char sep = separator(options_.style);

    if (options_.style == PathStyle::Windows) {
        denied_prefixes_.assign(WINDOWS_DENYLIST.begin(), WINDOWS_DENYLIST.end());
    } else {
        denied_prefixes_.assign(POSIX_DENYLIST.begin(), POSIX_DENYLIST.end());
    }

    for (const auto& extra : options_.extra_denied_prefixes) {
        auto key = normalize(extra).value_or(to_lower(extra));
        if (key.empty()) {
            continue;
        }
        if (!key.empty() && key.back() != sep) {
            key.push_back(sep);
        }
        extra_prefixes_.push_back(std::move(key));
    }

    if (options_.style == PathStyle::Posix && options_.check_mount_points) {
        for (const auto& mount_dir : read_mount_points()) {
            mount_points_.insert(strip_trailing_separator(to_lower(mount_dir), '/', 1));
        }
    }

    if (!options_.home_directory) {
        options_.home_directory = detect_home_directory();
    }
    if (options_.home_directory) {
        auto key = normalize(*options_.home_directory);
        // A home directory at a volume root would whitelist the whole system
        if (key && !is_volume_root(*key)) {
            home_key_ = std::move(*key);
        }
    }
}

auto PathClassifier::detect_home_directory() -> std::optional<std::filesystem::path> {
#ifdef _WIN32
    if (const char* profile = std::getenv("USERPROFILE"); profile != nullptr && profile[0] != '\0') {
        return std::filesystem::path(profile);
    }
    return std::nullopt;
#else
    if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0') {
        return std::filesystem::path(home);
    }

    long buffer_size = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (buffer_size <= 0) {
        buffer_size = 16'384;
    }
    std::string buffer(static_cast<size_t>(buffer_size), '\0');

    struct passwd pwd{};
    struct passwd* result = nullptr;
    if (::getpwuid_r(::getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 &&
        result != nullptr && result->pw_dir != nullptr) {
        return std::filesystem::path(result->pw_dir);
    }

    return std::nullopt;
#endif
}

auto PathClassifier::read_mount_points() -> std::set<std::string> {
    std::set<std::string> mounts;

#ifndef _WIN32
    auto mtab_deleter = [](FILE* f) {
        if (f)
            ::endmntent(f);
    };
    std::unique_ptr<FILE, decltype(mtab_deleter)> mtab{::setmntent("/proc/mounts", "r"),
                                                       mtab_deleter};
    if (!mtab) {
        return mounts;
    }

    while (auto* entry = ::getmntent(mtab.get())) {
        mounts.emplace(entry->mnt_dir);
    }
#endif

    return mounts;
}

auto PathClassifier::normalize(const std::filesystem::path& path) const
    -> std::optional<std::string> {
    if (path.empty()) {
        return std::nullopt;
    }

    if (options_.style == PathStyle::Windows) {
#ifdef _WIN32
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec) {
            return std::nullopt;
        }
        auto resolved = std::filesystem::weakly_canonical(absolute, ec);
        if (ec) {
            return std::nullopt;
        }
        return normalize_windows(resolved.string());
#else
        return normalize_windows(path.string());
#endif
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return std::nullopt;
    }
    auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return std::nullopt;
    }

    auto key = to_lower(resolved.lexically_normal().string());
    return strip_trailing_separator(std::move(key), '/', 1);
}

auto PathClassifier::is_volume_root(const std::string& key) const -> bool {
    if (options_.style == PathStyle::Windows) {
        return key.size() == 3 && key[1] == ':' && key[2] == '\\';
    }
    return key == "/";
}

auto PathClassifier::is_denylisted_root(const std::string& key) const -> bool {
    const char sep = separator(options_.style);
    return rng::any_of(denied_prefixes_, [&](const std::string& prefix) {
        if (!prefix.empty() && prefix.back() == sep) {
            return std::string_view{prefix}.substr(0, prefix.size() - 1) == key;
        }
        return prefix == key;
    });
}

auto PathClassifier::is_under_denylisted_tree(const std::string& key) const -> bool {
    return rng::any_of(denied_prefixes_,
                       [&](const std::string& prefix) { return key.starts_with(prefix); });
}

auto PathClassifier::is_under_extra_prefix(const std::string& key) const -> bool {
    return rng::any_of(extra_prefixes_, [&](const std::string& prefix) {
        return key.starts_with(prefix) || std::string_view{prefix}.substr(0, prefix.size() - 1) == key;
    });
}

auto PathClassifier::is_under_home(const std::string& key) const -> bool {
    if (home_key_.empty() || key.size() <= home_key_.size() || !key.starts_with(home_key_)) {
        return false;
    }
    return key[home_key_.size()] == separator(options_.style);
}

auto PathClassifier::has_admin_extension(const std::string& key) -> bool {
    const auto slash = key.find_last_of("/\\");
    const auto dot = key.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return false;
    }
    const std::string_view extension{key.data() + dot, key.size() - dot};
    return rng::find(ADMIN_EXTENSIONS, extension) != ADMIN_EXTENSIONS.end();
}

auto PathClassifier::is_sensitive(const std::filesystem::path& path) const -> bool {
    const auto key = normalize(path);
    if (!key) {
        return true;
    }

    if (is_volume_root(*key) || is_denylisted_root(*key) || mount_points_.contains(*key)) {
        return true;
    }

    if (!home_key_.empty() && *key == home_key_) {
        return true;
    }

    // Caller-supplied prefixes hold inside the home directory too
    if (is_under_extra_prefix(*key)) {
        return true;
    }

    if (is_under_home(*key)) {
        return false;
    }

    return has_admin_extension(*key) || is_under_denylisted_tree(*key);
}

auto PathClassifier::validate(const std::filesystem::path& path, TargetKind kind) const
    -> util::Result<ShredTarget> {
    using util::ErrorKind;

    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return std::unexpected(util::Error{ErrorKind::NotFound,
                                           std::format("Target does not exist: {}", path.string())});
    }
    if (ec) {
        return std::unexpected(util::Error{
            util::kind_from_errno(ec.value()),
            std::format("Cannot inspect {}: {}", path.string(), ec.message()), ec.value()});
    }

    if (std::filesystem::is_symlink(status)) {
        return std::unexpected(util::Error{
            ErrorKind::SymlinkUnsupported,
            std::format("Symbolic links not supported: {}", path.string())});
    }

    if (is_sensitive(path)) {
        return std::unexpected(util::Error{
            ErrorKind::SystemPathRefused,
            std::format("Refusing to shred system path: {}", path.string())});
    }

    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return std::unexpected(util::Error{
            ErrorKind::IoError, std::format("Cannot resolve {}: {}", path.string(), ec.message()),
            ec.value()});
    }

    ShredTarget target{.path = absolute.lexically_normal(), .kind = kind, .size = 0};

    if (kind == TargetKind::Directory) {
        if (!std::filesystem::is_directory(status)) {
            return std::unexpected(util::Error{
                ErrorKind::NotADirectory,
                std::format("Target is not a directory: {}", path.string())});
        }
        return target;
    }

    if (!std::filesystem::is_regular_file(status)) {
        return std::unexpected(util::Error{
            ErrorKind::NotAFile, std::format("Target is not a regular file: {}", path.string())});
    }

    target.size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(util::Error{
            util::kind_from_errno(ec.value()),
            std::format("Cannot read size of {}: {}", path.string(), ec.message()), ec.value()});
    }

    return target;
}
