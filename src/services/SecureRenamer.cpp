#include "services/SecureRenamer.hpp"

#include "util/SecureRandom.hpp"

#include <format>
#include <system_error>

namespace fs = std::filesystem;

SecureRenamer::SecureRenamer(std::shared_ptr<util::ILogger> logger)
    : logger_(logger ? std::move(logger) : util::NullLogger::shared()) {}

auto SecureRenamer::random_name(const std::string& prefix, size_t token_bytes) -> std::string {
    return prefix + util::SecureRandom::hex_token(token_bytes) + NAME_EXTENSION;
}

auto SecureRenamer::try_rename(const fs::path& from, const fs::path& to) -> std::error_code {
    std::error_code ec;
    fs::rename(from, to, ec);
    return ec;
}

auto SecureRenamer::secure_rename(const fs::path& path, ObfuscationRecord& record)
    -> util::Result<fs::path> {
    if (record.original_path.empty()) {
        record.original_path = path;
    }

    fs::path current = path;

    for (int i = 0; i < RENAME_ITERATIONS; ++i) {
        auto next = current.parent_path() / random_name(NAME_PREFIX, TOKEN_BYTES);
        auto ec = try_rename(current, next);

        if (ec) {
            // One retry with a fresh name
            next = current.parent_path() / random_name(NAME_PREFIX, TOKEN_BYTES);
            ec = try_rename(current, next);
        }

        if (ec) {
            if (i == 0) {
                return std::unexpected(util::Error{
                    util::ErrorKind::RenameFailed,
                    std::format("Failed to rename {}: {}", path.filename().string(), ec.message()),
                    ec.value()});
            }
            logger_->warning("SecureRenamer",
                             std::format("Rename iteration {} failed, keeping {}: {}", i + 1,
                                         current.filename().string(), ec.message()));
            break;
        }

        logger_->debug("SecureRenamer", std::format("Renamed to {}", next.filename().string()));
        record.renames.push_back(next);
        current = std::move(next);
    }

    logger_->info("SecureRenamer", std::format("Original: {} -> Final: {}",
                                               path.filename().string(),
                                               current.filename().string()));
    return current;
}

auto SecureRenamer::relocate(const fs::path& path, const fs::path& directory,
                             ObfuscationRecord& record) -> util::Result<fs::path> {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return std::unexpected(util::Error{
            util::ErrorKind::RenameFailed,
            std::format("Cannot create preserve directory {}: {}", directory.string(), ec.message()),
            ec.value()});
    }

    const auto destination = directory / random_name(PRESERVED_PREFIX, PRESERVED_TOKEN_BYTES);

    ec = try_rename(path, destination);
    if (ec == std::errc::cross_device_link) {
        logger_->debug("SecureRenamer", "Preserve directory is on another filesystem, copying");

        std::error_code copy_ec;
        fs::copy_file(path, destination, fs::copy_options::none, copy_ec);
        if (copy_ec) {
            fs::remove(destination, ec);
            return std::unexpected(util::Error{
                util::ErrorKind::RenameFailed,
                std::format("Cannot copy to {}: {}", destination.string(), copy_ec.message()),
                copy_ec.value()});
        }
        fs::remove(path, ec);
        if (ec) {
            // The copy is complete, only the wiped source lingers
            logger_->warning("SecureRenamer", std::format("Cannot remove {} after copy: {}",
                                                          path.filename().string(), ec.message()));
        }
    } else if (ec) {
        return std::unexpected(util::Error{
            util::ErrorKind::RenameFailed,
            std::format("Cannot move to {}: {}", destination.string(), ec.message()), ec.value()});
    }

    record.renames.push_back(destination);
    logger_->info("SecureRenamer", std::format("Relocated to {}", destination.string()));
    return destination;
}
