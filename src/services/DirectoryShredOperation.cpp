#include "services/DirectoryShredOperation.hpp"

#include "services/ShredOperation.hpp"
#include "util/SecureRandom.hpp"

#include <exception>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr const char* COMPONENT = "DirectoryShred";
constexpr size_t OPERATION_ID_BYTES = 8;

auto cancelled(std::string message = "Operation cancelled by user") -> util::Error {
    return util::Error{util::ErrorKind::Cancelled, std::move(message)};
}

}  // namespace

DirectoryShredOperation::DirectoryShredOperation(std::shared_ptr<IPathClassifier> classifier,
                                                 std::shared_ptr<ITimestampObfuscator> timestamps,
                                                 std::shared_ptr<IShredMethod> method,
                                                 std::shared_ptr<util::ILogger> logger)
    : classifier_(std::move(classifier)),
      timestamps_(std::move(timestamps)),
      method_(std::move(method)),
      logger_(logger ? std::move(logger) : util::NullLogger::shared()) {}

auto DirectoryShredOperation::collect(const fs::path& directory,
                                      const util::CancellationToken& cancel, util::ILogger& log)
    -> util::Result<std::vector<Candidate>> {
    std::vector<Candidate> found;
    std::error_code ec;

    // Directory symlinks are not followed by default
    fs::recursive_directory_iterator it(directory, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (cancel.is_cancelled()) {
            return std::unexpected(cancelled("Operation cancelled during file discovery"));
        }

        std::error_code status_ec;
        const auto status = it->symlink_status(status_ec);
        if (status_ec || !fs::is_regular_file(status)) {
            continue;
        }

        const auto& path = it->path();
        if (classifier_->is_sensitive(path)) {
            log.debug(COMPONENT, std::format("Skipping protected path {}", path.string()));
            ++skipped_;
            continue;
        }

        std::error_code size_ec;
        const auto size = it->file_size(size_ec);
        found.push_back(Candidate{.path = path, .size = size_ec ? 0 : size});
    }

    if (ec) {
        return std::unexpected(util::Error{
            util::kind_from_errno(ec.value()),
            std::format("Cannot walk {}: {}", directory.string(), ec.message()), ec.value()});
    }
    return found;
}

auto DirectoryShredOperation::run(const fs::path& directory, const ShredOptions& options,
                                  const ProgressCallback& progress,
                                  const util::CancellationToken& cancel) -> OperationResult {
    candidates_.clear();
    failed_.clear();
    skipped_ = 0;

    std::shared_ptr<util::ILogger> log = logger_;

    try {
        log = std::make_shared<util::ScopedLogger>(
            logger_, util::SecureRandom::hex_token(OPERATION_ID_BYTES));
        log->info(COMPONENT, std::format("STARTING DIRECTORY SHRED: {}", directory.string()));

        auto target = classifier_->validate(directory, TargetKind::Directory);
        if (!target) {
            log->error(COMPONENT, std::format("FAILED: {}", target.error().message));
            return OperationResult::failure(target.error());
        }

        auto files = collect(target->path, cancel, *log);
        if (!files) {
            if (files.error().kind == util::ErrorKind::Cancelled) {
                log->info(COMPONENT, std::format("INTERRUPTED: {}", files.error().message));
            } else {
                log->error(COMPONENT, std::format("FAILED: {}", files.error().message));
            }
            return OperationResult::failure(files.error());
        }
        candidates_ = std::move(*files);

        if (candidates_.empty()) {
            log->info(COMPONENT, "No files found in directory");
            return OperationResult::failure(
                util::Error{util::ErrorKind::NoFilesFound, "No files found in directory"});
        }

        const auto total = static_cast<int>(candidates_.size());
        uint64_t total_bytes = 0;
        for (const auto& candidate : candidates_) {
            total_bytes += candidate.size;
        }

        if (progress) {
            ShredProgress found{.current_step = 0, .total_steps = total,
                                .status = std::format("Found {} files", total),
                                .bytes_processed = total_bytes};
            if (!progress(found)) {
                log->info(COMPONENT, "INTERRUPTED before the first file");
                return OperationResult::failure(cancelled());
            }
        }

        ShredOperation file_operation(classifier_, timestamps_, method_, log);

        for (int index = 1; index <= total; ++index) {
            const auto& file = candidates_[static_cast<size_t>(index - 1)].path;

            if (cancel.is_cancelled()) {
                log->info(COMPONENT, "INTERRUPTED: Operation cancelled by user");
                return OperationResult::failure(cancelled());
            }

            ProgressCallback per_file = [&](const ShredProgress& inner) -> bool {
                if (cancel.is_cancelled()) {
                    return false;
                }
                if (!progress) {
                    return true;
                }
                const double fraction =
                    inner.total_steps > 0
                        ? static_cast<double>(inner.current_step) / inner.total_steps
                        : 0.0;
                const double percent = (index - 1 + fraction) / total * 100.0;
                ShredProgress outer{
                    .current_step = index,
                    .total_steps = total,
                    .status = std::format("FILE {}/{}: {} ({:.1f}%)", index, total, inner.status,
                                          percent),
                    .bytes_processed = inner.bytes_processed,
                };
                return progress(outer);
            };

            auto result = file_operation.run(file, options, per_file, cancel);
            if (result.is_cancelled()) {
                log->info(COMPONENT, std::format("INTERRUPTED: {}", result.message));
                return result;
            }
            if (!result.success) {
                log->error(COMPONENT,
                           std::format("FAILED: {}: {}", file.string(), result.message));
                failed_.push_back(file);
            }
        }

        if (!failed_.empty()) {
            log->error(COMPONENT,
                       std::format("{} of {} files failed", failed_.size(), total));
        }

        if (!failed_.empty() && !options.keep_file) {
            log->warning(COMPONENT, "Keeping directory tree: some files were not shredded");
        } else if (skipped_ > 0 && !options.keep_file) {
            log->warning(COMPONENT,
                         std::format("Keeping directory tree: {} protected entries skipped",
                                     skipped_));
        } else if (!options.keep_file && !cancel.is_cancelled()) {
            std::error_code ec;
            fs::remove_all(target->path, ec);
            if (ec) {
                log->warning(COMPONENT, std::format("Could not remove directory: {}", ec.message()));
            }
        }

        const auto message =
            options.keep_file ? std::format("DIRECTORY OVERWRITTEN: {} FILES (PRESERVED)", total)
                              : std::format("DIRECTORY DESTROYED: {} FILES - IRRECOVERABLE", total);
        log->info(COMPONENT, message);
        return OperationResult::ok(message);
    } catch (const std::exception& e) {
        log->error(COMPONENT, std::format("FAILED with exception: {}", e.what()));
        return OperationResult::failure(
            util::Error{util::ErrorKind::IoError, std::format("Directory error: {}", e.what())});
    }
}
