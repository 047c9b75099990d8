#include "services/ShredOperation.hpp"

#include "services/Overwriter.hpp"
#include "services/SecureRenamer.hpp"
#include "util/SecureRandom.hpp"

#include <exception>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr const char* COMPONENT = "ShredOperation";
constexpr size_t OPERATION_ID_BYTES = 8;

auto path_exists(const fs::path& path) -> bool {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    // Any status other than not_found counts, including stat errors
    return status.type() != fs::file_type::not_found;
}

}  // namespace

ShredOperation::ShredOperation(std::shared_ptr<IPathClassifier> classifier,
                               std::shared_ptr<ITimestampObfuscator> timestamps,
                               std::shared_ptr<IShredMethod> method,
                               std::shared_ptr<util::ILogger> logger)
    : classifier_(std::move(classifier)),
      timestamps_(std::move(timestamps)),
      method_(std::move(method)),
      logger_(logger ? std::move(logger) : util::NullLogger::shared()),
      still_exists_(path_exists) {}

void ShredOperation::set_existence_check(ExistenceCheck check) {
    still_exists_ = check ? std::move(check) : ExistenceCheck(path_exists);
}

void ShredOperation::transition(ShredState next, util::ILogger& log) {
    log.debug(COMPONENT, std::format("{} -> {}", to_string(state_), to_string(next)));
    state_ = next;
}

auto ShredOperation::run(const fs::path& path, const ShredOptions& options,
                         const ProgressCallback& progress, const util::CancellationToken& cancel)
    -> OperationResult {
    state_ = ShredState::Idle;
    record_ = ObfuscationRecord{};
    operation_id_.clear();

    std::shared_ptr<util::ILogger> log = logger_;

    try {
        operation_id_ = util::SecureRandom::hex_token(OPERATION_ID_BYTES);
        log = std::make_shared<util::ScopedLogger>(logger_, operation_id_);

        log->info(COMPONENT, std::format("STARTING SHRED: {}", path.string()));
        log->info(COMPONENT, std::format("KEEP_FILE: {}", options.keep_file));

        auto message = execute(path, options, progress, cancel, log);
        if (message) {
            log->info(COMPONENT, std::format("COMPLETED: {}", *message));
            return OperationResult::ok(std::move(*message));
        }

        if (message.error().kind == util::ErrorKind::Cancelled) {
            transition(ShredState::Interrupted, *log);
            log->info(COMPONENT, std::format("OPERATION INTERRUPTED: {}", message.error().message));
            discard_interrupted(options, *log);
        } else {
            transition(ShredState::Failed, *log);
            log->error(COMPONENT, std::format("FAILED ({}): {}", util::to_string(message.error().kind),
                                              message.error().message));
        }
        return OperationResult::failure(message.error());
    } catch (const std::exception& e) {
        transition(ShredState::Failed, *log);
        log->error(COMPONENT, std::format("FAILED with exception: {}", e.what()));
        return OperationResult::failure(
            util::Error{util::ErrorKind::IoError, std::format("Shred error: {}", e.what())});
    }
}

auto ShredOperation::execute(const fs::path& path, const ShredOptions& options,
                             const ProgressCallback& progress,
                             const util::CancellationToken& cancel,
                             const std::shared_ptr<util::ILogger>& log)
    -> util::Result<std::string> {
    transition(ShredState::Validating, *log);

    auto target = classifier_->validate(path, TargetKind::File);
    if (!target) {
        return std::unexpected(target.error());
    }

    const auto original_name = target->path.filename().string();
    record_.original_path = target->path;

    if (options.preserve_directory && !options.keep_file) {
        log->warning(COMPONENT, "Preserve directory ignored because the file is not kept");
    }

    if (cancel.is_cancelled()) {
        return std::unexpected(
            util::Error{util::ErrorKind::Cancelled, "Operation cancelled by user"});
    }
    if (progress) {
        ShredProgress initiating{
            .current_step = 0, .total_steps = 1, .status = "Initiating shred",
            .bytes_processed = target->size};
        if (!progress(initiating)) {
            return std::unexpected(
                util::Error{util::ErrorKind::Cancelled, "Operation cancelled by user"});
        }
    }

    transition(ShredState::Renaming, *log);
    SecureRenamer renamer(log);
    auto scrambled = renamer.secure_rename(target->path, record_);
    if (!scrambled) {
        return std::unexpected(scrambled.error());
    }

    transition(ShredState::Overwriting, *log);
    Overwriter overwriter(log);
    if (auto written = overwriter.overwrite(*scrambled, method_->schedule(), progress, cancel);
        !written) {
        return std::unexpected(written.error());
    }

    transition(ShredState::ObfuscatingTimestamps, *log);
    const auto report = timestamps_->obfuscate(*scrambled);
    record_.applied_timestamps = report.applied_times;
    log->info(COMPONENT, std::format("Timestamps via {}: {}/{} fields written{}",
                                     timestamps_->get_name(), report.fields_written,
                                     report.fields_attempted,
                                     report.privileged ? " (privileged)" : ""));

    transition(ShredState::Disposing, *log);

    if (!options.keep_file) {
        std::error_code ec;
        fs::remove(*scrambled, ec);
        if (ec) {
            return std::unexpected(util::Error{
                util::kind_from_errno(ec.value()),
                std::format("Failed to delete {}: {}", scrambled->filename().string(), ec.message()),
                ec.value()});
        }
        if (still_exists_(*scrambled)) {
            return std::unexpected(util::Error{util::ErrorKind::ConsistencyError,
                                               "FILE STILL EXISTS AFTER DELETION"});
        }
        transition(ShredState::Destroyed, *log);
        return std::format("FILE DESTROYED: {} -> IRRECOVERABLE", original_name);
    }

    if (options.preserve_directory) {
        auto moved = renamer.relocate(*scrambled, *options.preserve_directory, record_);
        if (!moved) {
            return std::unexpected(moved.error());
        }
        transition(ShredState::Preserved, *log);
        return std::format("FILE PRESERVED: {} -> {}", original_name, moved->string());
    }

    transition(ShredState::Preserved, *log);
    return std::format("FILE PRESERVED: {} -> {}", original_name, scrambled->filename().string());
}

void ShredOperation::discard_interrupted(const ShredOptions& options, util::ILogger& log) {
    if (options.keep_file || record_.renames.empty()) {
        return;
    }

    const auto& current = record_.current_path();
    std::error_code ec;
    fs::remove(current, ec);
    if (ec) {
        log.warning(COMPONENT, std::format("Could not remove interrupted file {}: {}",
                                           current.filename().string(), ec.message()));
    }
}
