#include "services/ShredService.hpp"

#include "algorithms/GutmannMethod.hpp"
#include "services/DirectoryShredOperation.hpp"
#include "services/PathClassifier.hpp"
#include "services/ShredOperation.hpp"

#include <exception>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr const char* COMPONENT = "ShredService";

}  // namespace

ShredService::ShredService(std::shared_ptr<IPathClassifier> classifier,
                           std::shared_ptr<ITimestampObfuscator> timestamps,
                           std::shared_ptr<util::ILogger> logger)
    : classifier_(std::move(classifier)),
      timestamps_(std::move(timestamps)),
      logger_(logger ? std::move(logger) : util::NullLogger::shared()) {
    if (!classifier_) {
        classifier_ = std::make_shared<PathClassifier>();
    }
    if (!timestamps_) {
        timestamps_ = timestamps::make_platform_obfuscator(logger_);
    }
    state_ = std::make_shared<ThreadState>();
    initialize_methods();
}

ShredService::~ShredService() {
    if (state_->operation_in_progress.load()) {
        state_->cancel.cancel();

        auto start = std::chrono::steady_clock::now();
        while (state_->operation_in_progress.load()) {
            if (std::chrono::steady_clock::now() - start >= SHUTDOWN_TIMEOUT) {
                logger_->error(COMPONENT,
                               std::format("Shutdown - worker did not respond to cancel within {}s; "
                                           "waiting for the current chunk to finish",
                                           SHUTDOWN_TIMEOUT.count()));
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{50});
        }
    }

    std::lock_guard lock(thread_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ShredService::initialize_methods() {
    auto gutmann = std::make_shared<GutmannMethod>();
    methods_[gutmann->get_id()] = gutmann;
}

auto ShredService::get_method(const std::string& id) const -> std::shared_ptr<IShredMethod> {
    auto it = methods_.find(id);
    if (it != methods_.end()) {
        return it->second;
    }
    return nullptr;
}

auto ShredService::shred_file(const fs::path& path, const ShredOptions& options,
                              const ProgressCallback& progress,
                              const util::CancellationToken& cancel) -> OperationResult {
    ShredOperation operation(classifier_, timestamps_, get_method(DEFAULT_METHOD), logger_);
    return operation.run(path, options, progress, cancel);
}

auto ShredService::shred_directory(const fs::path& path, const ShredOptions& options,
                                   const ProgressCallback& progress,
                                   const util::CancellationToken& cancel) -> OperationResult {
    DirectoryShredOperation operation(classifier_, timestamps_, get_method(DEFAULT_METHOD),
                                      logger_);
    return operation.run(path, options, progress, cancel);
}

auto ShredService::shred(const fs::path& path, const ShredOptions& options,
                         const ProgressCallback& progress, const util::CancellationToken& cancel)
    -> OperationResult {
    std::error_code ec;
    if (fs::is_directory(fs::symlink_status(path, ec))) {
        return shred_directory(path, options, progress, cancel);
    }
    return shred_file(path, options, progress, cancel);
}

auto ShredService::validate_shredding_path(const fs::path& path) -> OperationResult {
    try {
        std::error_code ec;
        const auto status = fs::symlink_status(path, ec);
        const auto kind = fs::is_directory(status) ? TargetKind::Directory : TargetKind::File;

        auto target = classifier_->validate(path, kind);
        if (!target) {
            return OperationResult::failure(target.error());
        }
        return OperationResult::ok("Path validated - ready to shred");
    } catch (const std::exception& e) {
        logger_->error(COMPONENT, std::format("Validation error for {}: {}", path.string(), e.what()));
        return OperationResult::failure(
            util::Error{util::ErrorKind::IoError, std::format("Validation error: {}", e.what())});
    }
}

auto ShredService::get_available_methods() const -> std::map<std::string, MethodInfo> {
    std::map<std::string, MethodInfo> methods;
    for (const auto& [id, method] : methods_) {
        methods[id] = MethodInfo{.name = method->get_name(),
                                 .passes = method->get_pass_count(),
                                 .security = method->get_security_tier()};
    }
    return methods;
}

auto ShredService::start(const fs::path& path, const ShredOptions& options,
                         ProgressCallback progress, CompletionCallback completion) -> bool {
    std::lock_guard lock(thread_mutex_);

    if (state_->operation_in_progress.load()) {
        return false;
    }

    if (worker_.joinable()) {
        worker_.join();
    }

    state_->cancel.reset();
    state_->operation_in_progress.store(true);

    worker_ = std::thread([this, path, options, progress = std::move(progress),
                           completion = std::move(completion), state = state_]() {
        auto result = shred(path, options, progress, state->cancel);
        if (completion) {
            completion(result);
        }
        state->operation_in_progress.store(false);
    });

    return true;
}

auto ShredService::cancel_current_operation() -> bool {
    if (state_->operation_in_progress.load()) {
        state_->cancel.cancel();
        logger_->info(COMPONENT, "Cancellation requested");
        return true;
    }
    return false;
}

auto ShredService::is_busy() const -> bool {
    return state_->operation_in_progress.load();
}
