/**
 * @file ShredService.hpp
 * @brief Engine facade wiring classifier, method and obfuscator together
 */

#pragma once

#include "services/IShredService.hpp"

#include "algorithms/IShredMethod.hpp"
#include "services/IPathClassifier.hpp"
#include "services/ITimestampObfuscator.hpp"
#include "util/Logger.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

class ShredService : public IShredService {
public:
    static constexpr const char* DEFAULT_METHOD = "gutmann_35_pass";

    /**
     * @param classifier Safety gate; the platform PathClassifier when null
     * @param timestamps Timestamp capability; the platform one when null
     * @param logger Log sink; discards output when null
     */
    explicit ShredService(std::shared_ptr<IPathClassifier> classifier = nullptr,
                          std::shared_ptr<ITimestampObfuscator> timestamps = nullptr,
                          std::shared_ptr<util::ILogger> logger = nullptr);
    ~ShredService() override;

    ShredService(const ShredService&) = delete;
    ShredService& operator=(const ShredService&) = delete;

    auto shred_file(const std::filesystem::path& path, const ShredOptions& options,
                    const ProgressCallback& progress, const util::CancellationToken& cancel)
        -> OperationResult override;

    auto shred_directory(const std::filesystem::path& path, const ShredOptions& options,
                         const ProgressCallback& progress, const util::CancellationToken& cancel)
        -> OperationResult override;

    /**
     * @brief Dispatch to shred_file or shred_directory by what path is
     */
    auto shred(const std::filesystem::path& path, const ShredOptions& options,
               const ProgressCallback& progress, const util::CancellationToken& cancel)
        -> OperationResult;

    [[nodiscard]] auto validate_shredding_path(const std::filesystem::path& path)
        -> OperationResult override;

    [[nodiscard]] auto get_available_methods() const -> std::map<std::string, MethodInfo> override;

    auto start(const std::filesystem::path& path, const ShredOptions& options,
               ProgressCallback progress, CompletionCallback completion) -> bool override;

    auto cancel_current_operation() -> bool override;

    [[nodiscard]] auto is_busy() const -> bool override;

private:
    static constexpr auto SHUTDOWN_TIMEOUT = std::chrono::seconds{5};

    struct ThreadState {
        util::CancellationToken cancel;
        std::atomic<bool> operation_in_progress{false};
    };

    std::shared_ptr<IPathClassifier> classifier_;
    std::shared_ptr<ITimestampObfuscator> timestamps_;
    std::shared_ptr<util::ILogger> logger_;

    std::shared_ptr<ThreadState> state_;
    std::thread worker_;
    mutable std::mutex thread_mutex_;  // Protects worker_

    std::map<std::string, std::shared_ptr<IShredMethod>> methods_;

    void initialize_methods();
    [[nodiscard]] auto get_method(const std::string& id) const -> std::shared_ptr<IShredMethod>;
};
