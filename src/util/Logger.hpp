/**
 * @file Logger.hpp
 * @brief Logging interface and thread-safe file logger with rotation
 *
 * Engine components receive a std::shared_ptr<ILogger> instead of reaching
 * for a global, so tests can observe or silence log output per instance.
 * Logger is the production sink: ISO 8601 timestamps, log levels,
 * component tags, and automatic file rotation.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Detailed debugging information
    INFO,     ///< General operational information
    WARNING,  ///< Warning conditions
    ERROR     ///< Error conditions
};

/**
 * @class ILogger
 * @brief Abstract log sink handed to every engine component
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Log a message with specified level and component
     * @param level Log level
     * @param component Component/module name (e.g., "Overwriter")
     * @param message Log message
     */
    virtual void log(LogLevel level, std::string_view component, std::string_view message) = 0;

    void debug(std::string_view component, std::string_view message) {
        log(LogLevel::DEBUG, component, message);
    }

    void info(std::string_view component, std::string_view message) {
        log(LogLevel::INFO, component, message);
    }

    void warning(std::string_view component, std::string_view message) {
        log(LogLevel::WARNING, component, message);
    }

    void error(std::string_view component, std::string_view message) {
        log(LogLevel::ERROR, component, message);
    }
};

/**
 * @class NullLogger
 * @brief Sink that discards every message
 */
class NullLogger final : public ILogger {
public:
    void log(LogLevel /*level*/, std::string_view /*component*/,
             std::string_view /*message*/) override {}

    [[nodiscard]] static auto shared() -> std::shared_ptr<ILogger> {
        static auto instance = std::make_shared<NullLogger>();
        return instance;
    }
};

/**
 * @class ScopedLogger
 * @brief Forwards to another sink with a fixed "[tag] " message prefix
 *
 * Used to tag every line of one shred invocation with its operation id.
 */
class ScopedLogger final : public ILogger {
public:
    ScopedLogger(std::shared_ptr<ILogger> inner, std::string tag)
        : inner_(inner ? std::move(inner) : NullLogger::shared()),
          prefix_("[" + std::move(tag) + "] ") {}

    void log(LogLevel level, std::string_view component, std::string_view message) override {
        std::string line = prefix_;
        line.append(message);
        inner_->log(level, component, line);
    }

    [[nodiscard]] auto prefix() const -> const std::string& { return prefix_; }

private:
    std::shared_ptr<ILogger> inner_;
    std::string prefix_;
};

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 10 * 1024 * 1024;  ///< Max size before rotation (10MB default)
    int max_files = 7;                               ///< Number of rotated files to keep
};

/**
 * @class Logger
 * @brief Thread-safe logger with file output and rotation
 *
 * Usage:
 * @code
 * auto logger = util::Logger::shared_instance();
 * logger->initialize(log_dir, "file-shredder");
 * ShredService service(logger);
 * @endcode
 */
class Logger final : public ILogger {
public:
    Logger() = default;
    ~Logger() override;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Get the process-wide logger used by the command-line front end
     */
    static auto instance() -> Logger&;

    /**
     * @brief Same instance as instance(), as a handle for engine components
     */
    static auto shared_instance() -> std::shared_ptr<Logger>;

    /**
     * @brief Initialize the logger with output directory and application name
     * @param log_dir Directory for log files (created if doesn't exist)
     * @param app_name Application name used in log filename
     * @param min_level Minimum level to log (default: INFO)
     * @param policy Rotation policy (default: 10MB, 7 files)
     * @return true if initialized successfully
     *
     * Log files are named: {app_name}.log
     * Rotated files: {app_name}.1.log, {app_name}.2.log, etc.
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO,
                    LogRotationPolicy policy = {}) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message) override;

    /**
     * @brief Flush pending log entries to disk
     */
    void flush();

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Enable/disable console output (stderr)
     * @param enable Whether to also write to stderr
     */
    void set_console_output(bool enable);

    /**
     * @brief Get the current log file path
     * @return Path to the active log file, or empty if not initialized
     */
    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    /**
     * @brief Shutdown the logger, flushing and closing files
     */
    void shutdown();

    /**
     * @brief Get ISO 8601 timestamp string
     * @return Formatted timestamp (e.g., "2026-01-22T14:32:45.123Z ")
     */
    [[nodiscard]] static auto get_timestamp() -> std::string;

    /**
     * @brief Get string representation of log level
     * @return Level string (e.g., "INFO ", "ERROR")
     */
    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

private:
    void check_and_rotate();
    void rotate_logs();
    auto open_log_file() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t current_file_size_ = 0;
};

// Convenience macros for the command-line layer
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
