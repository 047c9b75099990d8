/**
 * @file Logger.cpp
 * @brief Thread-safe logging utility implementation
 */

#include "util/Logger.hpp"

#include <format>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace util {

namespace {

auto rotated_name(const std::string& app_name, int index) -> std::string {
    return std::format("{}.{}.log", app_name, index);
}

}  // namespace

Logger::~Logger() {
    shutdown();
}

auto Logger::shared_instance() -> std::shared_ptr<Logger> {
    static auto logger = std::make_shared<Logger>();
    return logger;
}

auto Logger::instance() -> Logger& {
    return *shared_instance();
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    policy_ = policy;
    current_file_size_ = 0;
    initialized_ = false;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "Logger: Failed to create log directory: " << log_dir_ << " - "
                  << ec.message() << std::endl;
        return false;
    }

    if (!open_log_file()) {
        return false;
    }

    initialized_ = true;

    file_ << get_timestamp() << "[INFO ] [Logger] Logger initialized: app=" << app_name_
          << " dir=" << log_dir_.string() << " level=" << level_to_string(min_level_)
          << " max_size=" << policy_.max_file_size_bytes << " max_files=" << policy_.max_files
          << std::endl;

    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::open_log_file() -> bool {
    auto log_path = log_dir_ / (app_name_ + ".log");

    file_.open(log_path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Logger: Failed to open log file: " << log_path << std::endl;
        return false;
    }

    std::error_code ec;
    current_file_size_ = std::filesystem::file_size(log_path, ec);
    if (ec) {
        current_file_size_ = 0;
    }

    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::string log_line = std::format("{}[{}] [{}] {}\n", get_timestamp(),
                                       level_to_string(level), component, message);

    if (initialized_ && file_.is_open()) {
        check_and_rotate();
        file_ << log_line;
        file_.flush();
        current_file_size_ += log_line.size();
    }

    if (console_output_) {
        std::cerr << log_line;
    }
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return {};
    }
    return log_dir_ / (app_name_ + ".log");
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);

    if (initialized_ && file_.is_open()) {
        file_ << get_timestamp() << "[INFO ] [Logger] Logger shutting down" << std::endl;
        file_.close();
    }

    initialized_ = false;
}

auto Logger::get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count() << "Z ";

    return oss.str();
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

void Logger::check_and_rotate() {
    if (current_file_size_ >= policy_.max_file_size_bytes) {
        rotate_logs();
    }
}

void Logger::rotate_logs() {
    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;

    // Oldest rotation falls off the end; the rest shift up by one
    std::filesystem::remove(log_dir_ / rotated_name(app_name_, policy_.max_files), ec);
    for (int i = policy_.max_files - 1; i >= 1; --i) {
        auto from = log_dir_ / rotated_name(app_name_, i);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, log_dir_ / rotated_name(app_name_, i + 1), ec);
        }
    }
    std::filesystem::rename(log_dir_ / (app_name_ + ".log"),
                            log_dir_ / rotated_name(app_name_, 1), ec);

    if (!open_log_file()) {
        initialized_ = false;
        return;
    }

    file_ << get_timestamp() << "[INFO ] [Logger] Log file rotated" << std::endl;
}

}  // namespace util
