/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace cli {

namespace {

// ANSI color codes
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[32m";
constexpr auto RED = "\033[31m";
constexpr auto YELLOW = "\033[33m";

}  // namespace

ProgressDisplay::ProgressDisplay(std::string target_path, std::string method_name,
                                 int total_passes)
    : target_path_(std::move(target_path)), method_name_(std::move(method_name)),
      total_passes_(total_passes), start_time_(std::chrono::steady_clock::now()) {
    color_enabled_ = is_terminal();
}

auto ProgressDisplay::is_write_event(std::string_view status) -> bool {
    return !status.starts_with("Found ") && !status.contains("Initiating shred") &&
           !status.contains("GUTMANN METHOD");
}

auto ProgressDisplay::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void ProgressDisplay::set_color_enabled(bool enable) {
    color_enabled_ = enable;
}

void ProgressDisplay::print_header() {
    std::cout << "\n";
    if (color_enabled_) {
        std::cout << BOLD;
    }
    std::cout << "Shredding " << target_path_ << "\n";
    std::cout << "Method: " << method_name_ << " (" << total_passes_ << " pass"
              << (total_passes_ != 1 ? "es" : "") << ")\n";
    if (color_enabled_) {
        std::cout << RESET;
    }
    std::cout << std::flush;
    header_printed_ = true;
}

void ProgressDisplay::update(const ShredProgress& progress) {
    if (!header_printed_) {
        print_header();
    }

    // Only chunk events report bytes written; the others carry the file
    // size. bytes_processed restarts at each pass or file.
    if (!is_write_event(progress.status)) {
        last_bytes_ = 0;
        last_step_ = progress.current_step;
    } else {
        if (progress.current_step != last_step_ || progress.bytes_processed < last_bytes_) {
            last_bytes_ = 0;
            last_step_ = progress.current_step;
        }
        total_written_ += progress.bytes_processed - last_bytes_;
        last_bytes_ = progress.bytes_processed;
    }

    const double percentage =
        progress.total_steps > 0
            ? static_cast<double>(progress.current_step) / progress.total_steps * 100.0
            : 0.0;

    std::string status_line = std::format("{} {:5.1f}%  {}", generate_progress_bar(percentage),
                                          percentage, progress.status);

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::steady_clock::now() - start_time_)
                             .count();
    if (elapsed > 0 && total_written_ > 0) {
        status_line += "  |  " + format_bytes(total_written_ / static_cast<uint64_t>(elapsed)) + "/s";
    }
    status_line += "  |  " + format_duration(elapsed);

    clear_line();
    std::cout << status_line << std::flush;
}

void ProgressDisplay::complete(const OperationResult& result) {
    clear_line();
    std::cout << "\n";

    const char* color = result.success ? GREEN : (result.is_cancelled() ? YELLOW : RED);
    const char* label = result.success ? "[OK] " : (result.is_cancelled() ? "[CANCELLED] " : "[FAILED] ");

    if (color_enabled_) {
        std::cout << color << BOLD;
    }

    std::cout << label << result.message;

    if (color_enabled_) {
        std::cout << RESET;
    }

    std::cout << "\n" << std::endl;
}

auto ProgressDisplay::format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;
    constexpr uint64_t TB = GB * 1024;

    if (bytes >= TB) {
        return std::format("{:.1f} TB", static_cast<double>(bytes) / static_cast<double>(TB));
    } else if (bytes >= GB) {
        return std::format("{:.1f} GB", static_cast<double>(bytes) / static_cast<double>(GB));
    } else if (bytes >= MB) {
        return std::format("{:.1f} MB", static_cast<double>(bytes) / static_cast<double>(MB));
    } else if (bytes >= KB) {
        return std::format("{:.1f} KB", static_cast<double>(bytes) / static_cast<double>(KB));
    }
    return std::format("{} B", bytes);
}

auto ProgressDisplay::format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }

    int64_t hours = seconds / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (hours > 0) {
        return std::format("{}:{:02d}:{:02d}", hours, minutes, secs);
    }
    return std::format("{:02d}:{:02d}", minutes, secs);
}

auto ProgressDisplay::generate_progress_bar(double percentage) -> std::string {
    int filled = static_cast<int>(std::round(percentage / 100.0 * BAR_WIDTH));
    filled = std::clamp(filled, 0, BAR_WIDTH);

    std::string bar = "[";

    if (color_enabled_) {
        bar += GREEN;
    }

    for (int i = 0; i < filled; ++i) {
        bar += "█";
    }

    if (color_enabled_) {
        bar += RESET;
    }

    for (int i = filled; i < BAR_WIDTH; ++i) {
        bar += "░";
    }

    bar += "]";

    return bar;
}

void ProgressDisplay::clear_line() {
    if (is_terminal()) {
        std::cout << "\r\033[K";
    } else {
        std::cout << "\n";
    }
}

}  // namespace cli
