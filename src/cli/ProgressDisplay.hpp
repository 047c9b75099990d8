/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for CLI shred operations
 */

#pragma once

#include "models/ShredTypes.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief ANSI terminal progress bar display
 *
 * Shows the current step (pass or file) as a bar, the engine's status text,
 * write speed and elapsed time. Falls back to one line per update when
 * stdout is not a terminal.
 */
class ProgressDisplay {
public:
    /**
     * @brief Construct a progress display
     * @param target_path File or directory being shredded
     * @param method_name Display name of the overwrite method
     * @param total_passes Passes per file
     */
    ProgressDisplay(std::string target_path, std::string method_name, int total_passes);

    /**
     * @brief Update the progress display
     * @param progress Event delivered by the engine
     */
    void update(const ShredProgress& progress);

    /**
     * @brief Print the final result line
     */
    void complete(const OperationResult& result);

    void set_color_enabled(bool enable);

    /**
     * @brief Bytes written so far, summed over passes and files
     */
    [[nodiscard]] auto bytes_written() const -> uint64_t { return total_written_; }

    /**
     * @brief Whether an event reports overwrite progress
     *
     * Discovery, initiation and pass-start events carry the target size
     * rather than bytes written.
     */
    [[nodiscard]] static auto is_write_event(std::string_view status) -> bool;

    /**
     * @brief Check if stdout is a terminal
     */
    [[nodiscard]] static auto is_terminal() -> bool;

    /**
     * @brief Format bytes as human-readable string (e.g., "245.0 MB")
     */
    [[nodiscard]] static auto format_bytes(uint64_t bytes) -> std::string;

    /**
     * @brief Format duration as "mm:ss" or "h:mm:ss"
     */
    [[nodiscard]] static auto format_duration(int64_t seconds) -> std::string;

private:
    [[nodiscard]] auto generate_progress_bar(double percentage) -> std::string;

    void clear_line();

    void print_header();

    std::string target_path_;
    std::string method_name_;
    int total_passes_;
    bool color_enabled_ = true;
    bool header_printed_ = false;
    std::chrono::steady_clock::time_point start_time_;

    // Bytes accumulated across passes for the speed figure
    uint64_t total_written_ = 0;
    uint64_t last_bytes_ = 0;
    int last_step_ = 0;

    static constexpr int BAR_WIDTH = 30;
};

}  // namespace cli
