/**
 * @file CliApplication.hpp
 * @brief CLI application for secure file shredding
 */

#pragma once

#include "models/ShredTypes.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

class ShredService;

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool list_methods = false;
    bool json_output = false;
    bool check_only = false;
    bool keep_file = false;
    bool no_confirm = false;
    bool verbose = false;
    bool invalid = false;
    std::optional<std::string> preserve_directory;
    std::string target;
};

/**
 * @class CliApplication
 * @brief Command-line front end for the shredding engine
 *
 * Provides command-line interface for:
 * - Shredding a file or a directory tree (destroy or keep mode)
 * - Pre-flight path checks
 * - Listing the available overwrite methods
 */
class CliApplication {
public:
    CliApplication();
    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @param argc Argument count
     * @param argv Argument values
     * @return Exit code (0 = success)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed options
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    static void print_help();

    static void print_version();

    /**
     * @brief Render the method table as a JSON object keyed by method id
     */
    [[nodiscard]] static auto methods_to_json(const std::map<std::string, MethodInfo>& methods)
        -> std::string;

private:
    auto cmd_methods(bool json) -> int;

    auto cmd_check(const std::string& target) -> int;

    auto cmd_shred(const CliOptions& options) -> int;

    /**
     * @brief Prompt user for confirmation
     * @param target Path about to be shredded
     * @param keep_file Whether the wiped file is kept
     * @return true if user confirms
     */
    [[nodiscard]] static auto confirm_shred(const std::string& target, bool keep_file) -> bool;

    std::unique_ptr<ShredService> service_;
};

}  // namespace cli
