/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "services/ShredService.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

#include <getopt.h>

namespace cli {

namespace {

// Global for signal handling
std::atomic<bool> g_cancel_requested{false};

void signal_handler(int /*signal*/) {
    g_cancel_requested.store(true);
}

constexpr auto APP_NAME = PROJECT_NAME;

const struct option long_options[] = {
    {        "help",       no_argument, nullptr, 'h'},
    {     "version",       no_argument, nullptr, 'V'},
    {     "methods",       no_argument, nullptr, 'm'},
    {        "json",       no_argument, nullptr, 'j'},
    {       "check",       no_argument, nullptr, 'c'},
    {        "keep",       no_argument, nullptr, 'k'},
    {"preserve-dir", required_argument, nullptr, 'o'},
    {         "yes",       no_argument, nullptr, 'y'},
    {     "verbose",       no_argument, nullptr, 'v'},
    {       nullptr,                 0, nullptr,   0}
};

auto json_escape(const std::string& value) -> std::string {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            default:
                escaped += c;
                break;
        }
    }
    return escaped;
}

}  // namespace

CliApplication::CliApplication() = default;

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / PROJECT_NAME / "logs";
    auto& logger = util::Logger::instance();
    logger.initialize(log_dir, PROJECT_NAME,
                      options.verbose ? util::LogLevel::DEBUG : util::LogLevel::INFO);
    logger.set_console_output(options.verbose);

    if (options.show_help || options.invalid) {
        print_help();
        return options.invalid ? 1 : 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    service_ = std::make_unique<ShredService>(nullptr, nullptr, util::Logger::shared_instance());

    if (options.list_methods) {
        return cmd_methods(options.json_output);
    }

    if (options.target.empty()) {
        print_help();
        return 1;
    }

    if (options.check_only) {
        return cmd_check(options.target);
    }

    return cmd_shred(options);
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // glibc re-initializes getopt state when optind is 0
    optind = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVmjcko:yv", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'm':
                options.list_methods = true;
                break;
            case 'j':
                options.json_output = true;
                break;
            case 'c':
                options.check_only = true;
                break;
            case 'k':
                options.keep_file = true;
                break;
            case 'o':
                options.preserve_directory = optarg;
                options.keep_file = true;
                break;
            case 'y':
                options.no_confirm = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            default:
                options.invalid = true;
                break;
        }
    }

    if (optind < argc) {
        options.target = argv[optind];
        if (optind + 1 < argc) {
            options.invalid = true;
        }
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS] <path>\n\n"
              << "Securely overwrite, rename and delete a file or directory tree\n\n"
              << "Options:\n"
              << "  -h, --help               Show this help message\n"
              << "  -V, --version            Show version information\n"
              << "  -m, --methods            List available overwrite methods\n"
              << "  -j, --json               Output in JSON format (with --methods)\n"
              << "  -c, --check              Only check whether <path> may be shredded\n"
              << "  -k, --keep               Keep the overwritten file under a random name\n"
              << "  -o, --preserve-dir <dir> Move kept files into <dir> (implies --keep)\n"
              << "  -y, --yes                Skip confirmation prompt\n"
              << "  -v, --verbose            Log to stderr at debug level\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " secret.pdf\n"
              << "  " << APP_NAME << " --keep --preserve-dir ~/wiped secret.pdf\n"
              << "  " << APP_NAME << " --yes ~/old-project\n"
              << "  " << APP_NAME << " --methods --json\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Secure file shredder (Gutmann 35-pass)\n";
}

auto CliApplication::methods_to_json(const std::map<std::string, MethodInfo>& methods)
    -> std::string {
    std::ostringstream out;
    out << "{\n";
    size_t index = 0;
    for (const auto& [id, info] : methods) {
        out << "  \"" << json_escape(id) << "\": {\n";
        out << "    \"name\": \"" << json_escape(info.name) << "\",\n";
        out << "    \"passes\": " << info.passes << ",\n";
        out << "    \"security\": \"" << json_escape(info.security) << "\"\n";
        out << "  }" << (++index < methods.size() ? "," : "") << "\n";
    }
    out << "}\n";
    return out.str();
}

auto CliApplication::cmd_methods(bool json) -> int {
    auto methods = service_->get_available_methods();

    if (json) {
        std::cout << methods_to_json(methods);
        return 0;
    }

    constexpr int COL_ID = 20;
    constexpr int COL_NAME = 40;
    constexpr int COL_PASSES = 8;
    constexpr int COL_SECURITY = 10;

    std::cout << std::left << std::setw(COL_ID) << "ID" << std::setw(COL_NAME) << "NAME"
              << std::setw(COL_PASSES) << "PASSES" << std::setw(COL_SECURITY) << "SECURITY"
              << "\n";
    std::cout << std::string(COL_ID + COL_NAME + COL_PASSES + COL_SECURITY, '-') << "\n";

    for (const auto& [id, info] : methods) {
        std::cout << std::left << std::setw(COL_ID) << id << std::setw(COL_NAME) << info.name
                  << std::setw(COL_PASSES) << info.passes << std::setw(COL_SECURITY)
                  << info.security << "\n";
    }

    return 0;
}

auto CliApplication::cmd_check(const std::string& target) -> int {
    auto verdict = service_->validate_shredding_path(target);
    if (verdict.success) {
        std::cout << target << ": " << verdict.message << "\n";
        return 0;
    }
    std::cerr << target << ": " << verdict.message << "\n";
    return 1;
}

auto CliApplication::cmd_shred(const CliOptions& options) -> int {
    // Refuse before prompting so the user is never asked about a protected path
    auto verdict = service_->validate_shredding_path(options.target);
    if (!verdict.success) {
        LOG_ERROR("CLI", std::format("Refused {}: {}", options.target, verdict.message));
        std::cerr << "Error: " << verdict.message << "\n";
        return 1;
    }

    if (!options.no_confirm) {
        if (!confirm_shred(options.target, options.keep_file)) {
            std::cout << "Aborted.\n";
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const auto methods = service_->get_available_methods();
    const auto& method = methods.at(ShredService::DEFAULT_METHOD);
    ProgressDisplay display(options.target, method.name, method.passes);

    ShredOptions shred_options{.keep_file = options.keep_file, .preserve_directory = std::nullopt};
    if (options.preserve_directory) {
        shred_options.preserve_directory = std::filesystem::path(*options.preserve_directory);
    }

    std::atomic<bool> complete{false};
    OperationResult final_result;

    auto on_progress = [&display](const ShredProgress& p) -> bool {
        display.update(p);
        return !g_cancel_requested.load();
    };

    auto on_complete = [&](const OperationResult& result) {
        final_result = result;
        complete.store(true);
    };

    if (!service_->start(options.target, shred_options, on_progress, on_complete)) {
        LOG_ERROR("CLI", std::format("Failed to start shred operation for {}", options.target));
        std::cerr << "Error: Failed to start shred operation.\n";
        return 1;
    }

    bool cancel_sent = false;
    while (!complete.load()) {
        if (g_cancel_requested.load() && !cancel_sent) {
            std::cerr << "\nCancellation requested..." << std::endl;
            LOG_WARNING("CLI", std::format("Cancellation requested for {}", options.target));
            cancel_sent = service_->cancel_current_operation();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }

    display.complete(final_result);
    LOG_INFO("CLI", std::format("{}: {}", options.target, final_result.message));

    return final_result.success ? 0 : 1;
}

auto CliApplication::confirm_shred(const std::string& target, bool keep_file) -> bool {
    std::cout << "\n";
    if (keep_file) {
        std::cout << "\033[1;33mWARNING: The contents of " << target
                  << " will be PERMANENTLY overwritten and renamed.\033[0m\n";
    } else {
        std::cout << "\033[1;31mWARNING: " << target
                  << " will be PERMANENTLY DESTROYED and cannot be recovered!\033[0m\n";
    }
    std::cout << "Type 'yes' to confirm: ";
    std::cout.flush();

    std::string input;
    std::getline(std::cin, input);

    return input == "yes";
}

}  // namespace cli
