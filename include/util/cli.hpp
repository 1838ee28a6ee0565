#pragma once

/**
 * CLI utilities for rme tools
 *
 * Provides command-line argument parsing and related utilities.
 */

#include <iostream>
#include <string>

namespace rme {
namespace util {

/**
 * Command-line arguments for rme_config_check.
 */
struct CLIArgs {
    bool help = false;
    bool quiet = false;     // Only the exit code, no settings dump
    bool defaults = false;  // Print built-in defaults instead of loading a file
    std::string config_path;
};

/**
 * Print help message for rme_config_check.
 */
inline void print_help() {
    std::cout << R"(
rme config check
================

Usage: rme_config_check [options] <config.json>

Loads a JSON engine configuration, validates it and prints the
effective settings (file values merged over built-in defaults).

Options:
  --defaults             Print the built-in defaults and exit
  -q, --quiet            No output, exit code only
  -h, --help             Show this help

Exit codes:
  0  configuration is valid
  1  configuration is invalid (message on stderr)
  2  usage error
)";
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--quiet" || arg == "-q") {
            args.quiet = true;
        }
        else if (arg == "--defaults") {
            args.defaults = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
        else if (args.config_path.empty()) {
            args.config_path = arg;
        }
        else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

}  // namespace util
}  // namespace rme
