#ifndef FRAMESPLICE_CLI_COMMON_HPP
#define FRAMESPLICE_CLI_COMMON_HPP

#include <string>
#include <optional>
#include <iostream>
#include <stdexcept>

namespace framesplice::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;

    // connect
    std::optional<double> tolerance;
    std::optional<double> elevation_tolerance;
    bool merge_duplicates = false;
    bool no_attach = false;

    // govern
    std::string results_path;
    std::string export_path;
};

inline double parse_number_arg(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    double number = 0.0;
    try {
        number = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::runtime_error(flag + " expects a number, got '" + value + "'");
    }
    return number;
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto require_value = [&](const std::string& flag) -> std::string {
        if (i + 1 < argc) {
            std::string value = argv[++i];
            ++i;
            return value;
        }
        throw std::runtime_error(flag + " requires an argument");
    };

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value(arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value(arg);
        } else if (arg == "--tolerance") {
            ctx.tolerance = parse_number_arg(arg, require_value(arg));
        } else if (arg == "--elevation-tolerance") {
            ctx.elevation_tolerance = parse_number_arg(arg, require_value(arg));
        } else if (arg == "--merge-duplicates") {
            ctx.merge_duplicates = true;
            ++i;
        } else if (arg == "--no-attach") {
            ctx.no_attach = true;
            ++i;
        } else if (arg == "--results") {
            ctx.results_path = require_value(arg);
        } else if (arg == "--export") {
            ctx.export_path = require_value(arg);
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Command function declarations
int command_connect(int argc, char** argv);
int command_govern(int argc, char** argv);

}  // namespace framesplice::cli

#endif // FRAMESPLICE_CLI_COMMON_HPP
