#ifndef MERMAIDGEN_CLI_COMMON_HPP
#define MERMAIDGEN_CLI_COMMON_HPP

#include <string>
#include <optional>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace mermaidgen::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;  // empty means stdout
    std::optional<std::string> config_path;
    bool verbose = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (!arg.empty() && arg[0] != '-') {
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

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Command function declarations
int command_render(int argc, char** argv);

}  // namespace mermaidgen::cli

#endif // MERMAIDGEN_CLI_COMMON_HPP
