#include <iostream>
#include <string>

#include "cli_common.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Generates Mermaid diagram text from a JSON diagram description.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  render <diagram.json>   Render a flowchart, class or ER diagram\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <file>     Write to file instead of stdout\n";
    std::cerr << "  -c, --config <file>     JSON object overriding the \"config\" section\n";
    std::cerr << "  -v, --verbose           Enable debug logging\n";
    std::cerr << "  -h, --help              Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  MERMAIDGEN_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "render") {
        return mermaidgen::cli::command_render(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
