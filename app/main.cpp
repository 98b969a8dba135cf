#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Plans cross-stitch patterns made of colored layers.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  generate <pattern_config.json> -o <pattern.json>   Classify every stitch of the grid\n";
    std::cerr << "  stats <pattern.json> [-o <usage.json>]             Stitch counts and thread usage\n";
    std::cerr << "  preview <pattern.json> [-o <preview.txt>]          Text preview, one symbol per stitch\n";
    std::cerr << "  palettes [-o <palettes.json>]                      List built-in palettes\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -c, --config <file>   Tool configuration file\n";
    std::cerr << "  -o, --output <file>   Output file\n";
    std::cerr << "  -j, --threads <n>     Worker threads for generate\n";
    std::cerr << "      --canvas <id>     Canvas type for stats (standard, sudan)\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  XSTITCH_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    auto log = xstitch::logging::get_logger();

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    log->debug("Dispatching command '{}'", command);

    if (command == "generate") {
        return xstitch::cli::command_generate(argc, argv);
    } else if (command == "stats") {
        return xstitch::cli::command_stats(argc, argv);
    } else if (command == "preview") {
        return xstitch::cli::command_preview(argc, argv);
    } else if (command == "palettes") {
        return xstitch::cli::command_palettes(argc, argv);
    } else if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
