#include "cli_common.hpp"
#include <serialization/document_json.hpp>
#include <serialization/pattern_json.hpp>
#include <common/logging.hpp>

namespace xstitch::cli {

int command_preview(int argc, char** argv) {
    auto log = xstitch::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: xstitch preview <pattern.json> [-o <preview.txt>]\n";
            return 1;
        }

        json::Document input = json::read_document(ctx.input_path, json::DocumentKind::Pattern);
        Pattern pattern = pattern_from_json(input.data);
        std::string text = pattern.to_text();

        if (ctx.output_path.empty()) {
            std::cout << text;
        } else {
            write_file(ctx.output_path, text);
            log->info("Wrote preview to {}", ctx.output_path);
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace xstitch::cli
