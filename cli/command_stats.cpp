#include "cli_common.hpp"
#include <yarn/thread_usage.hpp>
#include <serialization/document_json.hpp>
#include <serialization/pattern_json.hpp>
#include <serialization/thread_usage_json.hpp>
#include <common/logging.hpp>

namespace xstitch::cli {

int command_stats(int argc, char** argv) {
    auto log = xstitch::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: xstitch stats <pattern.json> [-o <usage.json>] [-c <config.json>]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config <file>   Tool configuration (canvas type)\n";
            std::cerr << "      --canvas <id>     Canvas type: standard or sudan\n";
            return 1;
        }
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        log->info("Computing thread usage for: {}", ctx.input_path);

        json::Document input = json::read_document(ctx.input_path, json::DocumentKind::Pattern);
        Pattern pattern = pattern_from_json(input.data);

        ToolConfig tool = load_tool_config(ctx);
        log->debug("Using canvas '{}' ({} cm per stitch)", tool.canvas.name,
                   tool.canvas.cm_per_stitch);

        ColorHistogram histogram = color_histogram(pattern);
        ThreadUsage usage = calculate_thread_usage(histogram, tool.canvas);

        std::cout << format_thread_usage(usage);

        if (!ctx.output_path.empty()) {
            json::Document doc;
            doc.kind = json::DocumentKind::ThreadUsage;
            doc.created = json::get_timestamp();
            doc.source_file = ctx.input_path;
            doc.grid = json::summarize(pattern);
            doc.tool_config = tool.to_json();
            doc.data = {
                {"histogram", histogram_to_json(histogram)},
                {"usage", usage}
            };

            json::write_document(ctx.output_path, doc);
            log->info("Wrote thread usage to {}", ctx.output_path);
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace xstitch::cli
