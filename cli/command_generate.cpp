#include "cli_common.hpp"
#include <pattern/pattern.hpp>
#include <palette/palettes.hpp>
#include <serialization/document_json.hpp>
#include <serialization/config_json.hpp>
#include <serialization/pattern_json.hpp>
#include <common/logging.hpp>

namespace xstitch::cli {

int command_generate(int argc, char** argv) {
    auto log = xstitch::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: xstitch generate <pattern_config.json> -o <pattern.json> [-c <config.json>]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config <file>   Tool configuration (engine threads, canvas, fit_colors)\n";
            std::cerr << "  -j, --threads <n>     Worker threads, 0 for the OpenMP default\n";
            return 1;
        }
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        log->info("Generating pattern from: {}", ctx.input_path);

        // Accept either a bare pattern config or an exported {"config": ...} file
        nlohmann::json input = json::read_json_file(ctx.input_path);
        if (input.contains("config") && input["config"].is_object()) {
            input = input["config"];
        }
        PatternConfig config = input.get<PatternConfig>();

        ToolConfig tool = load_tool_config(ctx);
        if (ctx.config_path.has_value()) {
            log->info("Loaded configuration from: {}", ctx.config_path.value());
        }

        // One color per layer, cycling or truncating the palette
        Pattern pattern = tool.fit_colors ? generate_fitted(config, tool.engine)
                                          : Pattern::generate(config, tool.engine);
        if (pattern.colors().size() != config.colors.size()) {
            log->info("Fitted palette of {} colors to {} layers", config.colors.size(),
                      pattern.colors().size());
        }

        json::Document doc;
        doc.kind = json::DocumentKind::Pattern;
        doc.created = json::get_timestamp();
        doc.source_file = ctx.input_path;
        doc.grid = json::summarize(pattern);
        doc.tool_config = tool.to_json();
        doc.data = pattern_to_json(pattern);

        json::write_document(ctx.output_path, doc);

        log->info("Wrote pattern to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << pattern.width() << "x" << pattern.height() << " "
                  << shape_name(pattern.config().shape) << ")\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace xstitch::cli
