#include "cli_common.hpp"
#include <palette/palettes.hpp>
#include <serialization/document_json.hpp>
#include <serialization/config_json.hpp>
#include <common/logging.hpp>

namespace xstitch::cli {

int command_palettes(int argc, char** argv) {
    auto log = xstitch::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        const auto& palettes = builtin_palettes();

        if (ctx.output_path.empty()) {
            for (const auto& palette : palettes) {
                std::cout << palette.key << " (" << palette.name << "):";
                for (const auto& color : palette.colors) {
                    std::cout << " " << color;
                }
                std::cout << "\n";
            }
            return 0;
        }

        json::Document doc;
        doc.kind = json::DocumentKind::Palettes;
        doc.created = json::get_timestamp();
        doc.data = palettes;

        json::write_document(ctx.output_path, doc);
        log->info("Wrote {} palettes to {}", palettes.size(), ctx.output_path);

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace xstitch::cli
