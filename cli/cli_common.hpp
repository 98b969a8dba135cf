#ifndef XSTITCH_CLI_COMMON_HPP
#define XSTITCH_CLI_COMMON_HPP

#include <nlohmann/json.hpp>
#include <pattern/pattern.hpp>
#include <yarn/canvas_type.hpp>
#include <serialization/document_json.hpp>
#include <serialization/config_json.hpp>
#include <string>
#include <optional>
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace xstitch::cli {

// Options shared by every command
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<int> threads;            // -j, overrides engine.num_threads
    std::optional<std::string> canvas_id;  // --canvas, overrides the file's canvas
    bool verbose = false;
};

// Value following option `argv[i]`; advances `i` past it
inline std::string require_value(int argc, char** argv, int& i) {
    std::string option = argv[i];
    if (i + 1 >= argc) {
        throw std::runtime_error(option + " requires an argument");
    }
    i += 2;
    return argv[i - 1];
}

inline int parse_thread_count(const std::string& text) {
    std::size_t used = 0;
    int value = -1;
    try {
        value = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != text.size() || value < 0) {
        throw std::runtime_error("--threads expects a non-negative integer, got '" + text + "'");
    }
    return value;
}

// Parse the arguments after the command name
inline CommandContext parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value(argc, argv, i);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value(argc, argv, i);
        } else if (arg == "-j" || arg == "--threads") {
            ctx.threads = parse_thread_count(require_value(argc, argv, i));
        } else if (arg == "--canvas") {
            ctx.canvas_id = require_value(argc, argv, i);
        } else if (!arg.empty() && arg[0] != '-') {
            if (!ctx.input_path.empty()) {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
            ctx.input_path = arg;
            ++i;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return ctx;
}

// Tool settings: the -c file, then command-line overrides
struct ToolConfig {
    GenerateOptions engine;
    CanvasType canvas = CanvasType::standard();
    bool fit_colors = false;   // Resize the palette to one color per layer

    // Effective settings, recorded in every document written
    nlohmann::json to_json() const {
        return {
            {"engine", engine},
            {"canvas", canvas.id},
            {"fit_colors", fit_colors}
        };
    }
};

inline CanvasType canvas_or_throw(const std::string& id) {
    if (!has_canvas_type(id)) {
        throw std::runtime_error("Unknown canvas type: " + id);
    }
    return find_canvas_type(id);
}

inline ToolConfig load_tool_config(const CommandContext& ctx) {
    ToolConfig tool;
    if (ctx.config_path.has_value()) {
        nlohmann::json file = json::read_json_file(ctx.config_path.value());
        if (file.contains("engine")) {
            tool.engine = file["engine"].get<GenerateOptions>();
        }
        if (file.contains("canvas")) {
            tool.canvas = canvas_or_throw(file["canvas"].get<std::string>());
        }
        tool.fit_colors = file.value("fit_colors", false);
    }

    if (ctx.threads) {
        tool.engine.num_threads = *ctx.threads;
    }
    if (ctx.canvas_id) {
        tool.canvas = canvas_or_throw(*ctx.canvas_id);
    }
    return tool;
}

// Read entire file to string
inline std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
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
int command_generate(int argc, char** argv);
int command_stats(int argc, char** argv);
int command_preview(int argc, char** argv);
int command_palettes(int argc, char** argv);

}  // namespace xstitch::cli

#endif // XSTITCH_CLI_COMMON_HPP
