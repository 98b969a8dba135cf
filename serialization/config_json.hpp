#ifndef XSTITCH_SERIALIZATION_CONFIG_JSON_HPP
#define XSTITCH_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <common/logging.hpp>
#include <pattern/pattern_config.hpp>
#include <pattern/pattern.hpp>
#include <palette/palettes.hpp>
#include <yarn/canvas_type.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace xstitch {

// SizeSpec serialization: writes either layer_count or layer_thickness
// into the enclosing shape object
inline void write_size(nlohmann::json& j, const SizeSpec& size) {
    if (const auto* thickness = std::get_if<LayerThickness>(&size)) {
        j["layer_thickness"] = thickness->thickness;
    } else {
        j["layer_count"] = std::get<LayerCount>(size).count;
    }
}

// Thickness mode is selected by the presence of layer_thickness
inline SizeSpec read_size(const nlohmann::json& j) {
    if (j.contains("layer_thickness") && !j["layer_thickness"].is_null()) {
        return LayerThickness{j["layer_thickness"].get<double>()};
    }
    return LayerCount{j.value("layer_count", 5)};
}

// ShapeParams serialization (flattened into the config object)
inline void write_shape(nlohmann::json& j, const ShapeParams& params) {
    j["shape"] = std::string(shape_name(params));
    std::visit([&](auto&& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, shape::Stripes>) {
            j["stripe_width"] = alternative.stripe_width;
        } else if constexpr (std::is_same_v<T, shape::IsometricCubes>) {
            j["cube_size"] = alternative.cube_size;
        } else if constexpr (std::is_same_v<T, shape::Polygons>) {
            write_size(j, alternative.size);
            j["num_sides"] = alternative.num_sides;
        } else {
            write_size(j, alternative.size);
        }
    }, params);
}

inline ShapeParams read_shape(const nlohmann::json& j) {
    std::string name = j.value("shape", "rectangles");
    if (name == "rectangles") {
        return shape::Rectangles{read_size(j)};
    } else if (name == "circles") {
        return shape::Circles{read_size(j)};
    } else if (name == "polygons") {
        return shape::Polygons{read_size(j), j.value("num_sides", 5)};
    } else if (name == "stripes") {
        return shape::Stripes{j.value("stripe_width", 5.0)};
    } else if (name == "isometric_cubes") {
        return shape::IsometricCubes{j.value("cube_size", 5.0)};
    }
    throw std::runtime_error("Unknown shape: " + name);
}

// PatternConfig serialization
inline void to_json(nlohmann::json& j, const PatternConfig& config) {
    j = {
        {"width", config.width},
        {"height", config.height},
        {"colors", config.colors},
        {"offset_x", config.offset_x},
        {"offset_y", config.offset_y},
        {"tilt", config.tilt},
        {"ratio_x", config.ratio_x},
        {"ratio_y", config.ratio_y}
    };
    write_shape(j, config.shape);
}

inline void from_json(const nlohmann::json& j, PatternConfig& config) {
    config.width = j.value("width", 100);
    config.height = j.value("height", 100);
    if (j.contains("colors")) {
        config.colors = j["colors"].get<std::vector<std::string>>();
    } else {
        std::string key = j.value("palette", "pastelGarden");
        if (!has_palette(key)) {
            logging::get_logger()->warn("Unknown palette '{}', using pastelGarden", key);
        }
        config.colors = get_palette(key).colors;
    }
    config.offset_x = j.value("offset_x", 0.0);
    config.offset_y = j.value("offset_y", 0.0);
    config.tilt = j.value("tilt", 0.0);
    config.ratio_x = j.value("ratio_x", 1.0);
    config.ratio_y = j.value("ratio_y", 1.0);
    config.shape = read_shape(j);
}

// GenerateOptions serialization
inline void to_json(nlohmann::json& j, const GenerateOptions& options) {
    j = {
        {"num_threads", options.num_threads}
    };
}

inline void from_json(const nlohmann::json& j, GenerateOptions& options) {
    options.num_threads = j.value("num_threads", 0);
}

// CanvasType serialization
inline void to_json(nlohmann::json& j, const CanvasType& canvas) {
    j = {
        {"id", canvas.id},
        {"name", canvas.name},
        {"cm_per_stitch", canvas.cm_per_stitch}
    };
}

// Palette serialization
inline void to_json(nlohmann::json& j, const Palette& palette) {
    j = {
        {"key", palette.key},
        {"name", palette.name},
        {"colors", palette.colors}
    };
}

}  // namespace xstitch

#endif // XSTITCH_SERIALIZATION_CONFIG_JSON_HPP
