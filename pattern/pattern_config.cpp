#include "pattern_config.hpp"
#include <algorithm>
#include <cmath>
#include <type_traits>

namespace xstitch {

namespace {

void require_finite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw InvalidConfiguration(std::string(name) + " must be a finite number");
    }
}

void validate_size(const SizeSpec& size) {
    if (const auto* thickness = std::get_if<LayerThickness>(&size)) {
        require_finite(thickness->thickness, "layer_thickness");
        if (thickness->thickness <= 0.0) {
            throw InvalidConfiguration("layer_thickness must be positive");
        }
    }
    // A non-positive layer count is clamped, not rejected
}

}  // namespace

void validate(const PatternConfig& config) {
    if (config.width <= 0 || config.height <= 0) {
        throw InvalidConfiguration("Grid dimensions must be positive, got " +
                                   std::to_string(config.width) + "x" +
                                   std::to_string(config.height));
    }
    if (config.colors.empty()) {
        throw InvalidConfiguration("Color palette must not be empty");
    }

    require_finite(config.offset_x, "offset_x");
    require_finite(config.offset_y, "offset_y");
    require_finite(config.tilt, "tilt");
    require_finite(config.ratio_x, "ratio_x");
    require_finite(config.ratio_y, "ratio_y");

    if (config.ratio_x <= 0.0 || config.ratio_y <= 0.0) {
        throw InvalidConfiguration("Axis ratios must be positive");
    }

    std::visit([&](auto&& params) {
        using T = std::decay_t<decltype(params)>;
        if constexpr (std::is_same_v<T, shape::Stripes>) {
            require_finite(params.stripe_width, "stripe_width");
            if (params.stripe_width <= 0.0) {
                throw InvalidConfiguration("stripe_width must be positive");
            }
            // Band indices across the whole grid must stay finite
            double extent = config.width + config.height +
                            std::abs(config.offset_x) + std::abs(config.offset_y);
            if (!std::isfinite(extent / params.stripe_width)) {
                throw InvalidConfiguration("stripe_width is too small for the grid");
            }
        } else if constexpr (std::is_same_v<T, shape::IsometricCubes>) {
            require_finite(params.cube_size, "cube_size");
        } else {
            validate_size(params.size);
        }
    }, config.shape);
}

std::string_view shape_name(const ShapeParams& params) {
    return std::visit([](auto&& alternative) -> std::string_view {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, shape::Rectangles>) return "rectangles";
        else if constexpr (std::is_same_v<T, shape::Circles>) return "circles";
        else if constexpr (std::is_same_v<T, shape::Polygons>) return "polygons";
        else if constexpr (std::is_same_v<T, shape::Stripes>) return "stripes";
        else if constexpr (std::is_same_v<T, shape::IsometricCubes>) return "isometric_cubes";
    }, params);
}

int clamped_layer_count(const LayerCount& size) {
    return std::max(1, size.count);
}

int clamped_sides(const shape::Polygons& polygons) {
    return std::max(3, polygons.num_sides);
}

}  // namespace xstitch
