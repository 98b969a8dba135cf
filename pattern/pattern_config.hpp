#ifndef XSTITCH_PATTERN_CONFIG_HPP
#define XSTITCH_PATTERN_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xstitch {

// Raised before any cell is computed when a configuration cannot be
// classified (empty palette, non-positive size or ratio, ...)
class InvalidConfiguration : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Sizing policies for concentric shapes
struct LayerCount { int count = 5; };               // Fixed number of layers
struct LayerThickness { double thickness = 10.0; }; // Fixed layer width in cells

using SizeSpec = std::variant<LayerCount, LayerThickness>;

namespace shape {

struct Rectangles { SizeSpec size = LayerCount{}; };
struct Circles { SizeSpec size = LayerCount{}; };
struct Polygons {
    SizeSpec size = LayerCount{};
    int num_sides = 5;   // Clamped to 3 when smaller
};
struct Stripes { double stripe_width = 5.0; };
struct IsometricCubes { double cube_size = 5.0; };  // Hexagon circumradius

}  // namespace shape

// One alternative per shape family, carrying only that family's parameters
using ShapeParams = std::variant<
    shape::Rectangles, shape::Circles, shape::Polygons,
    shape::Stripes, shape::IsometricCubes
>;

// Complete input for one generation call
struct PatternConfig {
    // Grid dimensions in cells
    int width = 100;
    int height = 100;

    // Palette, cycled by modulo
    std::vector<std::string> colors;

    // Shift of the pattern center from the grid midpoint, in cells
    double offset_x = 0.0;
    double offset_y = 0.0;

    // Rotation in degrees (ignored by isometric cubes)
    double tilt = 0.0;

    // Axis stretch applied after rotation (ignored by stripes and cubes)
    double ratio_x = 1.0;
    double ratio_y = 1.0;

    ShapeParams shape = shape::Rectangles{};
};

// Throws InvalidConfiguration if the config cannot be generated
void validate(const PatternConfig& config);

// Canonical shape names used in configuration files
std::string_view shape_name(const ShapeParams& params);

// Effective layer count in count mode (count clamped to 1)
int clamped_layer_count(const LayerCount& size);

// Effective number of polygon sides (clamped to 3)
int clamped_sides(const shape::Polygons& polygons);

}  // namespace xstitch

#endif // XSTITCH_PATTERN_CONFIG_HPP
