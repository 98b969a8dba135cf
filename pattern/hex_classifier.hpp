#ifndef XSTITCH_HEX_CLASSIFIER_HPP
#define XSTITCH_HEX_CLASSIFIER_HPP

#include <math/vec2.hpp>
#include <cstdint>

namespace xstitch {

// Smallest hexagon circumradius; smaller cubes alias on the cell grid
constexpr double MIN_HEX_RADIUS = 2.0;

// Integer cube coordinates of a hexagon; q + r + s == 0
struct CubeCoord {
    int q = 0;
    int r = 0;
    int s = 0;

    bool operator==(const CubeCoord& other) const = default;
};

// Visible face of a tumbling-blocks cube
enum class CubeFace : uint8_t {
    Top = 0,
    Right = 1,
    Left = 2
};

// Everything the classifier derives for one cell
struct HexSample {
    CubeCoord hex;          // Nearest hexagon
    Vec2 hex_center;        // Its center, relative to the pattern center
    double angle_degrees;   // Direction from hex_center to the cell
    CubeFace face;
};

// Isometric-cube classifier: finds the nearest center of a pointy-top
// hexagonal lattice and splits each hexagon into three 120-degree wedges
// (top, right, left faces).
class HexGridClassifier {
public:
    explicit HexGridClassifier(double cube_size);

    double hex_radius() const { return hex_radius_; }

    // Classify a cell given its offset from the pattern center
    HexSample classify(const Vec2& offset) const;

    // Round fractional axial coordinates to the nearest hexagon, repairing
    // the axis with the largest rounding error so q + r + s stays zero
    static CubeCoord round_cube(double q, double r);

    // Face for a direction in degrees, as returned by atan2:
    // [-150, -30) top, [-30, 90) right, everything else left
    static CubeFace face_for_angle(double degrees);

private:
    double hex_radius_;
};

// Round half toward positive infinity
double round_half_up(double value);

}  // namespace xstitch

#endif // XSTITCH_HEX_CLASSIFIER_HPP
