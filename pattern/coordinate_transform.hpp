#ifndef XSTITCH_COORDINATE_TRANSFORM_HPP
#define XSTITCH_COORDINATE_TRANSFORM_HPP

#include "pattern_config.hpp"
#include <math/vec2.hpp>

namespace xstitch {

// Nudge added to rotated coordinates so that cells lying exactly on a
// layer boundary always fall on the same side of it
constexpr double TIE_BREAK_EPSILON = 1e-10;

// How the tie-break nudge is applied to a rotated coordinate
enum class Nudge {
    None,       // Exact coordinates (corner sampling for round metrics)
    Signed,     // (r + eps) / ratio
    Magnitude   // (|r| + eps) / ratio, for metrics that only use magnitudes
};

// Maps integer cell positions into the pattern's own frame: centered on
// the (offset) grid midpoint, rotated by -tilt and divided by the axis ratios
class CoordinateTransform {
public:
    explicit CoordinateTransform(const PatternConfig& config);

    // Pattern center in grid coordinates
    const Vec2& center() const { return center_; }

    double cos_tilt() const { return cos_tilt_; }
    double sin_tilt() const { return sin_tilt_; }

    // Cell position relative to the center (no rotation, no scaling)
    Vec2 relative(int x, int y) const;

    // Full transform into the pattern frame
    Vec2 to_pattern_frame(int x, int y, Nudge nudge) const;

    // Signed distance along the rotated x axis, nudged; the stripe normal
    double project(int x, int y) const;

private:
    Vec2 center_;
    double cos_tilt_ = 1.0;
    double sin_tilt_ = 0.0;
    double ratio_x_ = 1.0;
    double ratio_y_ = 1.0;
};

// Degrees to radians, as used for the tilt
double degrees_to_radians(double degrees);

}  // namespace xstitch

#endif // XSTITCH_COORDINATE_TRANSFORM_HPP
