#include "coordinate_transform.hpp"
#include <cmath>
#include <numbers>

namespace xstitch {

double degrees_to_radians(double degrees) {
    return (degrees * std::numbers::pi) / 180.0;
}

CoordinateTransform::CoordinateTransform(const PatternConfig& config)
    : center_((config.width - 1) / 2.0 + config.offset_x,
              (config.height - 1) / 2.0 + config.offset_y),
      ratio_x_(config.ratio_x),
      ratio_y_(config.ratio_y) {
    double tilt = degrees_to_radians(config.tilt);
    cos_tilt_ = std::cos(tilt);
    sin_tilt_ = std::sin(tilt);
}

Vec2 CoordinateTransform::relative(int x, int y) const {
    return {x - center_.x, y - center_.y};
}

Vec2 CoordinateTransform::to_pattern_frame(int x, int y, Nudge nudge) const {
    Vec2 d = relative(x, y);
    double rx = d.x * cos_tilt_ + d.y * sin_tilt_;
    double ry = -d.x * sin_tilt_ + d.y * cos_tilt_;

    switch (nudge) {
        case Nudge::Signed:
            rx += TIE_BREAK_EPSILON;
            ry += TIE_BREAK_EPSILON;
            break;
        case Nudge::Magnitude:
            rx = std::abs(rx) + TIE_BREAK_EPSILON;
            ry = std::abs(ry) + TIE_BREAK_EPSILON;
            break;
        case Nudge::None:
            break;
    }

    return {rx / ratio_x_, ry / ratio_y_};
}

double CoordinateTransform::project(int x, int y) const {
    Vec2 d = relative(x, y);
    return d.x * cos_tilt_ + d.y * sin_tilt_ + TIE_BREAK_EPSILON;
}

}  // namespace xstitch
