#include "hex_classifier.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace xstitch {

double round_half_up(double value) {
    double whole = std::floor(value);
    return (value - whole >= 0.5) ? whole + 1.0 : whole;
}

HexGridClassifier::HexGridClassifier(double cube_size)
    : hex_radius_(std::max(MIN_HEX_RADIUS, cube_size)) {}

CubeCoord HexGridClassifier::round_cube(double q, double r) {
    double s = -q - r;

    double rq = round_half_up(q);
    double rr = round_half_up(r);
    double rs = round_half_up(s);

    double q_diff = std::abs(rq - q);
    double r_diff = std::abs(rr - r);
    double s_diff = std::abs(rs - s);

    if (q_diff > r_diff && q_diff > s_diff) {
        rq = -rr - rs;
    } else if (r_diff > s_diff) {
        rr = -rq - rs;
    } else {
        rs = -rq - rr;
    }

    return {static_cast<int>(rq), static_cast<int>(rr), static_cast<int>(rs)};
}

CubeFace HexGridClassifier::face_for_angle(double degrees) {
    if (degrees >= -150.0 && degrees < -30.0) {
        return CubeFace::Top;
    }
    if (degrees >= -30.0 && degrees < 90.0) {
        return CubeFace::Right;
    }
    return CubeFace::Left;
}

HexSample HexGridClassifier::classify(const Vec2& offset) const {
    const double sqrt3 = std::sqrt(3.0);

    // Pixel to fractional axial coordinates
    double q = (sqrt3 / 3.0 * offset.x - 1.0 / 3.0 * offset.y) / hex_radius_;
    double r = (2.0 / 3.0 * offset.y) / hex_radius_;

    HexSample sample;
    sample.hex = round_cube(q, r);

    // Axial back to pixel space
    sample.hex_center = {
        hex_radius_ * sqrt3 * (sample.hex.q + sample.hex.r / 2.0),
        hex_radius_ * 3.0 / 2.0 * sample.hex.r
    };

    sample.angle_degrees = (offset - sample.hex_center).angle() * 180.0 / std::numbers::pi;
    sample.face = face_for_angle(sample.angle_degrees);
    return sample;
}

}  // namespace xstitch
