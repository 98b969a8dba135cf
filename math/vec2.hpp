#ifndef XSTITCH_MATH_VEC2_HPP
#define XSTITCH_MATH_VEC2_HPP

#include <cmath>

namespace xstitch {

// Point or offset in grid space, in cell units
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y;
    }

    // Magnitude
    double length() const {
        return std::sqrt(length_squared());
    }

    // Polar angle in radians, in (-pi, pi]
    double angle() const {
        return std::atan2(y, x);
    }
};

}  // namespace xstitch

#endif // XSTITCH_MATH_VEC2_HPP
