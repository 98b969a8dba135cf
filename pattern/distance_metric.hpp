#ifndef XSTITCH_DISTANCE_METRIC_HPP
#define XSTITCH_DISTANCE_METRIC_HPP

#include "coordinate_transform.hpp"
#include <cstddef>
#include <variant>

namespace xstitch {

// Nested squares/rectangles: max(|x|, |y|)
struct ChebyshevMetric {
    static constexpr Nudge cell_nudge = Nudge::Magnitude;
    static constexpr Nudge corner_nudge = Nudge::Magnitude;

    double operator()(const Vec2& p) const;
};

// Nested circles/ellipses: sqrt(x^2 + y^2)
struct EuclideanMetric {
    static constexpr Nudge cell_nudge = Nudge::Signed;
    static constexpr Nudge corner_nudge = Nudge::None;

    double operator()(const Vec2& p) const;
};

// Nested regular polygons. The polar angle is folded into one sector of
// width 2*pi/sides and the radius projected onto that sector's bisector,
// giving flat edges with a vertex at angle 0.
class PolygonMetric {
public:
    static constexpr Nudge cell_nudge = Nudge::Signed;
    static constexpr Nudge corner_nudge = Nudge::None;

    explicit PolygonMetric(int sides);

    double operator()(const Vec2& p) const;

    int sides() const { return sides_; }
    double angle_step() const { return angle_step_; }

private:
    int sides_;
    double angle_step_;
};

// Metrics of the concentric shape families
using RadialMetric = std::variant<ChebyshevMetric, EuclideanMetric, PolygonMetric>;

// Distance of cell (x, y) under the given metric
double cell_distance(const RadialMetric& metric, const CoordinateTransform& transform,
                     int x, int y);

// Distance of a grid corner, as sampled by the bounds estimator
double corner_distance(const RadialMetric& metric, const CoordinateTransform& transform,
                       int x, int y);

// Parallel bands perpendicular to the rotated x axis
class StripeMetric {
public:
    explicit StripeMetric(double stripe_width) : stripe_width_(stripe_width) {}

    // Band index of a projected coordinate, as a whole number; negative
    // left of the center
    double stripe_index(double projection) const;

    // Color slot of a band, in [0, color_count) for negative bands too
    static std::size_t color_slot(double stripe, std::size_t color_count);

private:
    double stripe_width_;
};

// Remainder with the sign of the divisor
double positive_fmod(double value, double modulus);

}  // namespace xstitch

#endif // XSTITCH_DISTANCE_METRIC_HPP
