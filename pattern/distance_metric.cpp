#include "distance_metric.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <type_traits>

namespace xstitch {

double positive_fmod(double value, double modulus) {
    return std::fmod(std::fmod(value, modulus) + modulus, modulus);
}

double ChebyshevMetric::operator()(const Vec2& p) const {
    return std::max(std::abs(p.x), std::abs(p.y));
}

double EuclideanMetric::operator()(const Vec2& p) const {
    return p.length();
}

PolygonMetric::PolygonMetric(int sides)
    : sides_(std::max(3, sides)),
      angle_step_((2.0 * std::numbers::pi) / sides_) {}

double PolygonMetric::operator()(const Vec2& p) const {
    double r = p.length();
    double folded = positive_fmod(p.angle(), angle_step_);
    return r * std::cos(folded - angle_step_ / 2.0);
}

double cell_distance(const RadialMetric& metric, const CoordinateTransform& transform,
                     int x, int y) {
    return std::visit([&](auto&& m) {
        using M = std::decay_t<decltype(m)>;
        return m(transform.to_pattern_frame(x, y, M::cell_nudge));
    }, metric);
}

double corner_distance(const RadialMetric& metric, const CoordinateTransform& transform,
                       int x, int y) {
    return std::visit([&](auto&& m) {
        using M = std::decay_t<decltype(m)>;
        return m(transform.to_pattern_frame(x, y, M::corner_nudge));
    }, metric);
}

double StripeMetric::stripe_index(double projection) const {
    return std::floor(projection / stripe_width_);
}

std::size_t StripeMetric::color_slot(double stripe, std::size_t color_count) {
    return static_cast<std::size_t>(positive_fmod(stripe, static_cast<double>(color_count)));
}

}  // namespace xstitch
