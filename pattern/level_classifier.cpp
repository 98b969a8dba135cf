#include "level_classifier.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <string>

namespace xstitch {

double estimate_max_distance(const RadialMetric& metric,
                             const CoordinateTransform& transform,
                             int width, int height) {
    const std::array<std::array<int, 2>, 4> corners = {{
        {0, 0},
        {width - 1, 0},
        {0, height - 1},
        {width - 1, height - 1}
    }};

    double max_distance = 0.0;
    for (const auto& corner : corners) {
        max_distance = std::max(max_distance,
                                corner_distance(metric, transform, corner[0], corner[1]));
    }
    return max_distance;
}

LevelClassifier::LevelClassifier(const SizeSpec& size, double max_distance)
    : max_distance_(max_distance) {
    if (const auto* thickness = std::get_if<LayerThickness>(&size)) {
        thickness_mode_ = true;
        thickness_ = thickness->thickness;

        double layers = std::ceil((max_distance_ + thickness_ / 2.0) / thickness_);
        if (!(layers <= std::numeric_limits<int>::max())) {
            throw InvalidConfiguration("layer_thickness " + std::to_string(thickness_) +
                                       " needs more layers than supported for this grid");
        }
        resolved_layer_count_ = std::max(1, static_cast<int>(layers));
    } else {
        layer_count_ = clamped_layer_count(std::get<LayerCount>(size));
        resolved_layer_count_ = layer_count_;
    }
}

double LevelClassifier::layer(double distance) const {
    if (thickness_mode_) {
        return std::floor((distance + thickness_ / 2.0) / thickness_);
    }

    // Degenerate grids (every corner on the center) fall back to divisor 1
    double divisor = max_distance_ != 0.0 ? max_distance_ : 1.0;
    double layer = std::floor((distance / divisor) * layer_count_);
    return std::min(layer, static_cast<double>(layer_count_ - 1));
}

std::size_t LevelClassifier::color_slot(double layer, std::size_t color_count) {
    return static_cast<std::size_t>(std::fmod(layer, static_cast<double>(color_count)));
}

}  // namespace xstitch
