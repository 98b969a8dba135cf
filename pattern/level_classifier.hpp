#ifndef XSTITCH_LEVEL_CLASSIFIER_HPP
#define XSTITCH_LEVEL_CLASSIFIER_HPP

#include "pattern_config.hpp"
#include "distance_metric.hpp"
#include <cstddef>

namespace xstitch {

// Largest metric distance over the grid, sampled at the four corners.
// Valid for the concentric metrics, which never decrease moving away from
// the center along a grid axis.
double estimate_max_distance(const RadialMetric& metric,
                             const CoordinateTransform& transform,
                             int width, int height);

// Buckets distances into layers.
//
// Count mode divides [0, max_distance] into `count` equal bands; the
// outermost corner is clamped into the last band.
// Thickness mode centers layer 0 on the origin: its boundaries sit at
// +-thickness/2, the next one at 1.5 * thickness, and so on. A thickness
// so small that the grid needs more than INT_MAX layers is rejected with
// InvalidConfiguration.
//
// Layers stay whole numbers in double precision until they are folded
// into a color slot, so no cast ever sees an out-of-range value.
class LevelClassifier {
public:
    LevelClassifier(const SizeSpec& size, double max_distance);

    double layer(double distance) const;

    // Total layers covering the grid; derived in thickness mode
    int resolved_layer_count() const { return resolved_layer_count_; }

    // Color slot of a (non-negative, whole) layer
    static std::size_t color_slot(double layer, std::size_t color_count);

private:
    bool thickness_mode_ = false;
    int layer_count_ = 1;
    double thickness_ = 1.0;
    double max_distance_ = 0.0;
    int resolved_layer_count_ = 1;
};

}  // namespace xstitch

#endif // XSTITCH_LEVEL_CLASSIFIER_HPP
