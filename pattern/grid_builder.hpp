#ifndef XSTITCH_GRID_BUILDER_HPP
#define XSTITCH_GRID_BUILDER_HPP

#include "pattern.hpp"
#include "coordinate_transform.hpp"
#include "distance_metric.hpp"
#include "level_classifier.hpp"
#include "hex_classifier.hpp"
#include <vector>

namespace xstitch {

// Builds a Pattern from a validated configuration. Shared quantities
// (center, tilt, bounds) are computed once; every cell is then classified
// independently, rows in parallel where OpenMP is available.
class GridBuilder {
public:
    GridBuilder(const PatternConfig& config, const GenerateOptions& options);

    Pattern build();

private:
    const PatternConfig& config_;
    GenerateOptions options_;
    CoordinateTransform transform_;

    // Each returns the row-major color slot of every cell
    std::vector<int> build_concentric(Pattern& pattern, const RadialMetric& metric,
                                      const SizeSpec& size);
    std::vector<int> build_stripes(const shape::Stripes& stripes);
    std::vector<int> build_cubes(const shape::IsometricCubes& cubes);

    int thread_count() const;
};

}  // namespace xstitch

#endif // XSTITCH_GRID_BUILDER_HPP
