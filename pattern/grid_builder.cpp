#include "grid_builder.hpp"
#include "logging.hpp"
#include <type_traits>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace xstitch {

namespace {

// Grids smaller than this are classified on the calling thread
constexpr long PARALLEL_CELL_THRESHOLD = 4096;

// Color slot of every cell, row-major. `classify(x, y)` must be safe to
// call concurrently and must not throw; only the pre-sized slot buffer is
// written inside the parallel region.
template <typename Classify>
std::vector<int> classify_cells(int width, int height, int threads,
                                const Classify& classify) {
    std::vector<int> slots(static_cast<size_t>(width) * height);
    long cell_count = static_cast<long>(width) * height;

    #pragma omp parallel for schedule(static) num_threads(threads) \
        if(cell_count > PARALLEL_CELL_THRESHOLD)
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            slots[static_cast<size_t>(y) * width + x] = static_cast<int>(classify(x, y));
        }
    }
    return slots;
}

}  // namespace

GridBuilder::GridBuilder(const PatternConfig& config, const GenerateOptions& options)
    : config_(config), options_(options), transform_(config) {}

int GridBuilder::thread_count() const {
    #ifdef _OPENMP
    return (options_.num_threads > 0) ? options_.num_threads : omp_get_max_threads();
    #else
    return 1;
    #endif
}

Pattern GridBuilder::build() {
    auto log = xstitch::logging::get_logger();

    validate(config_);

    Pattern pattern;
    pattern.config_ = config_;

    std::vector<int> slots = std::visit([&](auto&& params) {
        using T = std::decay_t<decltype(params)>;
        if constexpr (std::is_same_v<T, shape::Rectangles>) {
            return build_concentric(pattern, ChebyshevMetric{}, params.size);
        } else if constexpr (std::is_same_v<T, shape::Circles>) {
            return build_concentric(pattern, EuclideanMetric{}, params.size);
        } else if constexpr (std::is_same_v<T, shape::Polygons>) {
            return build_concentric(pattern, PolygonMetric(params.num_sides), params.size);
        } else if constexpr (std::is_same_v<T, shape::Stripes>) {
            return build_stripes(params);
        } else if constexpr (std::is_same_v<T, shape::IsometricCubes>) {
            return build_cubes(params);
        }
    }, config_.shape);

    // Colors are resolved after the parallel region
    const auto& colors = config_.colors;
    pattern.cells_.reserve(slots.size());
    for (int slot : slots) {
        pattern.cells_.push_back(Cell{colors[slot], slot});
    }

    log->debug("Generated {}x{} {} pattern ({} colors, {} threads)",
               config_.width, config_.height, shape_name(config_.shape),
               config_.colors.size(), thread_count());

    return pattern;
}

std::vector<int> GridBuilder::build_concentric(Pattern& pattern, const RadialMetric& metric,
                                               const SizeSpec& size) {
    auto log = xstitch::logging::get_logger();

    // Needed in thickness mode too, to report the total layer count
    double max_distance = estimate_max_distance(metric, transform_,
                                                config_.width, config_.height);
    LevelClassifier classifier(size, max_distance);
    pattern.resolved_layer_count_ = classifier.resolved_layer_count();

    log->debug("Concentric bounds: max distance {}, {} layers",
               max_distance, classifier.resolved_layer_count());

    size_t color_count = config_.colors.size();
    return classify_cells(config_.width, config_.height, thread_count(),
        [&](int x, int y) {
            double layer = classifier.layer(cell_distance(metric, transform_, x, y));
            return LevelClassifier::color_slot(layer, color_count);
        });
}

std::vector<int> GridBuilder::build_stripes(const shape::Stripes& stripes) {
    StripeMetric metric(stripes.stripe_width);

    size_t color_count = config_.colors.size();
    return classify_cells(config_.width, config_.height, thread_count(),
        [&](int x, int y) {
            double stripe = metric.stripe_index(transform_.project(x, y));
            return StripeMetric::color_slot(stripe, color_count);
        });
}

std::vector<int> GridBuilder::build_cubes(const shape::IsometricCubes& cubes) {
    HexGridClassifier classifier(cubes.cube_size);

    // Top, right and left faces take the first three colors; short
    // palettes repeat
    size_t color_count = config_.colors.size();
    return classify_cells(config_.width, config_.height, thread_count(),
        [&](int x, int y) {
            HexSample sample = classifier.classify(transform_.relative(x, y));
            return static_cast<size_t>(sample.face) % color_count;
        });
}

}  // namespace xstitch
