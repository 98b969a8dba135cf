#include "pattern.hpp"
#include "grid_builder.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace xstitch {

Pattern Pattern::generate(const PatternConfig& config, const GenerateOptions& options) {
    return GridBuilder(config, options).build();
}

Pattern::Pattern(PatternConfig config, const std::vector<int>& levels,
                 std::optional<int> resolved_layer_count)
    : config_(std::move(config)),
      resolved_layer_count_(resolved_layer_count) {
    validate(config_);

    size_t expected = static_cast<size_t>(config_.width) * config_.height;
    if (levels.size() != expected) {
        throw std::runtime_error("Pattern has " + std::to_string(levels.size()) +
                                 " cells, expected " + std::to_string(expected));
    }

    cells_.reserve(expected);
    for (int level : levels) {
        if (level < 0 || static_cast<size_t>(level) >= config_.colors.size()) {
            throw std::runtime_error("Cell level " + std::to_string(level) +
                                     " outside the palette");
        }
        cells_.push_back({config_.colors[level], level});
    }
}

const Cell& Pattern::at(int x, int y) const {
    if (x < 0 || y < 0 || x >= width() || y >= height()) {
        throw std::out_of_range("Cell (" + std::to_string(x) + ", " +
                                std::to_string(y) + ") outside the grid");
    }
    return cells_[static_cast<size_t>(y) * width() + x];
}

std::optional<int> Pattern::resolved_sides() const {
    if (const auto* polygons = std::get_if<shape::Polygons>(&config_.shape)) {
        return clamped_sides(*polygons);
    }
    return std::nullopt;
}

char level_symbol(int level) {
    static constexpr char symbols[] =
        "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    if (level < 0 || level >= static_cast<int>(sizeof(symbols) - 1)) {
        return '?';
    }
    return symbols[level];
}

std::string Pattern::to_text() const {
    std::ostringstream ss;
    for (int y = 0; y < height(); ++y) {
        for (int x = 0; x < width(); ++x) {
            ss << level_symbol(at(x, y).level);
        }
        ss << "\n";
    }
    return ss.str();
}

ColorHistogram color_histogram(const Pattern& pattern) {
    ColorHistogram counts;
    for (const auto& cell : pattern.cells()) {
        ++counts[cell.color];
    }
    return counts;
}

}  // namespace xstitch
