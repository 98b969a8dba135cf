#ifndef XSTITCH_PATTERN_HPP
#define XSTITCH_PATTERN_HPP

#include "pattern_config.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace xstitch {

// One stitch of the grid. `level` is the color slot the cell's layer maps
// to, so colors[level] == color.
struct Cell {
    std::string color;
    int level = 0;

    bool operator==(const Cell& other) const = default;
};

// Tuning knobs that never change the produced grid
struct GenerateOptions {
    int num_threads = 0;  // 0 = OpenMP default, > 0 = use specific count
};

// Cell counts per color
using ColorHistogram = std::map<std::string, std::size_t>;

// Forward declaration
class GridBuilder;

// Generated pattern: a row-major width x height grid of cells together with
// the configuration that produced it
class Pattern {
public:
    friend class GridBuilder;

    // Classify every cell of the grid described by `config`.
    // Throws InvalidConfiguration before computing anything if the config
    // is rejected by validate().
    static Pattern generate(const PatternConfig& config,
                            const GenerateOptions& options = GenerateOptions{});

    // Rebuild a pattern from stored levels (one per cell, row-major).
    // Throws std::runtime_error if the levels do not fit the config.
    Pattern(PatternConfig config, const std::vector<int>& levels,
            std::optional<int> resolved_layer_count);

    int width() const { return config_.width; }
    int height() const { return config_.height; }
    const std::vector<std::string>& colors() const { return config_.colors; }
    const PatternConfig& config() const { return config_; }

    // Row-major cells
    const std::vector<Cell>& cells() const { return cells_; }
    const Cell& at(int x, int y) const;

    // Total layers covering the grid (concentric shapes only)
    std::optional<int> resolved_layer_count() const { return resolved_layer_count_; }

    // Effective number of sides (polygons only)
    std::optional<int> resolved_sides() const;

    // Text preview, one symbol per cell and one line per row
    std::string to_text() const;

private:
    Pattern() = default;

    PatternConfig config_;
    std::vector<Cell> cells_;
    std::optional<int> resolved_layer_count_;
};

// Count cells by color
ColorHistogram color_histogram(const Pattern& pattern);

// Preview symbol for a level: 0-9, a-z, A-Z, then '?'
char level_symbol(int level);

}  // namespace xstitch

#endif // XSTITCH_PATTERN_HPP
