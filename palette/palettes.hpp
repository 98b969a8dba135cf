#ifndef XSTITCH_PALETTE_PALETTES_HPP
#define XSTITCH_PALETTE_PALETTES_HPP

#include <pattern/pattern.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace xstitch {

// Named set of harmonious thread colors
struct Palette {
    std::string key;
    std::string name;
    std::vector<std::string> colors;
};

// Built-in palettes, in display order
const std::vector<Palette>& builtin_palettes();

// Palette with the given key; unknown keys fall back to pastelGarden
const Palette& get_palette(std::string_view key);

// True if `key` names a built-in palette
bool has_palette(std::string_view key);

// Deterministic pick for a seed
const Palette& random_palette(uint32_t seed);

// Cycle or truncate `colors` to exactly `count` entries, the way the
// editor keeps one color per layer. An empty list stays empty.
std::vector<std::string> fit_colors(const std::vector<std::string>& colors,
                                    std::size_t count);

// Generate `config`, then refit the palette to the resolved layer count
// and regenerate when the two differ. Shapes that report no layer count
// keep their palette.
Pattern generate_fitted(PatternConfig config, const GenerateOptions& options = {});

}  // namespace xstitch

#endif // XSTITCH_PALETTE_PALETTES_HPP
