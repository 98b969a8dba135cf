#include "palettes.hpp"
#include "logging.hpp"
#include <random>

namespace xstitch {

const std::vector<Palette>& builtin_palettes() {
    static const std::vector<Palette> palettes = {
        {"earthTones", "Earth Tones",
         {"#8B7355", "#A0826D", "#C9B299", "#E8D5C4", "#F5EBE0"}},
        {"pastelGarden", "Pastel Garden",
         {"#E8B4B8", "#F4D1AE", "#F9EAC2", "#C8E3D4", "#B4D4E1"}},
        {"autumnLeaves", "Autumn Leaves",
         {"#8B4513", "#CD853F", "#DAA520", "#D2691E", "#A0522D"}},
        {"oceanBreeze", "Ocean Breeze",
         {"#4A90A4", "#5FB3B3", "#8ECAE6", "#A8DADC", "#C1E7E3"}},
        {"lavenderFields", "Lavender Fields",
         {"#9D84B7", "#B8A4C9", "#D4C5E2", "#E8DFF5", "#F5F0FA"}},
        {"sunsetBlush", "Sunset Blush",
         {"#E07A5F", "#F2A490", "#F4C2B8", "#F9DCC4", "#FEF0E7"}},
        {"forestMoss", "Forest Moss",
         {"#3D5A40", "#5F7A61", "#8B9D83", "#B8C5B4", "#D8E2DC"}},
        {"berrySweet", "Berry Sweet",
         {"#A4508B", "#C97C9D", "#E5A4B4", "#F4C2C2", "#FFE5EC"}},
        {"vintageTea", "Vintage Tea",
         {"#9B6B4F", "#B8927D", "#D4B5A0", "#E8D5C4", "#F5EBE0"}},
        {"mintChocolate", "Mint Chocolate",
         {"#4A5240", "#6B7F5E", "#A8C69F", "#C8E6C9", "#E8F5E9"}},
    };
    return palettes;
}

bool has_palette(std::string_view key) {
    for (const auto& palette : builtin_palettes()) {
        if (palette.key == key) {
            return true;
        }
    }
    return false;
}

const Palette& get_palette(std::string_view key) {
    const auto& palettes = builtin_palettes();
    for (const auto& palette : palettes) {
        if (palette.key == key) {
            return palette;
        }
    }
    return palettes[1];  // pastelGarden
}

const Palette& random_palette(uint32_t seed) {
    const auto& palettes = builtin_palettes();
    std::mt19937 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, palettes.size() - 1);
    return palettes[pick(rng)];
}

std::vector<std::string> fit_colors(const std::vector<std::string>& colors,
                                    std::size_t count) {
    if (colors.empty()) {
        return {};
    }

    std::vector<std::string> fitted;
    fitted.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        fitted.push_back(colors[i % colors.size()]);
    }
    return fitted;
}

Pattern generate_fitted(PatternConfig config, const GenerateOptions& options) {
    Pattern pattern = Pattern::generate(config, options);

    auto layers = pattern.resolved_layer_count();
    if (!layers || config.colors.size() == static_cast<size_t>(*layers)) {
        return pattern;
    }

    logging::get_logger()->debug("Fitting palette of {} colors to {} layers",
                                 config.colors.size(), *layers);
    config.colors = fit_colors(config.colors, static_cast<size_t>(*layers));
    return Pattern::generate(config, options);
}

}  // namespace xstitch
