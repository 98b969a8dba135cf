#ifndef XSTITCH_SERIALIZATION_PATTERN_JSON_HPP
#define XSTITCH_SERIALIZATION_PATTERN_JSON_HPP

#include <nlohmann/json.hpp>
#include <pattern/pattern.hpp>
#include "config_json.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace xstitch {

// Pattern serialization. Levels are stored as one array per row; the
// generating config is embedded so the pattern can be rebuilt exactly.
inline nlohmann::json pattern_to_json(const Pattern& pattern) {
    nlohmann::json rows = nlohmann::json::array();
    for (int y = 0; y < pattern.height(); ++y) {
        nlohmann::json row = nlohmann::json::array();
        for (int x = 0; x < pattern.width(); ++x) {
            row.push_back(pattern.at(x, y).level);
        }
        rows.push_back(std::move(row));
    }

    nlohmann::json j;
    j["width"] = pattern.width();
    j["height"] = pattern.height();
    j["colors"] = pattern.colors();
    j["shape"] = std::string(shape_name(pattern.config().shape));
    if (auto layers = pattern.resolved_layer_count()) {
        j["resolved_layer_count"] = *layers;
    }
    if (auto sides = pattern.resolved_sides()) {
        j["resolved_sides"] = *sides;
    }
    j["config"] = pattern.config();
    j["levels"] = std::move(rows);
    return j;
}

// Pattern deserialization
inline Pattern pattern_from_json(const nlohmann::json& j) {
    if (!j.contains("config") || !j.contains("levels")) {
        throw std::runtime_error("Pattern data needs 'config' and 'levels'");
    }

    auto config = j["config"].get<PatternConfig>();

    std::vector<int> levels;
    levels.reserve(static_cast<size_t>(std::max(0, config.width)) *
                   static_cast<size_t>(std::max(0, config.height)));
    for (const auto& row : j["levels"]) {
        if (row.size() != static_cast<size_t>(config.width)) {
            throw std::runtime_error("Pattern row has " + std::to_string(row.size()) +
                                     " cells, expected " + std::to_string(config.width));
        }
        for (const auto& level : row) {
            levels.push_back(level.get<int>());
        }
    }

    std::optional<int> layers;
    if (j.contains("resolved_layer_count")) {
        layers = j["resolved_layer_count"].get<int>();
    }

    return Pattern(std::move(config), levels, layers);
}

// ColorHistogram serialization
inline nlohmann::json histogram_to_json(const ColorHistogram& histogram) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [color, count] : histogram) {
        j[color] = count;
    }
    return j;
}

}  // namespace xstitch

#endif // XSTITCH_SERIALIZATION_PATTERN_JSON_HPP
