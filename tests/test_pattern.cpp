#include <gtest/gtest.h>
#include "pattern.hpp"
#include "hex_classifier.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <cstdlib>
#include <set>

using namespace xstitch;
using namespace xstitch::test;

// ============================================
// Concrete scenarios
// ============================================

TEST(PatternTest, RectanglesCenterAndRing) {
    Pattern pattern = Pattern::generate(
        make_config(3, 3, {"red", "blue"}, shape::Rectangles{LayerCount{2}}));

    ASSERT_EQ(pattern.width(), 3);
    ASSERT_EQ(pattern.height(), 3);
    ASSERT_EQ(pattern.cells().size(), 9u);
    EXPECT_EQ(pattern.resolved_layer_count(), 2);

    EXPECT_EQ(pattern.at(1, 1).level, 0);
    EXPECT_EQ(pattern.at(1, 1).color, "red");

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 3; ++x) {
            if (x == 1 && y == 1) continue;
            EXPECT_EQ(pattern.at(x, y).level, 1) << "at (" << x << ", " << y << ")";
            EXPECT_EQ(pattern.at(x, y).color, "blue") << "at (" << x << ", " << y << ")";
        }
    }
}

TEST(PatternTest, StripesSplitAtCenter) {
    Pattern pattern = Pattern::generate(
        make_config(4, 1, {"a", "b"}, shape::Stripes{2.0}));

    EXPECT_EQ(pattern.at(0, 0).color, pattern.at(1, 0).color);
    EXPECT_EQ(pattern.at(2, 0).color, pattern.at(3, 0).color);
    EXPECT_NE(pattern.at(1, 0).color, pattern.at(2, 0).color);

    // Left of the center is stripe -1, which wraps to the last color
    EXPECT_EQ(pattern.at(0, 0).color, "b");
    EXPECT_EQ(pattern.at(3, 0).color, "a");
    EXPECT_FALSE(pattern.resolved_layer_count().has_value());
}

TEST(PatternTest, ThicknessModeDerivesLayerCount) {
    // Center (15, 20): every corner is exactly 25 cells away
    Pattern pattern = Pattern::generate(
        make_config(31, 41, five_colors(), shape::Circles{LayerThickness{10.0}}));

    EXPECT_EQ(pattern.resolved_layer_count(), 3);
    EXPECT_EQ(pattern.at(15, 20).level, 0);
    EXPECT_EQ(pattern.at(15, 26).level, 1);

    // The nudge pulls the corner just inside 25, below the 3rd boundary
    EXPECT_EQ(pattern.at(0, 0).level, 2);
}

TEST(PatternTest, CountModeEchoesLayerCount) {
    Pattern pattern = Pattern::generate(
        make_config(20, 20, five_colors(), shape::Polygons{LayerCount{7}, 5}));
    EXPECT_EQ(pattern.resolved_layer_count(), 7);
    EXPECT_EQ(pattern.resolved_sides(), 5);
}

// ============================================
// Properties over every shape family
// ============================================

TEST(PatternTest, GenerationIsDeterministic) {
    for (const auto& config : sample_configs()) {
        Pattern first = Pattern::generate(config);
        Pattern second = Pattern::generate(config);
        EXPECT_EQ(first.cells(), second.cells()) << shape_name(config.shape);
        EXPECT_EQ(first.resolved_layer_count(), second.resolved_layer_count());
    }
}

TEST(PatternTest, LevelsStayInsidePalette) {
    for (auto config : sample_configs()) {
        for (size_t color_count : {1u, 2u, 3u, 5u}) {
            config.colors = five_colors();
            config.colors.resize(color_count);
            Pattern pattern = Pattern::generate(config);

            ASSERT_EQ(pattern.cells().size(),
                      static_cast<size_t>(config.width) * config.height);
            for (const auto& cell : pattern.cells()) {
                ASSERT_GE(cell.level, 0) << shape_name(config.shape);
                ASSERT_LT(cell.level, static_cast<int>(color_count)) << shape_name(config.shape);
                EXPECT_EQ(cell.color, config.colors[cell.level]);
            }
        }
    }
}

TEST(PatternTest, CornersReachOutermostLayer) {
    std::vector<ShapeParams> shapes = {
        shape::Rectangles{LayerCount{4}},
        shape::Circles{LayerCount{5}},
        shape::Polygons{LayerCount{3}, 6},
        shape::Polygons{LayerCount{5}, 3}
    };

    for (const auto& params : shapes) {
        PatternConfig config = make_config(29, 19, five_colors(), params);
        config.tilt = 20.0;
        config.offset_x = 1.5;
        config.ratio_y = 1.25;
        Pattern pattern = Pattern::generate(config);
        int outermost = *pattern.resolved_layer_count() - 1;

        int corner_max = std::max({
            pattern.at(0, 0).level,
            pattern.at(config.width - 1, 0).level,
            pattern.at(0, config.height - 1).level,
            pattern.at(config.width - 1, config.height - 1).level
        });
        EXPECT_EQ(corner_max, outermost) << shape_name(params);

        for (const auto& cell : pattern.cells()) {
            EXPECT_LE(cell.level, outermost);
        }
    }
}

TEST(PatternTest, FewerColorsThanLayersCycles) {
    Pattern pattern = Pattern::generate(
        make_config(9, 9, {"x", "y"}, shape::Rectangles{LayerCount{4}}));

    // One ring per layer; layers 0..3 map onto two colors
    std::set<int> levels;
    for (const auto& cell : pattern.cells()) {
        levels.insert(cell.level);
    }
    EXPECT_EQ(levels, (std::set<int>{0, 1}));
    EXPECT_EQ(pattern.at(0, 0).level, 3 % 2);
}

TEST(PatternTest, FullTurnTiltIsIdentity) {
    for (auto config : sample_configs()) {
        config.tilt = 0.0;
        Pattern upright = Pattern::generate(config);
        config.tilt = 360.0;
        Pattern turned = Pattern::generate(config);
        EXPECT_EQ(levels_of(upright), levels_of(turned)) << shape_name(config.shape);
    }
}

TEST(PatternTest, StripeColorsRepeatAcrossCenter) {
    // Center at x = 7: stripe index is x - 7, so negative stripes lie left
    Pattern pattern = Pattern::generate(
        make_config(15, 1, {"a", "b", "c"}, shape::Stripes{1.0}));

    for (int x = 0; x < 15; ++x) {
        int stripe = x - 7;
        int expected = ((stripe % 3) + 3) % 3;
        EXPECT_EQ(pattern.at(x, 0).level, expected) << "x=" << x;
    }
    for (int x = 0; x + 3 < 15; ++x) {
        EXPECT_EQ(pattern.at(x, 0).level, pattern.at(x + 3, 0).level);
    }
}

TEST(PatternTest, RatiosStretchContours) {
    PatternConfig config = make_config(21, 21, five_colors(), shape::Circles{LayerThickness{1.0}});
    config.ratio_x = 2.0;
    Pattern pattern = Pattern::generate(config);

    // Four cells along x match two cells along y
    EXPECT_EQ(pattern.at(14, 10).level, 2);
    EXPECT_EQ(pattern.at(10, 12).level, 2);
}

// ============================================
// Isometric cubes
// ============================================

TEST(PatternTest, CubesUseThreeFaceColors) {
    Pattern pattern = Pattern::generate(
        make_config(40, 40, {"light", "medium", "dark", "unused"}, shape::IsometricCubes{5.0}));

    std::set<std::string> colors;
    for (const auto& cell : pattern.cells()) {
        colors.insert(cell.color);
        EXPECT_LT(cell.level, 3);
    }
    EXPECT_EQ(colors, (std::set<std::string>{"light", "medium", "dark"}));
}

TEST(PatternTest, CubesCenterCellIsRightFace) {
    Pattern pattern = Pattern::generate(
        make_config(3, 3, {"top", "right", "left"}, shape::IsometricCubes{5.0}));
    EXPECT_EQ(pattern.at(1, 1).color, "right");
    EXPECT_EQ(pattern.at(1, 1).level, static_cast<int>(CubeFace::Right));
}

TEST(PatternTest, CubesWithShortPaletteRepeatColors) {
    Pattern single = Pattern::generate(
        make_config(30, 30, {"only"}, shape::IsometricCubes{4.0}));
    for (const auto& cell : single.cells()) {
        EXPECT_EQ(cell.color, "only");
        EXPECT_EQ(cell.level, 0);
    }

    // The left face wraps onto the first color
    Pattern pair = Pattern::generate(
        make_config(30, 30, {"a", "b"}, shape::IsometricCubes{4.0}));
    for (const auto& cell : pair.cells()) {
        EXPECT_EQ(cell.color, cell.level == 0 ? "a" : "b");
    }
}

TEST(PatternTest, CubesIgnoreTiltAndRatios) {
    PatternConfig config = make_config(25, 25, {"a", "b", "c"}, shape::IsometricCubes{4.0});
    Pattern plain = Pattern::generate(config);

    config.tilt = 45.0;
    config.ratio_x = 3.0;
    Pattern tilted = Pattern::generate(config);
    EXPECT_EQ(plain.cells(), tilted.cells());
}

// ============================================
// Degenerate input
// ============================================

TEST(PatternTest, SingleCellGrid) {
    Pattern circles = Pattern::generate(
        make_config(1, 1, {"a", "b", "c"}, shape::Circles{LayerCount{3}}));
    EXPECT_EQ(circles.at(0, 0).level, 0);

    Pattern rectangles = Pattern::generate(
        make_config(1, 1, {"a", "b", "c"}, shape::Rectangles{LayerCount{3}}));
    EXPECT_EQ(rectangles.cells().size(), 1u);
    EXPECT_LT(rectangles.at(0, 0).level, 3);
}

TEST(PatternTest, NonPositiveLayerCountIsOneLayer) {
    Pattern pattern = Pattern::generate(
        make_config(10, 10, five_colors(), shape::Circles{LayerCount{0}}));
    EXPECT_EQ(pattern.resolved_layer_count(), 1);
    for (const auto& cell : pattern.cells()) {
        EXPECT_EQ(cell.level, 0);
    }
}

TEST(PatternTest, FewerThanThreeSidesActsAsTriangle) {
    Pattern two = Pattern::generate(
        make_config(15, 15, five_colors(), shape::Polygons{LayerCount{4}, 2}));
    Pattern three = Pattern::generate(
        make_config(15, 15, five_colors(), shape::Polygons{LayerCount{4}, 3}));

    EXPECT_EQ(two.resolved_sides(), 3);
    EXPECT_EQ(two.cells(), three.cells());
}

TEST(PatternTest, InvalidConfigurationIsRejected) {
    EXPECT_THROW(Pattern::generate(make_config(5, 5, {}, shape::Rectangles{})),
                 InvalidConfiguration);
    EXPECT_THROW(Pattern::generate(make_config(0, 5, {"a"}, shape::Rectangles{})),
                 InvalidConfiguration);

    PatternConfig config = make_config(5, 5, {"a"}, shape::Circles{});
    config.ratio_y = 0.0;
    EXPECT_THROW(Pattern::generate(config), InvalidConfiguration);
}

TEST(PatternTest, ThinLayersKeepCyclingColors) {
    // 50 cells from center to edge, a million layers per cell
    Pattern pattern = Pattern::generate(
        make_config(101, 1, {"a", "b", "c"}, shape::Rectangles{LayerThickness{1e-6}}));

    EXPECT_EQ(pattern.resolved_layer_count(), 50000001);
    for (int x = 0; x < 101; ++x) {
        // Layer |x - 50| * 10^6, and 10^6 == 1 (mod 3)
        EXPECT_EQ(pattern.at(x, 0).level, std::abs(x - 50) % 3) << "x=" << x;
    }

    ColorHistogram histogram = color_histogram(pattern);
    EXPECT_EQ(histogram["a"], 33u);
    EXPECT_EQ(histogram["b"], 34u);
    EXPECT_EQ(histogram["c"], 34u);
}

TEST(PatternTest, LayerCountBeyondIntRangeIsRejected) {
    EXPECT_THROW(Pattern::generate(
                     make_config(101, 1, {"a", "b", "c"}, shape::Rectangles{LayerThickness{1e-9}})),
                 InvalidConfiguration);
}

TEST(PatternTest, NarrowStripesKeepCyclingColors) {
    // Band indices near 1e302 overflow every integer type
    Pattern pattern = Pattern::generate(
        make_config(101, 1, {"a", "b", "c"}, shape::Stripes{1e-300}));

    ColorHistogram histogram = color_histogram(pattern);
    EXPECT_EQ(histogram["a"], 33u);
    EXPECT_EQ(histogram["b"], 34u);
    EXPECT_EQ(histogram["c"], 34u);
    EXPECT_EQ(pattern.at(0, 0).color, "a");
    EXPECT_EQ(pattern.at(2, 0).color, "c");
    EXPECT_EQ(pattern.at(4, 0).color, "b");
}

// ============================================
// Parallel generation
// ============================================

TEST(PatternTest, ThreadCountDoesNotChangeResult) {
    PatternConfig config = make_config(120, 90, five_colors(), shape::Polygons{LayerCount{8}, 7});
    config.tilt = 12.0;

    Pattern sequential = Pattern::generate(config, GenerateOptions{.num_threads = 1});
    Pattern parallel = Pattern::generate(config, GenerateOptions{.num_threads = 4});
    EXPECT_EQ(sequential.cells(), parallel.cells());
}

// ============================================
// Accessors, preview and histogram
// ============================================

TEST(PatternTest, AtRejectsOutOfRange) {
    Pattern pattern = Pattern::generate(make_config(3, 2, {"a"}, shape::Rectangles{}));
    EXPECT_THROW(pattern.at(3, 0), std::out_of_range);
    EXPECT_THROW(pattern.at(0, 2), std::out_of_range);
    EXPECT_THROW(pattern.at(-1, 0), std::out_of_range);
}

TEST(PatternTest, TextPreview) {
    Pattern pattern = Pattern::generate(
        make_config(3, 3, {"red", "blue"}, shape::Rectangles{LayerCount{2}}));
    EXPECT_EQ(pattern.to_text(), "111\n101\n111\n");
}

TEST(PatternTest, LevelSymbols) {
    EXPECT_EQ(level_symbol(0), '0');
    EXPECT_EQ(level_symbol(10), 'a');
    EXPECT_EQ(level_symbol(36), 'A');
    EXPECT_EQ(level_symbol(61), 'Z');
    EXPECT_EQ(level_symbol(62), '?');
}

TEST(PatternTest, ColorHistogramCountsCells) {
    Pattern pattern = Pattern::generate(
        make_config(3, 3, {"red", "blue"}, shape::Rectangles{LayerCount{2}}));
    ColorHistogram histogram = color_histogram(pattern);

    EXPECT_EQ(histogram.size(), 2u);
    EXPECT_EQ(histogram["red"], 1u);
    EXPECT_EQ(histogram["blue"], 8u);
}

TEST(PatternTest, RebuildFromLevels) {
    PatternConfig config = make_config(2, 2, {"a", "b"}, shape::Stripes{1.0});
    Pattern pattern(config, {0, 1, 1, 0}, std::nullopt);

    EXPECT_EQ(pattern.at(1, 0).color, "b");
    EXPECT_EQ(pattern.at(1, 1).color, "a");

    EXPECT_THROW(Pattern(config, {0, 1, 1}, std::nullopt), std::runtime_error);
    EXPECT_THROW(Pattern(config, {0, 1, 2, 0}, std::nullopt), std::runtime_error);
    EXPECT_THROW(Pattern(make_config(2, 2, {}, shape::Stripes{1.0}), {0, 0, 0, 0}, std::nullopt),
                 InvalidConfiguration);
}
