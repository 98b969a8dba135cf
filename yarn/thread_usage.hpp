#ifndef XSTITCH_YARN_THREAD_USAGE_HPP
#define XSTITCH_YARN_THREAD_USAGE_HPP

#include "canvas_type.hpp"
#include <pattern/pattern.hpp>
#include <map>
#include <string>

namespace xstitch {

constexpr double THREAD_PER_SKEIN_M = 8.0;   // Standard skein length
constexpr double CM_PER_METER = 100.0;
constexpr double YARDS_PER_METER = 1.09361;

// Thread needed for one color (or for the whole pattern)
struct ThreadAmount {
    std::size_t stitches = 0;
    double thread_meters = 0.0;
    double thread_yards = 0.0;
    int skeins_needed = 0;
};

struct ThreadUsage {
    std::string canvas_name;
    std::map<std::string, ThreadAmount> by_color;
    ThreadAmount total;
};

// Thread requirements for a stitch histogram. Meter and yard values are
// rounded to two decimals; total skeins are computed from the unrounded
// total length, not summed per color.
ThreadUsage calculate_thread_usage(const ColorHistogram& histogram,
                                   const CanvasType& canvas);

// Human-readable report
std::string format_thread_usage(const ThreadUsage& usage);

// Round to two decimals
double round_hundredths(double value);

}  // namespace xstitch

#endif // XSTITCH_YARN_THREAD_USAGE_HPP
