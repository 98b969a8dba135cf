#include "thread_usage.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace xstitch {

double round_hundredths(double value) {
    return std::round(value * 100.0) / 100.0;
}

namespace {

int skeins_for(double meters) {
    return static_cast<int>(std::ceil(meters / THREAD_PER_SKEIN_M));
}

std::string format_amount(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

}  // namespace

ThreadUsage calculate_thread_usage(const ColorHistogram& histogram,
                                   const CanvasType& canvas) {
    ThreadUsage usage;
    usage.canvas_name = canvas.name;

    double total_meters = 0.0;
    for (const auto& [color, count] : histogram) {
        double meters = count * canvas.cm_per_stitch / CM_PER_METER;

        ThreadAmount amount;
        amount.stitches = count;
        amount.thread_meters = round_hundredths(meters);
        amount.thread_yards = round_hundredths(meters * YARDS_PER_METER);
        amount.skeins_needed = skeins_for(meters);
        usage.by_color[color] = amount;

        usage.total.stitches += count;
        total_meters += meters;
    }

    usage.total.thread_meters = round_hundredths(total_meters);
    usage.total.thread_yards = round_hundredths(total_meters * YARDS_PER_METER);
    usage.total.skeins_needed = skeins_for(total_meters);
    return usage;
}

std::string format_thread_usage(const ThreadUsage& usage) {
    std::ostringstream ss;
    ss << "Yarn Requirements:\n\n";

    for (const auto& [color, amount] : usage.by_color) {
        ss << color << ":\n";
        ss << "  " << amount.stitches << " stitches\n";
        ss << "  " << format_amount(amount.thread_meters) << "m ("
           << format_amount(amount.thread_yards) << " yards)\n";
        ss << "  " << amount.skeins_needed << " skein(s)\n\n";
    }

    ss << "Total:\n";
    ss << "  " << usage.total.stitches << " stitches\n";
    ss << "  " << format_amount(usage.total.thread_meters) << "m ("
       << format_amount(usage.total.thread_yards) << " yards)\n";
    return ss.str();
}

}  // namespace xstitch
