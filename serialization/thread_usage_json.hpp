#ifndef XSTITCH_SERIALIZATION_THREAD_USAGE_JSON_HPP
#define XSTITCH_SERIALIZATION_THREAD_USAGE_JSON_HPP

#include <nlohmann/json.hpp>
#include <yarn/thread_usage.hpp>

namespace xstitch {

// ThreadAmount serialization
inline void to_json(nlohmann::json& j, const ThreadAmount& amount) {
    j = {
        {"stitches", amount.stitches},
        {"thread_meters", amount.thread_meters},
        {"thread_yards", amount.thread_yards},
        {"skeins_needed", amount.skeins_needed}
    };
}

// ThreadUsage serialization
inline void to_json(nlohmann::json& j, const ThreadUsage& usage) {
    j = {
        {"canvas", usage.canvas_name},
        {"by_color", usage.by_color},
        {"total", usage.total}
    };
}

}  // namespace xstitch

#endif // XSTITCH_SERIALIZATION_THREAD_USAGE_JSON_HPP
