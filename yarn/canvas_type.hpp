#ifndef XSTITCH_YARN_CANVAS_TYPE_HPP
#define XSTITCH_YARN_CANVAS_TYPE_HPP

#include <string>
#include <string_view>
#include <vector>

namespace xstitch {

// Stitching canvas; determines how much thread one stitch consumes
struct CanvasType {
    std::string id = "standard";
    std::string name = "Standard (Aida 14ct)";
    double cm_per_stitch = 50.0;       // Thread per stitch, waste included

    // Factory methods for the supported canvases
    static CanvasType standard() {
        return CanvasType{
            .id = "standard",
            .name = "Standard (Aida 14ct)",
            .cm_per_stitch = 50.0
        };
    }

    static CanvasType sudan() {
        return CanvasType{
            .id = "sudan",
            .name = "Sudan Canvas (Toile Soudan)",
            .cm_per_stitch = (8.0 * 100.0) / 300.0   // 8m for 300 stitches
        };
    }
};

// All supported canvases, in display order
inline std::vector<CanvasType> canvas_types() {
    return {CanvasType::standard(), CanvasType::sudan()};
}

inline bool has_canvas_type(std::string_view id) {
    for (const auto& canvas : canvas_types()) {
        if (canvas.id == id) {
            return true;
        }
    }
    return false;
}

// Canvas with the given id; unknown ids fall back to the standard canvas
inline CanvasType find_canvas_type(std::string_view id) {
    for (const auto& canvas : canvas_types()) {
        if (canvas.id == id) {
            return canvas;
        }
    }
    return CanvasType::standard();
}

}  // namespace xstitch

#endif // XSTITCH_YARN_CANVAS_TYPE_HPP
