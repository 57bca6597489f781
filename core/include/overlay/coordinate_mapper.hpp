#pragma once

#include <optional>
#include <string>

#include <overlay/types.hpp>

namespace ovs {
    inline double clamp_value(double v, double lo, double hi) {
        return v < lo ? lo : (v > hi ? hi : v);
    }

    // Unknown names map to FitMode::Contain.
    FitMode parse_fit_mode(const std::string& s);
    bool is_known_fit_mode(const std::string& s);
    const char* fit_mode_name(FitMode mode);

    // Rectangle actually covered by the media inside its element, in element-local pixels.
    // Zero intrinsic size yields the element size at zero offset.
    DisplayedRect displayed_rect(double intrinsic_w,
                                 double intrinsic_h,
                                 double element_w,
                                 double element_h,
                                 FitMode fit = FitMode::Contain);

    // Empty when the clamped box has no visible area.
    std::optional<PixelBox> to_pixel_box(const NormalizedBox& box,
                                         double canvas_w,
                                         double canvas_h);

    struct LabelPosition {
        double x = 0.0;
        double y = 0.0; // text baseline
    };

    // Above the box when there is room, otherwise below; x kept inside the canvas.
    LabelPosition label_position(double box_x,
                                 double box_y,
                                 double box_h,
                                 double text_h,
                                 double padding,
                                 double label_w,
                                 double canvas_w,
                                 double canvas_h);
}
