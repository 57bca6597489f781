#include <overlay/coordinate_mapper.hpp>

#include <algorithm>
#include <cctype>

namespace ovs {
    namespace {
        std::string normalize_name(std::string s) {
            std::transform(s.begin(),
                           s.end(),
                           s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            std::replace(s.begin(), s.end(), '_', '-');
            return s;
        }
    } // namespace

    bool is_known_fit_mode(const std::string& s) {
        const std::string n = normalize_name(s);
        return n == "contain" || n == "cover" || n == "fill" || n == "none" || n == "scale-down";
    }

    FitMode parse_fit_mode(const std::string& s) {
        const std::string n = normalize_name(s);
        if (n == "cover") return FitMode::Cover;
        if (n == "fill") return FitMode::Fill;
        if (n == "none") return FitMode::None;
        if (n == "scale-down") return FitMode::ScaleDown;
        return FitMode::Contain;
    }

    const char* fit_mode_name(FitMode mode) {
        switch (mode) {
            case FitMode::Cover: return "cover";
            case FitMode::Fill: return "fill";
            case FitMode::None: return "none";
            case FitMode::ScaleDown: return "scale-down";
            case FitMode::Contain: break;
        }
        return "contain";
    }

    DisplayedRect displayed_rect(double intrinsic_w,
                                 double intrinsic_h,
                                 double element_w,
                                 double element_h,
                                 FitMode fit) {
        if (!(intrinsic_w > 0.0) || !(intrinsic_h > 0.0)) {
            return {element_w, element_h, 0.0, 0.0};
        }

        const double wr = element_w / intrinsic_w;
        const double hr = element_h / intrinsic_h;
        double w = element_w;
        double h = element_h;

        switch (fit) {
            case FitMode::Cover: {
                const double s = std::max(wr, hr);
                w = intrinsic_w * s;
                h = intrinsic_h * s;
                break;
            }
            case FitMode::Fill:
                break;
            case FitMode::None:
                w = intrinsic_w;
                h = intrinsic_h;
                break;
            case FitMode::ScaleDown: {
                const double s = std::min(1.0, std::min(wr, hr));
                w = intrinsic_w * s;
                h = intrinsic_h * s;
                break;
            }
            case FitMode::Contain:
            default: {
                const double s = std::min(wr, hr);
                w = intrinsic_w * s;
                h = intrinsic_h * s;
                break;
            }
        }

        return {w, h, (element_w - w) / 2.0, (element_h - h) / 2.0};
    }

    std::optional<PixelBox> to_pixel_box(const NormalizedBox& box,
                                         double canvas_w,
                                         double canvas_h) {
        const double raw_x = box.x * canvas_w;
        const double raw_y = box.y * canvas_h;
        const double raw_w = box.width * canvas_w;
        const double raw_h = box.height * canvas_h;

        const double x0 = clamp_value(raw_x, 0.0, canvas_w);
        const double y0 = clamp_value(raw_y, 0.0, canvas_h);
        const double x1 = clamp_value(raw_x + raw_w, 0.0, canvas_w);
        const double y1 = clamp_value(raw_y + raw_h, 0.0, canvas_h);

        const double w = std::max(0.0, x1 - x0);
        const double h = std::max(0.0, y1 - y0);
        // NaN inputs fall through as !(w > 0)
        if (!(w > 0.0) || !(h > 0.0)) return std::nullopt;

        return PixelBox{x0, y0, w, h};
    }

    LabelPosition label_position(double box_x,
                                 double box_y,
                                 double box_h,
                                 double text_h,
                                 double padding,
                                 double label_w,
                                 double canvas_w,
                                 double canvas_h) {
        LabelPosition p;
        p.y = box_y > text_h + padding
                  ? box_y - 4.0
                  : std::min(canvas_h - 2.0, box_y + box_h + text_h + 4.0);
        // lower bound wins when the label is wider than the canvas
        p.x = std::max(0.0, std::min(box_x, canvas_w - label_w));
        return p;
    }
}
