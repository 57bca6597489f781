#include <render/overlay_painter.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

#include <overlay/coordinate_mapper.hpp>

namespace ovs {
    const std::array<Rgba, 8> kDetectionColors = {{
        {0x00, 0xd4, 0xff, 0xff},
        {0x00, 0xff, 0x88, 0xff},
        {0xff, 0x6b, 0x9d, 0xff},
        {0xff, 0xd9, 0x3d, 0xff},
        {0xff, 0x8c, 0x42, 0xff},
        {0xa8, 0xe6, 0xcf, 0xff},
        {0xb4, 0xa5, 0xff, 0xff},
        {0xff, 0xb3, 0x47, 0xff},
    }};

    const Rgba kInterpolatedColor = {0x80, 0x80, 0x80, 0xff};

    namespace {
        // Leading integer, 0 when there is none.
        long leading_int(const std::string& s) {
            char* end = nullptr;
            const long v = std::strtol(s.c_str(), &end, 10);
            if (end == s.c_str()) return 0;
            return v;
        }
    } // namespace

    Rgba detection_color(const std::string& label, bool interpolated) {
        if (interpolated) return kInterpolatedColor;
        const long idx = std::labs(leading_int(label));
        return kDetectionColors[static_cast<size_t>(idx) % kDetectionColors.size()];
    }

    std::string format_detection_label(const std::string& label,
                                       const std::optional<float>& confidence,
                                       const std::optional<double>& distance,
                                       const std::optional<std::string>& label_text,
                                       const LabelResolver& resolve) {
        std::string text;
        if (resolve) {
            text = resolve(label, label_text);
        } else if (label_text && !label_text->empty()) {
            text = *label_text;
        } else {
            text = label;
        }

        text += ' ';
        if (confidence && std::isfinite(*confidence)) {
            text += std::to_string(std::lround(static_cast<double>(*confidence) * 100.0));
        } else {
            text += '?';
        }
        text += '%';

        if (distance && std::isfinite(*distance) && *distance != 0.0) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), " | %.2fm", *distance);
            text += buf;
        }
        return text;
    }

    OverlayPainter::OverlayPainter(OverlayPainterConfig cfg) : cfg_(std::move(cfg)) {
        if (!(cfg_.line_width > 0.0)) cfg_.line_width = 1.0;
    }

    int OverlayPainter::paint(IDrawSurface& surface, const MetadataFrame& frame) const {
        const double cw = surface.logical_width();
        const double ch = surface.logical_height();
        if (!(cw > 0.0) || !(ch > 0.0)) return 0;

        int painted = 0;
        for (const auto& det : frame.detections) {
            const auto px = to_pixel_box(det.box, cw, ch);
            if (!px) continue;

            const Rgba color = detection_color(det.label, det.interpolated);
            surface.stroke_rect(*px, color, cfg_.line_width);
            paint_label_(surface, det, *px, color);
            ++painted;
        }
        return painted;
    }

    void OverlayPainter::paint_label_(IDrawSurface& surface,
                                      const BoundingBox& det,
                                      const PixelBox& px,
                                      const Rgba& color) const {
        const std::string text = format_detection_label(det.label,
                                                        det.confidence,
                                                        det.distance,
                                                        det.label_text,
                                                        cfg_.resolve_label);
        const TextExtent extent = surface.measure_text(text);
        const double label_w = extent.width + cfg_.padding * 2.0;

        const LabelPosition pos = label_position(px.x,
                                                 px.y,
                                                 px.height,
                                                 cfg_.text_height,
                                                 cfg_.padding,
                                                 label_w,
                                                 surface.logical_width(),
                                                 surface.logical_height());

        Rgba bg = color;
        bg.a = 0xdd;
        surface.fill_rect({pos.x,
                           pos.y - cfg_.text_height - cfg_.padding / 2.0,
                           label_w,
                           cfg_.text_height + cfg_.padding},
                          bg);
        surface.draw_text(text, pos.x + cfg_.padding, pos.y - cfg_.padding / 2.0, Rgba{0, 0, 0, 0xff});
    }
}
