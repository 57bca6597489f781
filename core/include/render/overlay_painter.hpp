#pragma once

#include <array>
#include <functional>
#include <optional>
#include <string>

#include <overlay/types.hpp>
#include <render/draw_surface.hpp>

namespace ovs {
    // Stroke palette, keyed by numeric class id.
    extern const std::array<Rgba, 8> kDetectionColors;
    extern const Rgba kInterpolatedColor;

    // Non-numeric labels use the first palette entry.
    Rgba detection_color(const std::string& label, bool interpolated);

    using LabelResolver = std::function<std::string(const std::string& label,
                                                    const std::optional<std::string>& label_text)>;

    // "<label> <pct>%" with " | <d>m" appended for a non-zero distance.
    std::string format_detection_label(const std::string& label,
                                       const std::optional<float>& confidence,
                                       const std::optional<double>& distance,
                                       const std::optional<std::string>& label_text = std::nullopt,
                                       const LabelResolver& resolve = {});

    struct OverlayPainterConfig {
        double line_width = 3.0;
        double text_height = 18.0;
        double padding = 6.0;
        LabelResolver resolve_label;
    };

    class OverlayPainter {
    public:
        explicit OverlayPainter(OverlayPainterConfig cfg = {});

        // Paints every visible detection. Returns how many boxes were drawn.
        int paint(IDrawSurface& surface, const MetadataFrame& frame) const;

    private:
        void paint_label_(IDrawSurface& surface,
                          const BoundingBox& det,
                          const PixelBox& px,
                          const Rgba& color) const;

        OverlayPainterConfig cfg_;
    };
}
