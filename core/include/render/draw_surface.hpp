#pragma once

#include <cstdint>
#include <string>

#include <overlay/types.hpp>

namespace ovs {
    struct Rgba {
        uint8_t r = 0;
        uint8_t g = 0;
        uint8_t b = 0;
        uint8_t a = 255;
    };

    struct TextExtent {
        double width = 0.0;
        double height = 0.0;
    };

    // Drawing target composited over the video. Drawing calls take logical
    // (pre-dpr) coordinates; the surface applies its scale transform.
    class IDrawSurface {
    public:
        virtual ~IDrawSurface() = default;

        // Reallocates the pixel buffer and resets the transform to identity.
        virtual void resize(int pixel_w, int pixel_h) = 0;
        virtual void set_scale(double dpr) = 0;
        // On-screen placement relative to the container, logical pixels.
        virtual void place(double left, double top, double width, double height) = 0;

        virtual void clear() = 0;
        virtual void stroke_rect(const PixelBox& r, const Rgba& color, double line_width) = 0;
        virtual void fill_rect(const PixelBox& r, const Rgba& color) = 0;
        // (x, y) is the left end of the baseline.
        virtual void draw_text(const std::string& text, double x, double y, const Rgba& color) = 0;
        virtual TextExtent measure_text(const std::string& text) const = 0;

        virtual double logical_width() const = 0;
        virtual double logical_height() const = 0;
    };
}
