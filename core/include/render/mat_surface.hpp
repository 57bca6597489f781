#pragma once

#include <opencv2/core.hpp>

#include <overlay/types.hpp>
#include <render/draw_surface.hpp>

namespace ovs {
    // BGRA cv::Mat drawing surface. Pixels outside drawn shapes stay fully transparent.
    class MatSurface final : public IDrawSurface {
    public:
        explicit MatSurface(double font_scale = 0.5);

        void resize(int pixel_w, int pixel_h) override;
        void set_scale(double dpr) override;
        void place(double left, double top, double width, double height) override;

        void clear() override;
        void stroke_rect(const PixelBox& r, const Rgba& color, double line_width) override;
        void fill_rect(const PixelBox& r, const Rgba& color) override;
        void draw_text(const std::string& text, double x, double y, const Rgba& color) override;
        TextExtent measure_text(const std::string& text) const override;

        double logical_width() const override;
        double logical_height() const override;

        const cv::Mat& pixels() const { return bgra_; }
        const ScreenRect& placement() const { return placement_; }
        double scale() const { return scale_; }
        int resize_count() const { return resize_count_; }

    private:
        cv::Rect to_device_(const PixelBox& r) const;

        cv::Mat bgra_;
        double scale_ = 1.0;
        double font_scale_;
        ScreenRect placement_;
        int resize_count_ = 0;
    };
}
