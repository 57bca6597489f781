#include <render/mat_surface.hpp>

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace ovs {
    namespace {
        constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;

        cv::Scalar to_scalar(const Rgba& c) {
            return cv::Scalar(c.b, c.g, c.r, c.a);
        }
    } // namespace

    MatSurface::MatSurface(double font_scale)
        : font_scale_(font_scale > 0.0 ? font_scale : 0.5) {}

    void MatSurface::resize(int pixel_w, int pixel_h) {
        bgra_ = cv::Mat(std::max(1, pixel_h), std::max(1, pixel_w), CV_8UC4, cv::Scalar::all(0));
        scale_ = 1.0;
        ++resize_count_;
    }

    void MatSurface::set_scale(double dpr) {
        scale_ = dpr > 0.0 ? dpr : 1.0;
    }

    void MatSurface::place(double left, double top, double width, double height) {
        placement_ = {left, top, width, height};
    }

    void MatSurface::clear() {
        if (!bgra_.empty()) bgra_.setTo(cv::Scalar::all(0));
    }

    cv::Rect MatSurface::to_device_(const PixelBox& r) const {
        const int x = static_cast<int>(std::lround(r.x * scale_));
        const int y = static_cast<int>(std::lround(r.y * scale_));
        const int w = static_cast<int>(std::lround(r.width * scale_));
        const int h = static_cast<int>(std::lround(r.height * scale_));
        return cv::Rect(x, y, w, h);
    }

    void MatSurface::stroke_rect(const PixelBox& r, const Rgba& color, double line_width) {
        if (bgra_.empty()) return;
        const cv::Rect dev = to_device_(r);
        if (dev.width <= 0 || dev.height <= 0) return;
        const int thickness = std::max(1, static_cast<int>(std::lround(line_width * scale_)));
        cv::rectangle(bgra_, dev, to_scalar(color), thickness, cv::LINE_AA);
    }

    void MatSurface::fill_rect(const PixelBox& r, const Rgba& color) {
        if (bgra_.empty()) return;
        const cv::Rect dev = to_device_(r) & cv::Rect(0, 0, bgra_.cols, bgra_.rows);
        if (dev.width <= 0 || dev.height <= 0) return;
        bgra_(dev).setTo(to_scalar(color));
    }

    void MatSurface::draw_text(const std::string& text, double x, double y, const Rgba& color) {
        if (bgra_.empty() || text.empty()) return;
        const cv::Point origin(static_cast<int>(std::lround(x * scale_)),
                               static_cast<int>(std::lround(y * scale_)));
        const int thickness = std::max(1, static_cast<int>(std::lround(scale_)));
        cv::putText(bgra_, text, origin, kFont, font_scale_ * scale_, to_scalar(color), thickness, cv::LINE_AA);
    }

    TextExtent MatSurface::measure_text(const std::string& text) const {
        // measured in logical units so layout math is dpr independent
        int baseline = 0;
        const cv::Size sz = cv::getTextSize(text, kFont, font_scale_, 1, &baseline);
        return {static_cast<double>(sz.width), static_cast<double>(sz.height + baseline)};
    }

    double MatSurface::logical_width() const {
        return bgra_.empty() ? 0.0 : bgra_.cols / scale_;
    }

    double MatSurface::logical_height() const {
        return bgra_.empty() ? 0.0 : bgra_.rows / scale_;
    }
}
