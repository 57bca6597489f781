#include <render/compositor.hpp>

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

#include <overlay/coordinate_mapper.hpp>

namespace ovs {
    int interp_from_str(const std::string& s) {
        if (s == "nearest") return cv::INTER_NEAREST;
        if (s == "cubic") return cv::INTER_CUBIC;
        if (s == "area") return cv::INTER_AREA;
        return cv::INTER_LINEAR;
    }

    namespace {
        int px(double v, double dpr) {
            return static_cast<int>(std::lround(v * dpr));
        }
    } // namespace

    void blend_bgra_onto(const cv::Mat& src_bgra, cv::Mat& dst_bgr, int x, int y) {
        if (src_bgra.empty() || dst_bgr.empty()) return;
        if (src_bgra.type() != CV_8UC4 || dst_bgr.type() != CV_8UC3) return;

        const cv::Rect dst_rect = cv::Rect(x, y, src_bgra.cols, src_bgra.rows) &
                                  cv::Rect(0, 0, dst_bgr.cols, dst_bgr.rows);
        if (dst_rect.width <= 0 || dst_rect.height <= 0) return;

        const cv::Rect src_rect(dst_rect.x - x, dst_rect.y - y, dst_rect.width, dst_rect.height);

        for (int r = 0; r < dst_rect.height; ++r) {
            const auto* s = src_bgra.ptr<cv::Vec4b>(src_rect.y + r) + src_rect.x;
            auto* d = dst_bgr.ptr<cv::Vec3b>(dst_rect.y + r) + dst_rect.x;
            for (int c = 0; c < dst_rect.width; ++c) {
                const int a = s[c][3];
                if (a == 0) continue;
                for (int k = 0; k < 3; ++k) {
                    d[c][k] = static_cast<uchar>((s[c][k] * a + d[c][k] * (255 - a) + 127) / 255);
                }
            }
        }
    }

    cv::Mat compose_frame(const cv::Mat& video_bgr,
                          const MatSurface& overlay,
                          const CompositorConfig& cfg) {
        const double dpr = cfg.dpr > 0.0 ? cfg.dpr : 1.0;
        const int out_w = std::max(1, px(cfg.container.width, dpr));
        const int out_h = std::max(1, px(cfg.container.height, dpr));
        cv::Mat out(out_h, out_w, CV_8UC3, cv::Scalar::all(0));

        const double el_left = cfg.element.left - cfg.container.left;
        const double el_top = cfg.element.top - cfg.container.top;
        const cv::Rect element_px = cv::Rect(px(el_left, dpr),
                                             px(el_top, dpr),
                                             px(cfg.element.width, dpr),
                                             px(cfg.element.height, dpr)) &
                                    cv::Rect(0, 0, out_w, out_h);

        if (!video_bgr.empty() && element_px.width > 0 && element_px.height > 0) {
            const DisplayedRect dr = displayed_rect(video_bgr.cols,
                                                    video_bgr.rows,
                                                    cfg.element.width,
                                                    cfg.element.height,
                                                    cfg.fit);
            const int vw = std::max(1, px(dr.width, dpr));
            const int vh = std::max(1, px(dr.height, dpr));
            const int vx = px(el_left + dr.offset_x, dpr);
            const int vy = px(el_top + dr.offset_y, dpr);

            cv::Mat scaled;
            if (vw == video_bgr.cols && vh == video_bgr.rows) {
                scaled = video_bgr;
            } else {
                cv::resize(video_bgr, scaled, cv::Size(vw, vh), 0, 0, cfg.interp);
            }

            // cover/none may overflow the element; the element clips
            const cv::Rect dst = cv::Rect(vx, vy, vw, vh) & element_px;
            if (dst.width > 0 && dst.height > 0) {
                const cv::Rect src(dst.x - vx, dst.y - vy, dst.width, dst.height);
                scaled(src).copyTo(out(dst));
            }
        }

        if (element_px.width > 0 && element_px.height > 0) {
            const ScreenRect& p = overlay.placement();
            cv::Mat element_roi = out(element_px);
            blend_bgra_onto(overlay.pixels(),
                            element_roi,
                            px(p.left, dpr) - element_px.x,
                            px(p.top, dpr) - element_px.y);
        }
        return out;
    }
}
