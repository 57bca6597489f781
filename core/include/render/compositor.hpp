#pragma once

#include <string>

#include <opencv2/core.hpp>

#include <overlay/types.hpp>
#include <render/mat_surface.hpp>

namespace ovs {
    int interp_from_str(const std::string& s);

    struct CompositorConfig {
        // Container (output canvas) size in logical pixels, and the element inside it.
        ScreenRect container;
        ScreenRect element;
        double dpr = 1.0;
        FitMode fit = FitMode::Contain;
        int interp = 1; // cv::INTER_LINEAR
    };

    // Lays the video into its element per the fit mode (clipped to the element), then
    // alpha-blends the overlay surface at its placement. Output is BGR at container*dpr.
    cv::Mat compose_frame(const cv::Mat& video_bgr,
                          const MatSurface& overlay,
                          const CompositorConfig& cfg);

    // Straight alpha blend of a BGRA image onto BGR at (x, y), clipped to dst.
    void blend_bgra_onto(const cv::Mat& src_bgra, cv::Mat& dst_bgr, int x, int y);
}
