#include <render/compositor.hpp>
#include <render/mat_surface.hpp>

#include <opencv2/imgproc.hpp>

#include <iostream>
#include <string>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    bool bgr_is(const cv::Mat& m, int x, int y, int b, int g, int r) {
        const auto& p = m.at<cv::Vec3b>(y, x);
        return p[0] == b && p[1] == g && p[2] == r;
    }

    void test_surface_scale_and_fill() {
        ovs::MatSurface s;
        check(s.logical_width() == 0.0, "unsized surface should have no logical size");

        s.resize(200, 100);
        s.set_scale(2.0);
        check(s.logical_width() == 100.0 && s.logical_height() == 50.0, "logical size should divide by dpr");

        s.fill_rect({10, 10, 5, 5}, ovs::Rgba{255, 0, 0, 255});
        const auto& px = s.pixels().at<cv::Vec4b>(25, 25);
        check(px[0] == 0 && px[1] == 0 && px[2] == 255 && px[3] == 255, "fill should land at device pixels");
        check(s.pixels().at<cv::Vec4b>(5, 5)[3] == 0, "untouched pixels should stay transparent");

        s.clear();
        check(cv::countNonZero(s.pixels().reshape(1)) == 0, "clear should make the surface transparent");

        s.resize(10, 10);
        check(s.scale() == 1.0 && s.resize_count() == 2, "resize should reset the transform");
    }

    void test_measure_text() {
        ovs::MatSurface s(0.5);
        const auto short_text = s.measure_text("ab");
        const auto long_text = s.measure_text("abcdef");
        check(short_text.width > 0 && short_text.height > 0, "text should have a size");
        check(long_text.width > short_text.width, "longer text should measure wider");
    }

    void test_blend() {
        cv::Mat dst(2, 2, CV_8UC3, cv::Scalar(100, 100, 100));
        cv::Mat src(2, 2, CV_8UC4, cv::Scalar::all(0));
        src.at<cv::Vec4b>(0, 0) = cv::Vec4b(255, 255, 255, 255);
        src.at<cv::Vec4b>(0, 1) = cv::Vec4b(0, 0, 0, 128);

        ovs::blend_bgra_onto(src, dst, 0, 0);
        check(bgr_is(dst, 0, 0, 255, 255, 255), "opaque pixel should replace the destination");
        check(bgr_is(dst, 1, 1, 100, 100, 100), "transparent pixel should keep the destination");
        const int half = dst.at<cv::Vec3b>(0, 1)[0];
        check(half > 40 && half < 60, "half alpha should mix the colors");

        cv::Mat shifted(2, 2, CV_8UC3, cv::Scalar(100, 100, 100));
        ovs::blend_bgra_onto(src, shifted, 1, 1);
        check(bgr_is(shifted, 1, 1, 255, 255, 255), "blend should honor the offset");
        check(bgr_is(shifted, 0, 0, 100, 100, 100), "pixels outside the source should be untouched");
    }

    void test_compose_contain_letterbox() {
        const cv::Mat video(20, 40, CV_8UC3, cv::Scalar(255, 0, 0));

        ovs::MatSurface overlay;
        overlay.resize(80, 40);
        overlay.place(0, 10, 80, 40);
        overlay.fill_rect({0, 0, 10, 10}, ovs::Rgba{255, 255, 255, 255});

        ovs::CompositorConfig cfg;
        cfg.container = {0, 0, 80, 60};
        cfg.element = {0, 0, 80, 60};
        cfg.fit = ovs::FitMode::Contain;

        const cv::Mat out = ovs::compose_frame(video, overlay, cfg);
        check(out.cols == 80 && out.rows == 60 && out.type() == CV_8UC3, "output should be container sized BGR");
        check(bgr_is(out, 40, 2, 0, 0, 0), "letterbox bar should be black");
        check(bgr_is(out, 40, 30, 255, 0, 0), "video should fill the displayed rect");
        check(bgr_is(out, 40, 55, 0, 0, 0), "bottom bar should be black");
        check(bgr_is(out, 5, 15, 255, 255, 255), "overlay should be blended at its placement");
    }

    void test_compose_cover_is_clipped() {
        const cv::Mat video(40, 40, CV_8UC3, cv::Scalar(0, 255, 0));
        ovs::MatSurface overlay;

        ovs::CompositorConfig cfg;
        cfg.container = {0, 0, 100, 40};
        cfg.element = {10, 0, 80, 40};
        cfg.fit = ovs::FitMode::Cover;

        const cv::Mat out = ovs::compose_frame(video, overlay, cfg);
        check(bgr_is(out, 50, 0, 0, 255, 0) && bgr_is(out, 50, 39, 0, 255, 0), "cover should fill the element");
        check(bgr_is(out, 5, 20, 0, 0, 0) && bgr_is(out, 95, 20, 0, 0, 0), "video should not spill outside the element");
    }

    void test_compose_dpr() {
        const cv::Mat video(10, 10, CV_8UC3, cv::Scalar(0, 0, 255));
        ovs::MatSurface overlay;

        ovs::CompositorConfig cfg;
        cfg.container = {0, 0, 50, 50};
        cfg.element = {0, 0, 50, 50};
        cfg.dpr = 2.0;

        const cv::Mat out = ovs::compose_frame(video, overlay, cfg);
        check(out.cols == 100 && out.rows == 100, "output should be scaled by dpr");
    }

    void test_interp_names() {
        check(ovs::interp_from_str("nearest") == cv::INTER_NEAREST, "nearest");
        check(ovs::interp_from_str("area") == cv::INTER_AREA, "area");
        check(ovs::interp_from_str("whatever") == cv::INTER_LINEAR, "unknown should be linear");
    }
}

int main() {
    test_surface_scale_and_fill();
    test_measure_text();
    test_blend();
    test_compose_contain_letterbox();
    test_compose_cover_is_clipped();
    test_compose_dpr();
    test_interp_names();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all compositor tests passed\n";
    return 0;
}
