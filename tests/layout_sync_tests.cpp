#include <overlay/layout_sync.hpp>

#include "test_fakes.hpp"

#include <cmath>
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

    bool near(double a, double b, double eps = 1e-6) {
        return std::abs(a - b) <= eps;
    }

    ovs::LayoutInput input(double element_w, double element_h, double dpr = 1.0) {
        ovs::LayoutInput in;
        in.element = {0.0, 0.0, element_w, element_h};
        in.container = {0.0, 0.0, element_w, element_h};
        in.dpr = dpr;
        in.intrinsic_w = 1920;
        in.intrinsic_h = 1080;
        in.fit = ovs::FitMode::Contain;
        return in;
    }

    void test_first_reconcile_applies_everything() {
        ovs::testing::RecordingSurface surface;
        ovs::LayoutSynchronizer sync(0.5);

        const auto c = sync.reconcile(input(800, 600, 2.0), surface);
        check(c.size_changed && c.position_changed, "first reconcile should report a full change");
        check(surface.resizes == 1, "first reconcile should size the surface");
        check(surface.pixel_width() == 1600 && surface.pixel_height() == 900,
              "pixel size should be displayed size times dpr");
        check(surface.scale() == 2.0, "scale should be reapplied after resize");
        check(near(surface.placement.left, 0) && near(surface.placement.top, 75) &&
                  near(surface.placement.width, 800) && near(surface.placement.height, 450),
              "surface should cover the letterboxed video region");
        check(near(surface.logical_width(), 800) && near(surface.logical_height(), 450),
              "logical size should match the displayed rect");
    }

    void test_unchanged_layout_is_noop() {
        ovs::testing::RecordingSurface surface;
        ovs::LayoutSynchronizer sync(0.5);
        (void)sync.reconcile(input(800, 600), surface);

        const auto c = sync.reconcile(input(800, 600), surface);
        check(!c.any(), "identical layout should report no change");
        check(surface.resizes == 1 && surface.places == 1, "identical layout should not touch the surface");
    }

    void test_threshold_suppresses_jitter() {
        ovs::testing::RecordingSurface surface;
        ovs::LayoutSynchronizer sync(0.5);
        (void)sync.reconcile(input(800, 600), surface);

        const auto small = sync.reconcile(input(800.3, 600), surface);
        check(!small.any(), "0.3px change should be suppressed");
        check(surface.resizes == 1, "0.3px change should not resize");

        const auto big = sync.reconcile(input(801, 600), surface);
        check(big.size_changed, "1.0px change should be applied");
        check(surface.resizes == 2, "1.0px change should resize");
    }

    void test_position_change_keeps_surface() {
        ovs::testing::RecordingSurface surface;
        ovs::LayoutSynchronizer sync(0.5);
        (void)sync.reconcile(input(800, 600), surface);

        auto moved = input(800, 600);
        moved.element.left = 10.0;
        const auto c = sync.reconcile(moved, surface);
        check(c.position_changed && !c.size_changed, "moving the element should be a position change");
        check(surface.resizes == 1, "position change should not resize");
        check(surface.places == 2 && near(surface.placement.left, 10), "position change should re-place");
    }

    void test_dpr_change_resizes() {
        ovs::testing::RecordingSurface surface;
        ovs::LayoutSynchronizer sync(0.5);
        (void)sync.reconcile(input(800, 600, 1.0), surface);

        const auto c = sync.reconcile(input(800, 600, 1.5), surface);
        check(c.size_changed, "dpr change should count as a size change");
        check(surface.pixel_width() == 1200 && surface.scale() == 1.5, "dpr change should rescale the surface");
    }

    void test_empty_element_is_ignored() {
        ovs::testing::RecordingSurface surface;
        ovs::LayoutSynchronizer sync(0.5);

        const auto c = sync.reconcile(input(0, 600), surface);
        check(!c.any() && surface.resizes == 0, "zero-size element should not touch the surface");
        check(!sync.last_applied(), "zero-size element should not be remembered");
    }

    void test_invalidate_reapplies() {
        ovs::testing::RecordingSurface surface;
        ovs::LayoutSynchronizer sync(0.5);
        (void)sync.reconcile(input(800, 600), surface);

        sync.invalidate();
        const auto c = sync.reconcile(input(800, 600), surface);
        check(c.size_changed && surface.resizes == 2, "invalidate should force a full re-apply");
    }

    void test_compare_layouts() {
        ovs::SurfaceLayout a{800, 450, 75, 0, 1.0};
        ovs::SurfaceLayout b = a;
        b.top = 75.4;
        check(!ovs::compare_layouts(b, a, 0.5).any(), "0.4px move should be under threshold");
        b.top = 76.0;
        check(ovs::compare_layouts(b, a, 0.5).position_changed, "1px move should exceed threshold");
    }
}

int main() {
    test_first_reconcile_applies_everything();
    test_unchanged_layout_is_noop();
    test_threshold_suppresses_jitter();
    test_position_change_keeps_surface();
    test_dpr_change_resizes();
    test_empty_element_is_ignored();
    test_invalidate_reapplies();
    test_compare_layouts();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all layout sync tests passed\n";
    return 0;
}
