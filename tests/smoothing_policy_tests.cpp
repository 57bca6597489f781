#include <overlay/smoothing_policy.hpp>

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

    ovs::MetadataMatch match_for(int64_t id) {
        ovs::MetadataMatch m;
        m.frame.frame_id = id;
        m.frame.timestamp = 1000.0;
        return m;
    }

    void test_match_draws() {
        ovs::SmoothingPolicy p(150.0);
        const auto d = p.decide(false, match_for(1), 1000.0);
        check(d.action == ovs::OverlayAction::Draw, "a match should draw");
        check(d.frame && d.frame->frame_id == 1, "draw should expose the matched frame");
        check(p.has_held_frame(), "a drawn frame should be held");
    }

    void test_hold_within_window() {
        ovs::SmoothingPolicy p(150.0);
        (void)p.decide(false, match_for(1), 1000.0);

        const auto d = p.decide(false, std::nullopt, 1100.0);
        check(d.action == ovs::OverlayAction::Hold, "100ms after the last match should hold");
        check(d.frame && d.frame->frame_id == 1, "hold should repaint the held frame");

        const auto edge = p.decide(false, std::nullopt, 1150.0);
        check(edge.action == ovs::OverlayAction::Hold, "exactly hold_ms after the match should still hold");
    }

    void test_clear_after_window() {
        ovs::SmoothingPolicy p(150.0);
        (void)p.decide(false, match_for(1), 1000.0);

        const auto d = p.decide(false, std::nullopt, 1200.0);
        check(d.action == ovs::OverlayAction::Clear, "200ms after the last match should clear");
        check(d.frame == nullptr, "clear should not expose a frame");
        check(!p.has_held_frame(), "clear should drop the held frame");
    }

    void test_pause_clears() {
        ovs::SmoothingPolicy p(150.0);
        (void)p.decide(false, match_for(1), 1000.0);

        const auto d = p.decide(true, std::nullopt, 1010.0);
        check(d.action == ovs::OverlayAction::Clear, "paused playback should clear");
        check(!p.has_held_frame(), "pause should drop the held frame");

        const auto resumed = p.decide(false, std::nullopt, 1020.0);
        check(resumed.action == ovs::OverlayAction::Clear, "resuming without a match should not resurrect a frame");
    }

    void test_backwards_seek_does_not_hold() {
        ovs::SmoothingPolicy p(150.0);
        (void)p.decide(false, match_for(1), 1000.0);

        const auto d = p.decide(false, std::nullopt, 900.0);
        check(d.action == ovs::OverlayAction::Clear, "presentation time before the held frame should clear");
    }

    void test_new_match_replaces_held() {
        ovs::SmoothingPolicy p(150.0);
        (void)p.decide(false, match_for(1), 1000.0);
        (void)p.decide(false, match_for(2), 1016.0);

        const auto d = p.decide(false, std::nullopt, 1150.0);
        check(d.action == ovs::OverlayAction::Hold && d.frame && d.frame->frame_id == 2,
              "hold window should restart from the newest match");
    }

    void test_action_names() {
        check(std::string(ovs::overlay_action_name(ovs::OverlayAction::Draw)) == "draw", "draw name");
        check(std::string(ovs::overlay_action_name(ovs::OverlayAction::Hold)) == "hold", "hold name");
        check(std::string(ovs::overlay_action_name(ovs::OverlayAction::Clear)) == "clear", "clear name");
    }
}

int main() {
    test_match_draws();
    test_hold_within_window();
    test_clear_after_window();
    test_pause_clears();
    test_backwards_seek_does_not_hold();
    test_new_match_replaces_held();
    test_action_names();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all smoothing policy tests passed\n";
    return 0;
}
