#include <app/test_pattern_feed.hpp>
#include <pipeline/event_loop.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    bool ready(std::future<void>& f, int ms = 2000) {
        return f.wait_for(std::chrono::milliseconds(ms)) == std::future_status::ready;
    }

    void test_posted_tasks_run_in_order_on_loop_thread() {
        ovs::EventLoop loop(60.0);
        std::thread t([&] { loop.run(); });

        std::vector<int> order;
        std::atomic<bool> on_loop{true};
        std::promise<void> done;
        auto f = done.get_future();
        for (int i = 0; i < 5; ++i) {
            loop.post([&, i] {
                if (!loop.in_loop_thread()) on_loop = false;
                order.push_back(i);
                if (i == 4) done.set_value();
            });
        }

        check(ready(f), "posted tasks should run");
        loop.stop();
        t.join();

        check(order == std::vector<int>({0, 1, 2, 3, 4}), "posted tasks should run in order");
        check(on_loop, "tasks should run on the loop thread");
        check(!loop.in_loop_thread(), "caller thread is not the loop thread");
    }

    void test_request_frame_fires_on_refresh_boundary() {
        ovs::EventLoop loop(50.0);
        check(loop.frame_interval_ms() == 20.0, "50 Hz should give a 20ms frame interval");
        std::thread t([&] { loop.run(); });

        std::promise<void> done;
        auto f = done.get_future();
        double fired_at = -1.0;
        const double requested_at = loop.now_ms();
        loop.request_frame([&](double now) {
            fired_at = now;
            done.set_value();
        });

        check(ready(f), "frame callback should fire");
        loop.stop();
        t.join();

        check(fired_at >= requested_at, "frame callback should not fire early");
        check(fired_at - requested_at <= 1000.0, "frame callback should fire within a second");
    }

    void test_cancelled_frame_never_fires() {
        ovs::EventLoop loop(60.0);

        // cancelled before the loop runs so the boundary cannot race the cancel
        std::atomic<bool> fired{false};
        const auto id = loop.request_frame([&](double) { fired = true; });
        check(id != 0, "request_frame should return an id");
        loop.cancel_frame(id);
        std::thread t([&] { loop.run(); });

        std::promise<void> done;
        auto f = done.get_future();
        loop.call_after(std::chrono::milliseconds(100), [&](double) { done.set_value(); });
        check(ready(f), "later timer should still fire");
        loop.stop();
        t.join();

        check(!fired, "cancelled frame callback should not run");
    }

    void test_call_after_waits() {
        ovs::EventLoop loop;
        std::thread t([&] { loop.run(); });

        std::promise<void> done;
        auto f = done.get_future();
        const double start = loop.now_ms();
        double fired_at = 0.0;
        loop.call_after(std::chrono::milliseconds(30), [&](double now) {
            fired_at = now;
            done.set_value();
        });

        check(ready(f), "call_after should fire");
        loop.stop();
        t.join();
        check(fired_at - start >= 30.0, "call_after should wait at least the delay");
    }

    void test_throwing_task_does_not_stop_loop() {
        ovs::EventLoop loop;
        std::thread t([&] { loop.run(); });

        std::promise<void> done;
        auto f = done.get_future();
        loop.post([] { throw std::runtime_error("boom"); });
        loop.post([&] { done.set_value(); });

        check(ready(f), "loop should survive a throwing task");
        loop.stop();
        t.join();
    }

    void test_test_pattern_frame() {
        const auto f = ovs::TestPatternFeed::make_frame(0.0, 3);
        check(f.frame_id == 3 && f.timestamp == 0.0, "pattern frame should carry id and timestamp");
        check(f.detections.size() == 1, "pattern frame should hold one box");
        if (f.detections.empty()) return;

        const auto& d = f.detections[0];
        check(d.id == "test-object-1" && d.label == "Test Object", "pattern box should be labeled");
        check(std::abs(d.box.x - 0.3) < 1e-9 && std::abs(d.box.y - 0.5) < 1e-9, "pattern box should start at (0.3, 0.5)");
        check(std::abs(d.box.width - 0.25) < 1e-9 && std::abs(d.box.height - 0.3) < 1e-9,
              "pattern box should start at 0.25 x 0.3");
        check(d.distance && std::abs(*d.distance - 1.5) < 1e-9, "pattern distance should start at 1.5m");

        const auto later = ovs::TestPatternFeed::make_frame(1000.0, 4);
        check(later.detections[0].box.x != d.box.x, "pattern box should move over time");
    }

    void test_test_pattern_feed_emits_on_loop() {
        ovs::EventLoop loop;
        std::vector<ovs::MetadataFrame> got;
        std::promise<void> done;
        auto f = done.get_future();
        double clock = 1000.0;

        ovs::TestPatternFeed feed(loop, 100.0, [&](ovs::MetadataFrame frame) {
            got.push_back(std::move(frame));
            if (got.size() == 3) {
                feed.stop();
                done.set_value();
            }
        }, [&clock] { return clock += 10.0; });

        loop.post([&] { feed.start(); });
        std::thread t([&] { loop.run(); });

        check(ready(f), "feed should emit frames");
        loop.stop();
        t.join();

        check(got.size() == 3, "stopped feed should emit no more frames");
        check(!feed.running() && feed.frames_emitted() == 3, "feed should count emitted frames");
        if (got.size() == 3) {
            check(got[0].frame_id == 0 && got[2].frame_id == 2, "frame ids should count up from 0");
            check(got[0].timestamp == 1010.0 && got[1].timestamp == 1020.0, "timestamps should come from the clock");
        }
    }

    void test_stop_is_final() {
        ovs::EventLoop loop;
        loop.stop();
        loop.stop();

        check(!loop.run(), "run after stop should return immediately");
        check(loop.request_frame([](double) {}) == 0, "requests after stop should be refused");

        bool ran = false;
        loop.post([&] { ran = true; });
        check(!ran && !loop.running(), "tasks after stop should be dropped");
    }
}

int main() {
    test_posted_tasks_run_in_order_on_loop_thread();
    test_request_frame_fires_on_refresh_boundary();
    test_cancelled_frame_never_fires();
    test_call_after_waits();
    test_throwing_task_does_not_stop_loop();
    test_test_pattern_frame();
    test_test_pattern_feed_emits_on_loop();
    test_stop_is_final();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all event loop tests passed\n";
    return 0;
}
