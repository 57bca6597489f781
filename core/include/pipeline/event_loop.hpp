#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <render/frame_scheduler.hpp>

namespace ovs {
    // Single-threaded cooperative loop. Other threads hand work over with post();
    // tasks and timers all run on the thread inside run(). Implements the display
    // refresh scheduler with a frame-duration timer grid.
    class EventLoop final : public IFrameScheduler {
    public:
        explicit EventLoop(double refresh_hz = 60.0);
        ~EventLoop() override;

        EventLoop(const EventLoop&) = delete;
        EventLoop& operator=(const EventLoop&) = delete;

        // Thread-safe. Tasks posted after stop() are dropped.
        void post(std::function<void()> task);

        // Thread-safe one-shot timer.
        CallbackId call_after(std::chrono::milliseconds delay, FrameCallback cb);

        // Fires on the next refresh boundary.
        CallbackId request_frame(FrameCallback cb) override;
        void cancel_frame(CallbackId id) override;

        // Blocks until stop(). Returns false if the loop was already stopped.
        bool run();
        void stop();

        bool running() const { return running_.load(); }
        bool in_loop_thread() const;

        // Monotonic milliseconds since construction.
        double now_ms() const;
        double frame_interval_ms() const { return interval_ms_; }

    private:
        CallbackId add_timer_(double due_ms, FrameCallback cb);

        const std::chrono::steady_clock::time_point epoch_;
        double interval_ms_;

        mutable std::mutex m_;
        std::condition_variable cv_;
        std::deque<std::function<void()>> tasks_;
        std::multimap<double, CallbackId> due_;
        std::unordered_map<CallbackId, FrameCallback> timers_;
        CallbackId next_id_ = 1;

        std::atomic<bool> running_{false};
        bool stopped_ = false;
        std::thread::id loop_thread_;
    };
}
