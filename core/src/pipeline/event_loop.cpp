#include <pipeline/event_loop.hpp>

#include <cmath>
#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace ovs {
    EventLoop::EventLoop(double refresh_hz)
        : epoch_(std::chrono::steady_clock::now()),
          interval_ms_(1000.0 / (refresh_hz > 0.0 ? refresh_hz : 60.0)) {}

    EventLoop::~EventLoop() { stop(); }

    double EventLoop::now_ms() const {
        const auto d = std::chrono::steady_clock::now() - epoch_;
        return std::chrono::duration<double, std::milli>(d).count();
    }

    bool EventLoop::in_loop_thread() const {
        std::lock_guard lk(m_);
        return running_ && loop_thread_ == std::this_thread::get_id();
    }

    void EventLoop::post(std::function<void()> task) {
        if (!task) return;
        {
            std::lock_guard lk(m_);
            if (stopped_) return;
            tasks_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    CallbackId EventLoop::add_timer_(double due_ms, FrameCallback cb) {
        CallbackId id = 0;
        {
            std::lock_guard lk(m_);
            if (stopped_ || !cb) return 0;
            id = next_id_++;
            timers_.emplace(id, std::move(cb));
            due_.emplace(due_ms, id);
        }
        cv_.notify_one();
        return id;
    }

    CallbackId EventLoop::call_after(std::chrono::milliseconds delay, FrameCallback cb) {
        return add_timer_(now_ms() + static_cast<double>(delay.count()), std::move(cb));
    }

    CallbackId EventLoop::request_frame(FrameCallback cb) {
        const double now = now_ms();
        const double next = (std::floor(now / interval_ms_) + 1.0) * interval_ms_;
        return add_timer_(next, std::move(cb));
    }

    void EventLoop::cancel_frame(CallbackId id) {
        std::lock_guard lk(m_);
        // stale entry in due_ is skipped when it comes up
        timers_.erase(id);
    }

    bool EventLoop::run() {
        {
            std::lock_guard lk(m_);
            if (stopped_) return false;
            loop_thread_ = std::this_thread::get_id();
        }
        running_ = true;

        std::vector<CallbackId> fired;
        while (true) {
            std::deque<std::function<void()>> tasks;
            double now = 0.0;
            fired.clear();
            {
                std::unique_lock lk(m_);
                while (!stopped_ && tasks_.empty()) {
                    if (due_.empty()) {
                        cv_.wait(lk);
                        continue;
                    }
                    const double wait_ms = due_.begin()->first - now_ms();
                    if (wait_ms <= 0.0) break;
                    cv_.wait_for(lk, std::chrono::duration<double, std::milli>(wait_ms));
                }
                if (stopped_) break;

                tasks.swap(tasks_);
                now = now_ms();
                while (!due_.empty() && due_.begin()->first <= now) {
                    fired.push_back(due_.begin()->second);
                    due_.erase(due_.begin());
                }
            }

            for (auto& t : tasks) {
                try {
                    t();
                } catch (const std::exception& e) {
                    std::cerr << "[EventLoop](run) task failed: " << e.what() << "\n";
                }
            }

            for (CallbackId id : fired) {
                // looked up late so a cancel issued by an earlier callback still wins
                FrameCallback cb;
                {
                    std::lock_guard lk(m_);
                    auto it = timers_.find(id);
                    if (it == timers_.end()) continue;
                    cb = std::move(it->second);
                    timers_.erase(it);
                }
                try {
                    cb(now);
                } catch (const std::exception& e) {
                    std::cerr << "[EventLoop](run) timer failed: " << e.what() << "\n";
                }
            }
        }

        running_ = false;
        return true;
    }

    void EventLoop::stop() {
        {
            std::lock_guard lk(m_);
            if (stopped_) return;
            stopped_ = true;
            tasks_.clear();
            due_.clear();
            timers_.clear();
        }
        cv_.notify_all();
    }
}
