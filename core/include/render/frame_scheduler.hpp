#pragma once

#include <cstdint>
#include <functional>

namespace ovs {
    using CallbackId = uint64_t;
    // Argument is the scheduler's monotonic time in milliseconds.
    using FrameCallback = std::function<void(double now_ms)>;

    // One callback per display refresh. Requests are one-shot and cancelable.
    class IFrameScheduler {
    public:
        virtual ~IFrameScheduler() = default;
        virtual CallbackId request_frame(FrameCallback cb) = 0;
        virtual void cancel_frame(CallbackId id) = 0;
    };
}
