#pragma once

#include <functional>

#include <overlay/types.hpp>
#include <render/frame_scheduler.hpp>

namespace ovs {
    using ListenerId = uint64_t;

    // What the overlay needs to know about the video it sits on.
    class IVideoSource {
    public:
        virtual ~IVideoSource() = default;

        virtual int intrinsic_width() const = 0;
        virtual int intrinsic_height() const = 0;
        virtual double presentation_time_ms() const = 0;
        virtual bool paused() const = 0;

        // Layout of the presenting element.
        virtual ScreenRect element_rect() const = 0;
        virtual ScreenRect container_rect() const = 0;
        virtual double device_pixel_ratio() const = 0;
        virtual FitMode fit_mode() const = 0;

        // One-shot callback for the next presented frame. Returns 0 when unsupported.
        virtual CallbackId request_video_frame(FrameCallback cb) = 0;
        virtual void cancel_video_frame(CallbackId id) = 0;

        // Fired on resize, metadata load, dpr change and play/pause transitions.
        virtual ListenerId add_geometry_listener(std::function<void()> fn) = 0;
        virtual void remove_geometry_listener(ListenerId id) = 0;
    };
}
