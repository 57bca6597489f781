#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include <overlay/layout_sync.hpp>
#include <overlay/metadata_buffer.hpp>
#include <overlay/smoothing_policy.hpp>
#include <render/draw_surface.hpp>
#include <render/frame_scheduler.hpp>
#include <render/overlay_painter.hpp>
#include <render/video_source.hpp>

namespace ovs {
    struct TickReport {
        OverlayAction action = OverlayAction::Clear;
        double now_ms = 0.0;
        double presentation_time_ms = 0.0;
        int boxes = 0;
        LayoutChange layout;
        bool discontinuity = false; // presentation time jumped back, buffer was reset
    };

    // Per-frame driver: layout, presentation time, smoothing decision, paint, draw rate.
    // Prefers the video's per-frame callback and falls back to the refresh scheduler.
    // Exactly one frame request is outstanding while running.
    // Presentation time stepping back by more than the match tolerance (a rewind or a
    // looped file) starts a new timeline: the buffer, its clock offset and the held frame
    // are dropped.
    class RenderLoop {
    public:
        struct Hooks {
            std::function<void(int fps)> on_draw_rate; // once per second
            std::function<void(const TickReport&)> on_tick;
        };

        enum class State {
            Stopped,
            Running
        };

        RenderLoop(IVideoSource* video,
                   IDrawSurface* surface,
                   IFrameScheduler& scheduler,
                   MetadataBuffer& buffer,
                   SmoothingPolicy& policy,
                   LayoutSynchronizer& layout,
                   const OverlayPainter& painter,
                   Hooks hooks = {});
        ~RenderLoop();

        RenderLoop(const RenderLoop&) = delete;
        RenderLoop& operator=(const RenderLoop&) = delete;

        // No-op (false) without a video source or surface.
        bool start();
        // Idempotent. Cancels the pending request and drops geometry listeners.
        void stop();

        State state() const { return state_; }
        bool running() const { return state_ == State::Running; }
        int draw_rate() const { return fps_; }

    private:
        void on_frame_(uint64_t generation, double now_ms);
        void on_source_changed_();
        void tick_(double now_ms);
        LayoutChange reconcile_layout_();
        void schedule_next_();
        void cancel_pending_();
        void count_frame_(double now_ms, bool painted);

        IVideoSource* video_;
        IDrawSurface* surface_;
        IFrameScheduler& scheduler_;
        MetadataBuffer& buffer_;
        SmoothingPolicy& policy_;
        LayoutSynchronizer& layout_;
        const OverlayPainter& painter_;
        Hooks hooks_;

        State state_ = State::Stopped;

        CallbackId pending_id_ = 0;
        bool pending_on_video_ = false;
        uint64_t generation_ = 0;
        std::vector<ListenerId> listeners_;

        double fps_window_start_ = -1.0;
        int fps_frames_ = 0;
        int fps_ = 0;

        std::optional<double> last_pt_;
    };
}
