#include <render/render_loop.hpp>

#include <utility>

namespace ovs {
    RenderLoop::RenderLoop(IVideoSource* video,
                           IDrawSurface* surface,
                           IFrameScheduler& scheduler,
                           MetadataBuffer& buffer,
                           SmoothingPolicy& policy,
                           LayoutSynchronizer& layout,
                           const OverlayPainter& painter,
                           Hooks hooks)
        : video_(video),
          surface_(surface),
          scheduler_(scheduler),
          buffer_(buffer),
          policy_(policy),
          layout_(layout),
          painter_(painter),
          hooks_(std::move(hooks)) {}

    RenderLoop::~RenderLoop() { stop(); }

    bool RenderLoop::start() {
        if (state_ == State::Running) return true;
        if (!video_ || !surface_) return false;

        state_ = State::Running;
        fps_window_start_ = -1.0;
        fps_frames_ = 0;
        last_pt_.reset();

        listeners_.push_back(video_->add_geometry_listener([this] { on_source_changed_(); }));

        layout_.invalidate();
        (void)reconcile_layout_();
        schedule_next_();
        return true;
    }

    void RenderLoop::stop() {
        if (state_ == State::Stopped) return;
        state_ = State::Stopped;

        cancel_pending_();
        if (video_) {
            for (ListenerId id : listeners_) video_->remove_geometry_listener(id);
        }
        listeners_.clear();
    }

    void RenderLoop::on_source_changed_() {
        if (state_ != State::Running) return;
        (void)reconcile_layout_();

        // a frame request parked on a now-paused video would never fire
        if (pending_id_ != 0 && pending_on_video_ && video_->paused()) {
            cancel_pending_();
            schedule_next_();
        }
    }

    void RenderLoop::cancel_pending_() {
        if (pending_id_ == 0) return;
        if (pending_on_video_) {
            video_->cancel_video_frame(pending_id_);
        } else {
            scheduler_.cancel_frame(pending_id_);
        }
        pending_id_ = 0;
        pending_on_video_ = false;
        ++generation_;
    }

    void RenderLoop::schedule_next_() {
        if (state_ != State::Running || pending_id_ != 0) return;

        const uint64_t gen = ++generation_;
        auto cb = [this, gen](double now_ms) { on_frame_(gen, now_ms); };

        // A paused video presents no frames, so ticks come from the refresh scheduler
        // to keep the clear-on-pause path running.
        if (!video_->paused()) {
            const CallbackId id = video_->request_video_frame(cb);
            if (id != 0) {
                pending_id_ = id;
                pending_on_video_ = true;
                return;
            }
        }

        pending_id_ = scheduler_.request_frame(std::move(cb));
        pending_on_video_ = false;
    }

    void RenderLoop::on_frame_(uint64_t generation, double now_ms) {
        // a callback from a cancelled request must not adopt the current one
        if (generation != generation_) return;

        // the request that fired is spent
        pending_id_ = 0;
        pending_on_video_ = false;
        if (state_ != State::Running) return;

        tick_(now_ms);
        schedule_next_();
    }

    LayoutChange RenderLoop::reconcile_layout_() {
        LayoutInput in;
        in.element = video_->element_rect();
        in.container = video_->container_rect();
        in.dpr = video_->device_pixel_ratio();
        in.intrinsic_w = video_->intrinsic_width();
        in.intrinsic_h = video_->intrinsic_height();
        in.fit = video_->fit_mode();
        return layout_.reconcile(in, *surface_);
    }

    void RenderLoop::tick_(double now_ms) {
        TickReport report;
        report.now_ms = now_ms;
        report.layout = reconcile_layout_();

        const double pt = video_->presentation_time_ms();
        const bool paused = video_->paused();
        report.presentation_time_ms = pt;

        if (!paused && last_pt_ && pt < *last_pt_ - buffer_.options().tolerance_ms) {
            buffer_.clear();
            policy_.reset();
            report.discontinuity = true;
        }
        if (!paused) last_pt_ = pt;

        // no lookup while paused so buffered frames survive until playback resumes
        std::optional<MetadataMatch> match;
        if (!paused) match = buffer_.match(pt);

        const OverlayDecision decision = policy_.decide(paused, std::move(match), pt);
        report.action = decision.action;

        surface_->clear();
        if (decision.frame && decision.action != OverlayAction::Clear) {
            report.boxes = painter_.paint(*surface_, *decision.frame);
        }

        count_frame_(now_ms, decision.action != OverlayAction::Clear);
        if (hooks_.on_tick) hooks_.on_tick(report);
    }

    void RenderLoop::count_frame_(double now_ms, bool painted) {
        if (fps_window_start_ < 0.0) fps_window_start_ = now_ms;
        if (painted) ++fps_frames_;

        if (now_ms - fps_window_start_ >= 1000.0) {
            fps_ = fps_frames_;
            fps_frames_ = 0;
            fps_window_start_ = now_ms;
            if (hooks_.on_draw_rate) hooks_.on_draw_rate(fps_);
        }
    }
}
