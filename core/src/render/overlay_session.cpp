#include <render/overlay_session.hpp>

#include <utility>

namespace ovs {
    OverlaySession::OverlaySession(IVideoSource* video,
                                   IDrawSurface* surface,
                                   IFrameScheduler& scheduler,
                                   OverlaySessionOptions opt,
                                   RenderLoop::Hooks hooks)
        : surface_(surface),
          buffer_(opt.buffer, std::move(opt.clock)),
          policy_(opt.hold_ms),
          layout_(opt.layout_threshold_px),
          painter_(std::move(opt.painter)) {
        loop_ = std::make_unique<RenderLoop>(video,
                                             surface,
                                             scheduler,
                                             buffer_,
                                             policy_,
                                             layout_,
                                             painter_,
                                             std::move(hooks));
    }

    void OverlaySession::reset() {
        buffer_.clear();
        policy_.reset();
        if (surface_) surface_->clear();
    }
}
