#pragma once

#include <memory>

#include <overlay/layout_sync.hpp>
#include <overlay/metadata_buffer.hpp>
#include <overlay/smoothing_policy.hpp>
#include <render/overlay_painter.hpp>
#include <render/render_loop.hpp>

namespace ovs {
    struct OverlaySessionOptions {
        MetadataBuffer::Options buffer;
        double hold_ms = 150.0;
        double layout_threshold_px = 0.5;
        OverlayPainterConfig painter;
        MetadataBuffer::Clock clock; // empty = wall clock
    };

    // One video+metadata session: buffer, clock offset, held frame and the render loop
    // that owns the surface. Every method must be called on the owning thread.
    class OverlaySession {
    public:
        OverlaySession(IVideoSource* video,
                       IDrawSurface* surface,
                       IFrameScheduler& scheduler,
                       OverlaySessionOptions opt = {},
                       RenderLoop::Hooks hooks = {});

        bool start() { return loop_->start(); }
        void stop() { loop_->stop(); }

        void ingest(MetadataFrame frame) { buffer_.ingest(std::move(frame)); }

        // Clear signal: empties the buffer, drops the held frame and the clock offset,
        // and blanks the surface.
        void reset();

        const MetadataBuffer& buffer() const { return buffer_; }
        const SmoothingPolicy& policy() const { return policy_; }
        const LayoutSynchronizer& layout() const { return layout_; }
        const RenderLoop& loop() const { return *loop_; }

    private:
        IDrawSurface* surface_;
        MetadataBuffer buffer_;
        SmoothingPolicy policy_;
        LayoutSynchronizer layout_;
        OverlayPainter painter_;
        std::unique_ptr<RenderLoop> loop_;
    };
}
