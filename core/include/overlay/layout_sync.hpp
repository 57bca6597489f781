#pragma once

#include <optional>

#include <overlay/types.hpp>

namespace ovs {
    class IDrawSurface;

    // Logical geometry of the drawing surface, relative to the container.
    struct SurfaceLayout {
        double width = 0.0;
        double height = 0.0;
        double top = 0.0;
        double left = 0.0;
        double dpr = 1.0;
    };

    struct LayoutChange {
        bool size_changed = false;
        bool position_changed = false;

        bool any() const { return size_changed || position_changed; }
    };

    struct LayoutInput {
        ScreenRect element;
        ScreenRect container;
        double dpr = 1.0;
        int intrinsic_w = 0;
        int intrinsic_h = 0;
        FitMode fit = FitMode::Contain;
    };

    // Size counts as changed on any dpr change.
    LayoutChange compare_layouts(const SurfaceLayout& current,
                                 const SurfaceLayout& previous,
                                 double threshold_px);

    // Surface covering the displayed media region inside the element.
    SurfaceLayout compute_surface_layout(const LayoutInput& in);

    // Keeps the overlay surface aligned with the displayed video region. Applies
    // geometry only past a threshold, since resizing the surface drops its transform
    // and sub-pixel layout jitter would otherwise reset it every tick.
    class LayoutSynchronizer {
    public:
        explicit LayoutSynchronizer(double threshold_px = 0.5) : threshold_px_(threshold_px) {}

        LayoutChange reconcile(const LayoutInput& in, IDrawSurface& surface);

        // Next reconcile() re-applies unconditionally.
        void invalidate() { last_.reset(); }

        const std::optional<SurfaceLayout>& last_applied() const { return last_; }
        double threshold_px() const { return threshold_px_; }

    private:
        double threshold_px_;
        std::optional<SurfaceLayout> last_;
    };
}
