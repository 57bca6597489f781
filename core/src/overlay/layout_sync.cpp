#include <overlay/layout_sync.hpp>

#include <algorithm>
#include <cmath>

#include <overlay/coordinate_mapper.hpp>
#include <render/draw_surface.hpp>

namespace ovs {
    LayoutChange compare_layouts(const SurfaceLayout& current,
                                 const SurfaceLayout& previous,
                                 double threshold_px) {
        LayoutChange c;
        c.size_changed = std::abs(current.width - previous.width) > threshold_px ||
                         std::abs(current.height - previous.height) > threshold_px ||
                         current.dpr != previous.dpr;
        c.position_changed = std::abs(current.top - previous.top) > threshold_px ||
                             std::abs(current.left - previous.left) > threshold_px;
        return c;
    }

    SurfaceLayout compute_surface_layout(const LayoutInput& in) {
        const DisplayedRect dr = displayed_rect(in.intrinsic_w,
                                                in.intrinsic_h,
                                                in.element.width,
                                                in.element.height,
                                                in.fit);
        SurfaceLayout l;
        l.width = dr.width;
        l.height = dr.height;
        l.left = in.element.left - in.container.left + dr.offset_x;
        l.top = in.element.top - in.container.top + dr.offset_y;
        l.dpr = in.dpr > 0.0 ? in.dpr : 1.0;
        return l;
    }

    LayoutChange LayoutSynchronizer::reconcile(const LayoutInput& in, IDrawSurface& surface) {
        if (!(in.element.width > 0.0) || !(in.element.height > 0.0)) return {};

        SurfaceLayout next = compute_surface_layout(in);
        if (!(next.width > 0.0) || !(next.height > 0.0)) return {};

        LayoutChange change;
        if (last_) {
            change = compare_layouts(next, *last_, threshold_px_);
        } else {
            change.size_changed = true;
            change.position_changed = true;
        }
        if (!change.any()) return change;

        if (change.size_changed) {
            const int pw = std::max(1, static_cast<int>(std::lround(next.width * next.dpr)));
            const int ph = std::max(1, static_cast<int>(std::lround(next.height * next.dpr)));
            surface.resize(pw, ph);
            surface.set_scale(next.dpr);
        } else {
            // remember the size the surface actually has
            next.width = last_->width;
            next.height = last_->height;
        }
        surface.place(next.left, next.top, next.width, next.height);

        last_ = next;
        return change;
    }
}
