#pragma once

#include <optional>

#include <overlay/metadata_buffer.hpp>
#include <overlay/types.hpp>

namespace ovs {
    enum class OverlayAction {
        Draw,
        Hold,
        Clear
    };

    const char* overlay_action_name(OverlayAction a);

    struct OverlayDecision {
        OverlayAction action = OverlayAction::Clear;
        const MetadataFrame* frame = nullptr; // set for Draw/Hold, owned by the policy
    };

    class SmoothingPolicy {
    public:
        explicit SmoothingPolicy(double hold_ms = 150.0) : hold_ms_(hold_ms) {}

        OverlayDecision decide(bool paused,
                               std::optional<MetadataMatch> match,
                               double presentation_time_ms);

        void reset() { held_.reset(); }

        bool has_held_frame() const { return held_.has_value(); }
        double hold_ms() const { return hold_ms_; }

    private:
        struct Held {
            MetadataFrame frame;
            double time_ms = 0.0;
        };

        double hold_ms_;
        std::optional<Held> held_;
    };
}
