#include <overlay/smoothing_policy.hpp>

#include <utility>

namespace ovs {
    const char* overlay_action_name(OverlayAction a) {
        switch (a) {
            case OverlayAction::Draw: return "draw";
            case OverlayAction::Hold: return "hold";
            case OverlayAction::Clear: break;
        }
        return "clear";
    }

    OverlayDecision SmoothingPolicy::decide(bool paused,
                                            std::optional<MetadataMatch> match,
                                            double presentation_time_ms) {
        if (paused) {
            held_.reset();
            return {};
        }

        if (match) {
            held_ = Held{std::move(match->frame), presentation_time_ms};
            return {OverlayAction::Draw, &held_->frame};
        }

        if (held_) {
            const double age = presentation_time_ms - held_->time_ms;
            if (age >= 0.0 && age <= hold_ms_) {
                return {OverlayAction::Hold, &held_->frame};
            }
        }

        held_.reset();
        return {};
    }
}
