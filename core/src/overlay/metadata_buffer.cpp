#include <overlay/metadata_buffer.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <utility>

namespace ovs {
    double wall_clock_ms() {
        using namespace std::chrono;
        return static_cast<double>(
            duration_cast<microseconds>(system_clock::now().time_since_epoch()).count()) / 1000.0;
    }

    MetadataBuffer::MetadataBuffer() : MetadataBuffer(Options{}) {}

    MetadataBuffer::MetadataBuffer(Options opt, Clock now_ms)
        : opt_(opt),
          now_ms_(now_ms ? std::move(now_ms) : Clock(wall_clock_ms)) {
        if (opt_.max_frames < 1) opt_.max_frames = 1;
        frames_.reserve(opt_.max_frames + 1);
    }

    void MetadataBuffer::ingest(MetadataFrame frame) {
        if (!std::isfinite(frame.timestamp)) {
            frame.timestamp = now_ms_();
        }

        auto same_id = std::find_if(frames_.begin(), frames_.end(), [&](const MetadataFrame& f) {
            return f.frame_id == frame.frame_id;
        });
        if (same_id != frames_.end()) frames_.erase(same_id);

        // upper_bound keeps equal timestamps in arrival order
        auto pos = std::upper_bound(frames_.begin(),
                                    frames_.end(),
                                    frame.timestamp,
                                    [](double ts, const MetadataFrame& f) { return ts < f.timestamp; });
        frames_.insert(pos, std::move(frame));

        if (frames_.size() > opt_.max_frames) {
            const auto overflow = static_cast<std::ptrdiff_t>(frames_.size() - opt_.max_frames);
            frames_.erase(frames_.begin(), frames_.begin() + overflow);
        }
    }

    std::optional<MetadataMatch> MetadataBuffer::match(double presentation_time_ms) {
        if (frames_.empty()) return std::nullopt;

        if (!offset_) {
            offset_ = frames_.front().timestamp - presentation_time_ms;
        }
        const double offset = *offset_;

        size_t best_index = 0;
        double best_delta = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < frames_.size(); ++i) {
            const double adjusted = frames_[i].timestamp - offset;
            const double delta = std::abs(adjusted - presentation_time_ms);
            if (delta < best_delta) {
                best_delta = delta;
                best_index = i;
            }
        }

        if (!(best_delta <= opt_.tolerance_ms)) return std::nullopt;

        MetadataMatch m;
        m.frame = std::move(frames_[best_index]);
        m.index = best_index;
        m.delta = best_delta;
        frames_.erase(frames_.begin(), frames_.begin() + static_cast<std::ptrdiff_t>(best_index) + 1);
        return m;
    }

    void MetadataBuffer::clear() {
        frames_.clear();
        offset_.reset();
    }
}
