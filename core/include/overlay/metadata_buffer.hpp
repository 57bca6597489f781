#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include <overlay/types.hpp>

namespace ovs {
    struct MetadataMatch {
        MetadataFrame frame;
        size_t index = 0;   // position in the buffer at match time
        double delta = 0.0; // |adjusted timestamp - presentation time|, ms
    };

    // Time-ordered store of recent metadata frames and the matcher that pairs them with
    // video presentation time. Owns the metadata-to-presentation clock offset.
    //
    // Every public call leaves the buffer sorted, bounded and free of duplicate frame ids,
    // so ingest() and match() can interleave in any order on the owning thread.
    class MetadataBuffer {
    public:
        struct Options {
            size_t max_frames = 120;
            double tolerance_ms = 120.0;
        };

        using Clock = std::function<double()>;

        MetadataBuffer();
        explicit MetadataBuffer(Options opt, Clock now_ms = {});

        // Inserts or replaces (same frame_id). Non-finite timestamps become now_ms().
        void ingest(MetadataFrame frame);

        // Best frame within tolerance. Consumes it and everything older.
        std::optional<MetadataMatch> match(double presentation_time_ms);

        // Empties the buffer and forgets the clock offset.
        void clear();

        size_t size() const { return frames_.size(); }
        bool empty() const { return frames_.empty(); }
        const std::vector<MetadataFrame>& frames() const { return frames_; }

        std::optional<double> clock_offset() const { return offset_; }
        const Options& options() const { return opt_; }

    private:
        Options opt_;
        Clock now_ms_;
        std::vector<MetadataFrame> frames_; // ascending by timestamp
        std::optional<double> offset_;
    };

    // Wall clock in milliseconds since the Unix epoch.
    double wall_clock_ms();
}
