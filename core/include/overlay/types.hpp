#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ovs {
    // Normalized to intrinsic media size, (x, y) is top-left. All in [0, 1].
    struct NormalizedBox {
        double x = 0.0;
        double y = 0.0;
        double width = 0.0;
        double height = 0.0;
    };

    struct Point3 {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
    };

    struct BoundingBox {
        std::string id;
        std::string label; // class id or string code
        std::optional<std::string> label_text;
        std::optional<float> confidence;
        NormalizedBox box;
        std::optional<double> distance; // meters
        std::optional<Point3> position;
        bool interpolated = false;
    };

    struct MetadataFrame {
        // Sender clock, milliseconds. Not the presentation clock.
        double timestamp = 0.0;
        int64_t frame_id = 0;
        std::vector<BoundingBox> detections;
    };

    struct PixelBox {
        double x = 0.0;
        double y = 0.0;
        double width = 0.0;
        double height = 0.0;
    };

    struct DisplayedRect {
        double width = 0.0;
        double height = 0.0;
        double offset_x = 0.0;
        double offset_y = 0.0;
    };

    // On-screen rectangle, CSS-like logical pixels.
    struct ScreenRect {
        double left = 0.0;
        double top = 0.0;
        double width = 0.0;
        double height = 0.0;
    };

    enum class FitMode {
        Contain,
        Cover,
        Fill,
        None,
        ScaleDown
    };
}
