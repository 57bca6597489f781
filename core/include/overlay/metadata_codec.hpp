#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <overlay/types.hpp>

namespace ovs {
    class MetadataDecodeError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct MetadataMessage {
        MetadataFrame frame;
        std::optional<double> analyzer_fps;
    };

    // Parses one analyzer message:
    //   {"timestamp": ms, "frame_id": n, "detections": [...], "fps": f}
    // camelCase keys (frameId, labelText) are accepted too. A missing or non-numeric
    // timestamp comes back as NaN for the buffer to sanitize. Keep-alive messages
    // ({"type":"ping"|"pong"}) yield std::nullopt. Throws MetadataDecodeError on bad
    // JSON, a non-object payload or a missing frame id. Detections without a usable
    // box are skipped.
    std::optional<MetadataMessage> decode_metadata_json(const std::string& payload);

    // Same, but malformed input is dropped instead of thrown. The reason goes to *error
    // when given, otherwise to the log.
    std::optional<MetadataMessage> try_decode_metadata(const std::string& payload,
                                                       std::string* error = nullptr);
}
