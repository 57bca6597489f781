#include <overlay/metadata_codec.hpp>

#include <cmath>
#include <iostream>
#include <limits>

#include <nlohmann/json.hpp>

namespace ovs {
    namespace {
        using nlohmann::json;

        const json* find_key(const json& obj, const char* a, const char* b = nullptr) {
            auto it = obj.find(a);
            if (it != obj.end() && !it->is_null()) return &*it;
            if (b) {
                it = obj.find(b);
                if (it != obj.end() && !it->is_null()) return &*it;
            }
            return nullptr;
        }

        std::optional<double> get_number(const json& obj, const char* key) {
            const json* v = find_key(obj, key);
            if (!v || !v->is_number()) return std::nullopt;
            return v->get<double>();
        }

        std::optional<int64_t> get_frame_id(const json& obj) {
            const json* v = find_key(obj, "frame_id", "frameId");
            if (!v) return std::nullopt;
            if (v->is_number_integer()) return v->get<int64_t>();
            if (v->is_number_float()) {
                const double d = v->get<double>();
                if (std::isfinite(d) && d == std::floor(d)) return static_cast<int64_t>(d);
            }
            return std::nullopt;
        }

        std::string label_of(const json& det) {
            const json* v = find_key(det, "label");
            if (!v) return {};
            if (v->is_string()) return v->get<std::string>();
            if (v->is_number_integer()) return std::to_string(v->get<int64_t>());
            if (v->is_number()) return std::to_string(static_cast<int64_t>(v->get<double>()));
            return {};
        }

        bool parse_box(const json& det, NormalizedBox& out) {
            const json* b = find_key(det, "box");
            if (!b || !b->is_object()) return false;
            const auto x = get_number(*b, "x");
            const auto y = get_number(*b, "y");
            const auto w = get_number(*b, "width");
            const auto h = get_number(*b, "height");
            if (!x || !y || !w || !h) return false;
            out = {*x, *y, *w, *h};
            return true;
        }

        std::optional<BoundingBox> parse_detection(const json& det, int64_t frame_id, size_t index) {
            if (!det.is_object()) return std::nullopt;

            BoundingBox bb;
            if (!parse_box(det, bb.box)) return std::nullopt;

            const json* id = find_key(det, "id");
            if (id && id->is_string()) {
                bb.id = id->get<std::string>();
            } else {
                bb.id = "detection-" + std::to_string(frame_id) + "-" + std::to_string(index);
            }

            bb.label = label_of(det);

            const json* text = find_key(det, "label_text", "labelText");
            if (text && text->is_string()) bb.label_text = text->get<std::string>();

            if (auto c = get_number(det, "confidence")) bb.confidence = static_cast<float>(*c);
            if (auto d = get_number(det, "distance")) bb.distance = *d;

            const json* pos = find_key(det, "position");
            if (pos && pos->is_object()) {
                const auto px = get_number(*pos, "x");
                const auto py = get_number(*pos, "y");
                const auto pz = get_number(*pos, "z");
                if (px && py && pz) bb.position = Point3{*px, *py, *pz};
            }

            const json* interp = find_key(det, "interpolated");
            bb.interpolated = interp && interp->is_boolean() && interp->get<bool>();
            return bb;
        }
    } // namespace

    std::optional<MetadataMessage> decode_metadata_json(const std::string& payload) {
        json root;
        try {
            root = json::parse(payload);
        } catch (const json::parse_error& e) {
            throw MetadataDecodeError(std::string("invalid json: ") + e.what());
        }

        if (!root.is_object()) {
            throw MetadataDecodeError("metadata payload is not an object");
        }

        const json* type = find_key(root, "type");
        if (type && type->is_string()) {
            const std::string t = type->get<std::string>();
            if (t == "ping" || t == "pong") return std::nullopt;
        }

        const auto frame_id = get_frame_id(root);
        if (!frame_id) {
            throw MetadataDecodeError("missing frame_id");
        }

        MetadataMessage msg;
        msg.frame.frame_id = *frame_id;
        msg.frame.timestamp = get_number(root, "timestamp")
                                  .value_or(std::numeric_limits<double>::quiet_NaN());
        msg.analyzer_fps = get_number(root, "fps");

        const json* dets = find_key(root, "detections");
        if (dets && dets->is_array()) {
            msg.frame.detections.reserve(dets->size());
            for (size_t i = 0; i < dets->size(); ++i) {
                if (auto bb = parse_detection((*dets)[i], *frame_id, i)) {
                    msg.frame.detections.push_back(std::move(*bb));
                }
            }
        }
        return msg;
    }

    std::optional<MetadataMessage> try_decode_metadata(const std::string& payload, std::string* error) {
        std::string reason;
        try {
            return decode_metadata_json(payload);
        } catch (const MetadataDecodeError& e) {
            reason = e.what();
        } catch (const nlohmann::json::exception& e) {
            reason = e.what();
        }

        if (error) {
            *error = reason;
        } else {
            std::cerr << "[Metadata](decode) dropped message: " << reason << "\n";
        }
        return std::nullopt;
    }
}
