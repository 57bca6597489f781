#include <common/config.hpp>

#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include <overlay/coordinate_mapper.hpp>

namespace ovs {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static double get_double(
        const YAML::Node& n, const char* key, double def) {
        return (n && n[key]) ? n[key].as<double>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static WebcamConfig parse_webcam_config(const YAML::Node& wc) {
        WebcamConfig c;
        if (!wc) return c;
        c.device = get_str(wc, "device", c.device);
        c.width = get_int(wc, "width", c.width);
        c.height = get_int(wc, "height", c.height);
        c.mjpg = get_bool(wc, "mjpg", get_bool(wc, "mjpeg", c.mjpg));
        return c;
    }

    static FileConfig parse_file_config(const YAML::Node& fc) {
        FileConfig c;
        if (!fc) return c;
        c.path = get_str(fc, "path", c.path);
        c.loop = get_bool(fc, "loop", c.loop);
        return c;
    }

    static RTSPConfig parse_rtsp_config(const YAML::Node& rc) {
        RTSPConfig c;
        if (!rc) return c;
        c.url = get_str(rc, "url", c.url);
        c.latency_ms = get_int(rc, "latency_ms", c.latency_ms);
        c.tcp = get_bool(rc, "tcp", c.tcp);
        return c;
    }

    static SourceConfig parse_source_config(const YAML::Node& s) {
        if (!s || !s.IsMap()) {
            throw std::runtime_error("[Config] no source specified!");
        }

        SourceConfig c;
        c.id = get_str(s, "id", c.id);
        c.type = get_str(s, "type", "unk");
        c.webcam = parse_webcam_config(s["webcam"]);
        c.file = parse_file_config(s["file"]);
        c.rtsp = parse_rtsp_config(s["rtsp"]);

        if (c.type != "webcam" && c.type != "file" && c.type != "rtsp") {
            throw std::runtime_error("[Config] unknown source type: " + c.type);
        }
        if (c.type == "rtsp" && c.rtsp.url.empty()) {
            throw std::runtime_error("[Config] RTSP source " + c.id + " has empty URL!");
        }
        if (c.type == "file" && c.file.path.empty()) {
            throw std::runtime_error("[Config] file source " + c.id + " has empty path!");
        }
        return c;
    }

    static DisplayConfig parse_display_config(const YAML::Node& d) {
        DisplayConfig c;
        if (d) {
            c.width = get_int(d, "width", c.width);
            c.height = get_int(d, "height", c.height);
            c.device_pixel_ratio = get_double(d, "device_pixel_ratio", c.device_pixel_ratio);
            c.fit = get_str(d, "fit", c.fit);
            c.refresh_hz = get_double(d, "refresh_hz", c.refresh_hz);
            c.frame_callbacks = get_bool(d, "frame_callbacks", c.frame_callbacks);
            c.interp = get_str(d, "interp", c.interp);
            c.jpeg_quality = get_int(d, "jpeg_quality", c.jpeg_quality);
        }

        if (c.width <= 0 || c.height <= 0) {
            throw std::runtime_error("[Config] display width/height must be > 0");
        }
        if (!(c.device_pixel_ratio > 0.0)) {
            throw std::runtime_error("[Config] display.device_pixel_ratio must be > 0");
        }
        if (!(c.refresh_hz > 0.0)) {
            throw std::runtime_error("[Config] display.refresh_hz must be > 0");
        }
        if (!is_known_fit_mode(c.fit)) {
            throw std::runtime_error("[Config] unknown display.fit: " + c.fit);
        }
        if (c.jpeg_quality < 1 || c.jpeg_quality > 100) {
            throw std::runtime_error("[Config] display.jpeg_quality must be in [1, 100]");
        }
        return c;
    }

    static OverlayConfig parse_overlay_config(const YAML::Node& o) {
        OverlayConfig c;
        if (o) {
            c.max_buffer = get_int(o, "max_buffer", c.max_buffer);
            c.tolerance_ms = get_double(o, "tolerance_ms", c.tolerance_ms);
            c.hold_ms = get_double(o, "hold_ms", c.hold_ms);
            c.layout_threshold_px = get_double(o, "layout_threshold_px", c.layout_threshold_px);
            c.line_width = get_double(o, "line_width", c.line_width);
            c.font_scale = get_double(o, "font_scale", c.font_scale);
            c.coco_labels = get_bool(o, "coco_labels", c.coco_labels);
        }

        if (c.max_buffer < 1) {
            throw std::runtime_error("[Config] overlay.max_buffer must be >= 1");
        }
        if (c.tolerance_ms < 0.0 || c.hold_ms < 0.0 || c.layout_threshold_px < 0.0) {
            throw std::runtime_error("[Config] overlay tolerance/hold/threshold must be >= 0");
        }
        return c;
    }

    static MetadataFeedConfig parse_metadata_config(const YAML::Node& m) {
        MetadataFeedConfig c;
        if (!m) return c;
        c.test_pattern = get_bool(m, "test_pattern", c.test_pattern);
        c.test_pattern_hz = get_double(m, "test_pattern_hz", c.test_pattern_hz);
        if (c.test_pattern && !(c.test_pattern_hz > 0.0)) {
            throw std::runtime_error("[Config] metadata.test_pattern_hz must be > 0");
        }
        return c;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        const YAML::Node srv = root["server"];
        cfg.server.url = get_str(srv, "host", cfg.server.url);
        cfg.server.port = get_int(srv, "port", cfg.server.port);

        cfg.source = parse_source_config(root["source"]);
        cfg.display = parse_display_config(root["display"]);
        cfg.overlay = parse_overlay_config(root["overlay"]);
        cfg.metadata = parse_metadata_config(root["metadata"]);
        return cfg;
    }
}
