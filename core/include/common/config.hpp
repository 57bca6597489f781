#pragma once

#include <string>

namespace ovs {
    struct WebcamConfig {
        std::string device = "/dev/video0";
        int width = 1280;
        int height = 720;
        bool mjpg = true;
    };

    struct FileConfig {
        std::string path;
        bool loop = false;
    };

    struct RTSPConfig {
        std::string url;
        int latency_ms = 200;
        bool tcp = true;
    };

    struct SourceConfig {
        std::string type; // webcam|file|rtsp
        std::string id = "cam0";

        WebcamConfig webcam;
        FileConfig file;
        RTSPConfig rtsp;
    };

    // Virtual presentation element the video and overlay are laid out in.
    struct DisplayConfig {
        int width = 1280;
        int height = 720;
        double device_pixel_ratio = 1.0;
        std::string fit = "contain"; // contain|cover|fill|none|scale-down
        double refresh_hz = 60.0;
        bool frame_callbacks = true; // tick per presented frame, else per refresh
        std::string interp = "linear"; // nearest|cubic|linear|area
        int jpeg_quality = 80;
    };

    struct OverlayConfig {
        int max_buffer = 120;
        double tolerance_ms = 120.0;
        double hold_ms = 150.0;
        double layout_threshold_px = 0.5;
        double line_width = 3.0;
        double font_scale = 0.5;
        bool coco_labels = true;
    };

    struct MetadataFeedConfig {
        bool test_pattern = false;
        double test_pattern_hz = 60.0;
    };

    struct ServerConfig {
        std::string url = "0.0.0.0";
        int port = 8080;
    };

    struct AppConfig {
        ServerConfig server;
        SourceConfig source;
        DisplayConfig display;
        OverlayConfig overlay;
        MetadataFeedConfig metadata;
    };

    AppConfig load_config_yaml(const std::string& path);
}
