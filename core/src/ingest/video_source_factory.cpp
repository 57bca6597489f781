#include <ingest/video_source_factory.hpp>

#include <stdexcept>

namespace ovs {
    static std::string appsink(const std::string& sink_name, bool sync) {
        return "videoconvert ! video/x-raw,format=BGR ! "
               "appsink name=" + sink_name + " max-buffers=2 drop=true sync=" +
               (sync ? "true" : "false");
    }

    static std::string web_pipeline(const WebcamConfig& c, const std::string& sink_name) {
        const std::string size = "width=" + std::to_string(c.width)
                                  + ",height=" + std::to_string(c.height);
        if (c.mjpg) {
            return "v4l2src device=" + c.device + " ! "
                   "image/jpeg," + size + " ! jpegdec ! " + appsink(sink_name, false);
        }
        return "v4l2src device=" + c.device + " ! "
               "video/x-raw," + size + " ! " + appsink(sink_name, false);
    }

    // Files play against the pipeline clock so PTS tracks wall time.
    static std::string file_pipeline(const FileConfig& c, const std::string& sink_name) {
        return "filesrc location=\"" + c.path + "\" ! "
               "decodebin ! " + appsink(sink_name, true);
    }

    static std::string rtsp_pipeline(const RTSPConfig& c, const std::string& sink_name) {
        std::string proto = c.tcp ? "tcp" : "udp";
        return "rtspsrc location=\"" + c.url +
               "\" latency=" + std::to_string(c.latency_ms) +
               " protocols=" + proto + " drop-on-latency=true ! "
               "decodebin ! " + appsink(sink_name, false);
    }

    std::string build_pipeline(const SourceConfig& cfg, const std::string& sink_name) {
        if (cfg.type == "webcam") {
            return web_pipeline(cfg.webcam, sink_name);
        }
        if (cfg.type == "file") {
            return file_pipeline(cfg.file, sink_name);
        }
        if (cfg.type == "rtsp") {
            if (cfg.rtsp.url.empty()) {
                throw std::runtime_error("rtsp.url is empty in config");
            }
            return rtsp_pipeline(cfg.rtsp, sink_name);
        }
        throw std::runtime_error("Unknown source type " + cfg.type);
    }

    std::unique_ptr<GstVideoSource> make_video_source(EventLoop& loop,
                                                      const SourceConfig& cfg,
                                                      const DisplayConfig& display) {
        const std::string sink_name = "sink_" + cfg.id;
        std::string pipe = build_pipeline(cfg, sink_name);
        const bool loop_playback = cfg.type == "file" && cfg.file.loop;
        return std::make_unique<GstVideoSource>(loop, std::move(pipe), cfg.id, sink_name,
                                                display, loop_playback);
    }
}
