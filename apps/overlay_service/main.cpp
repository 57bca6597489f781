#include <app/test_pattern_feed.hpp>
#include <common/config.hpp>
#include <encode/mjpeg_server.hpp>
#include <ingest/video_source_factory.hpp>
#include <overlay/coco_labels.hpp>
#include <overlay/metadata_codec.hpp>
#include <pipeline/event_loop.hpp>
#include <render/compositor.hpp>
#include <render/mat_surface.hpp>
#include <render/overlay_session.hpp>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <yaml-cpp/exceptions.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

namespace {
    // Written on the loop thread, read by /api/stats.
    struct ServiceStats {
        mutable std::mutex mtx;
        int draw_fps = 0;
        std::optional<double> analyzer_fps;
        size_t buffer_size = 0;
        std::optional<double> clock_offset_ms;
        std::string action = "clear";
        int boxes = 0;
        double presentation_time_ms = 0.0;
        int64_t frames_presented = 0;
        bool paused = false;

        std::string to_json() const {
            std::lock_guard lk(mtx);
            nlohmann::json j;
            j["draw_fps"] = draw_fps;
            j["analyzer_fps"] = analyzer_fps ? nlohmann::json(*analyzer_fps) : nlohmann::json();
            j["buffer_size"] = buffer_size;
            j["clock_offset_ms"] = clock_offset_ms ? nlohmann::json(*clock_offset_ms) : nlohmann::json();
            j["action"] = action;
            j["boxes"] = boxes;
            j["presentation_time_ms"] = presentation_time_ms;
            j["frames_presented"] = frames_presented;
            j["paused"] = paused;
            return j.dump();
        }
    };

    // Runs fn on the loop thread and waits for its result.
    bool run_on_loop(ovs::EventLoop& loop, std::function<bool()> fn) {
        auto done = std::make_shared<std::promise<bool>>();
        auto result = done->get_future();
        loop.post([done, fn = std::move(fn)] { done->set_value(fn()); });
        if (result.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            std::cerr << "[Service](run_on_loop) loop did not answer\n";
            return false;
        }
        try {
            return result.get();
        } catch (const std::future_error& e) {
            std::cerr << "[Service](run_on_loop) " << e.what() << "\n";
            return false;
        }
    }

    ovs::OverlaySessionOptions session_options(const ovs::AppConfig& cfg) {
        ovs::OverlaySessionOptions opt;
        opt.buffer.max_frames = static_cast<size_t>(cfg.overlay.max_buffer);
        opt.buffer.tolerance_ms = cfg.overlay.tolerance_ms;
        opt.hold_ms = cfg.overlay.hold_ms;
        opt.layout_threshold_px = cfg.overlay.layout_threshold_px;
        opt.painter.line_width = cfg.overlay.line_width;
        opt.painter.text_height = std::max(10.0, 36.0 * cfg.overlay.font_scale);
        if (cfg.overlay.coco_labels) opt.painter.resolve_label = ovs::resolve_coco_label;
        return opt;
    }
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string cfg_path = "../configs/overlay.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    ovs::AppConfig cfg;
    try {
        cfg = ovs::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    ovs::EventLoop loop(cfg.display.refresh_hz);

    std::unique_ptr<ovs::GstVideoSource> video;
    try {
        video = ovs::make_video_source(loop, cfg.source, cfg.display);
    } catch (const std::exception& e) {
        std::cerr << "[Service] Failed to create source: " << e.what() << "\n";
        return 1;
    }

    const std::string stream_key = cfg.source.id;
    ovs::MJPEGServer server(cfg.server.url, cfg.server.port);
    server.register_stream(stream_key);

    ServiceStats stats;
    ovs::MatSurface surface(cfg.overlay.font_scale);

    ovs::CompositorConfig comp;
    comp.container = video->container_rect();
    comp.element = video->element_rect();
    comp.dpr = video->device_pixel_ratio();
    comp.fit = video->fit_mode();
    comp.interp = ovs::interp_from_str(cfg.display.interp);

    std::unique_ptr<ovs::OverlaySession> session;

    ovs::RenderLoop::Hooks hooks;
    hooks.on_draw_rate = [&stats](int fps) {
        std::lock_guard lk(stats.mtx);
        stats.draw_fps = fps;
    };
    hooks.on_tick = [&](const ovs::TickReport& r) {
        if (r.discontinuity) {
            std::cout << "[Service](tick) presentation time went back to " << r.presentation_time_ms
                      << " ms, overlay buffer reset\n";
        }
        {
            std::lock_guard lk(stats.mtx);
            stats.action = ovs::overlay_action_name(r.action);
            stats.boxes = r.boxes;
            stats.presentation_time_ms = r.presentation_time_ms;
            stats.buffer_size = session->buffer().size();
            stats.clock_offset_ms = session->buffer().clock_offset();
            stats.frames_presented = video->frames_presented();
            stats.paused = video->paused();
        }

        const cv::Mat& frame = video->current_frame();
        if (frame.empty()) return;

        const cv::Mat out = ovs::compose_frame(frame, surface, comp);
        if (!server.push_jpeg(stream_key, out, cfg.display.jpeg_quality)) {
            std::cerr << "[Service](tick) imencode failed for " << stream_key << "\n";
            return;
        }

        nlohmann::json meta;
        meta["stream_id"] = stream_key;
        meta["action"] = ovs::overlay_action_name(r.action);
        meta["boxes"] = r.boxes;
        meta["pts_ms"] = r.presentation_time_ms;
        meta["w"] = out.cols;
        meta["h"] = out.rows;
        server.push_meta(stream_key, meta.dump());
    };

    session = std::make_unique<ovs::OverlaySession>(
        video.get(), &surface, loop, session_options(cfg), std::move(hooks));

    ovs::TestPatternFeed feed(loop, cfg.metadata.test_pattern_hz,
                              [&session](ovs::MetadataFrame f) { session->ingest(std::move(f)); });

    ovs::ControlHandlers handlers;
    handlers.on_metadata = [&](const std::string& body, std::string& error) {
        auto msg = ovs::try_decode_metadata(body, &error);
        if (!error.empty()) return false;
        if (!msg) return true; // keep-alive

        if (msg->analyzer_fps) {
            std::lock_guard lk(stats.mtx);
            stats.analyzer_fps = msg->analyzer_fps;
        }
        loop.post([&session, frame = std::move(msg->frame)]() mutable {
            session->ingest(std::move(frame));
        });
        return true;
    };
    handlers.on_clear = [&] {
        loop.post([&session] { session->reset(); });
    };
    handlers.on_pause = [&] {
        return run_on_loop(loop, [&video] { return video->pause(); });
    };
    handlers.on_resume = [&] {
        return run_on_loop(loop, [&video] { return video->resume(); });
    };
    handlers.stats_json = [&stats] { return stats.to_json(); };
    server.set_handlers(std::move(handlers));

    if (!video->start()) {
        std::cerr << "[Service] Failed to start source " << stream_key << "\n";
        return 1;
    }
    if (!server.start()) {
        video->stop();
        return 1;
    }

    loop.post([&] {
        if (!session->start()) {
            std::cerr << "[Service] overlay session did not start\n";
        }
        if (cfg.metadata.test_pattern) {
            std::cout << "[Service] test pattern metadata at " << cfg.metadata.test_pattern_hz << " Hz\n";
            feed.start();
        }
    });

    std::thread loop_thread([&loop] { loop.run(); });

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "Shutting down...\n";
    server.stop();
    loop.post([&] {
        feed.stop();
        session->stop();
        loop.stop();
    });
    if (loop_thread.joinable()) loop_thread.join();
    video->stop();

    return 0;
}
