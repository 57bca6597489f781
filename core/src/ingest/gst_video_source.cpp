#include <ingest/gst_video_source.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>

#include <iostream>
#include <mutex>
#include <utility>
#include <vector>

#include <overlay/coordinate_mapper.hpp>

namespace ovs {
    GstVideoSource::GstVideoSource(EventLoop& loop,
                                   std::string pipeline,
                                   std::string src_id,
                                   std::string sink_name,
                                   const DisplayConfig& display,
                                   bool loop_playback)
        : loop_(loop),
          pipeline_str_(std::move(pipeline)),
          id_(std::move(src_id)),
          sink_name_(std::move(sink_name)),
          loop_playback_(loop_playback),
          frame_callbacks_(display.frame_callbacks),
          element_{0.0, 0.0, static_cast<double>(display.width), static_cast<double>(display.height)},
          dpr_(display.device_pixel_ratio),
          fit_(parse_fit_mode(display.fit)) {}

    GstVideoSource::~GstVideoSource() {
        stop();
    }

    bool GstVideoSource::start() {
        if (running_) return true;

        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(pipeline_str_.c_str(), &err);
        if (!pipeline_) {
            if (err) {
                std::cerr << "[GStreamer](start) parse_launch error: " << err->message << "\n";
                g_error_free(err);
            } else {
                std::cerr << "[GStreamer](start) parse_launch failed (unk error)\n";
            }
            return false;
        }
        if (err) {
            // recoverable parse warning, pipeline is still usable
            std::cerr << "[GStreamer](start) " << id_ << ": " << err->message << "\n";
            g_error_free(err);
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!sink_) {
            std::cerr << "[GStreamer](start) appsink named " << sink_name_ << " not found.\n";
            stop();
            return false;
        }

        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_drop(appsink, TRUE);
        gst_app_sink_set_max_buffers(appsink, 2);
        gst_app_sink_set_emit_signals(appsink, FALSE);

        GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer](start) failed to set " << id_ << " to PLAYING\n";
            stop();
            return false;
        }

        running_ = true;
        reader_ = std::thread([this] { reader_loop_(); });
        std::cout << "[GStreamer](start) " << id_ << " playing\n";
        return true;
    }

    void GstVideoSource::stop() {
        running_ = false;
        if (reader_.joinable()) reader_.join();

        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (sink_) {
                gst_object_unref(sink_);
                sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }

    bool GstVideoSource::pause() {
        if (!pipeline_ || paused_) return false;
        if (gst_element_set_state(pipeline_, GST_STATE_PAUSED) == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer](pause) failed to pause " << id_ << "\n";
            return false;
        }
        paused_ = true;
        notify_geometry_();
        return true;
    }

    bool GstVideoSource::resume() {
        if (!pipeline_ || !paused_) return false;
        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer](resume) failed to resume " << id_ << "\n";
            return false;
        }
        paused_ = false;
        notify_geometry_();
        return true;
    }

    CallbackId GstVideoSource::request_video_frame(FrameCallback cb) {
        if (!frame_callbacks_ || !cb) return 0;
        const CallbackId id = next_frame_cb_++;
        frame_cbs_.emplace(id, std::move(cb));
        return id;
    }

    void GstVideoSource::cancel_video_frame(CallbackId id) {
        frame_cbs_.erase(id);
    }

    ListenerId GstVideoSource::add_geometry_listener(std::function<void()> fn) {
        const ListenerId id = next_listener_++;
        listeners_.emplace(id, std::move(fn));
        return id;
    }

    void GstVideoSource::remove_geometry_listener(ListenerId id) {
        listeners_.erase(id);
    }

    void GstVideoSource::notify_geometry_() {
        std::vector<std::function<void()>> fns;
        fns.reserve(listeners_.size());
        for (const auto& kv : listeners_) fns.push_back(kv.second);
        for (auto& fn : fns) fn();
    }

    void GstVideoSource::present_(cv::Mat frame, double pts_ms) {
        const bool size_changed = frame.cols != frame_.cols || frame.rows != frame_.rows;
        frame_ = std::move(frame);
        pts_ms_ = pts_ms;
        ++frames_presented_;

        if (size_changed) notify_geometry_();

        if (frame_cbs_.empty()) return;
        std::unordered_map<CallbackId, FrameCallback> due;
        due.swap(frame_cbs_);
        const double now = loop_.now_ms();
        for (auto& kv : due) kv.second(now);
    }

    void GstVideoSource::reader_loop_() {
        while (running_) {
            poll_bus_();
            pull_frame_(100);
        }
    }

    void GstVideoSource::poll_bus_() {
        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return;

        while (GstMessage* msg = gst_bus_pop_filtered(
                   bus, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS))) {
            if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
                GError* err = nullptr;
                gchar* dbg = nullptr;
                gst_message_parse_error(msg, &err, &dbg);
                std::cerr << "[GStreamer](bus) " << id_ << " error: "
                          << (err ? err->message : "unknown") << "\n";
                if (err) g_error_free(err);
                g_free(dbg);
            } else if (loop_playback_) {
                if (!gst_element_seek_simple(pipeline_, GST_FORMAT_TIME,
                                             static_cast<GstSeekFlags>(GST_SEEK_FLAG_FLUSH | GST_SEEK_FLAG_KEY_UNIT),
                                             0)) {
                    std::cerr << "[GStreamer](bus) " << id_ << " failed to rewind\n";
                }
            } else {
                std::cerr << "[GStreamer](bus) " << id_ << " reached end of stream\n";
            }
            gst_message_unref(msg);
        }
        gst_object_unref(bus);
    }

    bool GstVideoSource::pull_frame_(int timeout_ms) {
        GstSample* sample = gst_app_sink_try_pull_sample(
            GST_APP_SINK(sink_), timeout_ms * GST_MSECOND);

        if (!sample) return false;

        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) {
            gst_sample_unref(sample);
            return false;
        }

        GstVideoInfo vinfo;
        if (!gst_video_info_from_caps(&vinfo, caps)) {
            gst_sample_unref(sample);
            return false;
        }
        const int width = GST_VIDEO_INFO_WIDTH(&vinfo);
        const int height = GST_VIDEO_INFO_HEIGHT(&vinfo);
        int stride = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
        if (stride <= 0) stride = width * 3;
        if (width <= 0 || height <= 0) {
            gst_sample_unref(sample);
            return false;
        }

        GstMapInfo map;
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ) || !map.data || map.size == 0) {
            gst_sample_unref(sample);
            return false;
        }

        const size_t min_bytes = static_cast<size_t>(stride) * static_cast<size_t>(height);
        if (map.size < min_bytes) {
            gst_buffer_unmap(buffer, &map);
            gst_sample_unref(sample);
            return false;
        }

        cv::Mat frame = cv::Mat(height, width, CV_8UC3, map.data, stride).clone();
        const double pts_ms = GST_BUFFER_PTS_IS_VALID(buffer)
                                  ? static_cast<double>(GST_BUFFER_PTS(buffer)) / 1e6
                                  : loop_.now_ms();

        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);

        loop_.post([this, frame, pts_ms]() mutable { present_(std::move(frame), pts_ms); });
        return true;
    }
}
