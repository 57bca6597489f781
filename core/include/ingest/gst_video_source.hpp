#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <unordered_map>

#include <opencv2/core.hpp>

#include <common/config.hpp>
#include <pipeline/event_loop.hpp>
#include <render/video_source.hpp>

struct _GstElement;
using GstElement = _GstElement;

namespace ovs {
    // Decodes a GStreamer pipeline ending in a BGR appsink and presents the frames on
    // the event loop. Presentation time is the buffer PTS in milliseconds.
    // Everything except start()/stop() runs on the loop thread.
    class GstVideoSource final : public IVideoSource {
    public:
        GstVideoSource(EventLoop& loop,
                       std::string pipeline,
                       std::string src_id,
                       std::string sink_name,
                       const DisplayConfig& display,
                       bool loop_playback = false);
        ~GstVideoSource() override;

        GstVideoSource(const GstVideoSource&) = delete;
        GstVideoSource& operator=(const GstVideoSource&) = delete;

        bool start();
        void stop();

        bool pause();
        bool resume();

        const std::string& id() const { return id_; }
        const cv::Mat& current_frame() const { return frame_; }
        int64_t frames_presented() const { return frames_presented_; }

        int intrinsic_width() const override { return frame_.cols; }
        int intrinsic_height() const override { return frame_.rows; }
        double presentation_time_ms() const override { return pts_ms_; }
        bool paused() const override { return paused_; }

        ScreenRect element_rect() const override { return element_; }
        ScreenRect container_rect() const override { return element_; }
        double device_pixel_ratio() const override { return dpr_; }
        FitMode fit_mode() const override { return fit_; }

        CallbackId request_video_frame(FrameCallback cb) override;
        void cancel_video_frame(CallbackId id) override;

        ListenerId add_geometry_listener(std::function<void()> fn) override;
        void remove_geometry_listener(ListenerId id) override;

    private:
        void reader_loop_();
        bool pull_frame_(int timeout_ms);
        void poll_bus_();
        void present_(cv::Mat frame, double pts_ms);
        void notify_geometry_();

        EventLoop& loop_;
        std::string pipeline_str_;
        std::string id_;
        std::string sink_name_;
        bool loop_playback_;
        bool frame_callbacks_;

        ScreenRect element_;
        double dpr_;
        FitMode fit_;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;

        std::thread reader_;
        std::atomic<bool> running_{false};

        // loop thread only
        cv::Mat frame_;
        double pts_ms_ = 0.0;
        bool paused_ = false;
        int64_t frames_presented_ = 0;

        CallbackId next_frame_cb_ = 1;
        std::unordered_map<CallbackId, FrameCallback> frame_cbs_;
        ListenerId next_listener_ = 1;
        std::unordered_map<ListenerId, std::function<void()>> listeners_;
    };
}
