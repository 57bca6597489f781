#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

namespace ovs {
    // Control surface exposed under /api. Handlers run on server threads.
    struct ControlHandlers {
        // Returns false with a reason when the payload is rejected.
        std::function<bool(const std::string& body, std::string& error)> on_metadata;
        std::function<void()> on_clear;
        std::function<bool()> on_pause;
        std::function<bool()> on_resume;
        std::function<std::string()> stats_json;
    };

    class MJPEGServer {
    public:
        MJPEGServer(std::string host, int port);
        ~MJPEGServer();

        void set_handlers(ControlHandlers handlers);

        // Start http server in bg thread
        bool start();
        void stop();

        // push latest jpeg frame in bytes
        void push_jpeg(const std::string& stream_key,
                       std::shared_ptr<const std::vector<uint8_t>> jpeg);
        // encodes a BGR frame; false if it could not be encoded
        bool push_jpeg(const std::string& stream_key, const cv::Mat& frame, int quality);

        // last per-frame JSON, served at /meta/<key>
        void push_meta(const std::string& stream_key, std::string json);

        void register_stream(const std::string& stream_key);

        std::vector<std::string> list_streams() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;

        struct StreamState {
            mutable std::mutex mtx;
            std::condition_variable cv;

            std::shared_ptr<const std::vector<uint8_t>> last_jpeg;
            uint64_t seq = 0;

            mutable std::mutex meta_mtx;
            std::string last_meta;

            std::shared_ptr<const std::vector<uint8_t>> jpeg() const;
            std::string meta() const; // "{}" until the first push
        };

        void register_routes_();
        std::shared_ptr<StreamState> get_or_create_(const std::string& stream_key) const;
        std::shared_ptr<StreamState> get_(const std::string& stream_key) const;

        std::string host_;
        int port_;

        std::thread server_thread_;
        std::atomic<bool> running_{false};

        mutable std::mutex streams_mtx_;
        mutable std::unordered_map<std::string, std::shared_ptr<StreamState>> streams_;

        ControlHandlers handlers_;
    };
}
