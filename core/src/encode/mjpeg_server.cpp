#include <encode/mjpeg_server.hpp>

#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>

#include <httplib.h>
#include <opencv2/imgcodecs.hpp>

namespace ovs {
    struct MJPEGServer::Impl {
        httplib::Server svr;
    };

    MJPEGServer::MJPEGServer(std::string host, int port)
        : impl_(std::make_unique<Impl>()),
          host_(std::move(host)),
          port_(port) {}

    MJPEGServer::~MJPEGServer() {
        stop();
    }

    void MJPEGServer::set_handlers(ControlHandlers handlers) {
        handlers_ = std::move(handlers);
    }

    std::shared_ptr<MJPEGServer::StreamState> MJPEGServer::get_or_create_(const std::string& key) const {
        std::lock_guard lk(streams_mtx_);
        auto& p = streams_[key];
        if (!p) p = std::make_shared<StreamState>();
        return p;
    }

    std::shared_ptr<MJPEGServer::StreamState> MJPEGServer::get_(const std::string& key) const {
        std::lock_guard lk(streams_mtx_);
        auto it = streams_.find(key);
        if (it == streams_.end()) return nullptr;
        return it->second;
    }

    void MJPEGServer::push_jpeg(const std::string& stream_key,
                                std::shared_ptr<const std::vector<uint8_t>> jpeg) {
        auto st = get_or_create_(stream_key);
        {
            std::lock_guard lk(st->mtx);
            st->last_jpeg = std::move(jpeg);
            ++st->seq;
        }
        st->cv.notify_all();
    }

    bool MJPEGServer::push_jpeg(const std::string& stream_key, const cv::Mat& frame, int quality) {
        if (frame.empty() || frame.type() != CV_8UC3) return false;
        std::vector<uint8_t> tmp;
        const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};

        if (!cv::imencode(".jpg", frame, tmp, params)) return false;

        push_jpeg(stream_key, std::make_shared<const std::vector<uint8_t>>(std::move(tmp)));
        return true;
    }

    void MJPEGServer::push_meta(const std::string& stream_key, std::string json) {
        auto st = get_or_create_(stream_key);
        std::lock_guard<std::mutex> lk(st->meta_mtx);
        st->last_meta = std::move(json);
    }

    std::vector<std::string> MJPEGServer::list_streams() const {
        std::lock_guard lk(streams_mtx_);
        std::vector<std::string> out;
        out.reserve(streams_.size());
        for (const auto& kv : streams_) out.push_back(kv.first);
        std::sort(out.begin(), out.end());
        return out;
    }

    void MJPEGServer::register_stream(const std::string& stream_key) {
        (void)get_or_create_(stream_key);
    }

    static void no_store(httplib::Response& res) {
        res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
    }

    static void reply_json(httplib::Response& res, int status, const std::string& body) {
        res.status = status;
        res.set_content(body, "application/json");
        no_store(res);
    }

    static void reply_jpeg(httplib::Response& res, const std::vector<uint8_t>& jpeg) {
        res.status = 200;
        res.set_content(reinterpret_cast<const char*>(jpeg.data()), jpeg.size(), "image/jpeg");
        no_store(res);
    }

    // Regex routes capture the stream key as group 1.
    static std::optional<std::string> stream_key_of(const httplib::Request& req) {
        if (req.matches.size() < 2) return std::nullopt;
        return std::string(req.matches[1]);
    }

    // One multipart/x-mixed-replace part.
    static bool write_jpeg_part(httplib::DataSink& sink, const std::string& boundary,
                                const std::vector<uint8_t>& jpeg) {
        const std::string header =
            "--" + boundary + "\r\n"
            "Content-Type: image/jpeg\r\n"
            "Content-Length: " + std::to_string(jpeg.size()) + "\r\n\r\n";

        return sink.write(header.data(), header.size()) &&
               sink.write(reinterpret_cast<const char*>(jpeg.data()), jpeg.size()) &&
               sink.write("\r\n", 2);
    }

    std::shared_ptr<const std::vector<uint8_t>> MJPEGServer::StreamState::jpeg() const {
        std::lock_guard<std::mutex> lk(mtx);
        return last_jpeg;
    }

    std::string MJPEGServer::StreamState::meta() const {
        std::lock_guard<std::mutex> lk(meta_mtx);
        return last_meta.empty() ? "{}" : last_meta;
    }

    void MJPEGServer::register_routes_() {
        auto& svr = impl_->svr;

        // /api/metadata <- one analyzer message
        svr.Post("/api/metadata", [this](const httplib::Request& req, httplib::Response& res) {
            if (!handlers_.on_metadata) { reply_json(res, 503, R"({"ok":false})"); return; }
            std::string error;
            if (!handlers_.on_metadata(req.body, error)) {
                std::cerr << "[HTTP](metadata) rejected: " << error << "\n";
                reply_json(res, 400, R"({"ok":false})");
                return;
            }
            reply_json(res, 202, R"({"ok":true})");
        });

        svr.Post("/api/overlay/clear", [this](const httplib::Request&, httplib::Response& res) {
            if (handlers_.on_clear) handlers_.on_clear();
            reply_json(res, 200, R"({"ok":true})");
        });

        svr.Post("/api/playback/pause", [this](const httplib::Request&, httplib::Response& res) {
            const bool ok = handlers_.on_pause && handlers_.on_pause();
            reply_json(res, ok ? 200 : 409, ok ? R"({"ok":true})" : R"({"ok":false})");
        });

        svr.Post("/api/playback/resume", [this](const httplib::Request&, httplib::Response& res) {
            const bool ok = handlers_.on_resume && handlers_.on_resume();
            reply_json(res, ok ? 200 : 409, ok ? R"({"ok":true})" : R"({"ok":false})");
        });

        svr.Get("/api/stats", [this](const httplib::Request&, httplib::Response& res) {
            reply_json(res, 200, handlers_.stats_json ? handlers_.stats_json() : "{}");
        });

        svr.Get("/streams", [this](const httplib::Request&, httplib::Response& res) {
            const auto keys = list_streams();
            std::ostringstream oss;
            oss << "[";
            for (size_t i = 0; i < keys.size(); ++i) {
                if (i) oss << ",";
                oss << "\"" << keys[i] << "\"";
            }
            oss << "]";
            reply_json(res, 200, oss.str());
        });

        // per-tick overlay state for one stream
        svr.Get(R"(/meta/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            const auto key = stream_key_of(req);
            if (!key) { reply_json(res, 400, R"({"ok":false})"); return; }
            const auto st = get_(*key);
            if (!st) { reply_json(res, 404, R"({"ok":false})"); return; }
            reply_json(res, 200, st->meta());
        });

        svr.Get(R"(/snapshot/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            const auto key = stream_key_of(req);
            if (!key) { reply_json(res, 400, R"({"ok":false})"); return; }
            const auto st = get_(*key);
            if (!st) { reply_json(res, 404, R"({"ok":false})"); return; }

            const auto jpeg = st->jpeg();
            if (!jpeg || jpeg->empty()) { res.status = 204; return; }
            reply_jpeg(res, *jpeg);
        });

        // composited frames as MJPEG, one part per pushed frame
        svr.Get(R"(/video/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
            const auto key = stream_key_of(req);
            if (!key) { reply_json(res, 400, R"({"ok":false})"); return; }
            const auto st = get_(*key);
            if (!st) { reply_json(res, 404, R"({"ok":false})"); return; }

            no_store(res);
            res.set_header("Connection", "close");

            const std::string boundary = "frame";
            res.set_chunked_content_provider(
                "multipart/x-mixed-replace; boundary=" + boundary,
                [this, st, boundary](size_t, httplib::DataSink& sink) {
                    uint64_t sent_seq = 0;
                    while (running_) {
                        std::shared_ptr<const std::vector<uint8_t>> jpeg;
                        {
                            std::unique_lock lk(st->mtx);
                            st->cv.wait(lk, [&] { return st->seq != sent_seq || !running_; });
                            if (!running_) break;
                            jpeg = st->last_jpeg;
                            sent_seq = st->seq;
                        }
                        if (!jpeg || jpeg->empty()) continue;
                        if (!write_jpeg_part(sink, boundary, *jpeg)) return false;
                    }

                    sink.done();
                    return true;
                });
        });

        svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });
    }

    bool MJPEGServer::start() {
        if (running_) return true;

        register_routes_();
        if (!impl_->svr.bind_to_port(host_, port_)) {
            std::cerr << "[HTTP](start) failed to bind " << host_ << ":" << port_ << "\n";
            return false;
        }
        running_ = true;

        server_thread_ = std::thread([this] {
            std::cout << "[HTTP] Streams list: http://" << host_ << ":" << port_ << "/streams\n";
            std::cout << "[HTTP] Video: http://" << host_ << ":" << port_ << "/video/<stream_id>\n";
            std::cout << "[HTTP] Metadata: POST http://" << host_ << ":" << port_ << "/api/metadata\n";
            impl_->svr.listen_after_bind();
        });

        return true;
    }

    void MJPEGServer::stop() {
        if (!running_) return;
        running_ = false;

        {
            std::lock_guard lk(streams_mtx_);
            for (auto& kv : streams_) {
                kv.second->cv.notify_all();
            }
        }

        if (impl_) impl_->svr.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }
}
