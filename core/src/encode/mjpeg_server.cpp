#include <encode/mjpeg_server.hpp>
#include <pipeline/types.hpp>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <httplib.h>
#include <opencv2/imgcodecs.hpp>

namespace vs {
    struct MJPEGServer::Impl {
        httplib::Server svr;
    };

    namespace {
        void no_cache(httplib::Response& res) {
            res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
            res.set_header("Pragma", "no-cache");
        }

        void not_implemented(httplib::Response& res) {
            res.status = 501;
            res.set_content(R"({"error":"not available"})", "application/json");
        }
    } // namespace

    MJPEGServer::MJPEGServer(std::string host, int port)
        : impl_(std::make_unique<Impl>()),
          host_(std::move(host)),
          port_(port) {}

    MJPEGServer::~MJPEGServer() {
        stop();
    }

    void MJPEGServer::set_controls(ControlHandlers controls) {
        controls_ = std::move(controls);
    }

    void MJPEGServer::push_jpeg(std::shared_ptr<const std::vector<uint8_t>> jpeg) {
        {
            std::lock_guard lk(mtx_);
            last_jpeg_ = std::move(jpeg);
            ++seq_;
        }
        cv_.notify_all();
    }

    bool MJPEGServer::push_frame(const cv::Mat& frame, int quality) {
        if (frame.empty() || frame.type() != CV_8UC3) return false;
        std::vector<uint8_t> tmp;
        const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};

        if (!cv::imencode(".jpg", frame, tmp, params)) return false;

        push_jpeg(std::make_shared<const std::vector<uint8_t>>(std::move(tmp)));
        return true;
    }

    void MJPEGServer::push_meta(std::string json) {
        std::lock_guard lk(meta_mtx_);
        last_meta_ = std::move(json);
    }

    uint64_t MJPEGServer::frames_pushed() const {
        std::lock_guard lk(mtx_);
        return seq_;
    }

    bool MJPEGServer::start() {
        if (running_) return true;
        running_ = true;

        register_routes_();

        if (!impl_->svr.bind_to_port(host_.c_str(), port_)) {
            std::cerr << "[MJPEG](start) failed to bind " << host_ << ":" << port_ << "\n";
            running_ = false;
            return false;
        }

        server_thread_ = std::thread([this] {
            std::cout << "[MJPEG] Video: http://" << host_ << ":" << port_ << "/video\n";
            std::cout << "[MJPEG] Control: POST /severity?value=0..1, POST /effect?id=<name>, POST /stop\n";
            impl_->svr.listen_after_bind();
        });

        return true;
    }

    void MJPEGServer::register_routes_() {
        // /meta -> last frame metadata
        impl_->svr.Get("/meta", [this](const httplib::Request&, httplib::Response& res) {
            std::string json;
            {
                std::lock_guard lk(meta_mtx_);
                json = last_meta_.empty() ? "{}" : last_meta_;
            }
            res.set_content(json, "application/json");
            no_cache(res);
        });

        // /snapshot -> last_jpeg once
        impl_->svr.Get("/snapshot", [this](const httplib::Request&, httplib::Response& res) {
            std::shared_ptr<const std::vector<uint8_t>> jpeg;
            {
                std::lock_guard lk(mtx_);
                jpeg = last_jpeg_;
            }
            if (!jpeg || jpeg->empty()) { res.status = 204; return; }
            res.set_content(reinterpret_cast<const char *>(jpeg->data()), jpeg->size(), "image/jpeg");
            res.set_header("Cache-Control", "no-cache");
        });

        // /video -> MJPEG
        impl_->svr.Get("/video", [this](const httplib::Request&, httplib::Response& res) {
            res.set_header("Cache-Control", "no-cache");
            res.set_header("Pragma", "no-cache");
            res.set_header("Connection", "close");

            const std::string boundary = "frame";
            res.set_chunked_content_provider(
                "multipart/x-mixed-replace; boundary=" + boundary,
                [this, boundary](size_t /*offset*/, httplib::DataSink& sink) {
                    uint64_t last_sent = 0;
                    {
                        std::unique_lock lk(mtx_);
                        cv_.wait(lk, [&] { return seq_ != 0 || !running_; });
                        if (!running_) { sink.done(); return true; }
                    }

                    while (running_) {
                        std::shared_ptr<const std::vector<uint8_t>> jpeg;
                        uint64_t seq_local = 0;

                        {
                            std::unique_lock lk(mtx_);
                            cv_.wait(lk, [&] { return seq_ != last_sent || !running_; });
                            if (!running_) break;

                            jpeg = last_jpeg_;
                            seq_local = seq_;
                        }

                        last_sent = seq_local;
                        if (!jpeg || jpeg->empty()) continue;

                        std::string header =
                            "--" + boundary + "\r\n"
                            "Content-Type: image/jpeg\r\n"
                            "Content-Length: " + std::to_string(jpeg->size()) + "\r\n\r\n";

                        if (!sink.write(header.data(), header.size())) return false;
                        if (!sink.write(reinterpret_cast<const char *>(jpeg->data()), jpeg->size())) return false;
                        if (!sink.write("\r\n", 2)) return false;
                    }

                    sink.done();
                    return true;
                }
            );
        });

        impl_->svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });

        // control

        impl_->svr.Get("/effects", [this](const httplib::Request&, httplib::Response& res) {
            if (!controls_.list_effects) { not_implemented(res); return; }
            const auto ids = controls_.list_effects();
            std::ostringstream oss;
            oss << "[";
            for (size_t i = 0; i < ids.size(); ++i) {
                oss << "\"" << json_escape(ids[i]) << "\"";
                if (i + 1 < ids.size()) oss << ",";
            }
            oss << "]";
            res.set_content(oss.str(), "application/json");
        });

        impl_->svr.Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
            if (!controls_.stats_json) { not_implemented(res); return; }
            res.set_content(controls_.stats_json(), "application/json");
            no_cache(res);
        });

        impl_->svr.Get("/severity", [this](const httplib::Request&, httplib::Response& res) {
            if (!controls_.get_severity) { not_implemented(res); return; }
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(3) << R"({"severity":)" << controls_.get_severity() << "}";
            res.set_content(oss.str(), "application/json");
            no_cache(res);
        });

        impl_->svr.Post("/severity", [this](const httplib::Request& req, httplib::Response& res) {
            if (!controls_.set_severity) { not_implemented(res); return; }
            if (!req.has_param("value")) {
                res.status = 400;
                res.set_content(R"({"error":"missing value"})", "application/json");
                return;
            }

            float v = 0.0f;
            try {
                v = std::stof(req.get_param_value("value"));
            } catch (const std::exception&) {
                res.status = 400;
                res.set_content(R"({"error":"value must be a number"})", "application/json");
                return;
            }
            if (!(v >= 0.0f && v <= 1.0f)) {
                res.status = 400;
                res.set_content(R"({"error":"value must be in [0, 1]"})", "application/json");
                return;
            }

            controls_.set_severity(v);
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(3) << R"({"severity":)" << v << "}";
            res.set_content(oss.str(), "application/json");
        });

        impl_->svr.Post("/effect", [this](const httplib::Request& req, httplib::Response& res) {
            if (!controls_.start_effect) { not_implemented(res); return; }
            if (!req.has_param("id")) {
                res.status = 400;
                res.set_content(R"({"error":"missing id"})", "application/json");
                return;
            }

            const std::string id = req.get_param_value("id");
            if (!controls_.start_effect(id)) {
                res.status = 409;
                res.set_content(R"({"error":"could not start effect )" + json_escape(id) + "\"}", "application/json");
                return;
            }
            res.set_content(R"({"effect":")" + json_escape(id) + "\"}", "application/json");
        });

        impl_->svr.Post("/stop", [this](const httplib::Request&, httplib::Response& res) {
            if (!controls_.stop) { not_implemented(res); return; }
            controls_.stop();
            res.set_content(R"({"stopped":true})", "application/json");
        });
    }

    void MJPEGServer::stop() {
        if (!running_) return;
        running_ = false;

        {
            // wake streaming clients
            std::lock_guard lk(mtx_);
        }
        cv_.notify_all();

        if (impl_) impl_->svr.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }
}
