#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <memory>

#include <opencv2/core.hpp>

namespace vs {
    // Hooks for the HTTP control endpoints. Unset hooks answer 501.
    struct ControlHandlers {
        std::function<void(float)> set_severity;
        std::function<float()> get_severity;
        std::function<bool(const std::string&)> start_effect;
        std::function<void()> stop;
        std::function<std::string()> stats_json;
        std::function<std::vector<std::string>()> list_effects;
    };

    class MJPEGServer {
    public:
        MJPEGServer(std::string host, int port);
        ~MJPEGServer();

        MJPEGServer(const MJPEGServer&) = delete;
        MJPEGServer& operator=(const MJPEGServer&) = delete;

        // Must be called before start().
        void set_controls(ControlHandlers controls);

        // Start http server in bg thread
        bool start();
        void stop();

        // push latest jpeg frame in bytes
        void push_jpeg(std::shared_ptr<const std::vector<uint8_t>> jpeg);

        // encodes a BGR frame; false if it is not 8UC3 or encoding failed
        bool push_frame(const cv::Mat& frame, int quality);

        // optionally push JSON metadata
        void push_meta(std::string json);

        uint64_t frames_pushed() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;

        void register_routes_();

        std::string host_;
        int port_;
        ControlHandlers controls_;

        std::thread server_thread_;
        std::atomic<bool> running_{false};

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::shared_ptr<const std::vector<uint8_t>> last_jpeg_;
        uint64_t seq_ = 0;

        mutable std::mutex meta_mtx_;
        std::string last_meta_;
    };
}
