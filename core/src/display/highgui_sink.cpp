#include <display/highgui_sink.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/highgui.hpp>

namespace vs {
    HighGuiSink::HighGuiSink(WindowConfig cfg, std::function<void(float)> on_severity)
        : cfg_(std::move(cfg)), on_severity_(std::move(on_severity)) {}

    HighGuiSink::~HighGuiSink() {
        close();
    }

    bool HighGuiSink::open(float initial_severity) {
        if (open_) return true;
        try {
            cv::namedWindow(cfg_.title, cv::WINDOW_AUTOSIZE);
            cv::createTrackbar(cfg_.trackbar, cfg_.title, nullptr, cfg_.trackbar_steps, &HighGuiSink::on_trackbar_, this);

            const int pos = static_cast<int>(std::lround(std::clamp(initial_severity, 0.0f, 1.0f) * cfg_.trackbar_steps));
            cv::setTrackbarPos(cfg_.trackbar, cfg_.title, pos);
        } catch (const cv::Exception& e) {
            std::cerr << "[Window](open) " << e.what() << "\n";
            return false;
        }
        open_ = true;
        return true;
    }

    void HighGuiSink::close() {
        if (!open_) return;
        open_ = false;
        try {
            cv::destroyWindow(cfg_.title);
            cv::waitKey(1);
        } catch (const cv::Exception& e) {
            std::cerr << "[Window](close) " << e.what() << "\n";
        }
    }

    void HighGuiSink::present(const Frame& frame) {
        if (!open_ || frame.image.empty()) return;
        cv::imshow(cfg_.title, frame.image);
        poll_events_();
    }

    void HighGuiSink::idle() {
        if (open_) poll_events_();
    }

    void HighGuiSink::poll_events_() {
        const int key = cv::waitKey(1);
        if (key < 0) return;

        const int ch = key & 0xFF;
        if (ch == 27 || cfg_.quit_keys.find(static_cast<char>(ch)) != std::string::npos) {
            quit_ = true;
            return;
        }
        std::lock_guard lk(keys_mtx_);
        keys_.push_back(ch);
    }

    void HighGuiSink::set_caption(const std::string& suffix) {
        if (!open_) return;
        cv::setWindowTitle(cfg_.title, suffix.empty() ? cfg_.title : cfg_.title + " - " + suffix);
    }

    int HighGuiSink::take_key() {
        std::lock_guard lk(keys_mtx_);
        if (keys_.empty()) return -1;
        const int k = keys_.front();
        keys_.pop_front();
        return k;
    }

    void HighGuiSink::on_trackbar_(int pos, void* user) {
        auto* self = static_cast<HighGuiSink*>(user);
        if (!self || !self->on_severity_) return;
        self->on_severity_(static_cast<float>(pos) / static_cast<float>(std::max(1, self->cfg_.trackbar_steps)));
    }
}
