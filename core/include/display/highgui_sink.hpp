#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

#include <common/config.hpp>
#include <pipeline/runtime.hpp>

namespace vs {
    // OpenCV window with a severity trackbar. Must be driven from the thread that created it.
    class HighGuiSink : public IFrameSink {
    public:
        HighGuiSink(WindowConfig cfg, std::function<void(float)> on_severity);
        ~HighGuiSink() override;

        HighGuiSink(const HighGuiSink&) = delete;
        HighGuiSink& operator=(const HighGuiSink&) = delete;

        bool open(float initial_severity);
        void close();

        void present(const Frame& frame) override;
        void idle() override;

        void set_caption(const std::string& suffix);

        bool quit_requested() const { return quit_.load(); }

        // Next non-quit key pressed since the last call, or -1.
        int take_key();

    private:
        static void on_trackbar_(int pos, void* user);

        // waitKey pumps the window's event loop (trackbar, keys)
        void poll_events_();

        WindowConfig cfg_;
        std::function<void(float)> on_severity_;
        bool open_ = false;
        std::atomic<bool> quit_{false};

        std::mutex keys_mtx_;
        std::deque<int> keys_;
    };
}
