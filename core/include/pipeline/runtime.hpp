#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <effects/effect.hpp>
#include <ingest/frame_source.hpp>

#include <pipeline/types.hpp>
#include <pipeline/bounded_queue.hpp>
#include <pipeline/latest_slot.hpp>
#include <pipeline/severity.hpp>

namespace vs {
    struct IFrameSink {
        virtual ~IFrameSink() = default;
        virtual void present(const Frame& frame) = 0;

        // Tick with nothing shown yet. UI sinks service their event loop here.
        virtual void idle() {}
    };

    // Capture thread -> inbound queue -> worker thread(s) -> latest-result slot -> caller's
    // presentation ticks. The caller owns the presentation thread (usually the UI thread).
    class PipelineRuntime {
    public:
        struct Options {
            size_t inbound_cap = 2;
            OverflowPolicy inbound_policy = OverflowPolicy::DropNewest;
            int workers = 1;

            std::chrono::milliseconds pop_timeout{20};
            int read_timeout_ms = 100;
            int display_fps = 30;

            // below this the transform is skipped and the frame passes through
            float severity_epsilon = 1e-3f;

            // session frame shape, 0 = adopt the first frame's size
            int width = 0;
            int height = 0;
            bool keep_aspect = true;
            std::string interp = "linear";
        };

        enum class TickOutcome {
            Presented,
            Repeated, // timed out, last shown frame rendered again
            Idle,     // timed out with nothing shown yet
            Finished
        };

        PipelineRuntime(std::unique_ptr<IFrameSource> src,
                        EffectPtr effect,
                        std::shared_ptr<SeverityCell> severity,
                        Options opt);

        // Opens the source and spawns capture and worker threads. False means SourceFailure.
        bool start();

        // Cooperative cancellation; returns immediately.
        void request_stop();

        // Cancels, joins all threads and releases the source.
        void stop();

        // One display tick: waits at most one tick period for a fresh result.
        TickOutcome present_tick(IFrameSink& sink);

        // Fixed-rate presentation on the calling thread until the pipeline finishes
        // or keep_running returns false.
        StopReason run_presentation(IFrameSink& sink, const std::function<bool()>& keep_running = {});

        void set_severity(float v) { severity_->set(v); }
        float severity() const { return severity_->get(); }

        PipelineState capture_state() const { return capture_state_.load(); }
        PipelineState worker_state() const;
        PipelineState presentation_state() const { return presentation_state_.load(); }

        bool finished() const;
        StopReason stop_reason() const { return stop_reason_.load(); }
        std::string failure_message() const;
        const std::string& effect_id() const { return effect_->id(); }
        std::chrono::milliseconds tick_period() const { return tick_period_; }

        PipelineStats stats() const;

        ~PipelineRuntime() { stop(); }

        PipelineRuntime(const PipelineRuntime&) = delete;
        PipelineRuntime& operator=(const PipelineRuntime&) = delete;

    private:
        // loops
        void capture_loop_();
        void worker_loop_(size_t index);

        // hooks
        bool normalize_(cv::Mat& bgr);
        Result process_(const Job& job, std::unique_ptr<EffectState>& state);
        void finish_(StopReason reason, const std::string& message = {});

        std::unique_ptr<IFrameSource> src_;
        EffectPtr effect_;
        std::shared_ptr<SeverityCell> severity_;
        Options opt_;
        std::chrono::milliseconds tick_period_;

        std::atomic<bool> running_{false};
        std::atomic<bool> cancel_{false};
        bool started_ = false;

        BoundedQueue<Job> inbound_;
        LatestSlot<Result> outbound_;

        std::thread capture_thr_;
        std::vector<std::thread> worker_pool_;
        std::vector<std::unique_ptr<std::atomic<PipelineState>>> worker_states_;
        std::atomic<int> active_workers_{0};

        std::atomic<PipelineState> capture_state_{PipelineState::Idle};
        std::atomic<PipelineState> presentation_state_{PipelineState::Idle};

        std::atomic<StopReason> stop_reason_{StopReason::None};
        mutable std::mutex failure_mtx_;
        std::string failure_message_;

        // session shape, written by the capture thread only
        int session_w_ = 0;
        int session_h_ = 0;
        int64_t next_seq_ = 0;

        // presentation thread only
        FramePtr last_shown_;
        int64_t last_shown_seq_ = -1;

        // diagnostics
        std::atomic<uint64_t> frames_captured_{0};
        std::atomic<uint64_t> jobs_processed_{0};
        std::atomic<uint64_t> passthrough_{0};
        std::atomic<uint64_t> transform_failures_{0};
        std::atomic<uint64_t> frames_presented_{0};
        std::atomic<uint64_t> repeats_{0};
        std::atomic<uint64_t> presentation_timeouts_{0};
        std::atomic<uint64_t> presented_stale_{0};
        std::atomic<uint64_t> worker_latency_ns_{0};
        std::atomic<uint64_t> worker_latency_count_{0};
    };
}
