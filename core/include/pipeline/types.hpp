#pragma once

#include <opencv2/core.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace vs {
    struct Frame {
        int64_t seq = 0;    // assigned by the capture loop, strictly increasing
        int64_t pts_ns = 0; // source timestamp, 0 if unknown
        cv::Mat image;      // not written to after the frame is shared
    };

    using FramePtr = std::shared_ptr<const Frame>;

    struct Job {
        FramePtr frame;
        float captured_severity = 0.0f; // value when the job was built, diagnostics only
        std::chrono::steady_clock::time_point enqueued_at{};
    };

    struct Result {
        int64_t seq = -1;
        FramePtr frame;
        float severity = 0.0f; // value the worker applied
        bool processed = false; // false: bypassed by the zero-severity path or the transform failed
    };

    enum class PipelineState {
        Idle,
        Running,
        Draining,
        Stopped
    };

    enum class StopReason {
        None,
        Cancelled,
        SourceExhausted,
        SourceFailure
    };

    inline const char* to_string(PipelineState s) {
        switch (s) {
            case PipelineState::Idle: return "idle";
            case PipelineState::Running: return "running";
            case PipelineState::Draining: return "draining";
            case PipelineState::Stopped: return "stopped";
        }
        return "unk";
    }

    inline const char* to_string(StopReason r) {
        switch (r) {
            case StopReason::None: return "none";
            case StopReason::Cancelled: return "cancelled";
            case StopReason::SourceExhausted: return "source_exhausted";
            case StopReason::SourceFailure: return "source_failure";
        }
        return "unk";
    }

    struct PipelineStats {
        uint64_t frames_captured = 0;
        uint64_t inbound_dropped = 0;
        uint64_t jobs_processed = 0;
        uint64_t passthrough = 0;
        uint64_t transform_failures = 0;
        uint64_t results_overwritten = 0;
        uint64_t stale_discarded = 0;
        uint64_t frames_presented = 0;
        uint64_t repeats = 0;
        uint64_t presentation_timeouts = 0;
        double avg_worker_latency_ms = 0.0;

        StopReason stop_reason = StopReason::None;
        std::string failure_message;
    };

    // Escapes a value for use inside a JSON string literal; line breaks become spaces.
    std::string json_escape(const std::string& s);

    std::string stats_to_json(const PipelineStats& s);
}
