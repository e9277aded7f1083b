#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

namespace vs {
    struct FramePacket {
        cv::Mat bgr;
        int64_t pts_ns = 0;
        int64_t frame_id = 0;
    };

    enum class ReadStatus {
        Ok,
        Timeout,     // nothing yet, try again
        EndOfStream,
        Error
    };

    struct IFrameSource {
        virtual ~IFrameSource() = default;
        virtual bool start() = 0;
        virtual void stop() = 0;
        virtual ReadStatus read(FramePacket& out, int timeout_ms) = 0;
        virtual const std::string& id() const = 0;
        virtual std::string last_error() const { return {}; }
    };
}
