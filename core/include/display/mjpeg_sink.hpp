#pragma once

#include <cstdint>
#include <string>

#include <encode/mjpeg_server.hpp>
#include <pipeline/runtime.hpp>

namespace vs {
    // Publishes presented frames to an MJPEG server. Repeats of the last frame are not re-encoded.
    class MjpegSink : public IFrameSink {
    public:
        MjpegSink(MJPEGServer& server, int jpeg_quality);

        void present(const Frame& frame) override;

        // a new pipeline restarts sequence numbers
        void set_effect(std::string effect_id) {
            effect_id_ = std::move(effect_id);
            last_seq_ = -1;
        }

        uint64_t encode_failures() const { return encode_failures_; }

    private:
        MJPEGServer& server_;
        int jpeg_quality_;
        std::string effect_id_;
        int64_t last_seq_ = -1;
        uint64_t encode_failures_ = 0;
    };
}
