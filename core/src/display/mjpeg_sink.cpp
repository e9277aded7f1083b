#include <display/mjpeg_sink.hpp>

#include <iostream>

namespace vs {
    MjpegSink::MjpegSink(MJPEGServer& server, int jpeg_quality)
        : server_(server), jpeg_quality_(jpeg_quality) {}

    void MjpegSink::present(const Frame& frame) {
        if (frame.seq == last_seq_) return;
        last_seq_ = frame.seq;

        if (!server_.push_frame(frame.image, jpeg_quality_)) {
            if (++encode_failures_ == 1) {
                std::cerr << "[MJPEG](present) could not encode frame " << frame.seq << "\n";
            }
            return;
        }

        std::string meta =
            "{"
            "\"effect\":\"" + effect_id_ + "\","
            "\"seq\":" + std::to_string(frame.seq) + ","
            "\"pts_ns\":" + std::to_string(frame.pts_ns) + ","
            "\"w\":" + std::to_string(frame.image.cols) + ","
            "\"h\":" + std::to_string(frame.image.rows) +
            "}";
        server_.push_meta(std::move(meta));
    }
}
