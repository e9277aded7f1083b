#pragma once

#include <ingest/frame_source.hpp>
#include <string>

struct _GstElement;
using GstElement = _GstElement;

namespace vs {
    class GstFrameSource: public IFrameSource {
    public:
        GstFrameSource(std::string pipeline, std::string src_id, std::string sink_name, bool loop = false);

        bool start() override;
        void stop() override;
        ReadStatus read(FramePacket& out, int timeout_ms = 1000) override;
        const std::string& id() const override { return id_; }
        std::string last_error() const override { return last_error_; }

        const std::string& pipeline_description() const { return pipeline_str_; }

        ~GstFrameSource() override;

    private:
        // Drains pending bus messages. Returns Error/EndOfStream when one was posted, Timeout otherwise.
        ReadStatus poll_bus_();
        bool rewind_();
        // Records the error, tears the pipeline down and returns false.
        bool fail_(std::string message);

        std::string pipeline_str_;
        std::string id_;
        std::string sink_name_;
        bool loop_ = false;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;

        int64_t frame_id_ = 0;
        std::string last_error_;
    };
}
