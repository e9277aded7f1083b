#include <ingest/gst_frame_source.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <opencv2/core.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>

namespace vs {
    GstFrameSource::GstFrameSource(std::string pipeline, std::string id, std::string sink_name, bool loop)
        : pipeline_str_(std::move(pipeline)), id_(std::move(id)), sink_name_(std::move(sink_name)), loop_(loop) {}

    namespace {
        struct ErrorFree {
            void operator()(GError* e) const { g_error_free(e); }
        };
        using ErrorPtr = std::unique_ptr<GError, ErrorFree>;

        struct SampleUnref {
            void operator()(GstSample* s) const { gst_sample_unref(s); }
        };
        using SamplePtr = std::unique_ptr<GstSample, SampleUnref>;

        // Read-only mapping of a buffer, released on scope exit.
        class MappedBuffer {
        public:
            explicit MappedBuffer(GstBuffer* buf) : buf_(buf) {
                mapped_ = buf_ && gst_buffer_map(buf_, &info_, GST_MAP_READ);
            }
            ~MappedBuffer() {
                if (mapped_) gst_buffer_unmap(buf_, &info_);
            }
            MappedBuffer(const MappedBuffer&) = delete;
            MappedBuffer& operator=(const MappedBuffer&) = delete;

            bool ok() const { return mapped_ && info_.data && info_.size > 0; }
            const guint8* data() const { return info_.data; }
            size_t size() const { return info_.size; }

        private:
            GstBuffer* buf_;
            GstMapInfo info_{};
            bool mapped_ = false;
        };

        // Copies a packed BGR sample into an owned Mat. Empty Mat if the sample is unusable.
        cv::Mat bgr_from_sample(GstSample* sample, GstBuffer* buffer) {
            GstCaps* caps = gst_sample_get_caps(sample);
            GstVideoInfo vinfo;
            if (!caps || !gst_video_info_from_caps(&vinfo, caps)) return {};

            const int w = GST_VIDEO_INFO_WIDTH(&vinfo);
            const int h = GST_VIDEO_INFO_HEIGHT(&vinfo);
            if (w <= 0 || h <= 0) return {};
            const int row_bytes = std::max(GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0), w * 3);

            MappedBuffer mapped(buffer);
            if (!mapped.ok()) return {};
            if (mapped.size() < static_cast<size_t>(row_bytes) * static_cast<size_t>(h)) return {};

            // the buffer goes back to the pool once unmapped, so keep a deep copy
            return cv::Mat(h, w, CV_8UC3, const_cast<guint8*>(mapped.data()), static_cast<size_t>(row_bytes)).clone();
        }
    } // namespace

    bool GstFrameSource::start() {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        GError* raw_err = nullptr;
        pipeline_ = gst_parse_launch(pipeline_str_.c_str(), &raw_err);
        ErrorPtr err(raw_err);
        if (!pipeline_) return fail_(err ? err->message : "parse_launch failed (unk error)");
        if (err) {
            // recoverable, e.g. a missing optional property
            std::cerr << "[GStreamer](start) " << id_ << " parse warning: " << err->message << "\n";
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!sink_) return fail_("appsink " + sink_name_ + " not found");

        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_drop(appsink, TRUE);
        gst_app_sink_set_max_buffers(appsink, 2);
        gst_app_sink_set_emit_signals(appsink, FALSE);

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            // the bus usually carries the real reason (busy device, missing file)
            if (poll_bus_() == ReadStatus::Error) return fail_(last_error_);
            return fail_("failed to set pipeline to PLAYING");
        }

        frame_id_ = 0;
        std::cerr << "[GStreamer](start) " << id_ << " playing.\n";
        return true;
    }

    bool GstFrameSource::fail_(std::string message) {
        last_error_ = std::move(message);
        std::cerr << "[GStreamer](start) " << id_ << ": " << last_error_ << "\n";
        stop();
        return false;
    }

    ReadStatus GstFrameSource::read(FramePacket& out, int timeout_ms) {
        if (!sink_) {
            last_error_ = "source not started";
            return ReadStatus::Error;
        }

        GstAppSink* appsink = GST_APP_SINK(sink_);
        SamplePtr sample(gst_app_sink_try_pull_sample(appsink, static_cast<GstClockTime>(timeout_ms) * GST_MSECOND));

        if (!sample) {
            if (gst_app_sink_is_eos(appsink)) {
                if (loop_ && rewind_()) return ReadStatus::Timeout;
                return ReadStatus::EndOfStream;
            }
            return poll_bus_();
        }

        GstBuffer* buffer = gst_sample_get_buffer(sample.get());
        if (!buffer) return ReadStatus::Timeout;

        // malformed samples are skipped, the next pull may be fine
        cv::Mat bgr = bgr_from_sample(sample.get(), buffer);
        if (bgr.empty()) return ReadStatus::Timeout;

        out.bgr = std::move(bgr);
        out.pts_ns = GST_BUFFER_PTS_IS_VALID(buffer) ? static_cast<int64_t>(GST_BUFFER_PTS(buffer)) : 0;
        out.frame_id = frame_id_++;
        return ReadStatus::Ok;
    }

    ReadStatus GstFrameSource::poll_bus_() {
        if (!pipeline_) return ReadStatus::Error;

        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return ReadStatus::Timeout;

        ReadStatus status = ReadStatus::Timeout;
        const auto filter = static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS);
        while (GstMessage* msg = gst_bus_pop_filtered(bus, filter)) {
            if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
                GError* err = nullptr;
                gchar* dbg = nullptr;
                gst_message_parse_error(msg, &err, &dbg);
                last_error_ = err ? err->message : "unknown pipeline error";
                std::cerr << "[GStreamer](poll_bus_) " << id_ << ": " << last_error_ << "\n";
                if (err) g_error_free(err);
                if (dbg) g_free(dbg);
                status = ReadStatus::Error;
            } else if (status != ReadStatus::Error) {
                status = ReadStatus::EndOfStream;
            }
            gst_message_unref(msg);
        }
        gst_object_unref(bus);

        if (status == ReadStatus::EndOfStream && loop_ && rewind_()) return ReadStatus::Timeout;
        return status;
    }

    bool GstFrameSource::rewind_() {
        if (!pipeline_) return false;
        const auto flags = static_cast<GstSeekFlags>(GST_SEEK_FLAG_FLUSH | GST_SEEK_FLAG_KEY_UNIT);
        if (!gst_element_seek_simple(pipeline_, GST_FORMAT_TIME, flags, 0)) {
            std::cerr << "[GStreamer](rewind_) seek to start failed for " << id_ << "\n";
            return false;
        }
        return true;
    }

    void GstFrameSource::stop() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (sink_) {
                gst_object_unref(sink_);
                sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }

    GstFrameSource::~GstFrameSource() {
        stop();
    }
}
