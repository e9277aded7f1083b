#include <ingest/frame_source_factory.hpp>
#include <ingest/gst_frame_source.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace vs {
    static const char* kAppsinkTail = " ! videoconvert ! video/x-raw,format=BGR ! appsink name=";
    static const char* kAppsinkOpts = " max-buffers=2 drop=true sync=false";

    static bool is_index(const std::string& s) {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
    }

    std::string resolve_webcam_device(const std::string& device) {
        if (device.empty() || device == "auto") {
            for (int i = 0; i < 10; ++i) {
                const std::string path = "/dev/video" + std::to_string(i);
                std::error_code ec;
                if (std::filesystem::exists(path, ec)) return path;
            }
            throw std::runtime_error("no capture device found under /dev/video0..9");
        }
        if (is_index(device)) return "/dev/video" + device;
        return device;
    }

    static std::string web_pipeline(const WebcamConfig& c, const std::string& sink_name) {
        const std::string dev = resolve_webcam_device(c.device);
        const std::string caps = "width=" + std::to_string(c.width)
                                 + ",height=" + std::to_string(c.height)
                                 + ",framerate=" + std::to_string(c.fps) + "/1";
        if (c.mjpg) {
            return "v4l2src device=" + dev + " ! "
                   "image/jpeg," + caps + " ! jpegdec"
                   + kAppsinkTail + sink_name + kAppsinkOpts;
        }
        return "v4l2src device=" + dev + " ! "
               "video/x-raw," + caps
               + kAppsinkTail + sink_name + kAppsinkOpts;
    }

    static std::string file_pipeline(const FileConfig& c, const std::string& sink_name) {
        return "filesrc location=\"" + c.path + "\" ! decodebin"
               + kAppsinkTail + sink_name + kAppsinkOpts;
    }

    static std::string test_pipeline(const TestSourceConfig& c, const std::string& sink_name) {
        std::string src = "videotestsrc is-live=true pattern=" + c.pattern;
        if (c.num_frames > 0) src += " num-buffers=" + std::to_string(c.num_frames);
        return src + " ! video/x-raw,width=" + std::to_string(c.width)
               + ",height=" + std::to_string(c.height)
               + ",framerate=" + std::to_string(c.fps) + "/1"
               + kAppsinkTail + sink_name + kAppsinkOpts;
    }

    std::string build_source_pipeline(const SourceConfig& cfg, const std::string& sink_name) {
        if (cfg.type == "webcam") return web_pipeline(cfg.webcam, sink_name);
        if (cfg.type == "file") {
            if (cfg.file.path.empty()) {
                throw std::runtime_error("file.path is empty in config");
            }
            return file_pipeline(cfg.file, sink_name);
        }
        if (cfg.type == "test") return test_pipeline(cfg.test, sink_name);
        throw std::runtime_error("Unknown source type " + cfg.type);
    }

    std::unique_ptr<IFrameSource> make_frame_source(const SourceConfig& cfg) {
        const std::string sink_name = "sink_" + cfg.id;
        const bool loop = cfg.type == "file" && cfg.file.loop;
        return std::make_unique<GstFrameSource>(build_source_pipeline(cfg, sink_name), cfg.id, sink_name, loop);
    }
}
