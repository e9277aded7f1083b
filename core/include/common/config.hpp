#pragma once

#include <cstddef>
#include <string>

#include <effects/effect.hpp>

namespace vs {
    struct WebcamConfig {
        std::string device = "auto"; // auto | index | /dev/videoN
        int width = 640;
        int height = 480;
        int fps = 30;
        bool mjpg = false;
    };

    struct FileConfig {
        std::string path;
        bool loop = false;
    };

    struct TestSourceConfig {
        std::string pattern = "smpte"; // any videotestsrc pattern nick
        int width = 640;
        int height = 480;
        int fps = 30;
        int num_frames = -1; // -1 = endless
    };

    struct SourceConfig {
        std::string type = "webcam"; // webcam|file|test
        std::string id = "cam0";

        WebcamConfig webcam;
        FileConfig file;
        TestSourceConfig test;
    };

    struct PipelineConfig {
        size_t inbound_capacity = 2;
        int workers = 1;
        int pop_timeout_ms = 20;
        int read_timeout_ms = 100;
        float severity_epsilon = 1e-3f;

        // session frame shape, 0 = take it from the first frame
        int width = 0;
        int height = 0;
        bool keep_aspect = true;
        std::string interp = "linear"; // nearest|cubic|linear|area
    };

    struct WindowConfig {
        std::string title = "VisionSim";
        std::string trackbar = "Severity";
        int trackbar_steps = 100;
        std::string quit_keys = "q";
    };

    struct MjpegConfig {
        std::string host = "0.0.0.0";
        int port = 8080;
        int jpeg_quality = 80;
    };

    struct DisplayConfig {
        std::string backend = "window"; // window|mjpeg
        int fps = 30;
        int stats_interval_s = 5; // 0 = never log stats

        WindowConfig window;
        MjpegConfig mjpeg;
    };

    struct AppConfig {
        SourceConfig source;
        PipelineConfig pipeline;
        DisplayConfig display;
        EffectConfig effect;
    };

    AppConfig load_config_yaml(const std::string& path);
}
