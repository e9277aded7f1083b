#include <common/config.hpp>

#include <algorithm>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace vs {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static float get_float(
        const YAML::Node& n, const char* key, float def) {
        return (n && n[key]) ? n[key].as<float>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static void require(bool cond, const std::string& msg) {
        if (!cond) throw std::runtime_error("[Config] " + msg);
    }

    static WebcamConfig parse_webcam_config(const YAML::Node& wc) {
        WebcamConfig c;
        if (!wc) return c;
        c.device = get_str(wc, "device", c.device);
        c.width = get_int(wc, "width", c.width);
        c.height = get_int(wc, "height", c.height);
        c.fps = get_int(wc, "fps", c.fps);
        c.mjpg = get_bool(wc, "mjpg", get_bool(wc, "mjpeg", c.mjpg));
        return c;
    }

    static FileConfig parse_file_config(const YAML::Node& fc) {
        FileConfig c;
        if (!fc) return c;
        c.path = get_str(fc, "path", c.path);
        c.loop = get_bool(fc, "loop", c.loop);
        return c;
    }

    static TestSourceConfig parse_test_config(const YAML::Node& tc) {
        TestSourceConfig c;
        if (!tc) return c;
        c.pattern = get_str(tc, "pattern", c.pattern);
        c.width = get_int(tc, "width", c.width);
        c.height = get_int(tc, "height", c.height);
        c.fps = get_int(tc, "fps", c.fps);
        c.num_frames = get_int(tc, "num_frames", c.num_frames);
        return c;
    }

    static SourceConfig parse_source_config(const YAML::Node& s) {
        SourceConfig c;
        if (!s) return c;
        c.type = get_str(s, "type", c.type);
        c.id = get_str(s, "id", c.id);
        c.webcam = parse_webcam_config(s["webcam"]);
        c.file = parse_file_config(s["file"]);
        c.test = parse_test_config(s["test"]);

        require(c.type == "webcam" || c.type == "file" || c.type == "test",
                "unknown source type: " + c.type);
        if (c.type == "file") {
            require(!c.file.path.empty(), "file source " + c.id + " has empty path!");
        }
        if (c.type == "webcam") {
            require(c.webcam.width > 0 && c.webcam.height > 0, "webcam width/height must be > 0");
            require(c.webcam.fps > 0, "webcam fps must be > 0");
        }
        if (c.type == "test") {
            require(c.test.width > 0 && c.test.height > 0, "test width/height must be > 0");
            require(c.test.fps > 0, "test fps must be > 0");
        }
        return c;
    }

    static PipelineConfig parse_pipeline_config(const YAML::Node& p) {
        PipelineConfig c;
        if (!p) return c;
        const int cap = get_int(p, "inbound_capacity", static_cast<int>(c.inbound_capacity));
        require(cap >= 1 && cap <= 64, "pipeline.inbound_capacity must be in [1, 64]");
        c.inbound_capacity = static_cast<size_t>(cap);

        c.workers = get_int(p, "workers", c.workers);
        require(c.workers >= 1 && c.workers <= 8, "pipeline.workers must be in [1, 8]");

        c.pop_timeout_ms = get_int(p, "pop_timeout_ms", c.pop_timeout_ms);
        require(c.pop_timeout_ms > 0, "pipeline.pop_timeout_ms must be > 0");
        c.read_timeout_ms = get_int(p, "read_timeout_ms", c.read_timeout_ms);
        require(c.read_timeout_ms > 0, "pipeline.read_timeout_ms must be > 0");

        c.severity_epsilon = get_float(p, "severity_epsilon", c.severity_epsilon);
        require(c.severity_epsilon >= 0.0f && c.severity_epsilon < 1.0f,
                "pipeline.severity_epsilon must be in [0, 1)");

        c.width = get_int(p, "width", c.width);
        c.height = get_int(p, "height", c.height);
        require(c.width >= 0 && c.height >= 0, "pipeline width/height must be >= 0");
        c.keep_aspect = get_bool(p, "keep_aspect", c.keep_aspect);
        c.interp = get_str(p, "interp", c.interp);
        return c;
    }

    static DisplayConfig parse_display_config(const YAML::Node& d) {
        DisplayConfig c;
        if (!d) return c;
        c.backend = get_str(d, "backend", c.backend);
        require(c.backend == "window" || c.backend == "mjpeg", "unknown display backend: " + c.backend);

        c.fps = get_int(d, "fps", c.fps);
        require(c.fps >= 1 && c.fps <= 240, "display.fps must be in [1, 240]");
        c.stats_interval_s = std::max(0, get_int(d, "stats_interval_s", c.stats_interval_s));

        const YAML::Node w = d["window"];
        c.window.title = get_str(w, "title", c.window.title);
        c.window.trackbar = get_str(w, "trackbar", c.window.trackbar);
        c.window.trackbar_steps = get_int(w, "trackbar_steps", c.window.trackbar_steps);
        c.window.quit_keys = get_str(w, "quit_keys", c.window.quit_keys);
        require(c.window.trackbar_steps >= 1, "display.window.trackbar_steps must be >= 1");

        const YAML::Node m = d["mjpeg"];
        c.mjpeg.host = get_str(m, "host", c.mjpeg.host);
        c.mjpeg.port = get_int(m, "port", c.mjpeg.port);
        c.mjpeg.jpeg_quality = get_int(m, "jpeg_quality", c.mjpeg.jpeg_quality);
        require(c.mjpeg.port > 0 && c.mjpeg.port < 65536, "display.mjpeg.port out of range");
        require(c.mjpeg.jpeg_quality >= 1 && c.mjpeg.jpeg_quality <= 100,
                "display.mjpeg.jpeg_quality must be in [1, 100]");
        return c;
    }

    static EffectConfig parse_effect_config(const YAML::Node& e) {
        EffectConfig c;
        if (!e) return c;
        c.id = get_str(e, "id", c.id);
        c.severity = get_float(e, "severity", c.severity);
        if (e["seed"]) c.seed = e["seed"].as<uint32_t>();
        c.max_blur_sigma = get_float(e, "max_blur_sigma", c.max_blur_sigma);

        const auto ids = list_effects();
        require(std::find(ids.begin(), ids.end(), c.id) != ids.end(), "unknown effect id: " + c.id);
        require(c.severity >= 0.0f && c.severity <= 1.0f, "effect.severity must be in [0, 1]");
        require(c.max_blur_sigma >= 0.0f, "effect.max_blur_sigma must be >= 0");
        return c;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        require(static_cast<bool>(root["source"]), "no source specified!");

        cfg.source = parse_source_config(root["source"]);
        cfg.pipeline = parse_pipeline_config(root["pipeline"]);
        cfg.display = parse_display_config(root["display"]);
        cfg.effect = parse_effect_config(root["effect"]);
        return cfg;
    }
}
