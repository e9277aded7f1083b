#include <common/config.hpp>
#include <display/highgui_sink.hpp>
#include <display/mjpeg_sink.hpp>
#include <encode/mjpeg_server.hpp>
#include <ingest/frame_source_factory.hpp>
#include <pipeline/session.hpp>

#include <yaml-cpp/exceptions.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

namespace {
    struct KeyCommand {
        enum class Kind { None, Next, Prev, Select } kind = Kind::None;
        int index = 0;
    };

    KeyCommand command_for_key(int key, size_t effect_count) {
        KeyCommand c;
        if (key == 'n') c.kind = KeyCommand::Kind::Next;
        else if (key == 'p') c.kind = KeyCommand::Kind::Prev;
        else if (key >= '0' && key <= '9' && static_cast<size_t>(key - '0') < effect_count) {
            c.kind = KeyCommand::Kind::Select;
            c.index = key - '0';
        }
        return c;
    }

    // Logs a stats line every interval_s seconds, 0 disables it.
    class StatsTicker {
    public:
        explicit StatsTicker(int interval_s)
            : interval_(interval_s), last_(std::chrono::steady_clock::now()) {}

        void maybe_log(const vs::PipelineRuntime& rt) {
            if (interval_.count() <= 0) return;
            const auto now = std::chrono::steady_clock::now();
            if (now - last_ < interval_) return;
            last_ = now;
            std::cerr << "[Stats] effect=" << rt.effect_id()
                      << " severity=" << rt.severity()
                      << " " << vs::stats_to_json(rt.stats()) << "\n";
        }

    private:
        std::chrono::seconds interval_;
        std::chrono::steady_clock::time_point last_;
    };

    int run_window(vs::SimulatorSession& session) {
        const auto& cfg = session.config();

        vs::HighGuiSink window(cfg.display.window, [&session](float v) { session.set_severity(v); });
        if (!window.open(session.severity())) return 1;

        StatsTicker ticker(cfg.display.stats_interval_s);
        int exit_code = 0;

        while (g_running && !window.quit_requested()) {
            auto rt = session.runtime();
            if (!rt) break;
            window.set_caption(rt->effect_id());

            KeyCommand pending;
            auto keep_running = [&] {
                if (!g_running || window.quit_requested()) return false;
                ticker.maybe_log(*rt);
                const int key = window.take_key();
                if (key < 0) return true;
                pending = command_for_key(key, session.effects().size());
                return pending.kind == KeyCommand::Kind::None;
            };

            const vs::StopReason reason = rt->run_presentation(window, keep_running);

            if (pending.kind != KeyCommand::Kind::None) {
                bool ok = false;
                if (pending.kind == KeyCommand::Kind::Next) ok = session.cycle_effect(1);
                else if (pending.kind == KeyCommand::Kind::Prev) ok = session.cycle_effect(-1);
                else ok = session.start(session.effects()[static_cast<size_t>(pending.index)]);
                if (!ok) std::cerr << "[App] effect switch failed, exiting.\n";
                continue;
            }

            // quit, end of stream or source failure
            if (reason == vs::StopReason::SourceFailure) {
                std::cerr << "Source failure: " << rt->failure_message() << "\n";
                exit_code = 1;
            }
            break;
        }

        session.stop();
        window.close();
        return exit_code;
    }

    int run_mjpeg(vs::SimulatorSession& session) {
        const auto& cfg = session.config();

        vs::MJPEGServer server(cfg.display.mjpeg.host, cfg.display.mjpeg.port);
        vs::MjpegSink sink(server, cfg.display.mjpeg.jpeg_quality);

        vs::ControlHandlers controls;
        controls.set_severity = [&session](float v) { session.set_severity(v); };
        controls.get_severity = [&session] { return session.severity(); };
        controls.start_effect = [&session](const std::string& id) { return session.start(id); };
        controls.stop = [&session] { session.stop(); };
        controls.list_effects = [&session] { return session.effects(); };
        controls.stats_json = [&session] {
            auto rt = session.runtime();
            return rt ? vs::stats_to_json(rt->stats()) : std::string(R"({"stop_reason":"stopped"})");
        };
        server.set_controls(std::move(controls));

        if (!server.start()) return 1;

        StatsTicker ticker(cfg.display.stats_interval_s);
        int exit_code = 0;

        while (g_running) {
            auto rt = session.runtime();
            if (!rt) {
                // stopped over HTTP, wait for the next /effect
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }
            sink.set_effect(rt->effect_id());

            const vs::StopReason reason = rt->run_presentation(sink, [&] {
                ticker.maybe_log(*rt);
                return g_running.load();
            });

            // replaced or stopped through the control API
            if (session.runtime() != rt) continue;

            if (reason == vs::StopReason::SourceFailure) {
                std::cerr << "Source failure: " << rt->failure_message() << "\n";
                exit_code = 1;
            }
            break;
        }

        session.stop();
        server.stop();
        return exit_code;
    }
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string cfg_path = "configs/webcam.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    vs::AppConfig cfg;
    try {
        cfg = vs::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    // optional effect override: visionsim <config> <effect_id>
    std::string effect_id = cfg.effect.id;
    if (argc >= 3) effect_id = argv[2];

    vs::SimulatorSession session(cfg, [](const vs::SourceConfig& sc) { return vs::make_frame_source(sc); });
    if (!session.start(effect_id)) {
        std::cerr << "Failed to start effect " << effect_id << "\n";
        return 1;
    }

    const int rc = cfg.display.backend == "mjpeg" ? run_mjpeg(session) : run_window(session);
    std::cerr << "Shutting down...\n";
    return rc;
}
