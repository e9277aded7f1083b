#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <common/config.hpp>
#include <ingest/frame_source.hpp>
#include <pipeline/runtime.hpp>
#include <pipeline/severity.hpp>

namespace vs {
    // Input/UI side of the simulator: one active effect at a time, severity kept across switches.
    class SimulatorSession {
    public:
        using SourceFactory = std::function<std::unique_ptr<IFrameSource>(const SourceConfig&)>;

        SimulatorSession(AppConfig cfg, SourceFactory make_source);

        // Stops the running pipeline, if any, and starts a new one with the given effect.
        bool start(const std::string& effect_id);
        void stop();

        // Starts the effect at (current index + step) in list_effects(), wrapping around.
        bool cycle_effect(int step);

        void set_severity(float v) { severity_->set(v); }
        float severity() const { return severity_->get(); }

        // Null while stopped. The pointer stays valid until the next start()/stop().
        std::shared_ptr<PipelineRuntime> runtime() const;

        std::string active_effect() const;
        const AppConfig& config() const { return cfg_; }
        const std::vector<std::string>& effects() const { return effects_; }

        PipelineRuntime::Options runtime_options() const;

        ~SimulatorSession() { stop(); }

    private:
        void stop_locked_();

        AppConfig cfg_;
        SourceFactory make_source_;
        std::vector<std::string> effects_;
        std::shared_ptr<SeverityCell> severity_;

        // serializes start/stop coming from the UI thread and the control server
        std::mutex lifecycle_mtx_;
        mutable std::mutex mtx_;
        std::shared_ptr<PipelineRuntime> runtime_;
        std::string active_effect_;
    };
}
