#include <pipeline/session.hpp>

#include <algorithm>
#include <iostream>
#include <utility>

namespace vs {
    SimulatorSession::SimulatorSession(AppConfig cfg, SourceFactory make_source)
        : cfg_(std::move(cfg)),
          make_source_(std::move(make_source)),
          effects_(list_effects()),
          severity_(std::make_shared<SeverityCell>(cfg_.effect.severity)) {}

    PipelineRuntime::Options SimulatorSession::runtime_options() const {
        PipelineRuntime::Options opt;
        opt.inbound_cap = cfg_.pipeline.inbound_capacity;
        opt.workers = cfg_.pipeline.workers;
        opt.pop_timeout = std::chrono::milliseconds(cfg_.pipeline.pop_timeout_ms);
        opt.read_timeout_ms = cfg_.pipeline.read_timeout_ms;
        opt.severity_epsilon = cfg_.pipeline.severity_epsilon;
        opt.width = cfg_.pipeline.width;
        opt.height = cfg_.pipeline.height;
        opt.keep_aspect = cfg_.pipeline.keep_aspect;
        opt.interp = cfg_.pipeline.interp;
        opt.display_fps = cfg_.display.fps;
        return opt;
    }

    bool SimulatorSession::start(const std::string& effect_id) {
        std::lock_guard life(lifecycle_mtx_);

        EffectConfig ecfg = cfg_.effect;
        ecfg.id = effect_id;

        // an unknown id leaves the running pipeline alone
        EffectPtr effect;
        try {
            effect = make_effect(ecfg);
        } catch (const std::exception& e) {
            std::cerr << "[Session](start) " << e.what() << "\n";
            return false;
        }

        // one active transform, and the device can only be opened once
        stop_locked_();

        std::unique_ptr<IFrameSource> src;
        try {
            src = make_source_(cfg_.source);
        } catch (const std::exception& e) {
            std::cerr << "[Session](start) failed to create source " << cfg_.source.id << ": " << e.what() << "\n";
            return false;
        }
        if (!src) {
            std::cerr << "[Session](start) no source for type " << cfg_.source.type << "\n";
            return false;
        }

        auto rt = std::make_shared<PipelineRuntime>(std::move(src), effect, severity_, runtime_options());
        if (!rt->start()) return false;

        std::lock_guard lk(mtx_);
        runtime_ = std::move(rt);
        active_effect_ = effect->id();
        return true;
    }

    void SimulatorSession::stop() {
        std::lock_guard life(lifecycle_mtx_);
        stop_locked_();
    }

    void SimulatorSession::stop_locked_() {
        std::shared_ptr<PipelineRuntime> rt;
        {
            std::lock_guard lk(mtx_);
            rt = std::move(runtime_);
            runtime_.reset();
            active_effect_.clear();
        }
        if (rt) rt->stop();
    }

    bool SimulatorSession::cycle_effect(int step) {
        if (effects_.empty()) return false;

        const std::string current = active_effect();
        const auto it = std::find(effects_.begin(), effects_.end(), current.empty() ? cfg_.effect.id : current);
        const int n = static_cast<int>(effects_.size());
        const int idx = it == effects_.end() ? 0 : static_cast<int>(it - effects_.begin());
        const int next = ((idx + step) % n + n) % n;
        return start(effects_[static_cast<size_t>(next)]);
    }

    std::shared_ptr<PipelineRuntime> SimulatorSession::runtime() const {
        std::lock_guard lk(mtx_);
        return runtime_;
    }

    std::string SimulatorSession::active_effect() const {
        std::lock_guard lk(mtx_);
        return active_effect_;
    }
}
