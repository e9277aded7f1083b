#include <pipeline/runtime.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <common/resize.hpp>

namespace vs {
    namespace {
        std::chrono::milliseconds period_for_fps(int fps) {
            const int f = std::clamp(fps, 1, 240);
            return std::chrono::milliseconds(std::max(1, 1000 / f));
        }

        bool should_log(uint64_t n) { return n == 1 || n % 100 == 0; }
    } // namespace

    PipelineRuntime::PipelineRuntime(std::unique_ptr<IFrameSource> src,
                                     EffectPtr effect,
                                     std::shared_ptr<SeverityCell> severity,
                                     Options opt)
                                         : src_(std::move(src)),
                                           effect_(std::move(effect)),
                                           severity_(severity ? std::move(severity) : std::make_shared<SeverityCell>()),
                                           opt_(std::move(opt)),
                                           tick_period_(period_for_fps(opt_.display_fps)),
                                           inbound_(std::max<size_t>(1, opt_.inbound_cap), opt_.inbound_policy) {
        if (!effect_) throw std::invalid_argument("PipelineRuntime requires an effect");
    }

    bool PipelineRuntime::start() {
        if (running_) return true;
        if (started_) {
            std::cerr << "[Pipeline](start) a stopped runtime cannot be restarted.\n";
            return false;
        }
        started_ = true;

        const int n = std::max(1, opt_.workers);
        worker_states_.clear();
        for (int i = 0; i < n; ++i) {
            worker_states_.push_back(std::make_unique<std::atomic<PipelineState>>(PipelineState::Idle));
        }

        bool opened = false;
        std::string err;
        if (src_) {
            try {
                opened = src_->start();
                if (!opened) err = src_->last_error();
            } catch (const std::exception& e) {
                err = e.what();
            }
        } else {
            err = "no frame source";
        }

        if (!opened) {
            if (err.empty()) err = "failed to open source";
            std::cerr << "[Pipeline](start) source " << (src_ ? src_->id() : std::string("?"))
                      << " failed to open: " << err << "\n";
            finish_(StopReason::SourceFailure, err);
            inbound_.close();
            outbound_.close();
            capture_state_ = PipelineState::Stopped;
            for (auto& s : worker_states_) *s = PipelineState::Stopped;
            presentation_state_ = PipelineState::Stopped;
            return false;
        }

        running_ = true;
        capture_state_ = PipelineState::Running;
        presentation_state_ = PipelineState::Running;

        active_workers_ = n;
        worker_pool_.reserve(static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) {
            worker_pool_.emplace_back([this, i] { worker_loop_(static_cast<size_t>(i)); });
        }
        capture_thr_ = std::thread([this] { capture_loop_(); });

        std::cerr << "[Pipeline](start) effect=" << effect_->id()
                  << " workers=" << n
                  << " inbound_cap=" << inbound_.capacity()
                  << " tick=" << tick_period_.count() << "ms\n";
        return true;
    }

    void PipelineRuntime::request_stop() {
        if (cancel_.exchange(true)) return;
        finish_(StopReason::Cancelled);
        inbound_.stop();
    }

    void PipelineRuntime::stop() {
        request_stop();

        if (capture_thr_.joinable()) capture_thr_.join();
        for (auto& t : worker_pool_) {
            if (t.joinable()) t.join();
        }
        worker_pool_.clear();
        outbound_.close();

        // only after every loop is down
        if (src_ && running_) src_->stop();

        capture_state_ = PipelineState::Stopped;
        presentation_state_ = PipelineState::Stopped;
        for (auto& s : worker_states_) *s = PipelineState::Stopped;
        running_ = false;
    }

    // loops

    void PipelineRuntime::capture_loop_() {
        StopReason reason = StopReason::Cancelled;
        std::string message;

        FramePacket fp;
        while (!cancel_.load(std::memory_order_relaxed)) {
            ReadStatus st = ReadStatus::Timeout;
            try {
                st = src_->read(fp, opt_.read_timeout_ms);
                if (st == ReadStatus::Ok && (fp.bgr.empty() || !normalize_(fp.bgr))) continue;
            } catch (const std::exception& e) {
                message = e.what();
                st = ReadStatus::Error;
            }

            if (st == ReadStatus::Timeout) continue;
            if (st == ReadStatus::EndOfStream) {
                reason = StopReason::SourceExhausted;
                break;
            }
            if (st == ReadStatus::Error) {
                reason = StopReason::SourceFailure;
                if (message.empty()) message = src_->last_error();
                if (message.empty()) message = "read failed";
                break;
            }

            auto frame = std::make_shared<Frame>();
            frame->seq = next_seq_++;
            frame->pts_ns = fp.pts_ns;
            frame->image = std::move(fp.bgr);

            Job job;
            job.frame = std::move(frame);
            job.captured_severity = severity_->get();
            job.enqueued_at = std::chrono::steady_clock::now();

            frames_captured_.fetch_add(1, std::memory_order_relaxed);
            // a full queue drops the job and counts it, nothing else to do
            (void)inbound_.push(std::move(job));
        }

        if (reason == StopReason::SourceFailure) {
            std::cerr << "[Pipeline](capture_loop_) source " << src_->id() << " failed: " << message << "\n";
        } else if (reason == StopReason::SourceExhausted) {
            std::cerr << "[Pipeline](capture_loop_) source " << src_->id() << " exhausted after "
                      << frames_captured_.load() << " frames.\n";
        }

        finish_(reason, message);
        capture_state_ = PipelineState::Stopped;
        inbound_.close();
    }

    void PipelineRuntime::worker_loop_(size_t index) {
        auto& state = *worker_states_[index];
        state = PipelineState::Running;

        // tables and scratch for this worker only
        std::unique_ptr<EffectState> effect_state;

        while (!cancel_.load(std::memory_order_relaxed)) {
            if (state.load() == PipelineState::Running && capture_state_.load() == PipelineState::Stopped) {
                state = PipelineState::Draining;
            }

            Job job;
            if (!inbound_.pop_for(job, opt_.pop_timeout)) {
                if (inbound_.drained()) break;
                continue;
            }
            if (!job.frame) continue;

            Result res = process_(job, effect_state);
            const int64_t seq = res.seq;
            (void)outbound_.publish(seq, std::move(res));
        }

        effect_state.reset();
        state = PipelineState::Stopped;
        if (active_workers_.fetch_sub(1) == 1) outbound_.close();
    }

    // hooks

    bool PipelineRuntime::normalize_(cv::Mat& bgr) {
        if (!to_bgr8(bgr)) return false;

        if (session_w_ == 0 || session_h_ == 0) {
            session_w_ = opt_.width > 0 ? opt_.width : bgr.cols;
            session_h_ = opt_.height > 0 ? opt_.height : bgr.rows;
        }
        if (bgr.cols != session_w_ || bgr.rows != session_h_) {
            bgr = resize_frame(bgr, session_w_, session_h_, opt_.keep_aspect, interp_from_str(opt_.interp));
        }
        return true;
    }

    Result PipelineRuntime::process_(const Job& job, std::unique_ptr<EffectState>& state) {
        const auto t0 = std::chrono::steady_clock::now();

        // current value at dequeue, not the one sampled at capture
        const float severity = severity_->get();

        Result res;
        res.seq = job.frame->seq;
        res.severity = severity;
        res.frame = job.frame;
        res.processed = false;

        if (severity < opt_.severity_epsilon && effect_->passthrough_at_zero()) {
            passthrough_.fetch_add(1, std::memory_order_relaxed);
        } else {
            try {
                const FrameShape shape = FrameShape::of(job.frame->image);
                if (!state || state->shape() != shape) state = effect_->init(shape);

                cv::Mat out;
                effect_->apply(job.frame->image, severity, *state, out);
                if (out.empty()) throw std::runtime_error("effect produced an empty frame");

                auto f = std::make_shared<Frame>();
                f->seq = job.frame->seq;
                f->pts_ns = job.frame->pts_ns;
                f->image = std::move(out);
                res.frame = std::move(f);
                res.processed = true;
            } catch (const std::exception& e) {
                const uint64_t n = transform_failures_.fetch_add(1, std::memory_order_relaxed) + 1;
                if (should_log(n)) {
                    std::cerr << "[Pipeline](worker_loop_) effect " << effect_->id()
                              << " failed on frame " << job.frame->seq
                              << " (" << n << " total), passing it through: " << e.what() << "\n";
                }
            } catch (...) {
                const uint64_t n = transform_failures_.fetch_add(1, std::memory_order_relaxed) + 1;
                if (should_log(n)) {
                    std::cerr << "[Pipeline](worker_loop_) effect " << effect_->id()
                              << " failed on frame " << job.frame->seq
                              << " (" << n << " total), passing it through: unknown exception\n";
                }
            }
        }

        const auto dt = std::chrono::steady_clock::now() - t0;
        worker_latency_ns_.fetch_add(
            static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(dt).count()),
            std::memory_order_relaxed);
        worker_latency_count_.fetch_add(1, std::memory_order_relaxed);
        jobs_processed_.fetch_add(1, std::memory_order_relaxed);
        return res;
    }

    void PipelineRuntime::finish_(StopReason reason, const std::string& message) {
        StopReason expected = StopReason::None;
        if (!stop_reason_.compare_exchange_strong(expected, reason)) return;
        if (!message.empty()) {
            std::lock_guard lk(failure_mtx_);
            failure_message_ = message;
        }
    }

    // presentation

    PipelineRuntime::TickOutcome PipelineRuntime::present_tick(IFrameSink& sink) {
        if (presentation_state_.load() == PipelineState::Stopped) return TickOutcome::Finished;

        auto present = [&](const Frame& f) {
            try {
                sink.present(f);
            } catch (const std::exception& e) {
                std::cerr << "[Pipeline](present_tick) sink failed on frame " << f.seq << ": " << e.what() << "\n";
            }
        };

        Result res;
        if (outbound_.take_for(res, tick_period_)) {
            if (res.frame && res.seq > last_shown_seq_) {
                present(*res.frame);
                last_shown_ = std::move(res.frame);
                last_shown_seq_ = res.seq;
                frames_presented_.fetch_add(1, std::memory_order_relaxed);
                return TickOutcome::Presented;
            }
            presented_stale_.fetch_add(1, std::memory_order_relaxed);
        } else {
            if (outbound_.drained()) {
                presentation_state_ = PipelineState::Stopped;
                return TickOutcome::Finished;
            }
            presentation_timeouts_.fetch_add(1, std::memory_order_relaxed);
        }

        if (!last_shown_) {
            try {
                sink.idle();
            } catch (const std::exception& e) {
                std::cerr << "[Pipeline](present_tick) sink failed while idle: " << e.what() << "\n";
            }
            return TickOutcome::Idle;
        }
        present(*last_shown_);
        repeats_.fetch_add(1, std::memory_order_relaxed);
        return TickOutcome::Repeated;
    }

    StopReason PipelineRuntime::run_presentation(IFrameSink& sink, const std::function<bool()>& keep_running) {
        using clock = std::chrono::steady_clock;
        auto next_tick = clock::now();

        while (true) {
            if (keep_running && !keep_running()) {
                request_stop();
                Result discard;
                (void)outbound_.try_take(discard);
                presentation_state_ = PipelineState::Stopped;
                break;
            }

            if (present_tick(sink) == TickOutcome::Finished) break;

            next_tick += tick_period_;
            const auto now = clock::now();
            if (next_tick < now) {
                // fell behind, do not burst to catch up
                next_tick = now;
            } else {
                std::this_thread::sleep_until(next_tick);
            }
        }
        return stop_reason();
    }

    // status

    PipelineState PipelineRuntime::worker_state() const {
        if (worker_states_.empty()) return PipelineState::Idle;

        bool any_draining = false;
        bool all_stopped = true;
        for (const auto& s : worker_states_) {
            const PipelineState v = s->load();
            if (v == PipelineState::Running) return PipelineState::Running;
            if (v == PipelineState::Draining) any_draining = true;
            if (v != PipelineState::Stopped) all_stopped = false;
        }
        if (any_draining) return PipelineState::Draining;
        return all_stopped ? PipelineState::Stopped : PipelineState::Idle;
    }

    bool PipelineRuntime::finished() const {
        return capture_state() == PipelineState::Stopped &&
               worker_state() == PipelineState::Stopped &&
               presentation_state() == PipelineState::Stopped;
    }

    std::string PipelineRuntime::failure_message() const {
        std::lock_guard lk(failure_mtx_);
        return failure_message_;
    }

    PipelineStats PipelineRuntime::stats() const {
        PipelineStats s;
        s.frames_captured = frames_captured_.load();
        s.inbound_dropped = inbound_.dropped();
        s.jobs_processed = jobs_processed_.load();
        s.passthrough = passthrough_.load();
        s.transform_failures = transform_failures_.load();
        s.results_overwritten = outbound_.overwritten();
        s.stale_discarded = outbound_.stale() + presented_stale_.load();
        s.frames_presented = frames_presented_.load();
        s.repeats = repeats_.load();
        s.presentation_timeouts = presentation_timeouts_.load();

        const uint64_t n = worker_latency_count_.load();
        if (n > 0) {
            s.avg_worker_latency_ms = static_cast<double>(worker_latency_ns_.load()) / static_cast<double>(n) / 1e6;
        }

        s.stop_reason = stop_reason_.load();
        s.failure_message = failure_message();
        return s;
    }
}
