#include <pipeline/runtime.hpp>

#include <opencv2/core.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    using namespace std::chrono_literals;
    using clock_type = std::chrono::steady_clock;

    cv::Mat frame_for(int64_t seq, int w, int h, int type = CV_8UC3) {
        cv::Mat m(h, w, type);
        cv::RNG rng(static_cast<uint64_t>(1000 + seq));
        rng.fill(m, cv::RNG::UNIFORM, 0, 256);
        return m;
    }

    bool same(const cv::Mat& a, const cv::Mat& b) {
        if (a.size() != b.size() || a.type() != b.type()) return false;
        return cv::norm(a, b, cv::NORM_INF) == 0.0;
    }

    // Shared between a source owned by the runtime and the test body.
    struct Tally {
        std::atomic<int> presented{0}; // distinct frames shown by the sink
        std::atomic<int> reads_after_stop{0};
        std::atomic<int> stop_calls{0};
        std::atomic<bool> stopped{false};
    };

    struct Script {
        int frames = 100;
        bool endless = false;
        bool lockstep = true;  // hand out frame n only after n frames were shown
        int period_ms = 0;
        int fail_after = -1;   // read error once this many frames were produced
        bool fail_open = false;
        int stall_after = -1;  // time out forever once this many frames were produced
        int width = 64;
        int height = 48;
        int type = CV_8UC3;
    };

    class ScriptedSource : public vs::IFrameSource {
    public:
        ScriptedSource(Script script, std::shared_ptr<Tally> tally)
            : script_(script), tally_(std::move(tally)) {}

        bool start() override {
            if (script_.fail_open) {
                err_ = "no device";
                return false;
            }
            return true;
        }

        void stop() override {
            ++tally_->stop_calls;
            tally_->stopped = true;
        }

        vs::ReadStatus read(vs::FramePacket& out, int timeout_ms) override {
            if (tally_->stopped) {
                ++tally_->reads_after_stop;
                return vs::ReadStatus::Error;
            }
            if (script_.fail_after >= 0 && next_ >= script_.fail_after) {
                err_ = "unplugged";
                return vs::ReadStatus::Error;
            }
            if (script_.stall_after >= 0 && next_ >= script_.stall_after) {
                std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
                return vs::ReadStatus::Timeout;
            }
            if (!script_.endless && next_ >= script_.frames) {
                // hold the end of stream back until the last frame was shown
                if (script_.lockstep && !wait_presented_(script_.frames, timeout_ms)) return vs::ReadStatus::Timeout;
                return vs::ReadStatus::EndOfStream;
            }
            if (script_.lockstep && !wait_presented_(static_cast<int>(next_), timeout_ms)) {
                return vs::ReadStatus::Timeout;
            }
            if (script_.period_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(script_.period_ms));

            out.bgr = frame_for(next_, script_.width, script_.height, script_.type);
            out.pts_ns = next_ * 1000000;
            out.frame_id = next_;
            ++next_;
            return vs::ReadStatus::Ok;
        }

        const std::string& id() const override { return id_; }
        std::string last_error() const override { return err_; }

    private:
        bool wait_presented_(int n, int timeout_ms) {
            const auto deadline = clock_type::now() + std::chrono::milliseconds(timeout_ms);
            while (tally_->presented.load() < n) {
                if (clock_type::now() >= deadline) return false;
                std::this_thread::sleep_for(1ms);
            }
            return true;
        }

        Script script_;
        std::shared_ptr<Tally> tally_;
        std::string id_ = "scripted";
        std::string err_;
        int64_t next_ = 0;
    };

    class RecordingSink : public vs::IFrameSink {
    public:
        explicit RecordingSink(std::shared_ptr<Tally> tally) : tally_(std::move(tally)) {}

        void present(const vs::Frame& f) override {
            ++calls;
            if (f.seq == last_seq_) return;
            last_seq_ = f.seq;
            seqs.push_back(f.seq);
            images.push_back(f.image);
            last_new_at = clock_type::now();
            if (on_new) on_new(f);
            ++tally_->presented;
        }

        void idle() override { ++idle_calls; }

        int calls = 0;
        int idle_calls = 0;
        std::vector<int64_t> seqs;
        std::vector<cv::Mat> images;
        clock_type::time_point last_new_at{};
        std::function<void(const vs::Frame&)> on_new;

    private:
        std::shared_ptr<Tally> tally_;
        int64_t last_seq_ = -1;
    };

    // Output filled with round(severity * 200), so the applied severity is visible per frame.
    class FillEffect : public vs::IEffect {
    public:
        explicit FillEffect(bool passthrough = true, int delay_ms = 0)
            : passthrough_(passthrough), delay_ms_(delay_ms) {}

        const std::string& id() const override { return id_; }
        std::unique_ptr<vs::EffectState> init(const vs::FrameShape& shape) const override {
            return std::make_unique<vs::EffectState>(shape);
        }
        void apply(const cv::Mat& in, float severity, vs::EffectState&, cv::Mat& out) const override {
            if (delay_ms_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
            out = cv::Mat(in.size(), in.type(), cv::Scalar::all(std::round(severity * 200.0f)));
        }
        bool passthrough_at_zero() const override { return passthrough_; }

    private:
        std::string id_ = "fill";
        bool passthrough_;
        int delay_ms_;
    };

    class SleepyEffect : public vs::IEffect {
    public:
        SleepyEffect(int min_ms, int max_ms) : min_ms_(min_ms), max_ms_(max_ms) {}

        const std::string& id() const override { return id_; }
        std::unique_ptr<vs::EffectState> init(const vs::FrameShape& shape) const override {
            return std::make_unique<vs::EffectState>(shape);
        }
        void apply(const cv::Mat& in, float, vs::EffectState&, cv::Mat& out) const override {
            thread_local std::mt19937 rng(std::random_device{}());
            std::uniform_int_distribution<int> d(min_ms_, max_ms_);
            std::this_thread::sleep_for(std::chrono::milliseconds(d(rng)));
            out = in;
        }

    private:
        std::string id_ = "sleepy";
        int min_ms_;
        int max_ms_;
    };

    class ThrowingEffect : public vs::IEffect {
    public:
        enum class Mode { RuntimeError, IntFromApply, IntFromInit };

        explicit ThrowingEffect(Mode mode = Mode::RuntimeError) : mode_(mode) {}

        const std::string& id() const override { return id_; }
        std::unique_ptr<vs::EffectState> init(const vs::FrameShape& shape) const override {
            if (mode_ == Mode::IntFromInit) throw 7;
            return std::make_unique<vs::EffectState>(shape);
        }
        void apply(const cv::Mat&, float, vs::EffectState&, cv::Mat&) const override {
            if (mode_ == Mode::IntFromApply) throw 42;
            throw std::runtime_error("transform exploded");
        }

    private:
        std::string id_ = "throwing";
        Mode mode_;
    };

    vs::PipelineRuntime::Options options(int workers = 1, int fps = 100) {
        vs::PipelineRuntime::Options opt;
        opt.workers = workers;
        opt.display_fps = fps;
        return opt;
    }

    std::unique_ptr<vs::PipelineRuntime> make_runtime(const Script& script,
                                                      const std::shared_ptr<Tally>& tally,
                                                      vs::EffectPtr effect,
                                                      float severity,
                                                      vs::PipelineRuntime::Options opt = options()) {
        return std::make_unique<vs::PipelineRuntime>(
            std::make_unique<ScriptedSource>(script, tally),
            std::move(effect),
            std::make_shared<vs::SeverityCell>(severity),
            opt);
    }

    void test_identity_presents_every_frame_in_order() {
        auto tally = std::make_shared<Tally>();
        Script script;
        vs::EffectConfig identity;
        identity.id = "none";
        auto rt = make_runtime(script, tally, vs::make_effect(identity), 1.0f);
        RecordingSink sink(tally);

        check(rt->start(), "runtime should start");
        const vs::StopReason reason = rt->run_presentation(sink);
        const auto returned_at = clock_type::now();

        check(reason == vs::StopReason::SourceExhausted, "exhausted source should end with SourceExhausted");
        check(sink.seqs.size() == 100, "all 100 frames should be presented");

        bool ordered = sink.seqs.size() == 100;
        bool identical = ordered;
        for (size_t i = 0; ordered && i < sink.seqs.size(); ++i) {
            if (sink.seqs[i] != static_cast<int64_t>(i)) ordered = false;
            else if (!same(sink.images[i], frame_for(sink.seqs[i], script.width, script.height))) identical = false;
        }
        check(ordered, "frames should be presented as 0..99 in order");
        check(identical, "identity transform should present every frame unmodified");

        check(rt->finished(), "every stage should be stopped once presentation finished");
        check(rt->capture_state() == vs::PipelineState::Stopped, "capture should be stopped");
        check(rt->worker_state() == vs::PipelineState::Stopped, "workers should be stopped");
        check(rt->presentation_state() == vs::PipelineState::Stopped, "presentation should be stopped");
        // one tick plus scheduler slack
        check(returned_at - sink.last_new_at < rt->tick_period() + 30ms,
              "presentation should finish within one tick of the last frame");

        const auto s = rt->stats();
        check(s.frames_captured == 100, "stats should count 100 captured frames");
        check(s.inbound_dropped == 0, "lockstep capture should never drop");
        check(s.passthrough == 0 && s.jobs_processed == 100, "every frame should go through the transform");
        check(s.frames_presented == 100, "stats should count 100 presented frames");
        check(s.stop_reason == vs::StopReason::SourceExhausted, "stats should carry the stop reason");

        check(!tally->stopped.load(), "source should stay open until stop()");
        rt->stop();
        check(tally->stop_calls.load() == 1, "source should be released exactly once");
        check(tally->reads_after_stop.load() == 0, "source must not be read after it was released");
    }

    void test_transformed_frames_reach_the_sink() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.frames = 20;
        auto rt = make_runtime(script, tally, std::make_shared<FillEffect>(), 0.5f);
        RecordingSink sink(tally);

        check(rt->start(), "runtime should start");
        (void)rt->run_presentation(sink);

        bool filled = sink.images.size() == 20;
        for (const auto& img : sink.images) {
            if (img.at<cv::Vec3b>(0, 0)[0] != 100) filled = false;
        }
        check(filled, "every presented frame should carry the transform's output");
        check(rt->stats().jobs_processed == 20, "every frame should be processed");
    }

    void test_presented_sequence_is_increasing_with_many_workers() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.frames = 200;
        script.lockstep = false;
        script.period_ms = 2;

        auto rt = make_runtime(script, tally, std::make_shared<SleepyEffect>(0, 15), 1.0f, options(3, 60));
        RecordingSink sink(tally);

        check(rt->start(), "runtime should start");
        const vs::StopReason reason = rt->run_presentation(sink);
        check(reason == vs::StopReason::SourceExhausted, "run should end with SourceExhausted");
        check(!sink.seqs.empty(), "some frames should be presented");

        bool increasing = true;
        for (size_t i = 1; i < sink.seqs.size(); ++i) {
            if (sink.seqs[i] <= sink.seqs[i - 1]) increasing = false;
        }
        check(increasing, "presented sequence numbers should be strictly increasing");

        const auto s = rt->stats();
        check(s.frames_captured == 200, "all 200 frames should be captured");
        check(s.inbound_dropped + s.jobs_processed == s.frames_captured,
              "every captured frame should be either dropped or processed");
        check(s.frames_presented <= s.jobs_processed, "cannot present more than was processed");
    }

    void test_transform_failure_passes_frames_through() {
        auto tally = std::make_shared<Tally>();
        Script script;
        auto rt = make_runtime(script, tally, std::make_shared<ThrowingEffect>(), 1.0f);
        RecordingSink sink(tally);

        check(rt->start(), "runtime should start");
        const vs::StopReason reason = rt->run_presentation(sink);
        check(reason == vs::StopReason::SourceExhausted, "transform failures must not stop the pipeline");
        check(sink.seqs.size() == 100, "all 100 frames should still be presented");

        bool identical = sink.seqs.size() == 100;
        for (size_t i = 0; identical && i < sink.seqs.size(); ++i) {
            identical = same(sink.images[i], frame_for(sink.seqs[i], script.width, script.height));
        }
        check(identical, "failed frames should be presented unmodified");
        check(rt->stats().transform_failures == 100, "every failure should be counted");
    }

    void test_non_std_exceptions_are_contained() {
        for (auto mode : {ThrowingEffect::Mode::IntFromApply, ThrowingEffect::Mode::IntFromInit}) {
            const std::string where = mode == ThrowingEffect::Mode::IntFromApply ? "apply" : "init";
            auto tally = std::make_shared<Tally>();
            Script script;
            script.frames = 20;
            auto rt = make_runtime(script, tally, std::make_shared<ThrowingEffect>(mode), 1.0f);
            RecordingSink sink(tally);

            check(rt->start(), "runtime should start");
            const vs::StopReason reason = rt->run_presentation(sink);
            check(reason == vs::StopReason::SourceExhausted, "an int thrown from " + where + " must not stop the pipeline");
            check(sink.seqs.size() == 20, "all frames should be presented when " + where + " throws an int");

            bool identical = sink.seqs.size() == 20;
            for (size_t i = 0; identical && i < sink.seqs.size(); ++i) {
                identical = same(sink.images[i], frame_for(sink.seqs[i], script.width, script.height));
            }
            check(identical, "frames should pass through unmodified when " + where + " throws an int");
            check(rt->stats().transform_failures == 20, "int failures from " + where + " should be counted");
            check(rt->worker_state() == vs::PipelineState::Stopped, "worker should stop normally after int failures");
        }
    }

    void test_severity_change_applies_to_later_frames() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.frames = 100;
        auto rt = make_runtime(script, tally, std::make_shared<FillEffect>(), 0.2f);
        RecordingSink sink(tally);
        sink.on_new = [&rt](const vs::Frame& f) {
            if (f.seq == 50) rt->set_severity(0.5f);
        };

        check(rt->start(), "runtime should start");
        (void)rt->run_presentation(sink);
        check(sink.seqs.size() == 100, "all frames should be presented");

        bool before_ok = true;
        bool after_ok = true;
        for (size_t i = 0; i < sink.seqs.size(); ++i) {
            const int v = sink.images[i].at<cv::Vec3b>(0, 0)[0];
            if (sink.seqs[i] <= 50 && v != 40) before_ok = false;
            // one frame may already have been in flight
            if (sink.seqs[i] >= 52 && v != 100) after_ok = false;
        }
        check(before_ok, "frames up to the change should use the old severity");
        check(after_ok, "frames after the change should use the new severity");
        check(std::abs(rt->severity() - 0.5f) < 1e-6f, "runtime should report the new severity");
    }

    void test_severity_change_reaches_queued_jobs() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.frames = 80;
        script.lockstep = false;
        script.period_ms = 5;

        // the worker is six times slower than capture, so the inbound queue stays full
        vs::PipelineRuntime::Options opt = options(1, 100);
        opt.inbound_cap = 4;
        auto rt = make_runtime(script, tally, std::make_shared<FillEffect>(true, 30), 0.2f, opt);
        RecordingSink sink(tally);

        size_t changed_at = 0;
        sink.on_new = [&](const vs::Frame&) {
            if (sink.seqs.size() == 3) {
                rt->set_severity(0.5f);
                changed_at = sink.seqs.size() - 1;
            }
        };

        check(rt->start(), "runtime should start");
        (void)rt->run_presentation(sink);
        check(sink.seqs.size() >= changed_at + 4, "several frames should be presented after the change");
        check(rt->stats().inbound_dropped > 0, "the inbound queue should have been full");

        int stale = 0;
        bool known_values = true;
        for (size_t i = changed_at + 1; i < sink.images.size(); ++i) {
            const int v = sink.images[i].at<cv::Vec3b>(0, 0)[0];
            if (v == 40) ++stale;
            else if (v != 100) known_values = false;
        }
        check(known_values, "presented frames should carry either the old or the new severity");
        // only the job already inside the effect may finish with the old value
        check(stale <= 1, "at most one frame after the change may use the old severity, got " + std::to_string(stale));
        check(!sink.images.empty() && sink.images.back().at<cv::Vec3b>(0, 0)[0] == 100,
              "the last frame should use the new severity");
    }

    void test_zero_severity_skips_the_transform() {
        const vs::EffectPtr slow = std::make_shared<SleepyEffect>(20, 20);
        Script script;
        script.frames = 30;

        auto tally0 = std::make_shared<Tally>();
        auto rt0 = make_runtime(script, tally0, slow, 0.0f);
        RecordingSink sink0(tally0);
        check(rt0->start(), "runtime should start");
        (void)rt0->run_presentation(sink0);
        const auto s0 = rt0->stats();

        auto tally1 = std::make_shared<Tally>();
        auto rt1 = make_runtime(script, tally1, slow, 1.0f);
        RecordingSink sink1(tally1);
        check(rt1->start(), "runtime should start");
        (void)rt1->run_presentation(sink1);
        const auto s1 = rt1->stats();

        check(s0.passthrough == 30, "severity 0 should pass every frame through");
        check(s1.passthrough == 0, "severity 1 should transform every frame");
        check(s0.avg_worker_latency_ms < 5.0, "passthrough latency should not include the transform");
        check(s1.avg_worker_latency_ms >= 15.0, "transform latency should include the slow transform");
        check(s0.avg_worker_latency_ms < s1.avg_worker_latency_ms, "severity 0 should be faster than severity 1");
    }

    void test_effect_can_opt_out_of_passthrough() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.frames = 10;
        auto rt = make_runtime(script, tally, std::make_shared<FillEffect>(false), 0.0f);
        RecordingSink sink(tally);

        check(rt->start(), "runtime should start");
        (void)rt->run_presentation(sink);

        bool zeroed = sink.images.size() == 10;
        for (const auto& img : sink.images) {
            if (cv::countNonZero(img.reshape(1)) != 0) zeroed = false;
        }
        check(zeroed, "an effect without passthrough should still run at severity 0");
        check(rt->stats().passthrough == 0, "no frame should take the passthrough path");
    }

    void test_cancellation_stops_everything() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.endless = true;
        script.lockstep = false;
        script.period_ms = 5;

        auto rt = make_runtime(script, tally, std::make_shared<SleepyEffect>(1, 3), 1.0f, options(2, 60));
        RecordingSink sink(tally);

        check(rt->start(), "runtime should start");
        const auto t0 = clock_type::now();
        const vs::StopReason reason = rt->run_presentation(sink, [&] { return clock_type::now() - t0 < 300ms; });
        check(reason == vs::StopReason::Cancelled, "keep_running=false should end with Cancelled");
        check(!sink.seqs.empty(), "frames should be presented before cancellation");

        const auto t1 = clock_type::now();
        rt->stop();
        check(clock_type::now() - t1 < 1000ms, "stop should return promptly");
        check(rt->finished(), "every stage should be stopped after stop()");
        check(tally->stop_calls.load() == 1, "source should be released once");
        check(tally->reads_after_stop.load() == 0, "source must not be read after release");
        check(rt->stop_reason() == vs::StopReason::Cancelled, "stop reason should stay Cancelled");

        rt->stop();
        check(tally->stop_calls.load() == 1, "a second stop() should be a no-op");
    }

    void test_open_failure_is_reported() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.fail_open = true;
        auto rt = make_runtime(script, tally, std::make_shared<FillEffect>(), 1.0f);
        RecordingSink sink(tally);

        check(!rt->start(), "start should fail when the source cannot open");
        check(rt->stop_reason() == vs::StopReason::SourceFailure, "open failure should be a SourceFailure");
        check(rt->failure_message() == "no device", "failure message should come from the source");
        check(rt->finished(), "a runtime that failed to start should be fully stopped");
        check(rt->run_presentation(sink) == vs::StopReason::SourceFailure, "presentation should end immediately");
        check(sink.calls == 0, "nothing should be presented");
    }

    void test_read_failure_is_reported() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.lockstep = false;
        script.period_ms = 2;
        script.fail_after = 10;
        auto rt = make_runtime(script, tally, std::make_shared<FillEffect>(), 1.0f);
        RecordingSink sink(tally);

        check(rt->start(), "runtime should start");
        const vs::StopReason reason = rt->run_presentation(sink);
        check(reason == vs::StopReason::SourceFailure, "read error should end with SourceFailure");
        check(rt->failure_message() == "unplugged", "failure message should come from the source");
        check(sink.seqs.size() <= 10, "no more frames than were read can be presented");
        check(rt->finished(), "every stage should be stopped after a source failure");
    }

    void test_repeat_when_no_new_frame() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.lockstep = false;
        script.stall_after = 1;
        auto rt = make_runtime(script, tally, std::make_shared<FillEffect>(), 1.0f);
        RecordingSink sink(tally);

        check(rt->start(), "runtime should start");
        using Outcome = vs::PipelineRuntime::TickOutcome;
        Outcome first = Outcome::Idle;
        for (int i = 0; i < 200 && first != Outcome::Presented; ++i) first = rt->present_tick(sink);
        check(first == Outcome::Presented, "the first frame should be presented");
        check(rt->present_tick(sink) == Outcome::Repeated, "a tick without a new frame should repeat the last one");
        check(sink.calls == 2 && sink.seqs.size() == 1, "the repeat should re-render the same frame");
        check(rt->stats().repeats == 1, "the repeat should be counted");

        rt->stop();
        check(rt->present_tick(sink) == Outcome::Finished, "ticks after stop should report Finished");
    }

    void test_idle_ticks_reach_the_sink() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.lockstep = false;
        script.stall_after = 0;
        auto rt = make_runtime(script, tally, std::make_shared<FillEffect>(), 1.0f);
        RecordingSink sink(tally);

        check(rt->start(), "runtime should start");
        using Outcome = vs::PipelineRuntime::TickOutcome;
        bool all_idle = true;
        for (int i = 0; i < 5; ++i) {
            if (rt->present_tick(sink) != Outcome::Idle) all_idle = false;
        }
        check(all_idle, "ticks before the first frame should be Idle");
        check(sink.idle_calls == 5, "every idle tick should let the sink service its events");
        check(sink.calls == 0, "nothing should be presented before the first frame");

        // a quit request seen while idle still ends the presentation loop
        int ticks = 0;
        const vs::StopReason reason = rt->run_presentation(sink, [&ticks] { return ++ticks <= 3; });
        check(reason == vs::StopReason::Cancelled, "keep_running=false while idle should cancel");
        check(sink.idle_calls == 8, "idle ticks inside run_presentation should reach the sink");
        rt->stop();
    }

    void test_frames_are_normalized_to_session_shape() {
        auto tally = std::make_shared<Tally>();
        Script script;
        script.frames = 5;
        script.type = CV_8UC1;

        auto opt = options();
        opt.width = 32;
        opt.height = 24;
        opt.keep_aspect = false;
        auto rt = make_runtime(script, tally, std::make_shared<FillEffect>(), 0.0f, opt);
        RecordingSink sink(tally);

        check(rt->start(), "runtime should start");
        (void)rt->run_presentation(sink);
        check(sink.images.size() == 5, "all frames should be presented");

        bool shaped = !sink.images.empty();
        for (const auto& img : sink.images) {
            if (img.cols != 32 || img.rows != 24 || img.type() != CV_8UC3) shaped = false;
        }
        check(shaped, "frames should be converted to 8-bit BGR at the session size");
    }

    void test_constructor_and_restart_rules() {
        auto tally = std::make_shared<Tally>();
        bool threw = false;
        try {
            vs::PipelineRuntime rt(std::make_unique<ScriptedSource>(Script{}, tally), nullptr, nullptr, options());
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "a runtime without an effect should be rejected");

        Script script;
        script.frames = 3;
        auto rt = make_runtime(script, tally, std::make_shared<FillEffect>(), 1.0f);
        RecordingSink sink(tally);
        check(rt->start(), "runtime should start");
        (void)rt->run_presentation(sink);
        rt->stop();
        check(!rt->start(), "a stopped runtime cannot be restarted");
    }

    void test_stats_json_has_counters() {
        vs::PipelineStats s;
        s.frames_captured = 7;
        s.stop_reason = vs::StopReason::SourceFailure;
        s.failure_message = "bad \"cable\"";
        const std::string json = vs::stats_to_json(s);

        check(json.find("\"frames_captured\":7") != std::string::npos, "json should carry frames_captured");
        check(json.find("\"stop_reason\":\"source_failure\"") != std::string::npos, "json should carry the stop reason");
        check(json.find("bad \\\"cable\\\"") != std::string::npos, "json should escape the failure message");
    }
}

int main() {
    test_identity_presents_every_frame_in_order();
    test_transformed_frames_reach_the_sink();
    test_presented_sequence_is_increasing_with_many_workers();
    test_transform_failure_passes_frames_through();
    test_non_std_exceptions_are_contained();
    test_severity_change_applies_to_later_frames();
    test_severity_change_reaches_queued_jobs();
    test_zero_severity_skips_the_transform();
    test_effect_can_opt_out_of_passthrough();
    test_cancellation_stops_everything();
    test_open_failure_is_reported();
    test_read_failure_is_reported();
    test_repeat_when_no_new_frame();
    test_idle_ticks_reach_the_sink();
    test_frames_are_normalized_to_session_shape();
    test_constructor_and_restart_rules();
    test_stats_json_has_counters();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all runtime tests passed\n";
    return 0;
}
