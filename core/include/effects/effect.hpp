#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace vs {
    struct FrameShape {
        int width = 0;
        int height = 0;
        int type = CV_8UC3;

        static FrameShape of(const cv::Mat& m) { return {m.cols, m.rows, m.type()}; }

        bool operator==(const FrameShape& o) const {
            return width == o.width && height == o.height && type == o.type;
        }
        bool operator!=(const FrameShape& o) const { return !(*this == o); }
    };

    // Per-activation state of an effect. Lookup tables are built once by init() and are
    // read-only afterwards; scratch buffers may be reused by apply(). One worker owns one state.
    class EffectState {
    public:
        explicit EffectState(FrameShape shape) : shape_(shape) {}
        virtual ~EffectState() = default;

        const FrameShape& shape() const { return shape_; }

        // Severity-independent tables, exposed for diagnostics and determinism checks.
        virtual std::vector<cv::Mat> lookup_tables() const { return {}; }

    private:
        FrameShape shape_;
    };

    class IEffect {
    public:
        virtual ~IEffect() = default;

        virtual const std::string& id() const = 0;

        virtual std::unique_ptr<EffectState> init(const FrameShape& shape) const = 0;

        // in is never modified; out may share its buffer when nothing changes.
        virtual void apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const = 0;

        // Whether a near-zero severity may skip apply() and pass the frame through.
        virtual bool passthrough_at_zero() const { return true; }
    };

    using EffectPtr = std::shared_ptr<const IEffect>;

    struct EffectConfig {
        std::string id = "none";
        float severity = 0.0f;
        uint32_t seed = 42;
        float max_blur_sigma = 12.0f;
    };

    std::vector<std::string> list_effects();

    // Throws std::runtime_error for an unknown id.
    EffectPtr make_effect(const EffectConfig& cfg);
}
