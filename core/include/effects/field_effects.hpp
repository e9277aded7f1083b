#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include <effects/effect.hpp>

namespace vs {
    // Normalized distance to the image centre, 0 at the centre and 1 at the corners. CV_32FC1.
    cv::Mat radius_map(const FrameShape& shape);

    // Tunnel vision: the periphery beyond a shrinking radius is darkened and blurred.
    class GlaucomaEffect : public IEffect {
    public:
        explicit GlaucomaEffect(float max_sigma);

        const std::string& id() const override { return id_; }
        std::unique_ptr<EffectState> init(const FrameShape& shape) const override;
        void apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const override;

    private:
        std::string id_ = "glaucoma";
        float max_sigma_ = 12.0f;
    };

    // Central scotoma with an irregular edge, growing with severity.
    class MacularDegenerationEffect : public IEffect {
    public:
        MacularDegenerationEffect(float max_sigma, uint32_t seed);

        const std::string& id() const override { return id_; }
        std::unique_ptr<EffectState> init(const FrameShape& shape) const override;
        void apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const override;

    private:
        std::string id_ = "macular_degeneration";
        float max_sigma_ = 12.0f;
        uint32_t seed_ = 42;
    };

    // Scattered dark floaters. Spot layout comes from the seed, opacity from severity.
    class DiabeticRetinopathyEffect : public IEffect {
    public:
        DiabeticRetinopathyEffect(float max_sigma, uint32_t seed, int spot_count = 48);

        const std::string& id() const override { return id_; }
        std::unique_ptr<EffectState> init(const FrameShape& shape) const override;
        void apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const override;

    private:
        std::string id_ = "diabetic_retinopathy";
        float max_sigma_ = 12.0f;
        uint32_t seed_ = 42;
        int spot_count_ = 48;
    };
}
