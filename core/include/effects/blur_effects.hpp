#pragma once

#include <string>

#include <opencv2/core.hpp>

#include <effects/effect.hpp>

namespace vs {
    class IdentityEffect : public IEffect {
    public:
        const std::string& id() const override { return id_; }
        std::unique_ptr<EffectState> init(const FrameShape& shape) const override;
        void apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const override;

    private:
        std::string id_ = "none";
    };

    // Refractive blur: gaussian sigma grows linearly with severity.
    class BlurEffect : public IEffect {
    public:
        explicit BlurEffect(float max_sigma);

        const std::string& id() const override { return id_; }
        std::unique_ptr<EffectState> init(const FrameShape& shape) const override;
        void apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const override;

    private:
        std::string id_ = "blur";
        float max_sigma_ = 12.0f;
    };

    // Cataract: lens clouding. Haze blur plus a yellow-brown tint with contrast loss.
    class CataractEffect : public IEffect {
    public:
        explicit CataractEffect(float max_sigma);

        const std::string& id() const override { return id_; }
        std::unique_ptr<EffectState> init(const FrameShape& shape) const override;
        void apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const override;

    private:
        std::string id_ = "cataract";
        float max_sigma_ = 12.0f;
    };

    // Gaussian blur with a kernel derived from sigma; sigma below ~0.3 copies src.
    void blur_by_sigma(const cv::Mat& src, cv::Mat& dst, double sigma);
}
