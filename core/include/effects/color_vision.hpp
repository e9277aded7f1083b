#pragma once

#include <string>

#include <opencv2/core.hpp>

#include <effects/effect.hpp>

namespace vs {
    enum class ColorDeficiency {
        Protanopia,
        Deuteranopia,
        Tritanopia
    };

    // Dichromacy simulation. The full-severity matrix is blended with identity by severity.
    class ColorVisionEffect : public IEffect {
    public:
        explicit ColorVisionEffect(ColorDeficiency kind);

        const std::string& id() const override { return id_; }
        std::unique_ptr<EffectState> init(const FrameShape& shape) const override;
        void apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const override;

        // 3x3 CV_32F matrix acting on BGR pixels.
        static cv::Mat bgr_matrix(ColorDeficiency kind);

    private:
        ColorDeficiency kind_;
        std::string id_;
    };
}
