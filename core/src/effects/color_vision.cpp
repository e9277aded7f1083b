#include <effects/color_vision.hpp>

#include <algorithm>

namespace vs {
    namespace {
        // Machado et al. 2009, severity 1.0, RGB order
        constexpr float kProtanopia[9] = {
             0.152286f,  1.052583f, -0.204868f,
             0.114503f,  0.786281f,  0.099216f,
            -0.003882f, -0.048116f,  1.051998f,
        };
        constexpr float kDeuteranopia[9] = {
             0.367322f,  0.860646f, -0.227968f,
             0.280085f,  0.672501f,  0.047413f,
            -0.011820f,  0.042940f,  0.968881f,
        };
        constexpr float kTritanopia[9] = {
             1.255528f, -0.076749f, -0.178779f,
            -0.078411f,  0.930809f,  0.147602f,
             0.004733f,  0.691367f,  0.303900f,
        };

        const char* id_for(ColorDeficiency k) {
            switch (k) {
                case ColorDeficiency::Protanopia: return "protanopia";
                case ColorDeficiency::Deuteranopia: return "deuteranopia";
                case ColorDeficiency::Tritanopia: return "tritanopia";
            }
            return "unk";
        }

        class ColorVisionState : public EffectState {
        public:
            using EffectState::EffectState;
            std::vector<cv::Mat> lookup_tables() const override { return {full}; }

            cv::Mat full;
            cv::Mat blended;
        };
    } // namespace

    ColorVisionEffect::ColorVisionEffect(ColorDeficiency kind) : kind_(kind), id_(id_for(kind)) {}

    cv::Mat ColorVisionEffect::bgr_matrix(ColorDeficiency kind) {
        const float* rgb = kProtanopia;
        if (kind == ColorDeficiency::Deuteranopia) rgb = kDeuteranopia;
        if (kind == ColorDeficiency::Tritanopia) rgb = kTritanopia;

        // reverse both axes: BGR row i / col j is RGB row 2-i / col 2-j
        cv::Mat m(3, 3, CV_32F);
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                m.at<float>(i, j) = rgb[(2 - i) * 3 + (2 - j)];
            }
        }
        return m;
    }

    std::unique_ptr<EffectState> ColorVisionEffect::init(const FrameShape& shape) const {
        auto st = std::make_unique<ColorVisionState>(shape);
        st->full = bgr_matrix(kind_);
        return st;
    }

    void ColorVisionEffect::apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const {
        auto& st = static_cast<ColorVisionState&>(state);
        const double s = std::clamp(static_cast<double>(severity), 0.0, 1.0);

        const cv::Mat eye = cv::Mat::eye(3, 3, CV_32F);
        cv::addWeighted(st.full, s, eye, 1.0 - s, 0.0, st.blended);
        cv::transform(in, out, st.blended);
    }
}
