#include <effects/blur_effects.hpp>

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace vs {
    namespace {
        int kernel_for_sigma(double sigma) {
            // ~3 sigma each side, forced odd and >= 3
            int k = static_cast<int>(std::ceil(sigma * 6.0)) | 1;
            return std::max(3, k);
        }

        class CataractState : public EffectState {
        public:
            using EffectState::EffectState;

            std::vector<cv::Mat> lookup_tables() const override { return {lut}; }

            cv::Mat lut; // 1x256 CV_8UC3, fully developed tint
            cv::Mat hazed;
            cv::Mat tinted;
        };

        cv::Mat build_cataract_lut() {
            cv::Mat lut(1, 256, CV_8UC3);
            for (int i = 0; i < 256; ++i) {
                const float v = static_cast<float>(i);
                // compress the range (contrast loss) and lift it toward a warm haze
                const float b = v * 0.55f + 18.0f;
                const float g = v * 0.80f + 30.0f;
                const float r = v * 0.88f + 34.0f;
                lut.at<cv::Vec3b>(0, i) = cv::Vec3b(cv::saturate_cast<uchar>(b),
                                                    cv::saturate_cast<uchar>(g),
                                                    cv::saturate_cast<uchar>(r));
            }
            return lut;
        }
    } // namespace

    void blur_by_sigma(const cv::Mat& src, cv::Mat& dst, double sigma) {
        if (sigma < 0.3) {
            src.copyTo(dst);
            return;
        }
        const int k = kernel_for_sigma(sigma);
        cv::GaussianBlur(src, dst, cv::Size(k, k), sigma, sigma);
    }

    std::unique_ptr<EffectState> IdentityEffect::init(const FrameShape& shape) const {
        return std::make_unique<EffectState>(shape);
    }

    void IdentityEffect::apply(const cv::Mat& in, float, EffectState&, cv::Mat& out) const {
        out = in;
    }

    BlurEffect::BlurEffect(float max_sigma) : max_sigma_(std::max(0.0f, max_sigma)) {}

    std::unique_ptr<EffectState> BlurEffect::init(const FrameShape& shape) const {
        return std::make_unique<EffectState>(shape);
    }

    void BlurEffect::apply(const cv::Mat& in, float severity, EffectState&, cv::Mat& out) const {
        blur_by_sigma(in, out, static_cast<double>(severity) * max_sigma_);
    }

    CataractEffect::CataractEffect(float max_sigma) : max_sigma_(std::max(0.0f, max_sigma)) {}

    std::unique_ptr<EffectState> CataractEffect::init(const FrameShape& shape) const {
        auto st = std::make_unique<CataractState>(shape);
        st->lut = build_cataract_lut();
        return st;
    }

    void CataractEffect::apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const {
        auto& st = static_cast<CataractState&>(state);

        blur_by_sigma(in, st.hazed, static_cast<double>(severity) * max_sigma_ * 0.6);
        cv::LUT(st.hazed, st.lut, st.tinted);

        const double s = std::clamp(static_cast<double>(severity), 0.0, 1.0);
        cv::addWeighted(st.hazed, 1.0 - s, st.tinted, s, 0.0, out);
    }
}
