#include <effects/field_effects.hpp>
#include <effects/blur_effects.hpp>

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace vs {
    namespace {
        // w = smoothstep(e0, e1, x), element-wise on a CV_32FC1 field
        void smoothstep(const cv::Mat& x, float e0, float e1, cv::Mat& w) {
            const float inv = 1.0f / std::max(1e-6f, e1 - e0);
            cv::Mat t;
            x.convertTo(t, CV_32F, inv, -e0 * inv);
            cv::max(t, 0.0, t);
            cv::min(t, 1.0, t);

            cv::Mat k;
            t.convertTo(k, CV_32F, -2.0, 3.0);
            w = t.mul(t).mul(k);
        }

        float clamp01(float v) { return std::clamp(v, 0.0f, 1.0f); }

        class GlaucomaState : public EffectState {
        public:
            using EffectState::EffectState;
            std::vector<cv::Mat> lookup_tables() const override { return {radius}; }

            cv::Mat radius;
            cv::Mat weight;
            cv::Mat keep;
            cv::Mat periphery;
        };

        class MacularState : public EffectState {
        public:
            using EffectState::EffectState;
            std::vector<cv::Mat> lookup_tables() const override { return {field}; }

            cv::Mat field; // radius with a seeded wobble so the scotoma edge is irregular
            cv::Mat weight;
            cv::Mat keep;
            cv::Mat dark;
        };

        class RetinopathyState : public EffectState {
        public:
            using EffectState::EffectState;
            std::vector<cv::Mat> lookup_tables() const override { return {mask, stain}; }

            cv::Mat mask;  // CV_32FC1 spot opacity in [0, 1]
            cv::Mat stain; // CV_8UC3 floater colour
            cv::Mat weight;
            cv::Mat keep;
            cv::Mat base;
        };
    } // namespace

    cv::Mat radius_map(const FrameShape& shape) {
        cv::Mat r(shape.height, shape.width, CV_32F);
        const float cx = 0.5f * static_cast<float>(shape.width - 1);
        const float cy = 0.5f * static_cast<float>(shape.height - 1);
        const float half_diag = std::max(1.0f, std::sqrt(cx * cx + cy * cy));

        for (int y = 0; y < shape.height; ++y) {
            auto* row = r.ptr<float>(y);
            const float dy = static_cast<float>(y) - cy;
            for (int x = 0; x < shape.width; ++x) {
                const float dx = static_cast<float>(x) - cx;
                row[x] = std::sqrt(dx * dx + dy * dy) / half_diag;
            }
        }
        return r;
    }

    // glaucoma

    GlaucomaEffect::GlaucomaEffect(float max_sigma) : max_sigma_(std::max(0.0f, max_sigma)) {}

    std::unique_ptr<EffectState> GlaucomaEffect::init(const FrameShape& shape) const {
        auto st = std::make_unique<GlaucomaState>(shape);
        st->radius = radius_map(shape);
        return st;
    }

    void GlaucomaEffect::apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const {
        auto& st = static_cast<GlaucomaState&>(state);
        const float s = clamp01(severity);

        const float visible = 1.0f - 0.85f * s;
        const float feather = 0.12f + 0.2f * s;
        smoothstep(st.radius, visible - 0.5f * feather, visible + 0.5f * feather, st.weight);
        st.weight.convertTo(st.keep, CV_32F, -1.0, 1.0);

        blur_by_sigma(in, st.periphery, static_cast<double>(s) * max_sigma_);
        st.periphery.convertTo(st.periphery, -1, 1.0 - 0.85 * s);

        cv::blendLinear(in, st.periphery, st.keep, st.weight, out);
    }

    // macular degeneration

    MacularDegenerationEffect::MacularDegenerationEffect(float max_sigma, uint32_t seed)
        : max_sigma_(std::max(0.0f, max_sigma)), seed_(seed) {}

    std::unique_ptr<EffectState> MacularDegenerationEffect::init(const FrameShape& shape) const {
        auto st = std::make_unique<MacularState>(shape);

        cv::RNG rng(seed_);
        cv::Mat coarse(12, 12, CV_32F);
        rng.fill(coarse, cv::RNG::UNIFORM, -1.0, 1.0);

        cv::Mat wobble;
        cv::resize(coarse, wobble, cv::Size(shape.width, shape.height), 0, 0, cv::INTER_CUBIC);

        st->field = radius_map(shape) + wobble * 0.06;
        return st;
    }

    void MacularDegenerationEffect::apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const {
        auto& st = static_cast<MacularState&>(state);
        const float s = clamp01(severity);

        const float spot = 0.04f + 0.5f * s;
        smoothstep(st.field, spot - 0.08f, spot + 0.08f, st.keep);
        // inside the spot the weight tops out below 1 at low severity
        const double strength = std::min(1.0, 0.3 + static_cast<double>(s));
        st.keep.convertTo(st.weight, CV_32F, -strength, strength);
        st.weight.convertTo(st.keep, CV_32F, -1.0, 1.0);

        blur_by_sigma(in, st.dark, std::max(1.0, 1.5 * max_sigma_));
        st.dark.convertTo(st.dark, -1, 0.25);

        cv::blendLinear(in, st.dark, st.keep, st.weight, out);
    }

    // diabetic retinopathy

    DiabeticRetinopathyEffect::DiabeticRetinopathyEffect(float max_sigma, uint32_t seed, int spot_count)
        : max_sigma_(std::max(0.0f, max_sigma)), seed_(seed), spot_count_(std::max(1, spot_count)) {}

    std::unique_ptr<EffectState> DiabeticRetinopathyEffect::init(const FrameShape& shape) const {
        auto st = std::make_unique<RetinopathyState>(shape);

        st->mask = cv::Mat::zeros(shape.height, shape.width, CV_32F);
        const int min_dim = std::max(1, std::min(shape.width, shape.height));

        cv::RNG rng(seed_);
        for (int i = 0; i < spot_count_; ++i) {
            const int cx = rng.uniform(0, std::max(1, shape.width));
            const int cy = rng.uniform(0, std::max(1, shape.height));
            const int r = std::max(1, static_cast<int>(static_cast<float>(min_dim) * rng.uniform(0.008f, 0.04f)));
            const float opacity = rng.uniform(0.5f, 1.0f);
            cv::circle(st->mask, cv::Point(cx, cy), r, cv::Scalar(opacity), cv::FILLED, cv::LINE_8);
        }
        cv::GaussianBlur(st->mask, st->mask, cv::Size(0, 0), std::max(1.0, min_dim * 0.006));
        cv::min(st->mask, 1.0, st->mask);

        st->stain = cv::Mat(shape.height, shape.width, shape.type, cv::Scalar(12, 14, 38));
        return st;
    }

    void DiabeticRetinopathyEffect::apply(const cv::Mat& in, float severity, EffectState& state, cv::Mat& out) const {
        auto& st = static_cast<RetinopathyState&>(state);
        const float s = clamp01(severity);

        st.mask.convertTo(st.weight, CV_32F, 0.95 * s);
        st.weight.convertTo(st.keep, CV_32F, -1.0, 1.0);

        blur_by_sigma(in, st.base, static_cast<double>(s) * max_sigma_ * 0.25);
        cv::blendLinear(st.base, st.stain, st.keep, st.weight, out);
    }
}
