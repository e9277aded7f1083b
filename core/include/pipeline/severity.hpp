#pragma once

#include <algorithm>
#include <atomic>
#include <cmath>

namespace vs {
    // Latest slider value. Readers may see a stale value, never a torn one.
    class SeverityCell {
    public:
        explicit SeverityCell(float initial = 0.0f) : v_(clamp_(initial)) {}

        void set(float v) {
            if (std::isnan(v)) return;
            v_.store(clamp_(v), std::memory_order_relaxed);
        }

        float get() const { return v_.load(std::memory_order_relaxed); }

    private:
        static float clamp_(float v) {
            if (std::isnan(v)) return 0.0f;
            return std::clamp(v, 0.0f, 1.0f);
        }

        std::atomic<float> v_;
    };
}
