#include <effects/effect.hpp>
#include <effects/blur_effects.hpp>
#include <effects/color_vision.hpp>
#include <effects/field_effects.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace vs {
    namespace {
        std::string normalize_id(std::string s) {
            std::transform(s.begin(),
                           s.end(),
                           s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            std::replace(s.begin(), s.end(), '-', '_');
            return s;
        }
    } // namespace

    std::vector<std::string> list_effects() {
        return {
            "none",
            "blur",
            "cataract",
            "glaucoma",
            "macular_degeneration",
            "diabetic_retinopathy",
            "protanopia",
            "deuteranopia",
            "tritanopia",
        };
    }

    EffectPtr make_effect(const EffectConfig& cfg) {
        const std::string id = normalize_id(cfg.id);

        if (id == "none" || id == "identity") return std::make_shared<IdentityEffect>();
        if (id == "blur") return std::make_shared<BlurEffect>(cfg.max_blur_sigma);
        if (id == "cataract") return std::make_shared<CataractEffect>(cfg.max_blur_sigma);
        if (id == "glaucoma") return std::make_shared<GlaucomaEffect>(cfg.max_blur_sigma);
        if (id == "macular_degeneration" || id == "amd") {
            return std::make_shared<MacularDegenerationEffect>(cfg.max_blur_sigma, cfg.seed);
        }
        if (id == "diabetic_retinopathy") {
            return std::make_shared<DiabeticRetinopathyEffect>(cfg.max_blur_sigma, cfg.seed);
        }
        if (id == "protanopia") return std::make_shared<ColorVisionEffect>(ColorDeficiency::Protanopia);
        if (id == "deuteranopia") return std::make_shared<ColorVisionEffect>(ColorDeficiency::Deuteranopia);
        if (id == "tritanopia") return std::make_shared<ColorVisionEffect>(ColorDeficiency::Tritanopia);

        throw std::runtime_error("Unknown effect id: " + cfg.id);
    }
}
