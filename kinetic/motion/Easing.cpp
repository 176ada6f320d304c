#include "motion/Easing.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>

namespace Kinetic {

float ApplyEasing(Easing easing, float t) noexcept {
    t = std::max(0.0f, std::min(1.0f, t));

    switch (easing) {
        case Easing::Linear:
            return t;

        case Easing::EaseIn:
            return t * t;

        case Easing::EaseOut:
            return t * (2 - t);

        case Easing::EaseInOut:
            return t < 0.5f ? 2 * t * t : -1 + (4 - 2 * t) * t;

        case Easing::EaseInCubic:
            return t * t * t;

        case Easing::EaseOutCubic: {
            const float u = t - 1;
            return u * u * u + 1;
        }

        case Easing::EaseInOutCubic:
            return t < 0.5f ? 4 * t * t * t : (t - 1) * (2 * t - 2) * (2 * t - 2) + 1;

        case Easing::EaseInQuart:
            return t * t * t * t;

        case Easing::EaseOutQuart: {
            const float u = t - 1;
            return 1 - u * u * u * u;
        }

        case Easing::EaseInOutQuart: {
            if (t < 0.5f) {
                return 8 * t * t * t * t;
            }
            const float u = t - 1;
            return 1 - 8 * u * u * u * u;
        }

        case Easing::EaseInExpo:
            return t == 0 ? 0 : std::pow(2.0f, 10 * (t - 1));

        case Easing::EaseOutExpo:
            return t == 1 ? 1 : 1 - std::pow(2.0f, -10 * t);

        case Easing::Bounce: {
            const float n1 = 7.5625f;
            const float d1 = 2.75f;
            if (t < 1 / d1) {
                return n1 * t * t;
            } else if (t < 2 / d1) {
                t -= 1.5f / d1;
                return n1 * t * t + 0.75f;
            } else if (t < 2.5f / d1) {
                t -= 2.25f / d1;
                return n1 * t * t + 0.9375f;
            } else {
                t -= 2.625f / d1;
                return n1 * t * t + 0.984375f;
            }
        }

        default:
            return t;
    }
}

std::expected<Easing, MotionError> ParseEasing(std::string_view name) {
    static const std::unordered_map<std::string, Easing> easingMap = {
        {"linear", Easing::Linear},
        {"easeIn", Easing::EaseIn},
        {"easeOut", Easing::EaseOut},
        {"easeInOut", Easing::EaseInOut},
        {"easeInCubic", Easing::EaseInCubic},
        {"easeOutCubic", Easing::EaseOutCubic},
        {"easeInOutCubic", Easing::EaseInOutCubic},
        {"easeInQuart", Easing::EaseInQuart},
        {"easeOutQuart", Easing::EaseOutQuart},
        {"easeInOutQuart", Easing::EaseInOutQuart},
        {"easeInExpo", Easing::EaseInExpo},
        {"easeOutExpo", Easing::EaseOutExpo},
        {"bounce", Easing::Bounce}
    };

    auto it = easingMap.find(std::string(name));
    if (it != easingMap.end()) {
        return it->second;
    }
    return std::unexpected(MotionError::UnknownEasing);
}

const char* EasingName(Easing easing) noexcept {
    switch (easing) {
        case Easing::Linear:         return "linear";
        case Easing::EaseIn:         return "easeIn";
        case Easing::EaseOut:        return "easeOut";
        case Easing::EaseInOut:      return "easeInOut";
        case Easing::EaseInCubic:    return "easeInCubic";
        case Easing::EaseOutCubic:   return "easeOutCubic";
        case Easing::EaseInOutCubic: return "easeInOutCubic";
        case Easing::EaseInQuart:    return "easeInQuart";
        case Easing::EaseOutQuart:   return "easeOutQuart";
        case Easing::EaseInOutQuart: return "easeInOutQuart";
        case Easing::EaseInExpo:     return "easeInExpo";
        case Easing::EaseOutExpo:    return "easeOutExpo";
        case Easing::Bounce:         return "bounce";
        default: return "linear";
    }
}

} // namespace Kinetic
