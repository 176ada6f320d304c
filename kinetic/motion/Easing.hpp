#pragma once

#include "motion/MotionError.hpp"

#include <expected>
#include <string_view>

namespace Kinetic {

/**
 * @brief Named easing curves available to tweens
 */
enum class Easing {
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
    EaseInCubic,
    EaseOutCubic,
    EaseInOutCubic,
    EaseInQuart,
    EaseOutQuart,
    EaseInOutQuart,
    EaseInExpo,
    EaseOutExpo,
    Bounce
};

/**
 * @brief Apply an easing curve to normalized progress
 *
 * Every curve maps 0 to 0 and 1 to 1. Input is clamped to [0, 1].
 */
[[nodiscard]] float ApplyEasing(Easing easing, float t) noexcept;

/**
 * @brief Look up an easing curve by its catalog name ("easeInOut", "bounce", ...)
 */
[[nodiscard]] std::expected<Easing, MotionError> ParseEasing(std::string_view name);

/**
 * @brief Catalog name of an easing curve
 */
[[nodiscard]] const char* EasingName(Easing easing) noexcept;

} // namespace Kinetic
