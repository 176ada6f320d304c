#pragma once

namespace Kinetic {

/**
 * @brief Errors reported at the transition request boundary
 */
enum class MotionError {
    UnknownEasing,
    UnknownSpringPreset,
    InvalidSpringConfig,
    InvalidDuration,
    InvalidDelay
};

/**
 * @brief Get error description string
 */
[[nodiscard]] const char* MotionErrorToString(MotionError error) noexcept;

} // namespace Kinetic
