#include "motion/MotionError.hpp"

namespace Kinetic {

const char* MotionErrorToString(MotionError error) noexcept {
    switch (error) {
        case MotionError::UnknownEasing:       return "Unknown easing curve";
        case MotionError::UnknownSpringPreset: return "Unknown spring preset";
        case MotionError::InvalidSpringConfig: return "Spring stiffness, damping and mass must be positive";
        case MotionError::InvalidDuration:     return "Duration must be a non-negative number";
        case MotionError::InvalidDelay:        return "Delay must be a non-negative number";
        default: return "Unknown error";
    }
}

} // namespace Kinetic
