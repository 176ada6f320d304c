#pragma once

#include "motion/Easing.hpp"
#include "motion/SpringModel.hpp"

#include <optional>

namespace Kinetic {

/**
 * @brief Options for a spring transition
 *
 * Unset spring parameters come from the preset (default: the configured
 * default preset).
 */
struct SpringOptions {
    std::optional<SpringPreset> preset;
    std::optional<float> stiffness;
    std::optional<float> damping;
    std::optional<float> mass;
    std::optional<float> durationMs;  // reported duration only; springs run until settled
    float delayMs = 0.0f;
    bool force = false;               // animate even when reduced motion is requested
};

/**
 * @brief Options for a duration based transition
 */
struct TweenOptions {
    std::optional<float> durationMs;
    std::optional<Easing> easing;
    float delayMs = 0.0f;
    bool force = false;
};

/**
 * @brief Options for a staggered group
 *
 * Child i starts after spring.delayMs + i * staggerDelayMs.
 */
struct StaggerOptions {
    std::optional<float> staggerDelayMs;
    SpringOptions spring;
};

/**
 * @brief Options for a layout (FLIP) transition
 */
struct LayoutOptions {
    SpringPreset preset = SpringPreset::Smooth;
    bool force = false;
};

} // namespace Kinetic
