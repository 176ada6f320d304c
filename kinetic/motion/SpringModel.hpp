#pragma once

#include "motion/MotionError.hpp"

#include <expected>
#include <string_view>

namespace Kinetic {

/**
 * @brief Damped spring parameters
 */
struct SpringConfig {
    float stiffness = 200.0f;
    float damping = 20.0f;
    float mass = 1.0f;

    /**
     * @brief Check that every parameter is positive and finite
     */
    [[nodiscard]] std::expected<void, MotionError> Validate() const;

    /**
     * @brief zeta = c / (2 * sqrt(k * m)); below 1 the spring overshoots
     */
    [[nodiscard]] float DampingRatio() const;
};

/**
 * @brief Named spring presets
 */
enum class SpringPreset {
    Gentle,
    Snappy,
    Bouncy,
    Stiff,
    Smooth
};

inline constexpr int kSpringPresetCount = 5;

/**
 * @brief Built-in values for a preset (configuration may override them)
 */
[[nodiscard]] SpringConfig GetDefaultSpringConfig(SpringPreset preset) noexcept;

[[nodiscard]] std::expected<SpringPreset, MotionError> ParseSpringPreset(std::string_view name);

[[nodiscard]] const char* SpringPresetName(SpringPreset preset) noexcept;

/**
 * @brief Position and velocity of one spring-driven scalar
 */
struct SpringState {
    float position = 0.0f;
    float velocity = 0.0f;
};

/**
 * @brief Damped spring integrator
 *
 * Steps use semi-implicit Euler with a fixed dt. The scheduler passes the
 * nominal frame interval, not the measured one: motion is reproducible
 * frame for frame, at the cost of running slow or fast when the display
 * does not hit the configured rate.
 */
class SpringModel {
public:
    static constexpr float kDefaultRestThreshold = 0.01f;

    /**
     * @brief Advance one step towards target
     * @param state Position and velocity, updated in place
     * @param target Rest position
     * @param config Spring parameters
     * @param dt Step in seconds
     * @param restThreshold Settle tolerance for both velocity and distance
     * @return true if the spring is settled
     */
    static bool Step(SpringState& state, float target, const SpringConfig& config,
                     float dt, float restThreshold = kDefaultRestThreshold) noexcept;

    /**
     * @brief Rough settle time in milliseconds (for reporting only)
     */
    [[nodiscard]] static float EstimateSettleDurationMs(const SpringConfig& config) noexcept;
};

} // namespace Kinetic
