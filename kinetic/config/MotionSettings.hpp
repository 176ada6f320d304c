#pragma once

#include "motion/Easing.hpp"
#include "motion/SpringModel.hpp"

#include <array>

namespace Kinetic {

class Config;

/**
 * @brief Motion engine configuration defaults
 */
struct MotionSettings {
    float targetFps = 60.0f;
    bool gpuAcceleration = true;
    bool reducedMotion = false;
    float restThreshold = SpringModel::kDefaultRestThreshold;
    bool compensatePausedTime = true;  // Resume() discounts the paused interval

    // Performance monitoring
    bool monitoring = false;
    float monitorIntervalMs = 1000.0f;
    float droppedFrameFactor = 1.5f;
    int droppedFrameWarningThreshold = 10;

    float tweenDurationMs = 300.0f;
    Easing tweenEasing = Easing::EaseInOut;

    SpringPreset defaultSpringPreset = SpringPreset::Smooth;
    std::array<SpringConfig, kSpringPresetCount> springPresets = {
        GetDefaultSpringConfig(SpringPreset::Gentle),
        GetDefaultSpringConfig(SpringPreset::Snappy),
        GetDefaultSpringConfig(SpringPreset::Bouncy),
        GetDefaultSpringConfig(SpringPreset::Stiff),
        GetDefaultSpringConfig(SpringPreset::Smooth)
    };

    float staggerDelayMs = 50.0f;

    /**
     * @brief Nominal frame interval in milliseconds
     */
    [[nodiscard]] float NominalFrameMs() const { return 1000.0f / targetFps; }

    /**
     * @brief Spring integration step in seconds (nominal, not measured)
     */
    [[nodiscard]] float NominalFrameSeconds() const { return NominalFrameMs() / 1000.0f; }

    [[nodiscard]] const SpringConfig& GetSpringPreset(SpringPreset preset) const {
        return springPresets[static_cast<size_t>(preset)];
    }

    /**
     * @brief Read settings from the "motion" section
     *
     * Missing keys keep their defaults. Invalid values (unknown names,
     * non-positive rates or spring parameters) are logged and ignored.
     */
    static MotionSettings FromConfig(const Config& config);

    /**
     * @brief Write every setting into the "motion" section
     */
    void WriteTo(Config& config) const;
};

} // namespace Kinetic
