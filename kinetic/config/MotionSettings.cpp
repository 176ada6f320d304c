#include "config/MotionSettings.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"

#include <cmath>
#include <string>

namespace Kinetic {

namespace {

constexpr SpringPreset kAllPresets[] = {
    SpringPreset::Gentle,
    SpringPreset::Snappy,
    SpringPreset::Bouncy,
    SpringPreset::Stiff,
    SpringPreset::Smooth
};

float ReadPositive(const Config& config, const std::string& key, float fallback) {
    const float value = config.Get<float>(key, fallback);
    if (!std::isfinite(value) || value <= 0.0f) {
        KINETIC_LOG_WARN("Config '{}' must be positive, got {}; using {}", key, value, fallback);
        return fallback;
    }
    return value;
}

} // namespace

MotionSettings MotionSettings::FromConfig(const Config& config) {
    MotionSettings settings;

    settings.targetFps = ReadPositive(config, "motion.fps", settings.targetFps);
    settings.gpuAcceleration = config.Get<bool>("motion.gpu_acceleration", settings.gpuAcceleration);
    settings.reducedMotion = config.Get<bool>("motion.reduced_motion", settings.reducedMotion);
    settings.restThreshold = ReadPositive(config, "motion.rest_threshold", settings.restThreshold);
    settings.compensatePausedTime = config.Get<bool>("motion.compensate_paused_time",
                                                     settings.compensatePausedTime);

    settings.monitoring = config.Get<bool>("motion.monitoring", settings.monitoring);
    settings.monitorIntervalMs = ReadPositive(config, "motion.monitor_interval_ms", settings.monitorIntervalMs);
    settings.droppedFrameFactor = ReadPositive(config, "motion.dropped_frame_factor", settings.droppedFrameFactor);
    settings.droppedFrameWarningThreshold = config.Get<int>("motion.dropped_frame_warning_threshold",
                                                            settings.droppedFrameWarningThreshold);

    settings.tweenDurationMs = ReadPositive(config, "motion.tween.duration_ms", settings.tweenDurationMs);
    if (config.Has("motion.tween.easing")) {
        const auto name = config.Get<std::string>("motion.tween.easing");
        if (auto easing = ParseEasing(name)) {
            settings.tweenEasing = *easing;
        } else {
            KINETIC_LOG_WARN("Config 'motion.tween.easing': {} '{}'", MotionErrorToString(easing.error()), name);
        }
    }

    if (config.Has("motion.spring.default_preset")) {
        const auto name = config.Get<std::string>("motion.spring.default_preset");
        if (auto preset = ParseSpringPreset(name)) {
            settings.defaultSpringPreset = *preset;
        } else {
            KINETIC_LOG_WARN("Config 'motion.spring.default_preset': {} '{}'",
                             MotionErrorToString(preset.error()), name);
        }
    }

    for (SpringPreset preset : kAllPresets) {
        const std::string base = std::string("motion.springs.") + SpringPresetName(preset);
        const SpringConfig& fallback = settings.GetSpringPreset(preset);

        SpringConfig spring;
        spring.stiffness = config.Get<float>(base + ".stiffness", fallback.stiffness);
        spring.damping = config.Get<float>(base + ".damping", fallback.damping);
        spring.mass = config.Get<float>(base + ".mass", fallback.mass);

        if (auto valid = spring.Validate(); !valid) {
            KINETIC_LOG_WARN("Config '{}': {}; keeping defaults", base, MotionErrorToString(valid.error()));
            continue;
        }
        settings.springPresets[static_cast<size_t>(preset)] = spring;
    }

    const float stagger = config.Get<float>("motion.stagger.delay_ms", settings.staggerDelayMs);
    if (std::isfinite(stagger) && stagger >= 0.0f) {
        settings.staggerDelayMs = stagger;
    } else {
        KINETIC_LOG_WARN("Config 'motion.stagger.delay_ms' must be non-negative, got {}", stagger);
    }

    return settings;
}

void MotionSettings::WriteTo(Config& config) const {
    config.Set("motion.fps", targetFps);
    config.Set("motion.gpu_acceleration", gpuAcceleration);
    config.Set("motion.reduced_motion", reducedMotion);
    config.Set("motion.rest_threshold", restThreshold);
    config.Set("motion.compensate_paused_time", compensatePausedTime);

    config.Set("motion.monitoring", monitoring);
    config.Set("motion.monitor_interval_ms", monitorIntervalMs);
    config.Set("motion.dropped_frame_factor", droppedFrameFactor);
    config.Set("motion.dropped_frame_warning_threshold", droppedFrameWarningThreshold);

    config.Set("motion.tween.duration_ms", tweenDurationMs);
    config.Set("motion.tween.easing", std::string(EasingName(tweenEasing)));

    config.Set("motion.spring.default_preset", std::string(SpringPresetName(defaultSpringPreset)));
    for (SpringPreset preset : kAllPresets) {
        const std::string base = std::string("motion.springs.") + SpringPresetName(preset);
        const SpringConfig& spring = GetSpringPreset(preset);
        config.Set(base + ".stiffness", spring.stiffness);
        config.Set(base + ".damping", spring.damping);
        config.Set(base + ".mass", spring.mass);
    }

    config.Set("motion.stagger.delay_ms", staggerDelayMs);
}

} // namespace Kinetic
