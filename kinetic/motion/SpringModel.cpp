#include "motion/SpringModel.hpp"

#include <cmath>
#include <string>
#include <unordered_map>

namespace Kinetic {

std::expected<void, MotionError> SpringConfig::Validate() const {
    const auto positive = [](float v) { return std::isfinite(v) && v > 0.0f; };
    if (!positive(stiffness) || !positive(damping) || !positive(mass)) {
        return std::unexpected(MotionError::InvalidSpringConfig);
    }
    return {};
}

float SpringConfig::DampingRatio() const {
    return damping / (2.0f * std::sqrt(stiffness * mass));
}

SpringConfig GetDefaultSpringConfig(SpringPreset preset) noexcept {
    switch (preset) {
        case SpringPreset::Gentle: return {100.0f, 15.0f, 1.0f};
        case SpringPreset::Snappy: return {300.0f, 25.0f, 0.8f};
        case SpringPreset::Bouncy: return {400.0f, 10.0f, 0.5f};
        case SpringPreset::Stiff:  return {500.0f, 30.0f, 1.2f};
        case SpringPreset::Smooth: return {200.0f, 20.0f, 1.0f};
        default: return {};
    }
}

std::expected<SpringPreset, MotionError> ParseSpringPreset(std::string_view name) {
    static const std::unordered_map<std::string, SpringPreset> presetMap = {
        {"gentle", SpringPreset::Gentle},
        {"snappy", SpringPreset::Snappy},
        {"bouncy", SpringPreset::Bouncy},
        {"stiff", SpringPreset::Stiff},
        {"smooth", SpringPreset::Smooth}
    };

    auto it = presetMap.find(std::string(name));
    if (it != presetMap.end()) {
        return it->second;
    }
    return std::unexpected(MotionError::UnknownSpringPreset);
}

const char* SpringPresetName(SpringPreset preset) noexcept {
    switch (preset) {
        case SpringPreset::Gentle: return "gentle";
        case SpringPreset::Snappy: return "snappy";
        case SpringPreset::Bouncy: return "bouncy";
        case SpringPreset::Stiff:  return "stiff";
        case SpringPreset::Smooth: return "smooth";
        default: return "smooth";
    }
}

bool SpringModel::Step(SpringState& state, float target, const SpringConfig& config,
                       float dt, float restThreshold) noexcept {
    const float distance = target - state.position;
    const float springForce = distance * config.stiffness;
    const float dampingForce = state.velocity * config.damping;
    const float acceleration = (springForce - dampingForce) / config.mass;

    state.velocity += acceleration * dt;
    state.position += state.velocity * dt;

    return std::abs(state.velocity) <= restThreshold && std::abs(distance) <= restThreshold;
}

float SpringModel::EstimateSettleDurationMs(const SpringConfig& config) noexcept {
    if (config.DampingRatio() < 1.0f) {
        // Underdamped
        return 4000.0f / std::sqrt(config.stiffness);
    }
    // Critically damped or overdamped
    return 6000.0f / config.stiffness;
}

} // namespace Kinetic
