#include "motion/AnimationTask.hpp"
#include "motion/MotionTarget.hpp"
#include "motion/PropertyApplier.hpp"

#include <algorithm>

namespace Kinetic {

const char* AnimationKindName(AnimationKind kind) noexcept {
    switch (kind) {
        case AnimationKind::Spring: return "spring";
        case AnimationKind::Tween:  return "tween";
        default: return "unknown";
    }
}

std::unique_ptr<AnimationTask> AnimationTask::CreateSpring(TaskId id, IMotionTarget& target,
                                                           const PropertySet& initial,
                                                           const PropertySet& targetValues,
                                                           const SpringConfig& config,
                                                           double startTime,
                                                           MotionCompletion completion) {
    std::unique_ptr<AnimationTask> task(new AnimationTask(
        id, AnimationKind::Spring, target, initial, targetValues, startTime, std::move(completion)));
    task->m_spring = config;
    for (const auto& [key, value] : task->m_targetValues) {
        task->m_velocity[key] = 0.0f;
    }
    return task;
}

std::unique_ptr<AnimationTask> AnimationTask::CreateTween(TaskId id, IMotionTarget& target,
                                                          const PropertySet& initial,
                                                          const PropertySet& targetValues,
                                                          const TweenConfig& config,
                                                          double startTime,
                                                          MotionCompletion completion) {
    std::unique_ptr<AnimationTask> task(new AnimationTask(
        id, AnimationKind::Tween, target, initial, targetValues, startTime, std::move(completion)));
    task->m_tween = config;
    return task;
}

AnimationTask::AnimationTask(TaskId id, AnimationKind kind, IMotionTarget& target,
                             const PropertySet& initial, const PropertySet& targetValues,
                             double startTime, MotionCompletion completion)
    : m_id(id)
    , m_kind(kind)
    , m_target(&target)
    , m_targetValues(targetValues)
    , m_startTime(startTime)
    , m_completion(std::move(completion))
{
    for (const auto& [key, value] : m_targetValues) {
        auto it = initial.find(key);
        m_initial[key] = it != initial.end() ? it->second : PropertyValue::FromNumber(0.0f);
        m_current[key] = PropertyValue::FromNumber(m_initial[key].ToNumber());
    }
}

bool AnimationTask::Update(double frameTimeMs, float dt, float restThreshold,
                           const PropertyApplier& applier) {
    const bool finished = m_kind == AnimationKind::Spring
        ? UpdateSpring(dt, restThreshold)
        : UpdateTween(frameTimeMs);

    // A finished task writes only its exact targets, removing residual error
    Write(applier, finished);
    return finished;
}

bool AnimationTask::UpdateSpring(float dt, float restThreshold) {
    bool complete = true;

    for (const auto& [key, targetValue] : m_targetValues) {
        SpringState state{m_current[key].numberValue, m_velocity[key]};
        const bool settled = SpringModel::Step(state, targetValue.ToNumber(), m_spring, dt, restThreshold);

        m_current[key].numberValue = state.position;
        m_velocity[key] = state.velocity;

        if (!settled) {
            complete = false;
        }
    }

    return complete;
}

bool AnimationTask::UpdateTween(double frameTimeMs) {
    float progress = 1.0f;
    if (m_tween.durationMs > 0.0f) {
        const double elapsed = frameTimeMs - m_startTime;
        progress = static_cast<float>(elapsed / m_tween.durationMs);
        progress = std::max(0.0f, std::min(1.0f, progress));
    }

    const float eased = ApplyEasing(m_tween.easing, progress);

    for (const auto& [key, targetValue] : m_targetValues) {
        const float from = m_initial[key].ToNumber();
        const float to = targetValue.ToNumber();
        m_current[key].numberValue = from + (to - from) * eased;
    }

    return progress >= 1.0f;
}

PropertySet AnimationTask::BuildFrameValues() const {
    PropertySet values;

    for (const auto& [key, targetValue] : m_targetValues) {
        if (!targetValue.IsNumeric()) {
            continue;
        }

        const float value = m_current.at(key).numberValue;
        const std::string unit = targetValue.Unit();
        values[key] = unit.empty()
            ? PropertyValue::FromNumber(value)
            : PropertyValue::FromString(PropertyApplier::FormatNumber(key, value, unit));
    }

    return values;
}

void AnimationTask::Write(const PropertyApplier& applier, bool settled) {
    const PropertySet values = settled ? m_targetValues : BuildFrameValues();

    if (m_writer) {
        m_writer(*m_target, values, settled);
    } else if (!values.empty()) {
        applier.Apply(*m_target, values);
    }
}

size_t AnimationTask::ReleaseStyle(const std::string& styleKey) {
    size_t released = 0;

    for (auto it = m_targetValues.begin(); it != m_targetValues.end();) {
        if (PropertyApplier::StyleKeyFor(it->first) == styleKey) {
            m_initial.erase(it->first);
            m_current.erase(it->first);
            m_velocity.erase(it->first);
            it = m_targetValues.erase(it);
            ++released;
        } else {
            ++it;
        }
    }

    return released;
}

std::vector<std::string> AnimationTask::GetStyleKeys() const {
    std::vector<std::string> keys;
    for (const auto& [key, value] : m_targetValues) {
        const std::string styleKey = PropertyApplier::StyleKeyFor(key);
        if (std::find(keys.begin(), keys.end(), styleKey) == keys.end()) {
            keys.push_back(styleKey);
        }
    }
    return keys;
}

float AnimationTask::GetVelocity(const std::string& property) const {
    auto it = m_velocity.find(property);
    return it != m_velocity.end() ? it->second : 0.0f;
}

} // namespace Kinetic
