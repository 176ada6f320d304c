#pragma once

#include "motion/Easing.hpp"
#include "motion/MotionCompletion.hpp"
#include "motion/PropertyValue.hpp"
#include "motion/SpringModel.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Kinetic {

class IMotionTarget;
class PropertyApplier;

enum class AnimationKind {
    Spring,
    Tween
};

[[nodiscard]] const char* AnimationKindName(AnimationKind kind) noexcept;

/**
 * @brief Duration based transition parameters
 */
struct TweenConfig {
    float durationMs = 300.0f;
    Easing easing = Easing::EaseInOut;
};

using TaskId = std::uint64_t;

/**
 * @brief Custom presentation write for a task
 *
 * Receives the frame's values (or the exact target values when settled).
 * Without one, values go through the PropertyApplier.
 */
using FrameWriter = std::function<void(IMotionTarget& target, const PropertySet& values, bool settled)>;

/**
 * @brief One in-flight transition of one target's property set
 *
 * Owned by the MotionEngine registry from creation until the frame it
 * finishes. initial, target values, current and (for springs) velocity
 * always share the same key set.
 */
class AnimationTask {
public:
    static std::unique_ptr<AnimationTask> CreateSpring(TaskId id, IMotionTarget& target,
                                                       const PropertySet& initial,
                                                       const PropertySet& targetValues,
                                                       const SpringConfig& config,
                                                       double startTime,
                                                       MotionCompletion completion);

    static std::unique_ptr<AnimationTask> CreateTween(TaskId id, IMotionTarget& target,
                                                      const PropertySet& initial,
                                                      const PropertySet& targetValues,
                                                      const TweenConfig& config,
                                                      double startTime,
                                                      MotionCompletion completion);

    /**
     * @brief Advance one frame and write the result to the target
     * @param frameTimeMs Frame timestamp (drives tween progress)
     * @param dt Spring step in seconds
     * @param restThreshold Spring settle tolerance
     * @param applier Default writer
     * @return true when finished; the exact target values have been written
     */
    bool Update(double frameTimeMs, float dt, float restThreshold, const PropertyApplier& applier);

    void SetFrameWriter(FrameWriter writer) { m_writer = std::move(writer); }

    /**
     * @brief Move the start time (used to discount a paused interval)
     */
    void ShiftStartTime(double deltaMs) { m_startTime += deltaMs; }

    /**
     * @brief Drop every property that writes the given style property
     * @return Number of properties dropped
     */
    size_t ReleaseStyle(const std::string& styleKey);

    /**
     * @brief Style properties this task writes (see PropertyApplier::StyleKeyFor)
     */
    [[nodiscard]] std::vector<std::string> GetStyleKeys() const;

    [[nodiscard]] TaskId GetId() const { return m_id; }
    [[nodiscard]] AnimationKind GetKind() const { return m_kind; }
    [[nodiscard]] IMotionTarget& GetTarget() const { return *m_target; }
    [[nodiscard]] const PropertySet& GetInitial() const { return m_initial; }
    [[nodiscard]] const PropertySet& GetTargetValues() const { return m_targetValues; }
    [[nodiscard]] const PropertySet& GetCurrent() const { return m_current; }
    [[nodiscard]] float GetVelocity(const std::string& property) const;
    [[nodiscard]] const SpringConfig& GetSpringConfig() const { return m_spring; }
    [[nodiscard]] const TweenConfig& GetTweenConfig() const { return m_tween; }
    [[nodiscard]] double GetStartTime() const { return m_startTime; }
    [[nodiscard]] const MotionCompletion& GetCompletion() const { return m_completion; }
    [[nodiscard]] MotionCompletion& GetCompletion() { return m_completion; }
    [[nodiscard]] bool IsEmpty() const { return m_targetValues.empty(); }

    [[nodiscard]] float GetExpectedDurationMs() const { return m_expectedDurationMs; }
    void SetExpectedDurationMs(float durationMs) { m_expectedDurationMs = durationMs; }

    [[nodiscard]] bool IsRetired() const { return m_retired; }
    void MarkRetired() { m_retired = true; }

private:
    AnimationTask(TaskId id, AnimationKind kind, IMotionTarget& target,
                  const PropertySet& initial, const PropertySet& targetValues,
                  double startTime, MotionCompletion completion);

    bool UpdateSpring(float dt, float restThreshold);
    bool UpdateTween(double frameTimeMs);

    /**
     * @brief Values to write this frame; opaque (non-numeric) targets are skipped
     */
    [[nodiscard]] PropertySet BuildFrameValues() const;
    void Write(const PropertyApplier& applier, bool settled);

    TaskId m_id;
    AnimationKind m_kind;
    IMotionTarget* m_target;

    PropertySet m_initial;
    PropertySet m_targetValues;
    PropertySet m_current;
    std::map<std::string, float> m_velocity;

    SpringConfig m_spring;
    TweenConfig m_tween;

    double m_startTime;
    float m_expectedDurationMs = 0.0f;
    MotionCompletion m_completion;
    FrameWriter m_writer;
    bool m_retired = false;
};

} // namespace Kinetic
