#pragma once

#include "config/MotionSettings.hpp"
#include "core/FrameTimer.hpp"
#include "motion/AnimationTask.hpp"
#include "motion/FrameSource.hpp"
#include "motion/GestureBinder.hpp"
#include "motion/MotionCompletion.hpp"
#include "motion/MotionOptions.hpp"
#include "motion/PropertyApplier.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Kinetic {

class IMotionTarget;

/**
 * @brief Read-only view of a registered task
 */
struct TaskInfo {
    TaskId id = 0;
    AnimationKind kind = AnimationKind::Spring;
    IMotionTarget* target = nullptr;
    size_t propertyCount = 0;
    double startTime = 0.0;
    float expectedDurationMs = 0.0f;
};

/**
 * @brief Frame-synchronized scheduler and entry point of the motion system
 *
 * Owns every in-flight AnimationTask and advances all of them once per
 * display frame from the injected IFrameSource. The loop runs only while
 * there is work and stops by itself when the registry drains.
 *
 * A target property is owned by at most one task: a new transition on the
 * same (target, style property) takes it over and the older task drops it.
 * An older task left with nothing to animate resolves Superseded.
 *
 * Not thread-safe. Every call, including frame callbacks, is expected on
 * the host's UI thread.
 *
 * Usage:
 * @code
 * MotionEngine engine(frameSource, settings);
 * auto done = engine.Spring(card, {{"opacity", PropertyValue::FromNumber(1.0f)}});
 * done.OnResolved([](MotionOutcome outcome) { ... });
 * @endcode
 */
class MotionEngine {
public:
    explicit MotionEngine(IFrameSource& frameSource, MotionSettings settings = {});
    ~MotionEngine();

    MotionEngine(const MotionEngine&) = delete;
    MotionEngine& operator=(const MotionEngine&) = delete;

    // =========================================================================
    // Transitions
    // =========================================================================

    /**
     * @brief Spring every property from its current value to the given one
     *
     * Rejected (InvalidSpringConfig / InvalidDelay / InvalidDuration) when the
     * options do not describe a usable spring. Under reduced motion the final
     * values are written at once and the result is already Completed.
     */
    MotionCompletion Spring(IMotionTarget& target, const PropertySet& properties,
                            const SpringOptions& options = {});

    /**
     * @brief Spring from explicit start values, optionally through a custom writer
     *
     * Properties missing from "from" start at 0.
     */
    MotionCompletion SpringFrom(IMotionTarget& target, const PropertySet& from,
                                const PropertySet& to, const SpringOptions& options = {},
                                FrameWriter writer = {});

    /**
     * @brief Duration based transition with an easing curve
     */
    MotionCompletion Tween(IMotionTarget& target, const PropertySet& properties,
                           const TweenOptions& options = {});

    /**
     * @brief Attach hover / tap / focus springs to a target
     */
    [[nodiscard]] GestureBinding Gesture(IMotionTarget& target, const GestureMap& gestures);

    /**
     * @brief Spring every child matching selector, offset in document order
     */
    MotionCompletion Stagger(IMotionTarget& parent, const std::string& childSelector,
                             const PropertySet& properties, const StaggerOptions& options = {});

    /**
     * @brief Animate a target from its old layout box to the one mutation produces
     */
    MotionCompletion Layout(IMotionTarget& target, const std::function<void()>& mutation,
                            const LayoutOptions& options = {});

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Stop advancing tasks until Resume()
     */
    void Pause();

    /**
     * @brief Continue after Pause()
     *
     * With compensatePausedTime, tweens and delayed starts are shifted by the
     * paused interval so they continue where they stopped.
     */
    void Resume();

    /**
     * @brief Host visibility; a hidden engine pauses, showing it again
     * resumes unless Pause() was called explicitly
     */
    void SetVisible(bool visible);

    /**
     * @brief Cancel every task and delayed start and stop the loop
     *
     * Every outstanding completion resolves Cancelled. Transitions requested
     * from those completion callbacks resolve Cancelled immediately, so no frame
     * is left requested when Destroy() returns. The engine stays usable.
     */
    void Destroy();

    void SetReducedMotion(bool enabled);
    [[nodiscard]] bool IsReducedMotion() const { return m_reducedMotion; }

    /**
     * @brief True if a request with the given force flag should skip animating
     */
    [[nodiscard]] bool ShouldSkipAnimation(bool force) const { return m_reducedMotion && !force; }

    /**
     * @brief Spring parameters after applying preset and overrides
     */
    [[nodiscard]] SpringConfig ResolveSpringConfig(const SpringOptions& options) const;

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] bool IsPaused() const { return m_paused; }
    [[nodiscard]] bool IsUserPaused() const { return m_userPaused; }
    [[nodiscard]] bool IsVisible() const { return !m_hidden; }
    [[nodiscard]] bool IsLoopRunning() const { return m_frameRequest.has_value(); }

    [[nodiscard]] size_t GetActiveTaskCount() const;
    [[nodiscard]] size_t GetPendingStartCount() const { return m_deferred.size(); }

    /**
     * @brief Registry size including retired tasks not yet compacted
     */
    [[nodiscard]] size_t GetRegisteredTaskCount() const { return m_tasks.size(); }
    [[nodiscard]] std::vector<TaskInfo> GetActiveTasks() const;

    [[nodiscard]] const FrameStats& GetFrameStats() const { return m_frameTimer.GetStats(); }
    [[nodiscard]] const MotionSettings& GetSettings() const { return m_settings; }
    [[nodiscard]] const PropertyApplier& GetApplier() const { return m_applier; }
    [[nodiscard]] IFrameSource& GetFrameSource() const { return m_frames; }

private:
    struct DeferredStart {
        double dueTime;
        MotionCompletion completion;
        std::function<void()> start;
    };

    void Tick(double timestampMs);
    void EnsureLoop();
    void ApplyPauseState();
    void ResolveCancelledStarts();
    void StartDueRequests(double timestampMs);
    void CancelFrameRequest();
    [[nodiscard]] bool HasPendingWork() const;

    MotionCompletion Schedule(float delayMs, MotionCompletion completion, std::function<void()> start);
    MotionCompletion ApplyImmediately(IMotionTarget& target, const PropertySet& properties);
    MotionCompletion StartSpring(IMotionTarget& target, const PropertySet* from,
                                 const PropertySet& to, const SpringOptions& options,
                                 FrameWriter writer);

    void Register(std::unique_ptr<AnimationTask> task);
    void SupersedeConflicts(const AnimationTask& incoming);
    void Retire(AnimationTask& task, std::optional<MotionOutcome> outcome);
    void CompactRegistry();
    void ReportPerformance(double timestampMs);

    IFrameSource& m_frames;
    MotionSettings m_settings;
    PropertyApplier m_applier;
    FrameTimer m_frameTimer;

    std::vector<std::unique_ptr<AnimationTask>> m_tasks;  // registration order
    std::vector<DeferredStart> m_deferred;
    std::optional<FrameRequestId> m_frameRequest;
    TaskId m_nextTaskId = 1;

    bool m_reducedMotion;
    bool m_userPaused = false;
    bool m_hidden = false;
    bool m_paused = false;
    double m_pausedAt = 0.0;

    bool m_inTick = false;
    int m_iterationDepth = 0;   // registry entries are only erased at depth 0
    bool m_destroying = false;
    std::uint64_t m_destroyCount = 0;
    double m_lastReportTime = 0.0;
};

} // namespace Kinetic
