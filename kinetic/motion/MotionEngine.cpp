#include "motion/MotionEngine.hpp"
#include "core/Logger.hpp"
#include "motion/LayoutTransition.hpp"
#include "motion/MotionTarget.hpp"
#include "motion/StaggerGroup.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>

namespace Kinetic {

namespace {

bool IsValidDelay(float delayMs) {
    return std::isfinite(delayMs) && delayMs >= 0.0f;
}

bool IsValidDuration(const std::optional<float>& durationMs) {
    return !durationMs || (std::isfinite(*durationMs) && *durationMs >= 0.0f);
}

/**
 * @brief Sets a value for the enclosing scope and restores the previous one,
 * also when the scope unwinds
 */
template<typename T>
class ScopedValue {
public:
    ScopedValue(T& slot, T value) : m_slot(slot), m_previous(slot) { m_slot = value; }
    ~ScopedValue() { m_slot = m_previous; }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

private:
    T& m_slot;
    T m_previous;
};

} // anonymous namespace

MotionEngine::MotionEngine(IFrameSource& frameSource, MotionSettings settings)
    : m_frames(frameSource)
    , m_settings(std::move(settings))
    , m_applier(m_settings.gpuAcceleration)
    , m_frameTimer(m_settings.NominalFrameMs(), m_settings.droppedFrameFactor)
    , m_reducedMotion(m_settings.reducedMotion)
{
    KINETIC_LOG_DEBUG("Motion engine created ({:.0f} fps, GPU acceleration {}, reduced motion {})",
                      m_settings.targetFps, m_settings.gpuAcceleration ? "on" : "off",
                      m_reducedMotion ? "on" : "off");
}

MotionEngine::~MotionEngine() {
    Destroy();
}

// =============================================================================
// Transitions
// =============================================================================

MotionCompletion MotionEngine::Spring(IMotionTarget& target, const PropertySet& properties,
                                      const SpringOptions& options) {
    return StartSpring(target, nullptr, properties, options, {});
}

MotionCompletion MotionEngine::SpringFrom(IMotionTarget& target, const PropertySet& from,
                                          const PropertySet& to, const SpringOptions& options,
                                          FrameWriter writer) {
    return StartSpring(target, &from, to, options, std::move(writer));
}

MotionCompletion MotionEngine::StartSpring(IMotionTarget& target, const PropertySet* from,
                                           const PropertySet& to, const SpringOptions& options,
                                           FrameWriter writer) {
    const SpringConfig config = ResolveSpringConfig(options);
    if (auto valid = config.Validate(); !valid) {
        KINETIC_LOG_WARN("Rejected spring: {} (stiffness {}, damping {}, mass {})",
                         MotionErrorToString(valid.error()), config.stiffness, config.damping, config.mass);
        return MotionCompletion::Rejected(valid.error());
    }
    if (!IsValidDelay(options.delayMs)) {
        KINETIC_LOG_WARN("Rejected spring: invalid delay {}", options.delayMs);
        return MotionCompletion::Rejected(MotionError::InvalidDelay);
    }
    if (!IsValidDuration(options.durationMs)) {
        KINETIC_LOG_WARN("Rejected spring: invalid duration {}", *options.durationMs);
        return MotionCompletion::Rejected(MotionError::InvalidDuration);
    }

    if (ShouldSkipAnimation(options.force)) {
        if (writer) {
            writer(target, to, true);
            return MotionCompletion::Resolved(MotionOutcome::Completed);
        }
        return ApplyImmediately(target, to);
    }

    const float expectedMs = options.durationMs.value_or(SpringModel::EstimateSettleDurationMs(config));
    std::optional<PropertySet> initial;
    if (from) {
        initial = *from;
    }

    MotionCompletion completion;
    return Schedule(options.delayMs, completion,
        [this, &target, initial, to, config, expectedMs, completion, writer = std::move(writer)]() {
            const PropertySet start = initial ? *initial : m_applier.ReadInitialValues(target, to);
            auto task = AnimationTask::CreateSpring(m_nextTaskId++, target, start, to, config,
                                                    m_frames.Now(), completion);
            task->SetExpectedDurationMs(expectedMs);
            if (writer) {
                task->SetFrameWriter(writer);
            }
            Register(std::move(task));
        });
}

MotionCompletion MotionEngine::Tween(IMotionTarget& target, const PropertySet& properties,
                                     const TweenOptions& options) {
    if (!IsValidDuration(options.durationMs)) {
        KINETIC_LOG_WARN("Rejected tween: invalid duration {}", *options.durationMs);
        return MotionCompletion::Rejected(MotionError::InvalidDuration);
    }
    if (!IsValidDelay(options.delayMs)) {
        KINETIC_LOG_WARN("Rejected tween: invalid delay {}", options.delayMs);
        return MotionCompletion::Rejected(MotionError::InvalidDelay);
    }

    if (ShouldSkipAnimation(options.force)) {
        return ApplyImmediately(target, properties);
    }

    TweenConfig config;
    config.durationMs = options.durationMs.value_or(m_settings.tweenDurationMs);
    config.easing = options.easing.value_or(m_settings.tweenEasing);

    MotionCompletion completion;
    return Schedule(options.delayMs, completion, [this, &target, properties, config, completion]() {
        const PropertySet initial = m_applier.ReadInitialValues(target, properties);
        auto task = AnimationTask::CreateTween(m_nextTaskId++, target, initial, properties, config,
                                               m_frames.Now(), completion);
        task->SetExpectedDurationMs(config.durationMs);
        Register(std::move(task));
    });
}

GestureBinding MotionEngine::Gesture(IMotionTarget& target, const GestureMap& gestures) {
    return BindGestures(*this, target, gestures);
}

MotionCompletion MotionEngine::Stagger(IMotionTarget& parent, const std::string& childSelector,
                                       const PropertySet& properties, const StaggerOptions& options) {
    return RunStagger(*this, parent, childSelector, properties, options);
}

MotionCompletion MotionEngine::Layout(IMotionTarget& target, const std::function<void()>& mutation,
                                      const LayoutOptions& options) {
    return RunLayoutTransition(*this, target, mutation, options);
}

SpringConfig MotionEngine::ResolveSpringConfig(const SpringOptions& options) const {
    SpringConfig config = m_settings.GetSpringPreset(options.preset.value_or(m_settings.defaultSpringPreset));
    if (options.stiffness) {
        config.stiffness = *options.stiffness;
    }
    if (options.damping) {
        config.damping = *options.damping;
    }
    if (options.mass) {
        config.mass = *options.mass;
    }
    return config;
}

MotionCompletion MotionEngine::ApplyImmediately(IMotionTarget& target, const PropertySet& properties) {
    m_applier.Apply(target, properties);
    return MotionCompletion::Resolved(MotionOutcome::Completed);
}

MotionCompletion MotionEngine::Schedule(float delayMs, MotionCompletion completion,
                                        std::function<void()> start) {
    if (m_destroying) {
        KINETIC_LOG_DEBUG("Transition requested while destroying the engine, cancelled");
        completion.Resolve(MotionOutcome::Cancelled);
        return completion;
    }

    if (delayMs <= 0.0f) {
        start();
        return completion;
    }

    m_deferred.push_back({m_frames.Now() + delayMs, completion, std::move(start)});
    EnsureLoop();
    return completion;
}

// =============================================================================
// Registry
// =============================================================================

void MotionEngine::Register(std::unique_ptr<AnimationTask> task) {
    const std::uint64_t destroyCount = m_destroyCount;
    SupersedeConflicts(*task);

    // A superseded task's callback tore the engine down
    if (m_destroying || m_destroyCount != destroyCount) {
        task->GetCompletion().Resolve(MotionOutcome::Cancelled);
        return;
    }

    KINETIC_LOG_TRACE("Registered {} task {} ({} properties, ~{:.0f}ms)",
                      AnimationKindName(task->GetKind()), task->GetId(),
                      task->GetTargetValues().size(), task->GetExpectedDurationMs());

    m_tasks.push_back(std::move(task));
    CompactRegistry();
    EnsureLoop();
}

void MotionEngine::SupersedeConflicts(const AnimationTask& incoming) {
    const std::vector<std::string> styleKeys = incoming.GetStyleKeys();
    if (styleKeys.empty()) {
        return;
    }

    // Resolution callbacks may start new transitions, so index rather than iterate
    ScopedValue<int> iterating(m_iterationDepth, m_iterationDepth + 1);
    for (size_t i = 0; i < m_tasks.size(); ++i) {
        AnimationTask& existing = *m_tasks[i];
        if (existing.IsRetired() || &existing.GetTarget() != &incoming.GetTarget()) {
            continue;
        }

        size_t released = 0;
        for (const auto& key : styleKeys) {
            released += existing.ReleaseStyle(key);
        }

        if (released > 0 && existing.IsEmpty()) {
            KINETIC_LOG_TRACE("Task {} superseded by task {}", existing.GetId(), incoming.GetId());
            Retire(existing, MotionOutcome::Superseded);
        }
    }
}

void MotionEngine::Retire(AnimationTask& task, std::optional<MotionOutcome> outcome) {
    if (task.IsRetired()) {
        return;
    }

    task.MarkRetired();
    if (outcome) {
        task.GetCompletion().Resolve(*outcome);
    }
}

void MotionEngine::CompactRegistry() {
    if (m_iterationDepth > 0) {
        return;
    }

    std::erase_if(m_tasks, [](const std::unique_ptr<AnimationTask>& task) {
        return task->IsRetired();
    });
}

size_t MotionEngine::GetActiveTaskCount() const {
    return static_cast<size_t>(std::count_if(m_tasks.begin(), m_tasks.end(),
        [](const std::unique_ptr<AnimationTask>& task) { return !task->IsRetired(); }));
}

std::vector<TaskInfo> MotionEngine::GetActiveTasks() const {
    std::vector<TaskInfo> infos;
    for (const auto& task : m_tasks) {
        if (task->IsRetired()) {
            continue;
        }

        TaskInfo info;
        info.id = task->GetId();
        info.kind = task->GetKind();
        info.target = &task->GetTarget();
        info.propertyCount = task->GetTargetValues().size();
        info.startTime = task->GetStartTime();
        info.expectedDurationMs = task->GetExpectedDurationMs();
        infos.push_back(info);
    }
    return infos;
}

bool MotionEngine::HasPendingWork() const {
    return !m_deferred.empty() || GetActiveTaskCount() > 0;
}

// =============================================================================
// Frame loop
// =============================================================================

void MotionEngine::EnsureLoop() {
    if (m_destroying || m_paused || m_frameRequest || !HasPendingWork()) {
        return;
    }

    // Starting from idle: don't report the idle gap as a frame
    if (!m_inTick) {
        m_frameTimer.Reset(m_frames.Now());
    }

    m_frameRequest = m_frames.RequestFrame([this](double timestampMs) { Tick(timestampMs); });
}

void MotionEngine::Tick(double timestampMs) {
    m_frameRequest.reset();
    if (m_paused) {
        return;
    }

    ScopedValue<bool> inTick(m_inTick, true);

    m_frameTimer.Update(timestampMs);
    ReportPerformance(timestampMs);
    ResolveCancelledStarts();
    StartDueRequests(timestampMs);

    const float dt = m_settings.NominalFrameSeconds();

    // Tasks registered by callbacks during this tick first run next frame
    {
        ScopedValue<int> iterating(m_iterationDepth, m_iterationDepth + 1);
        const size_t taskCount = m_tasks.size();
        for (size_t i = 0; i < taskCount; ++i) {
            AnimationTask& task = *m_tasks[i];
            if (task.IsRetired()) {
                continue;
            }

            try {
                if (task.GetCompletion().IsCancelRequested()) {
                    Retire(task, MotionOutcome::Cancelled);
                    continue;
                }
                if (task.Update(timestampMs, dt, m_settings.restThreshold, m_applier)) {
                    Retire(task, MotionOutcome::Completed);
                }
            } catch (const std::exception& e) {
                KINETIC_LOG_ERROR("Dropping {} task {} after failure: {}",
                                  AnimationKindName(task.GetKind()), task.GetId(), e.what());
                task.MarkRetired();
            }
        }
    }

    CompactRegistry();
    EnsureLoop();
}

void MotionEngine::ResolveCancelledStarts() {
    auto cancelled = std::stable_partition(m_deferred.begin(), m_deferred.end(),
        [](const DeferredStart& entry) { return !entry.completion.IsCancelRequested(); });
    if (cancelled == m_deferred.end()) {
        return;
    }

    std::vector<DeferredStart> dropped(std::make_move_iterator(cancelled),
                                       std::make_move_iterator(m_deferred.end()));
    m_deferred.erase(cancelled, m_deferred.end());

    for (auto& entry : dropped) {
        entry.completion.Resolve(MotionOutcome::Cancelled);
    }
}

void MotionEngine::StartDueRequests(double timestampMs) {
    if (m_deferred.empty()) {
        return;
    }

    std::vector<DeferredStart> due;
    auto notDue = std::stable_partition(m_deferred.begin(), m_deferred.end(),
        [timestampMs](const DeferredStart& entry) { return entry.dueTime > timestampMs; });
    std::move(notDue, m_deferred.end(), std::back_inserter(due));
    m_deferred.erase(notDue, m_deferred.end());

    std::stable_sort(due.begin(), due.end(), [](const DeferredStart& a, const DeferredStart& b) {
        return a.dueTime < b.dueTime;
    });

    const std::uint64_t destroyCount = m_destroyCount;
    for (auto& entry : due) {
        // Destroy() ran from an earlier callback and never saw these entries
        if (m_destroyCount != destroyCount || entry.completion.IsCancelRequested()) {
            entry.completion.Resolve(MotionOutcome::Cancelled);
            continue;
        }
        if (entry.completion.IsResolved()) {
            continue;
        }

        try {
            entry.start();
        } catch (const std::exception& e) {
            KINETIC_LOG_ERROR("Dropping delayed transition after failure: {}", e.what());
        }
    }
}

void MotionEngine::ReportPerformance(double timestampMs) {
    if (!m_settings.monitoring) {
        return;
    }
    if (timestampMs - m_lastReportTime < m_settings.monitorIntervalMs) {
        return;
    }
    m_lastReportTime = timestampMs;

    if (GetActiveTaskCount() == 0) {
        return;
    }

    const FrameStats& stats = m_frameTimer.GetStats();
    KINETIC_LOG_INFO("Motion performance: {:.0f} FPS | Dropped frames: {}", stats.fps, stats.droppedFrames);

    if (stats.droppedFrames > static_cast<std::uint32_t>(std::max(0, m_settings.droppedFrameWarningThreshold))) {
        KINETIC_LOG_WARN("Performance degradation detected ({} dropped frames). "
                         "Consider reducing animation complexity.", stats.droppedFrames);
        m_frameTimer.ClearDroppedFrames();
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void MotionEngine::Pause() {
    m_userPaused = true;
    ApplyPauseState();
}

void MotionEngine::Resume() {
    m_userPaused = false;
    ApplyPauseState();
}

void MotionEngine::SetVisible(bool visible) {
    m_hidden = !visible;
    ApplyPauseState();
}

void MotionEngine::ApplyPauseState() {
    const bool shouldPause = m_userPaused || m_hidden;
    if (shouldPause == m_paused) {
        return;
    }

    m_paused = shouldPause;

    if (m_paused) {
        m_pausedAt = m_frames.Now();
        CancelFrameRequest();
        KINETIC_LOG_DEBUG("Motion loop paused ({} active tasks)", GetActiveTaskCount());
        return;
    }

    const double pausedFor = m_frames.Now() - m_pausedAt;
    if (m_settings.compensatePausedTime && pausedFor > 0.0) {
        for (auto& task : m_tasks) {
            if (task->GetKind() == AnimationKind::Tween) {
                task->ShiftStartTime(pausedFor);
            }
        }
        for (auto& entry : m_deferred) {
            entry.dueTime += pausedFor;
        }
    }

    KINETIC_LOG_DEBUG("Motion loop resumed after {:.0f}ms", pausedFor);
    EnsureLoop();
}

void MotionEngine::CancelFrameRequest() {
    if (m_frameRequest) {
        m_frames.CancelFrame(*m_frameRequest);
        m_frameRequest.reset();
    }
}

void MotionEngine::Destroy() {
    if (m_destroying) {
        return;
    }

    ScopedValue<bool> destroying(m_destroying, true);
    ++m_destroyCount;

    CancelFrameRequest();

    const size_t cancelled = GetActiveTaskCount() + m_deferred.size();

    std::vector<DeferredStart> deferred = std::move(m_deferred);
    m_deferred.clear();

    {
        ScopedValue<int> iterating(m_iterationDepth, m_iterationDepth + 1);
        const size_t taskCount = m_tasks.size();
        for (size_t i = 0; i < taskCount; ++i) {
            Retire(*m_tasks[i], MotionOutcome::Cancelled);
        }
    }

    for (auto& entry : deferred) {
        entry.completion.Resolve(MotionOutcome::Cancelled);
    }

    CancelFrameRequest();
    CompactRegistry();

    if (cancelled > 0) {
        KINETIC_LOG_DEBUG("Motion engine destroyed, {} transitions cancelled", cancelled);
    }
}

void MotionEngine::SetReducedMotion(bool enabled) {
    if (m_reducedMotion == enabled) {
        return;
    }
    m_reducedMotion = enabled;
    KINETIC_LOG_INFO("Reduced motion {}", enabled ? "enabled" : "disabled");
}

} // namespace Kinetic
