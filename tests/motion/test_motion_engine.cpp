/**
 * @file test_motion_engine.cpp
 * @brief Unit tests for the frame loop, task registry and transition requests
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "motion/MotionEngine.hpp"

#include "mocks/ManualFrameSource.hpp"
#include "mocks/MockMotionTarget.hpp"
#include "utils/TestHelpers.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>

using namespace Kinetic;
using namespace Kinetic::Test;

// =============================================================================
// Fixture
// =============================================================================

class MotionEngineTest : public ::testing::Test {
protected:
    MotionEngine& CreateEngine(MotionSettings settings = {}) {
        engine = std::make_unique<MotionEngine>(frames, settings);
        return *engine;
    }

    void SetUp() override {
        CreateEngine();
    }

    void TearDown() override {
        engine.reset();
    }

    /**
     * @brief Step frames until completion resolves
     * @return Frames stepped, or -1 if it never resolved
     */
    int RunUntilResolved(const MotionCompletion& completion, int maxFrames = 1000) {
        for (int frame = 1; frame <= maxFrames; ++frame) {
            frames.StepFrame();
            if (completion.IsResolved()) {
                return frame;
            }
        }
        return -1;
    }

    ManualFrameSource frames;
    std::unique_ptr<MotionEngine> engine;
    FakeMotionTarget target;
};

// =============================================================================
// Spring Tests
// =============================================================================

TEST_F(MotionEngineTest, SpringCompletesOnSettleFrame) {
    SpringOptions options;
    options.preset = SpringPreset::Snappy;

    MotionCompletion completion = engine->Spring(target, Numbers({{"left", 100.0f}}), options);
    CompletionRecorder recorder;
    recorder.Attach(completion);

    // Reference integration with the same step and tolerance
    const MotionSettings& settings = engine->GetSettings();
    SpringState state;
    int expectedFrames = 0;
    do {
        ++expectedFrames;
    } while (!SpringModel::Step(state, 100.0f, GetDefaultSpringConfig(SpringPreset::Snappy),
                                settings.NominalFrameSeconds(), settings.restThreshold));

    for (int frame = 1; frame < expectedFrames; ++frame) {
        frames.StepFrame();
        ASSERT_FALSE(completion.IsResolved()) << "resolved early on frame " << frame;
    }

    frames.StepFrame();
    EXPECT_EQ(1, recorder.calls);
    EXPECT_EQ(MotionOutcome::Completed, recorder.outcome);
    EXPECT_EQ("100px", target.Style("left"));
    EXPECT_EQ(0u, engine->GetActiveTaskCount());
}

TEST_F(MotionEngineTest, SpringMovesTowardsTargetEachFrame) {
    engine->Spring(target, Numbers({{"left", 100.0f}}));

    frames.StepFrame();
    const float first = StyleNumber(target.Style("left"));
    frames.StepFrame();
    const float second = StyleNumber(target.Style("left"));

    EXPECT_GT(first, 0.0f);
    EXPECT_GT(second, first);
}

TEST_F(MotionEngineTest, CompletionResolvesExactlyOnce) {
    MotionCompletion completion = engine->Spring(target, Numbers({{"opacity", 0.0f}}));
    CompletionRecorder recorder;
    recorder.Attach(completion);

    ASSERT_GT(RunUntilResolved(completion), 0);
    for (int i = 0; i < 10; ++i) {
        frames.StepFrame();
    }

    EXPECT_EQ(1, recorder.calls);
    EXPECT_EQ("0", target.Style("opacity"));
}

TEST_F(MotionEngineTest, LoopStopsWhenIdle) {
    EXPECT_FALSE(engine->IsLoopRunning());

    MotionCompletion completion = engine->Spring(target, Numbers({{"left", 10.0f}}));
    EXPECT_TRUE(engine->IsLoopRunning());
    ASSERT_GT(RunUntilResolved(completion), 0);

    EXPECT_FALSE(engine->IsLoopRunning());
    EXPECT_FALSE(frames.HasPendingFrame());

    const size_t requests = frames.GetRequestCount();
    for (int i = 0; i < 5; ++i) {
        frames.StepFrame();
    }
    EXPECT_EQ(requests, frames.GetRequestCount());
}

TEST_F(MotionEngineTest, ResolveSpringConfigAppliesOverrides) {
    SpringOptions options;
    options.preset = SpringPreset::Snappy;
    options.stiffness = 123.0f;

    const SpringConfig config = engine->ResolveSpringConfig(options);
    EXPECT_FLOAT_EQ(123.0f, config.stiffness);
    EXPECT_FLOAT_EQ(25.0f, config.damping);
    EXPECT_FLOAT_EQ(0.8f, config.mass);
}

TEST_F(MotionEngineTest, DefaultPresetComesFromSettings) {
    MotionSettings settings;
    settings.defaultSpringPreset = SpringPreset::Bouncy;
    CreateEngine(settings);

    const SpringConfig config = engine->ResolveSpringConfig({});
    EXPECT_FLOAT_EQ(400.0f, config.stiffness);
    EXPECT_FLOAT_EQ(10.0f, config.damping);
}

TEST_F(MotionEngineTest, InvalidSpringIsRejected) {
    SpringOptions options;
    options.mass = 0.0f;

    MotionCompletion completion = engine->Spring(target, Numbers({{"left", 10.0f}}), options);

    EXPECT_EQ(MotionOutcome::Rejected, completion.GetOutcome());
    EXPECT_EQ(MotionError::InvalidSpringConfig, completion.GetError());
    EXPECT_EQ(0u, frames.GetRequestCount());
    EXPECT_TRUE(target.GetWrites().empty());
}

TEST_F(MotionEngineTest, OpaqueTargetIsWrittenOnSettle) {
    MotionCompletion completion = engine->Spring(target, {{"transform", PropertyValue::FromString("rotate(45deg)")}});

    EXPECT_EQ(1, RunUntilResolved(completion));
    EXPECT_EQ("rotate(45deg) translateZ(0)", target.Style("transform"));
    EXPECT_EQ("transform", target.Style("will-change"));
}

TEST_F(MotionEngineTest, AnimatedValuesKeepTargetUnit) {
    MotionCompletion completion = engine->Spring(target, {{"width", PropertyValue::FromString("50%")}});

    frames.StepFrame();
    const std::string midway = target.Style("width");
    ASSERT_FALSE(midway.empty());
    EXPECT_EQ('%', midway.back());

    ASSERT_GT(RunUntilResolved(completion), 0);
    EXPECT_EQ("50%", target.Style("width"));
}

// =============================================================================
// Tween Tests
// =============================================================================

class MotionEngineTweenTest : public MotionEngineTest,
                              public ::testing::WithParamInterface<Easing> {};

TEST_P(MotionEngineTweenTest, EndsExactlyOnTarget) {
    TweenOptions options;
    options.durationMs = 100.0f;
    options.easing = GetParam();

    target.Seed("left", "20px");
    MotionCompletion completion = engine->Tween(target, Numbers({{"left", 80.0f}}), options);

    const int framesTaken = RunUntilResolved(completion, 20);
    EXPECT_GE(framesTaken, 6);
    EXPECT_LE(framesTaken, 7);
    EXPECT_EQ(MotionOutcome::Completed, completion.GetOutcome());
    EXPECT_EQ("80px", target.Style("left"));
}

INSTANTIATE_TEST_SUITE_P(AllCurves, MotionEngineTweenTest, ::testing::Values(
    Easing::Linear, Easing::EaseIn, Easing::EaseOut, Easing::EaseInOut,
    Easing::EaseInCubic, Easing::EaseOutCubic, Easing::EaseInOutCubic,
    Easing::EaseInQuart, Easing::EaseOutQuart, Easing::EaseInOutQuart,
    Easing::EaseInExpo, Easing::EaseOutExpo, Easing::Bounce));

TEST_F(MotionEngineTest, LinearTweenProgress) {
    TweenOptions options;
    options.durationMs = 100.0f;
    options.easing = Easing::Linear;

    engine->Tween(target, Numbers({{"left", 100.0f}}), options);
    frames.StepFrame();

    EXPECT_NEAR(100.0f / 6.0f, StyleNumber(target.Style("left")), 0.01f);
}

TEST_F(MotionEngineTest, TweenDefaultsFromSettings) {
    MotionCompletion completion = engine->Tween(target, Numbers({{"opacity", 0.0f}}));

    const std::vector<TaskInfo> tasks = engine->GetActiveTasks();
    ASSERT_EQ(1u, tasks.size());
    EXPECT_EQ(AnimationKind::Tween, tasks[0].kind);
    EXPECT_FLOAT_EQ(300.0f, tasks[0].expectedDurationMs);
    EXPECT_EQ(&target, tasks[0].target);

    const int framesTaken = RunUntilResolved(completion);
    EXPECT_GE(framesTaken, 18);
    EXPECT_LE(framesTaken, 19);
}

TEST_F(MotionEngineTest, ZeroDurationTweenCompletesOnFirstFrame) {
    TweenOptions options;
    options.durationMs = 0.0f;

    MotionCompletion completion = engine->Tween(target, Numbers({{"left", 42.0f}}), options);

    EXPECT_EQ(1, RunUntilResolved(completion));
    EXPECT_EQ("42px", target.Style("left"));
}

TEST_F(MotionEngineTest, InvalidTweenTimingIsRejected) {
    TweenOptions negative;
    negative.durationMs = -10.0f;
    MotionCompletion a = engine->Tween(target, Numbers({{"left", 1.0f}}), negative);
    EXPECT_EQ(MotionError::InvalidDuration, a.GetError());

    TweenOptions badDelay;
    badDelay.delayMs = NAN;
    MotionCompletion b = engine->Tween(target, Numbers({{"left", 1.0f}}), badDelay);
    EXPECT_EQ(MotionError::InvalidDelay, b.GetError());

    EXPECT_EQ(0u, engine->GetActiveTaskCount());
    EXPECT_FALSE(engine->IsLoopRunning());
}

// =============================================================================
// Reduced Motion Tests
// =============================================================================

TEST_F(MotionEngineTest, ReducedMotionAppliesImmediately) {
    MotionSettings settings;
    settings.reducedMotion = true;
    CreateEngine(settings);

    MotionCompletion completion = engine->Spring(target, Numbers({{"opacity", 0.0f}}));

    EXPECT_EQ(MotionOutcome::Completed, completion.GetOutcome());
    EXPECT_EQ("0", target.Style("opacity"));
    EXPECT_EQ(0u, frames.GetRequestCount());
    EXPECT_EQ(0u, engine->GetActiveTaskCount());
}

TEST_F(MotionEngineTest, ForcedRequestAnimatesUnderReducedMotion) {
    engine->SetReducedMotion(true);
    EXPECT_TRUE(engine->IsReducedMotion());

    TweenOptions options;
    options.force = true;
    MotionCompletion completion = engine->Tween(target, Numbers({{"left", 10.0f}}), options);

    EXPECT_FALSE(completion.IsResolved());
    EXPECT_TRUE(engine->IsLoopRunning());
}

// =============================================================================
// Supersession Tests
// =============================================================================

TEST_F(MotionEngineTest, NewTaskTakesOverProperty) {
    MotionCompletion first = engine->Spring(target, Numbers({{"left", 100.0f}}));
    MotionCompletion second = engine->Spring(target, Numbers({{"left", -50.0f}}));

    EXPECT_EQ(MotionOutcome::Superseded, first.GetOutcome());
    EXPECT_EQ(1u, engine->GetActiveTaskCount());

    ASSERT_GT(RunUntilResolved(second), 0);
    EXPECT_EQ("-50px", target.Style("left"));
}

TEST_F(MotionEngineTest, PartialOverlapKeepsOtherProperties) {
    MotionCompletion first = engine->Spring(target, Numbers({{"left", 100.0f}, {"opacity", 0.0f}}));
    MotionCompletion second = engine->Spring(target, Numbers({{"left", 30.0f}}));

    EXPECT_FALSE(first.IsResolved());
    EXPECT_EQ(2u, engine->GetActiveTaskCount());

    frames.RunFrames(1000);
    ASSERT_TRUE(first.IsResolved());
    ASSERT_TRUE(second.IsResolved());
    EXPECT_EQ(MotionOutcome::Completed, first.GetOutcome());
    EXPECT_EQ("0", target.Style("opacity"));
    EXPECT_EQ("30px", target.Style("left"));
}

TEST_F(MotionEngineTest, ScaleAndTransformShareOwnership) {
    MotionCompletion scale = engine->Spring(target, Numbers({{"scale", 1.2f}}));
    engine->Tween(target, {{"transform", PropertyValue::FromString("rotate(5deg)")}});

    EXPECT_EQ(MotionOutcome::Superseded, scale.GetOutcome());
}

TEST_F(MotionEngineTest, DifferentTargetsDoNotConflict) {
    FakeMotionTarget other;
    MotionCompletion a = engine->Spring(target, Numbers({{"left", 10.0f}}));
    MotionCompletion b = engine->Spring(other, Numbers({{"left", 20.0f}}));

    EXPECT_FALSE(a.IsResolved());
    EXPECT_EQ(2u, engine->GetActiveTaskCount());
}

// =============================================================================
// Cancellation Tests
// =============================================================================

TEST_F(MotionEngineTest, CancelStopsWritesOnNextFrame) {
    MotionCompletion completion = engine->Spring(target, Numbers({{"left", 100.0f}}));
    frames.StepFrame();

    completion.Cancel();
    target.ClearWrites();
    frames.StepFrame();

    EXPECT_EQ(MotionOutcome::Cancelled, completion.GetOutcome());
    EXPECT_EQ(0u, target.CountWrites("left"));
    EXPECT_EQ(0u, engine->GetActiveTaskCount());
}

TEST_F(MotionEngineTest, CancelledDelayedStartNeverRuns) {
    SpringOptions options;
    options.delayMs = 90.0f;

    MotionCompletion completion = engine->Spring(target, Numbers({{"left", 100.0f}}), options);
    completion.Cancel();

    ASSERT_GT(RunUntilResolved(completion, 20), 0);
    EXPECT_EQ(MotionOutcome::Cancelled, completion.GetOutcome());
    EXPECT_TRUE(target.GetWrites().empty());
}

TEST_F(MotionEngineTest, CancelledDelayedStartResolvesOnNextFrame) {
    SpringOptions options;
    options.delayMs = 1000.0f;

    MotionCompletion completion = engine->Spring(target, Numbers({{"left", 100.0f}}), options);
    frames.StepFrame();
    completion.Cancel();
    frames.StepFrame();

    EXPECT_EQ(MotionOutcome::Cancelled, completion.GetOutcome());
    EXPECT_EQ(0u, engine->GetPendingStartCount());
    EXPECT_FALSE(engine->IsLoopRunning());
    EXPECT_TRUE(target.GetWrites().empty());
}

// =============================================================================
// Delay Tests
// =============================================================================

TEST_F(MotionEngineTest, DelayedStartBeginsOnDueFrame) {
    SpringOptions options;
    options.delayMs = 90.0f;

    engine->Spring(target, Numbers({{"left", 100.0f}}), options);
    EXPECT_EQ(1u, engine->GetPendingStartCount());
    EXPECT_EQ(0u, engine->GetActiveTaskCount());
    EXPECT_TRUE(engine->IsLoopRunning());

    for (int i = 0; i < 5; ++i) {
        frames.StepFrame();
    }
    EXPECT_EQ(0u, engine->GetActiveTaskCount());
    EXPECT_TRUE(target.GetWrites().empty());

    // t = 100ms: started and updated within the same frame
    frames.StepFrame();
    EXPECT_EQ(0u, engine->GetPendingStartCount());
    EXPECT_EQ(1u, engine->GetActiveTaskCount());
    EXPECT_EQ(1u, target.CountWrites("left"));
}

// =============================================================================
// Pause / Resume Tests
// =============================================================================

TEST_F(MotionEngineTest, PauseFreezesTasks) {
    engine->Spring(target, Numbers({{"left", 100.0f}}));
    frames.StepFrame();

    engine->Pause();
    EXPECT_TRUE(engine->IsPaused());
    EXPECT_FALSE(engine->IsLoopRunning());

    target.ClearWrites();
    for (int i = 0; i < 5; ++i) {
        frames.StepFrame();
    }
    EXPECT_TRUE(target.GetWrites().empty());

    engine->Resume();
    EXPECT_TRUE(engine->IsLoopRunning());
    frames.StepFrame();
    EXPECT_EQ(1u, target.CountWrites("left"));
}

TEST_F(MotionEngineTest, ResumeCompensatesPausedTime) {
    TweenOptions options;
    options.durationMs = 100.0f;
    options.easing = Easing::Linear;

    engine->Tween(target, Numbers({{"left", 100.0f}}), options);
    for (int i = 0; i < 3; ++i) {
        frames.StepFrame();
    }
    EXPECT_NEAR(50.0f, StyleNumber(target.Style("left")), 0.01f);

    engine->Pause();
    frames.Advance(1000.0);
    engine->Resume();
    frames.StepFrame();

    // The second of pause does not count as elapsed time
    EXPECT_NEAR(50.0f + 100.0f / 6.0f, StyleNumber(target.Style("left")), 0.01f);
}

TEST_F(MotionEngineTest, ResumeWithoutCompensationJumpsAhead) {
    MotionSettings settings;
    settings.compensatePausedTime = false;
    CreateEngine(settings);

    TweenOptions options;
    options.durationMs = 100.0f;

    MotionCompletion completion = engine->Tween(target, Numbers({{"left", 100.0f}}), options);
    frames.StepFrame();

    engine->Pause();
    frames.Advance(1000.0);
    engine->Resume();
    frames.StepFrame();

    EXPECT_EQ(MotionOutcome::Completed, completion.GetOutcome());
    EXPECT_EQ("100px", target.Style("left"));
}

TEST_F(MotionEngineTest, RequestsWhilePausedWaitForResume) {
    engine->Pause();
    MotionCompletion completion = engine->Spring(target, Numbers({{"left", 10.0f}}));

    EXPECT_EQ(1u, engine->GetActiveTaskCount());
    EXPECT_FALSE(engine->IsLoopRunning());

    engine->Resume();
    EXPECT_GT(RunUntilResolved(completion), 0);
}

TEST_F(MotionEngineTest, VisibilityPausesAndResumes) {
    engine->Spring(target, Numbers({{"left", 100.0f}}));

    engine->SetVisible(false);
    EXPECT_TRUE(engine->IsPaused());
    EXPECT_FALSE(engine->IsVisible());

    engine->SetVisible(true);
    EXPECT_FALSE(engine->IsPaused());
    EXPECT_TRUE(engine->IsLoopRunning());
}

TEST_F(MotionEngineTest, VisibilityKeepsExplicitPause) {
    engine->Spring(target, Numbers({{"left", 100.0f}}));

    engine->Pause();
    engine->SetVisible(false);
    engine->SetVisible(true);
    EXPECT_TRUE(engine->IsPaused());

    engine->SetVisible(false);
    engine->Resume();
    EXPECT_TRUE(engine->IsPaused());

    engine->SetVisible(true);
    EXPECT_FALSE(engine->IsPaused());
}

// =============================================================================
// Failure Isolation Tests
// =============================================================================

TEST_F(MotionEngineTest, FailingTaskIsDroppedWithoutAffectingOthers) {
    FakeMotionTarget broken;
    broken.SetThrowOnWrite(true);

    MotionCompletion bad = engine->Spring(broken, Numbers({{"left", 100.0f}}));
    MotionCompletion good = engine->Spring(target, Numbers({{"left", 100.0f}}));
    CompletionRecorder badRecorder;
    badRecorder.Attach(bad);

    frames.StepFrame();
    EXPECT_EQ(1u, engine->GetActiveTaskCount());
    EXPECT_FALSE(bad.IsResolved());

    ASSERT_GT(RunUntilResolved(good), 0);
    EXPECT_EQ("100px", target.Style("left"));
    EXPECT_EQ(0, badRecorder.calls);
}

TEST_F(MotionEngineTest, ThrowingCallbackDoesNotStopLoop) {
    TweenOptions instant;
    instant.durationMs = 0.0f;

    MotionCompletion first = engine->Tween(target, Numbers({{"opacity", 0.5f}}), instant);
    first.OnResolved([](MotionOutcome) { throw std::runtime_error("callback failed"); });

    FakeMotionTarget other;
    MotionCompletion second = engine->Spring(other, Numbers({{"left", 10.0f}}));

    frames.StepFrame();
    EXPECT_EQ(MotionOutcome::Completed, first.GetOutcome());
    EXPECT_GT(RunUntilResolved(second), 0);
}

TEST_F(MotionEngineTest, ForeignExceptionLeavesRegistryConsistent) {
    TweenOptions instant;
    instant.durationMs = 0.0f;

    FakeMotionTarget broken;
    broken.SetFaultOnWrite(true);
    MotionCompletion bad = engine->Tween(broken, Numbers({{"opacity", 0.5f}}), instant);

    EXPECT_THROW(frames.StepFrame(), HostFault);
    EXPECT_FALSE(engine->IsLoopRunning());

    // Restarting from idle must not report the gap as a dropped frame
    broken.SetFaultOnWrite(false);
    frames.Advance(500.0);
    MotionCompletion next = engine->Tween(target, Numbers({{"opacity", 0.5f}}), instant);
    EXPECT_TRUE(engine->IsLoopRunning());
    frames.StepFrame();

    EXPECT_EQ(MotionOutcome::Completed, bad.GetOutcome());
    EXPECT_EQ(MotionOutcome::Completed, next.GetOutcome());
    EXPECT_EQ(0u, engine->GetRegisteredTaskCount());
    EXPECT_EQ(0u, engine->GetFrameStats().droppedFrames);
}

// =============================================================================
// Lifecycle Tests
// =============================================================================

TEST_F(MotionEngineTest, DestroyCancelsEverything) {
    MotionCompletion running = engine->Spring(target, Numbers({{"left", 100.0f}}));
    SpringOptions delayed;
    delayed.delayMs = 500.0f;
    MotionCompletion pending = engine->Spring(target, Numbers({{"opacity", 0.0f}}), delayed);

    frames.StepFrame();
    engine->Destroy();

    EXPECT_EQ(MotionOutcome::Cancelled, running.GetOutcome());
    EXPECT_EQ(MotionOutcome::Cancelled, pending.GetOutcome());
    EXPECT_EQ(0u, engine->GetActiveTaskCount());
    EXPECT_EQ(0u, engine->GetPendingStartCount());
    EXPECT_FALSE(engine->IsLoopRunning());
    EXPECT_FALSE(frames.HasPendingFrame());
}

TEST_F(MotionEngineTest, DestroyFromCallbackDuringFrame) {
    TweenOptions instant;
    instant.durationMs = 0.0f;

    MotionCompletion first = engine->Tween(target, Numbers({{"opacity", 0.5f}}), instant);
    FakeMotionTarget other;
    MotionCompletion second = engine->Spring(other, Numbers({{"left", 100.0f}}));

    first.OnResolved([this](MotionOutcome) { engine->Destroy(); });
    frames.StepFrame();

    EXPECT_EQ(MotionOutcome::Completed, first.GetOutcome());
    EXPECT_EQ(MotionOutcome::Cancelled, second.GetOutcome());
    EXPECT_TRUE(other.GetWrites().empty());
    EXPECT_FALSE(engine->IsLoopRunning());
}

TEST_F(MotionEngineTest, TransitionChainedFromDestroyIsCancelled) {
    MotionCompletion running = engine->Spring(target, Numbers({{"opacity", 0.0f}}));
    MotionCompletion chained;
    running.OnResolved([this, &chained](MotionOutcome) {
        chained = engine->Spring(target, Numbers({{"left", 10.0f}}));
    });

    frames.StepFrame();
    engine->Destroy();

    EXPECT_EQ(MotionOutcome::Cancelled, running.GetOutcome());
    EXPECT_EQ(MotionOutcome::Cancelled, chained.GetOutcome());
    EXPECT_EQ(0u, engine->GetActiveTaskCount());
    EXPECT_EQ(0u, engine->GetPendingStartCount());
    EXPECT_EQ(0u, frames.GetPendingCount());
    EXPECT_FALSE(engine->IsLoopRunning());
}

TEST_F(MotionEngineTest, TransitionChainedFromTeardownLeavesNoFrameRequest) {
    MotionCompletion running = engine->Spring(target, Numbers({{"opacity", 0.0f}}));
    MotionEngine* raw = engine.get();
    MotionCompletion chained;
    running.OnResolved([this, raw, &chained](MotionOutcome) {
        chained = raw->Spring(target, Numbers({{"left", 10.0f}}));
    });

    frames.StepFrame();
    engine.reset();

    EXPECT_EQ(MotionOutcome::Cancelled, chained.GetOutcome());
    EXPECT_EQ(0u, frames.GetPendingCount());
    EXPECT_EQ(0u, frames.Dispatch());
}

TEST_F(MotionEngineTest, DestroyDuringDelayedStartsCancelsTheRest) {
    MotionCompletion running = engine->Spring(target, Numbers({{"left", 100.0f}}));
    running.OnResolved([this](MotionOutcome outcome) {
        if (outcome == MotionOutcome::Superseded) {
            engine->Destroy();
        }
    });

    SpringOptions delayed;
    delayed.delayMs = 10.0f;
    FakeMotionTarget other;
    MotionCompletion takeover = engine->Spring(target, Numbers({{"left", 0.0f}}), delayed);
    MotionCompletion later = engine->Spring(other, Numbers({{"left", 50.0f}}), delayed);

    // Starting the takeover supersedes the running task, whose callback destroys
    frames.StepFrame();

    EXPECT_EQ(MotionOutcome::Superseded, running.GetOutcome());
    EXPECT_EQ(MotionOutcome::Cancelled, takeover.GetOutcome());
    EXPECT_EQ(MotionOutcome::Cancelled, later.GetOutcome());
    EXPECT_TRUE(other.GetWrites().empty());
    EXPECT_EQ(0u, engine->GetActiveTaskCount());
    EXPECT_EQ(0u, engine->GetRegisteredTaskCount());
    EXPECT_EQ(0u, frames.GetPendingCount());
}

TEST_F(MotionEngineTest, EngineStaysUsableAfterDestroy) {
    engine->Spring(target, Numbers({{"left", 100.0f}}));
    engine->Destroy();

    MotionCompletion completion = engine->Spring(target, Numbers({{"left", 5.0f}}));
    EXPECT_GT(RunUntilResolved(completion), 0);
    EXPECT_EQ("5px", target.Style("left"));
}

TEST_F(MotionEngineTest, ChainedTransitionStartsNextFrame) {
    TweenOptions instant;
    instant.durationMs = 0.0f;

    FakeMotionTarget other;
    MotionCompletion first = engine->Tween(target, Numbers({{"opacity", 0.5f}}), instant);
    first.OnResolved([this, &other](MotionOutcome) {
        engine->Spring(other, Numbers({{"left", 10.0f}}));
    });

    frames.StepFrame();
    EXPECT_EQ(1u, engine->GetActiveTaskCount());
    EXPECT_TRUE(other.GetWrites().empty());
    EXPECT_TRUE(engine->IsLoopRunning());

    frames.StepFrame();
    EXPECT_EQ(1u, other.CountWrites("left"));
}

TEST_F(MotionEngineTest, FrameStatsTrackFrames) {
    engine->Spring(target, Numbers({{"left", 100.0f}}));
    for (int i = 0; i < 3; ++i) {
        frames.StepFrame();
    }

    const FrameStats& stats = engine->GetFrameStats();
    EXPECT_EQ(3u, stats.frameCount);
    EXPECT_NEAR(60.0f, stats.fps, 0.1f);
    EXPECT_EQ(0u, stats.droppedFrames);
}

TEST_F(MotionEngineTest, LongFrameCountsAsDropped) {
    engine->Spring(target, Numbers({{"left", 100.0f}}));
    frames.StepFrame();
    frames.Advance(50.0);
    frames.StepFrame();

    EXPECT_EQ(1u, engine->GetFrameStats().droppedFrames);
}
