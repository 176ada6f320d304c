#pragma once

#include <cstdint>

namespace Kinetic {

/**
 * @brief Snapshot of frame loop timing
 *
 * Diagnostics only. None of these values feed the spring integrator,
 * which always steps by the nominal frame interval.
 */
struct FrameStats {
    double lastFrameTime = 0.0;  // ms, host timebase
    float deltaMs = 0.0f;
    float fps = 0.0f;
    float averageFps = 0.0f;
    std::uint32_t droppedFrames = 0;
    std::uint64_t frameCount = 0;
};

/**
 * @brief Frame timing tracker for the motion loop
 *
 * Fed with host frame timestamps rather than reading a clock itself,
 * so the same numbers come out under a real display and a test harness.
 */
class FrameTimer {
public:
    /**
     * @param nominalFrameMs Expected interval between frames
     * @param droppedFrameFactor A frame longer than nominal * factor counts as dropped
     */
    explicit FrameTimer(float nominalFrameMs = 1000.0f / 60.0f,
                        float droppedFrameFactor = 1.5f) noexcept;

    /**
     * @brief Restart timing from the given timestamp
     *
     * Called when the loop (re)starts so the idle or paused interval is
     * not reported as one enormous frame.
     */
    void Reset(double timestampMs) noexcept;

    /**
     * @brief Record a frame (call once per tick)
     */
    void Update(double timestampMs) noexcept;

    /**
     * @brief Clear the dropped frame counter (after it has been reported)
     */
    void ClearDroppedFrames() noexcept { m_stats.droppedFrames = 0; }

    [[nodiscard]] const FrameStats& GetStats() const noexcept { return m_stats; }
    [[nodiscard]] float GetNominalFrameMs() const noexcept { return m_nominalFrameMs; }

private:
    float m_nominalFrameMs;
    float m_droppedFrameFactor;
    FrameStats m_stats;
    bool m_hasPrevious = false;

    // Average FPS window
    int m_windowFrames = 0;
    float m_windowMs = 0.0f;
};

} // namespace Kinetic
