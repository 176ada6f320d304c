#include "core/FrameTimer.hpp"

namespace Kinetic {

FrameTimer::FrameTimer(float nominalFrameMs, float droppedFrameFactor) noexcept
    : m_nominalFrameMs(nominalFrameMs)
    , m_droppedFrameFactor(droppedFrameFactor)
{
}

void FrameTimer::Reset(double timestampMs) noexcept {
    m_stats.lastFrameTime = timestampMs;
    m_stats.deltaMs = 0.0f;
    m_hasPrevious = true;
    m_windowFrames = 0;
    m_windowMs = 0.0f;
}

void FrameTimer::Update(double timestampMs) noexcept {
    if (!m_hasPrevious) {
        Reset(timestampMs);
    }

    m_stats.deltaMs = static_cast<float>(timestampMs - m_stats.lastFrameTime);
    m_stats.lastFrameTime = timestampMs;

    // Instantaneous FPS
    if (m_stats.deltaMs > 0.0f) {
        m_stats.fps = 1000.0f / m_stats.deltaMs;
    }

    if (m_stats.deltaMs > m_nominalFrameMs * m_droppedFrameFactor) {
        ++m_stats.droppedFrames;
    }

    // Average FPS over a 1 second window
    m_windowMs += m_stats.deltaMs;
    ++m_windowFrames;
    if (m_windowMs >= 1000.0f) {
        m_stats.averageFps = static_cast<float>(m_windowFrames) * 1000.0f / m_windowMs;
        m_windowFrames = 0;
        m_windowMs = 0.0f;
    }

    ++m_stats.frameCount;
}

} // namespace Kinetic
