#pragma once

#include "motion/FrameSource.hpp"

#include <chrono>
#include <map>

namespace Kinetic {

/**
 * @brief Frame source on std::chrono::steady_clock for hosts without a vsync callback
 *
 * Requests are queued and fired by DispatchFrame(), which the host calls
 * from its own loop. RunUntilIdle() drives the queue at a fixed rate until
 * nothing re-requests a frame.
 */
class SteadyFrameSource : public IFrameSource {
public:
    explicit SteadyFrameSource(float targetFps = 60.0f);

    FrameRequestId RequestFrame(FrameCallback callback) override;
    void CancelFrame(FrameRequestId requestId) override;
    [[nodiscard]] double Now() const override;

    /**
     * @brief Fire every pending request with the current timestamp
     * @return Number of callbacks run
     */
    size_t DispatchFrame();

    [[nodiscard]] bool HasPendingFrame() const { return !m_pending.empty(); }

    /**
     * @brief Dispatch frames at the target rate until idle or timeout
     * @return Number of frames dispatched
     */
    size_t RunUntilIdle(std::chrono::milliseconds timeout = std::chrono::seconds(10));

private:
    using Clock = std::chrono::steady_clock;

    Clock::time_point m_epoch;
    Clock::duration m_frameInterval;
    std::map<FrameRequestId, FrameCallback> m_pending;
    FrameRequestId m_nextRequestId = 1;
};

} // namespace Kinetic
