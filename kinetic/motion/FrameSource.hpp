#pragma once

#include <cstdint>
#include <functional>

namespace Kinetic {

/**
 * @brief Called once per display frame with the frame timestamp (ms)
 */
using FrameCallback = std::function<void(double timestampMs)>;

using FrameRequestId = std::uint64_t;

/**
 * @brief Host display clock
 *
 * Mirrors a vsync-driven "request animation frame" API. A request fires at
 * most once; callers re-request from inside the callback to keep running.
 * Hidden or minimized hosts are expected to stop delivering frames.
 */
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    /**
     * @brief Schedule callback for the next frame
     */
    virtual FrameRequestId RequestFrame(FrameCallback callback) = 0;

    /**
     * @brief Cancel a pending request (no-op if it already fired)
     */
    virtual void CancelFrame(FrameRequestId requestId) = 0;

    /**
     * @brief Monotonic time in ms, same timebase as frame timestamps
     */
    [[nodiscard]] virtual double Now() const = 0;
};

} // namespace Kinetic
