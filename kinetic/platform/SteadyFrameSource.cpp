#include "platform/SteadyFrameSource.hpp"

#include <thread>
#include <utility>

namespace Kinetic {

SteadyFrameSource::SteadyFrameSource(float targetFps)
    : m_epoch(Clock::now())
    , m_frameInterval(std::chrono::duration_cast<Clock::duration>(
          std::chrono::duration<double>(1.0 / (targetFps > 0.0f ? targetFps : 60.0f))))
{
}

FrameRequestId SteadyFrameSource::RequestFrame(FrameCallback callback) {
    const FrameRequestId id = m_nextRequestId++;
    m_pending.emplace(id, std::move(callback));
    return id;
}

void SteadyFrameSource::CancelFrame(FrameRequestId requestId) {
    m_pending.erase(requestId);
}

double SteadyFrameSource::Now() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - m_epoch).count();
}

size_t SteadyFrameSource::DispatchFrame() {
    // Callbacks re-request into m_pending; those belong to the next frame
    std::map<FrameRequestId, FrameCallback> frame;
    frame.swap(m_pending);

    const double timestamp = Now();
    for (auto& [id, callback] : frame) {
        callback(timestamp);
    }
    return frame.size();
}

size_t SteadyFrameSource::RunUntilIdle(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    auto nextFrame = Clock::now();
    size_t frames = 0;

    while (HasPendingFrame() && Clock::now() < deadline) {
        nextFrame += m_frameInterval;
        std::this_thread::sleep_until(nextFrame);
        DispatchFrame();
        ++frames;
    }

    return frames;
}

} // namespace Kinetic
