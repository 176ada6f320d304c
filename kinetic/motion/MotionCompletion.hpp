#pragma once

#include "motion/MotionError.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace Kinetic {

/**
 * @brief How a transition ended
 */
enum class MotionOutcome {
    Completed,   ///< Reached its target values
    Cancelled,   ///< Cancelled by the caller or dropped by Destroy()
    Superseded,  ///< Every property was taken over by a newer transition
    Rejected     ///< Refused at the request boundary (see GetError())
};

[[nodiscard]] const char* MotionOutcomeToString(MotionOutcome outcome) noexcept;

/**
 * @brief Single-resolution completion signal of a transition
 *
 * Copies share state. The signal resolves at most once; later Resolve()
 * calls are ignored. Callbacks registered after resolution run immediately.
 * Cancel() is the task's cancellation token: the scheduler checks it at the
 * top of the task's next frame and resolves the signal as Cancelled.
 */
class MotionCompletion {
public:
    using Callback = std::function<void(MotionOutcome)>;

    MotionCompletion();

    static MotionCompletion Resolved(MotionOutcome outcome);
    static MotionCompletion Rejected(MotionError error);

    /**
     * @brief Resolves once every child has resolved
     *
     * Outcome is Completed if all children completed, else the outcome of the
     * first child (by position) that did not. Cancel() forwards to children.
     */
    static MotionCompletion All(std::vector<MotionCompletion> children);

    [[nodiscard]] bool IsResolved() const;
    [[nodiscard]] std::optional<MotionOutcome> GetOutcome() const;
    [[nodiscard]] std::optional<MotionError> GetError() const;

    void OnResolved(Callback callback);

    /**
     * @brief Request cancellation
     */
    void Cancel();
    [[nodiscard]] bool IsCancelRequested() const;

    /**
     * @brief Fulfil the signal
     * @return false if it was already resolved
     */
    bool Resolve(MotionOutcome outcome);

    /**
     * @brief Fulfil the signal as Rejected with a reason
     */
    bool Reject(MotionError error);

    /**
     * @brief True if both handles refer to the same signal
     */
    [[nodiscard]] bool SharesStateWith(const MotionCompletion& other) const {
        return m_state == other.m_state;
    }

private:
    struct State {
        std::optional<MotionOutcome> outcome;
        std::optional<MotionError> error;
        bool cancelRequested = false;
        std::vector<Callback> callbacks;
        std::vector<MotionCompletion> children;
    };

    std::shared_ptr<State> m_state;
};

} // namespace Kinetic
