#include "motion/MotionCompletion.hpp"

#include <utility>

namespace Kinetic {

const char* MotionOutcomeToString(MotionOutcome outcome) noexcept {
    switch (outcome) {
        case MotionOutcome::Completed:  return "completed";
        case MotionOutcome::Cancelled:  return "cancelled";
        case MotionOutcome::Superseded: return "superseded";
        case MotionOutcome::Rejected:   return "rejected";
        default: return "unknown";
    }
}

MotionCompletion::MotionCompletion()
    : m_state(std::make_shared<State>())
{
}

MotionCompletion MotionCompletion::Resolved(MotionOutcome outcome) {
    MotionCompletion completion;
    completion.Resolve(outcome);
    return completion;
}

MotionCompletion MotionCompletion::Rejected(MotionError error) {
    MotionCompletion completion;
    completion.Reject(error);
    return completion;
}

MotionCompletion MotionCompletion::All(std::vector<MotionCompletion> children) {
    if (children.empty()) {
        return Resolved(MotionOutcome::Completed);
    }

    MotionCompletion combined;
    combined.m_state->children = children;

    // Children hold only a weak reference back, so an abandoned child never
    // keeps the combined state alive.
    std::weak_ptr<State> weakCombined = combined.m_state;
    auto remaining = std::make_shared<size_t>(children.size());

    for (auto& child : children) {
        child.OnResolved([weakCombined, remaining](MotionOutcome) {
            if (--(*remaining) > 0) {
                return;
            }
            auto state = weakCombined.lock();
            if (!state) {
                return;
            }

            MotionOutcome outcome = MotionOutcome::Completed;
            for (const auto& c : state->children) {
                const auto childOutcome = c.GetOutcome();
                if (childOutcome && *childOutcome != MotionOutcome::Completed) {
                    outcome = *childOutcome;
                    break;
                }
            }

            MotionCompletion handle;
            handle.m_state = state;
            handle.Resolve(outcome);
        });
    }

    return combined;
}

bool MotionCompletion::IsResolved() const {
    return m_state->outcome.has_value();
}

std::optional<MotionOutcome> MotionCompletion::GetOutcome() const {
    return m_state->outcome;
}

std::optional<MotionError> MotionCompletion::GetError() const {
    return m_state->error;
}

void MotionCompletion::OnResolved(Callback callback) {
    if (!callback) {
        return;
    }
    if (m_state->outcome) {
        callback(*m_state->outcome);
        return;
    }
    m_state->callbacks.push_back(std::move(callback));
}

void MotionCompletion::Cancel() {
    if (m_state->outcome) {
        return;
    }
    m_state->cancelRequested = true;
    for (auto& child : m_state->children) {
        child.Cancel();
    }
}

bool MotionCompletion::IsCancelRequested() const {
    return m_state->cancelRequested;
}

bool MotionCompletion::Resolve(MotionOutcome outcome) {
    if (m_state->outcome) {
        return false;
    }

    m_state->outcome = outcome;
    m_state->children.clear();

    // Keep the state alive while callbacks run; one may drop the last handle
    auto state = m_state;
    auto callbacks = std::move(state->callbacks);
    state->callbacks.clear();
    for (auto& callback : callbacks) {
        callback(outcome);
    }
    return true;
}

bool MotionCompletion::Reject(MotionError error) {
    if (m_state->outcome) {
        return false;
    }
    m_state->error = error;
    return Resolve(MotionOutcome::Rejected);
}

} // namespace Kinetic
