#pragma once

#include "motion/MotionTarget.hpp"
#include "motion/PropertyValue.hpp"
#include "motion/SpringModel.hpp"

#include <optional>
#include <vector>

namespace Kinetic {

class MotionEngine;

/**
 * @brief Property sets for each interaction phase
 *
 * A phase without a set is not bound. Leaving a phase springs back to
 * initial (an empty set when absent).
 */
struct GestureMap {
    std::optional<PropertySet> initial;
    std::optional<PropertySet> hover;
    std::optional<PropertySet> tap;
    std::optional<PropertySet> focus;
};

enum class GesturePhase {
    Hover,
    Tap,
    Focus
};

[[nodiscard]] const char* GesturePhaseName(GesturePhase phase) noexcept;

/**
 * @brief Preset a phase springs with (hover: snappy, tap: stiff, focus: gentle)
 */
[[nodiscard]] SpringPreset GetGesturePreset(GesturePhase phase) noexcept;

/**
 * @brief Listeners attached by one Gesture() call
 *
 * Move-only. Detach() removes exactly the listeners this binding added and
 * is safe to call more than once. Destroying a binding does not detach: the
 * gestures stay live for as long as the target keeps its listeners.
 */
class GestureBinding {
public:
    GestureBinding() = default;
    GestureBinding(IMotionTarget& target, std::vector<ListenerId> listeners);

    GestureBinding(GestureBinding&& other) noexcept;
    GestureBinding& operator=(GestureBinding&& other) noexcept;
    GestureBinding(const GestureBinding&) = delete;
    GestureBinding& operator=(const GestureBinding&) = delete;

    void Detach();

    [[nodiscard]] bool IsAttached() const { return m_target != nullptr; }
    [[nodiscard]] size_t GetListenerCount() const { return m_listeners.size(); }

private:
    IMotionTarget* m_target = nullptr;
    std::vector<ListenerId> m_listeners;
};

/**
 * @brief Subscribe enter/exit listeners for every phase present in gestures
 */
[[nodiscard]] GestureBinding BindGestures(MotionEngine& engine, IMotionTarget& target,
                                          const GestureMap& gestures);

} // namespace Kinetic
