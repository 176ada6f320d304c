#include "motion/GestureBinder.hpp"
#include "core/Logger.hpp"
#include "motion/MotionEngine.hpp"

#include <utility>

namespace Kinetic {

const char* GesturePhaseName(GesturePhase phase) noexcept {
    switch (phase) {
        case GesturePhase::Hover: return "hover";
        case GesturePhase::Tap:   return "tap";
        case GesturePhase::Focus: return "focus";
        default: return "unknown";
    }
}

SpringPreset GetGesturePreset(GesturePhase phase) noexcept {
    switch (phase) {
        case GesturePhase::Hover: return SpringPreset::Snappy;
        case GesturePhase::Tap:   return SpringPreset::Stiff;
        case GesturePhase::Focus: return SpringPreset::Gentle;
        default: return SpringPreset::Smooth;
    }
}

GestureBinding::GestureBinding(IMotionTarget& target, std::vector<ListenerId> listeners)
    : m_target(&target)
    , m_listeners(std::move(listeners))
{
}

GestureBinding::GestureBinding(GestureBinding&& other) noexcept
    : m_target(std::exchange(other.m_target, nullptr))
    , m_listeners(std::move(other.m_listeners))
{
    other.m_listeners.clear();
}

GestureBinding& GestureBinding::operator=(GestureBinding&& other) noexcept {
    if (this != &other) {
        m_target = std::exchange(other.m_target, nullptr);
        m_listeners = std::move(other.m_listeners);
        other.m_listeners.clear();
    }
    return *this;
}

void GestureBinding::Detach() {
    if (!m_target) {
        return;
    }

    for (ListenerId id : m_listeners) {
        m_target->RemoveEventListener(id);
    }

    KINETIC_LOG_TRACE("Detached {} gesture listeners", m_listeners.size());
    m_listeners.clear();
    m_target = nullptr;
}

namespace {

struct PhaseEvents {
    GesturePhase phase;
    InteractionEvent enter;
    InteractionEvent exit;
    const std::optional<PropertySet>* properties;
};

} // anonymous namespace

GestureBinding BindGestures(MotionEngine& engine, IMotionTarget& target, const GestureMap& gestures) {
    const PropertySet rest = gestures.initial.value_or(PropertySet{});

    const PhaseEvents phases[] = {
        {GesturePhase::Hover, InteractionEvent::PointerEnter, InteractionEvent::PointerLeave, &gestures.hover},
        {GesturePhase::Tap,   InteractionEvent::PointerDown,  InteractionEvent::PointerUp,    &gestures.tap},
        {GesturePhase::Focus, InteractionEvent::Focus,        InteractionEvent::Blur,         &gestures.focus},
    };

    std::vector<ListenerId> listeners;

    for (const auto& entry : phases) {
        if (!entry.properties->has_value()) {
            continue;
        }

        SpringOptions options;
        options.preset = GetGesturePreset(entry.phase);

        // Listeners hold the engine and target by reference; Detach() before either goes away
        const PropertySet active = **entry.properties;
        listeners.push_back(target.AddEventListener(entry.enter, [&engine, &target, active, options]() {
            engine.Spring(target, active, options);
        }));
        listeners.push_back(target.AddEventListener(entry.exit, [&engine, &target, rest, options]() {
            engine.Spring(target, rest, options);
        }));

        KINETIC_LOG_TRACE("Bound {} gesture ({} properties)", GesturePhaseName(entry.phase), active.size());
    }

    return GestureBinding(target, std::move(listeners));
}

} // namespace Kinetic
