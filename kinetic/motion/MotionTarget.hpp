#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <glm/glm.hpp>

namespace Kinetic {

/**
 * @brief Axis-aligned bounding rectangle in viewport pixels
 */
struct Rect {
    glm::vec2 position{0.0f};
    glm::vec2 size{0.0f};
};

/**
 * @brief Interaction edges a gesture can listen to
 */
enum class InteractionEvent {
    PointerEnter,
    PointerLeave,
    PointerDown,
    PointerUp,
    Focus,
    Blur
};

using ListenerId = std::uint64_t;

/**
 * @brief A visual node the motion engine animates
 *
 * Implemented by the host UI layer. The engine never owns a target; a
 * target destroyed while animated must be detached by the host (cancel the
 * completion or destroy the engine) or make its writes harmless.
 */
class IMotionTarget {
public:
    virtual ~IMotionTarget() = default;

    /**
     * @brief Current computed value of a property, empty if unset
     */
    [[nodiscard]] virtual std::string GetComputedValue(const std::string& property) const = 0;

    /**
     * @brief Write a property to the presentation state
     */
    virtual void SetStyle(const std::string& property, const std::string& value) = 0;

    /**
     * @brief Layout box of the node
     */
    [[nodiscard]] virtual Rect GetBoundingRect() const = 0;

    /**
     * @brief Force pending style writes to be resolved synchronously
     */
    virtual void FlushStyles() = 0;

    /**
     * @brief Subscribe to an interaction edge
     * @return Listener ID used for removal
     */
    virtual ListenerId AddEventListener(InteractionEvent event, std::function<void()> handler) = 0;

    /**
     * @brief Remove a subscription added by AddEventListener
     */
    virtual void RemoveEventListener(ListenerId listenerId) = 0;

    /**
     * @brief Descendants matching a selector, in document order
     */
    [[nodiscard]] virtual std::vector<IMotionTarget*> QuerySelectorAll(const std::string& selector) = 0;
};

} // namespace Kinetic
