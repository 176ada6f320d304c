#pragma once

#include "motion/MotionCompletion.hpp"
#include "motion/MotionOptions.hpp"
#include "motion/MotionTarget.hpp"

#include <functional>
#include <string>
#include <glm/glm.hpp>

namespace Kinetic {

class MotionEngine;

/**
 * @brief Inverse transform taking the new layout box back to the old one
 */
struct LayoutDelta {
    glm::vec2 translate{0.0f};
    glm::vec2 scale{1.0f};
};

/**
 * @brief Delta between two layout boxes; a zero sized "after" axis scales by 1
 */
[[nodiscard]] LayoutDelta ComputeLayoutDelta(const Rect& before, const Rect& after);

/**
 * @brief "translate(<x>px, <y>px) scale(<sx>, <sy>)"
 */
[[nodiscard]] std::string FormatLayoutTransform(const LayoutDelta& delta);

/**
 * @brief FLIP transition around a layout mutation
 *
 * Measures the target, runs mutation, measures again, writes the inverse
 * transform with a top left origin and flushes styles, then springs the
 * transform back to identity. The transform is written as "none" once
 * settled.
 */
MotionCompletion RunLayoutTransition(MotionEngine& engine, IMotionTarget& target,
                                     const std::function<void()>& mutation,
                                     const LayoutOptions& options);

} // namespace Kinetic
