#pragma once

#include "motion/MotionCompletion.hpp"
#include "motion/MotionOptions.hpp"
#include "motion/PropertyValue.hpp"

#include <string>
#include <vector>

namespace Kinetic {

class IMotionTarget;
class MotionEngine;

/**
 * @brief Start delay of each child: baseDelayMs + index * staggerDelayMs
 */
[[nodiscard]] std::vector<float> ComputeStaggerDelays(size_t childCount, float baseDelayMs,
                                                      float staggerDelayMs);

/**
 * @brief Spring every child of parent matching childSelector, in document order
 *
 * Resolves when the last child resolves. No matching children resolves
 * Completed at once. Under reduced motion every child receives its final
 * values synchronously.
 */
MotionCompletion RunStagger(MotionEngine& engine, IMotionTarget& parent,
                            const std::string& childSelector, const PropertySet& properties,
                            const StaggerOptions& options);

} // namespace Kinetic
