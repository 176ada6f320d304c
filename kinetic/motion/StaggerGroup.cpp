#include "motion/StaggerGroup.hpp"
#include "core/Logger.hpp"
#include "motion/MotionEngine.hpp"
#include "motion/MotionTarget.hpp"

#include <cmath>

namespace Kinetic {

std::vector<float> ComputeStaggerDelays(size_t childCount, float baseDelayMs, float staggerDelayMs) {
    std::vector<float> delays;
    delays.reserve(childCount);
    for (size_t i = 0; i < childCount; ++i) {
        delays.push_back(baseDelayMs + static_cast<float>(i) * staggerDelayMs);
    }
    return delays;
}

MotionCompletion RunStagger(MotionEngine& engine, IMotionTarget& parent,
                            const std::string& childSelector, const PropertySet& properties,
                            const StaggerOptions& options) {
    const float staggerDelay = options.staggerDelayMs.value_or(engine.GetSettings().staggerDelayMs);
    if (!std::isfinite(staggerDelay) || staggerDelay < 0.0f) {
        KINETIC_LOG_WARN("Rejected stagger on '{}': invalid stagger delay {}", childSelector, staggerDelay);
        return MotionCompletion::Rejected(MotionError::InvalidDelay);
    }

    const std::vector<IMotionTarget*> children = parent.QuerySelectorAll(childSelector);
    if (children.empty()) {
        KINETIC_LOG_DEBUG("Stagger on '{}' matched no children", childSelector);
        return MotionCompletion::Resolved(MotionOutcome::Completed);
    }

    const std::vector<float> delays = ComputeStaggerDelays(children.size(), options.spring.delayMs, staggerDelay);

    std::vector<MotionCompletion> completions;
    completions.reserve(children.size());

    for (size_t i = 0; i < children.size(); ++i) {
        SpringOptions childOptions = options.spring;
        childOptions.delayMs = delays[i];
        completions.push_back(engine.Spring(*children[i], properties, childOptions));
    }

    KINETIC_LOG_TRACE("Staggered {} children of '{}' every {:.0f}ms", children.size(), childSelector, staggerDelay);
    return MotionCompletion::All(std::move(completions));
}

} // namespace Kinetic
