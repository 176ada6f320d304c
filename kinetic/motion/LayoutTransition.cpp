#include "motion/LayoutTransition.hpp"
#include "core/Logger.hpp"
#include "motion/MotionEngine.hpp"

#include <spdlog/fmt/fmt.h>

namespace Kinetic {

namespace {

constexpr const char* kChannelX = "transform.x";
constexpr const char* kChannelY = "transform.y";
constexpr const char* kChannelScaleX = "transform.scaleX";
constexpr const char* kChannelScaleY = "transform.scaleY";

float Channel(const PropertySet& values, const char* key, float fallback) {
    auto it = values.find(key);
    return it != values.end() ? it->second.ToNumber() : fallback;
}

} // anonymous namespace

LayoutDelta ComputeLayoutDelta(const Rect& before, const Rect& after) {
    LayoutDelta delta;
    delta.translate = before.position - after.position;
    delta.scale.x = after.size.x != 0.0f ? before.size.x / after.size.x : 1.0f;
    delta.scale.y = after.size.y != 0.0f ? before.size.y / after.size.y : 1.0f;
    return delta;
}

std::string FormatLayoutTransform(const LayoutDelta& delta) {
    return fmt::format("translate({}px, {}px) scale({}, {})",
                       delta.translate.x, delta.translate.y, delta.scale.x, delta.scale.y);
}

MotionCompletion RunLayoutTransition(MotionEngine& engine, IMotionTarget& target,
                                     const std::function<void()>& mutation,
                                     const LayoutOptions& options) {
    const PropertyApplier& applier = engine.GetApplier();

    if (engine.ShouldSkipAnimation(options.force)) {
        if (mutation) {
            mutation();
        }
        applier.Apply(target, {{"transform", PropertyValue::FromString("none")}});
        return MotionCompletion::Resolved(MotionOutcome::Completed);
    }

    const Rect before = target.GetBoundingRect();
    if (mutation) {
        mutation();
    }
    const Rect after = target.GetBoundingRect();

    const LayoutDelta delta = ComputeLayoutDelta(before, after);
    KINETIC_LOG_TRACE("Layout transition: {}", FormatLayoutTransform(delta));

    target.SetStyle("transform-origin", "top left");
    applier.Apply(target, {{"transform", PropertyValue::FromString(FormatLayoutTransform(delta))}});
    target.FlushStyles();

    const PropertySet from = {
        {kChannelX, PropertyValue::FromNumber(delta.translate.x)},
        {kChannelY, PropertyValue::FromNumber(delta.translate.y)},
        {kChannelScaleX, PropertyValue::FromNumber(delta.scale.x)},
        {kChannelScaleY, PropertyValue::FromNumber(delta.scale.y)},
    };
    const PropertySet to = {
        {kChannelX, PropertyValue::FromNumber(0.0f)},
        {kChannelY, PropertyValue::FromNumber(0.0f)},
        {kChannelScaleX, PropertyValue::FromNumber(1.0f)},
        {kChannelScaleY, PropertyValue::FromNumber(1.0f)},
    };

    SpringOptions springOptions;
    springOptions.preset = options.preset;
    springOptions.force = true;

    FrameWriter writer = [&applier](IMotionTarget& node, const PropertySet& values, bool settled) {
        if (settled) {
            applier.Apply(node, {{"transform", PropertyValue::FromString("none")}});
            return;
        }

        LayoutDelta frame;
        frame.translate.x = Channel(values, kChannelX, 0.0f);
        frame.translate.y = Channel(values, kChannelY, 0.0f);
        frame.scale.x = Channel(values, kChannelScaleX, 1.0f);
        frame.scale.y = Channel(values, kChannelScaleY, 1.0f);
        applier.Apply(node, {{"transform", PropertyValue::FromString(FormatLayoutTransform(frame))}});
    };

    return engine.SpringFrom(target, from, to, springOptions, std::move(writer));
}

} // namespace Kinetic
