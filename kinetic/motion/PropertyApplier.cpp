#include "motion/PropertyApplier.hpp"
#include "motion/MotionTarget.hpp"

#include <spdlog/fmt/fmt.h>

namespace Kinetic {

PropertyApplier::PropertyApplier(bool gpuAcceleration)
    : m_gpuAcceleration(gpuAcceleration)
{
}

void PropertyApplier::Apply(IMotionTarget& target, const PropertySet& properties) const {
    bool touchesTransform = false;

    for (const auto& [key, value] : properties) {
        const std::string formatted = FormatValue(key, value);

        if (key == "scale") {
            WriteTransform(target, fmt::format("scale({})", formatted));
            touchesTransform = true;
        } else if (key == "transform") {
            WriteTransform(target, formatted);
            touchesTransform = true;
        } else {
            target.SetStyle(key, formatted);
        }
    }

    if (m_gpuAcceleration && touchesTransform) {
        target.SetStyle("will-change", "transform");
    }
}

PropertySet PropertyApplier::ReadInitialValues(const IMotionTarget& target,
                                               const PropertySet& properties) const {
    PropertySet initial;

    for (const auto& [key, value] : properties) {
        if (key == "transform") {
            const std::string computed = target.GetComputedValue("transform");
            initial[key] = PropertyValue::FromString(
                computed.empty() || computed == "none" ? "translate(0, 0)" : computed);
        } else if (key == "scale") {
            initial[key] = PropertyValue::FromNumber(1.0f);
        } else if (key == "opacity") {
            float opacity = 1.0f;
            if (!ParseLeadingNumber(target.GetComputedValue("opacity"), opacity)) {
                opacity = 1.0f;
            }
            initial[key] = PropertyValue::FromNumber(opacity);
        } else {
            const std::string computed = target.GetComputedValue(key);
            initial[key] = computed.empty() ? PropertyValue::FromNumber(0.0f)
                                            : PropertyValue::FromString(computed);
        }
    }

    return initial;
}

std::string PropertyApplier::FormatValue(const std::string& property, const PropertyValue& value) {
    if (value.type == PropertyValue::Type::Number) {
        return FormatNumber(property, value.numberValue);
    }
    return value.stringValue;
}

std::string PropertyApplier::FormatNumber(const std::string& property, float value,
                                          const std::string& unit) {
    if (!unit.empty()) {
        return fmt::format("{}{}", value, unit);
    }
    if (IsUnitless(property)) {
        return fmt::format("{}", value);
    }
    return fmt::format("{}px", value);
}

bool PropertyApplier::IsUnitless(const std::string& property) {
    return property == "opacity" || property == "scale";
}

std::string PropertyApplier::StyleKeyFor(const std::string& property) {
    if (property == "scale") {
        return "transform";
    }
    const auto dot = property.find('.');
    if (dot != std::string::npos) {
        return property.substr(0, dot);
    }
    return property;
}

void PropertyApplier::WriteTransform(IMotionTarget& target, const std::string& transform) const {
    if (!m_gpuAcceleration) {
        target.SetStyle("transform", transform);
        return;
    }
    if (transform.empty() || transform == "none") {
        target.SetStyle("transform", "translateZ(0)");
    } else {
        target.SetStyle("transform", transform + " translateZ(0)");
    }
}

} // namespace Kinetic
