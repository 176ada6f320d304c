#pragma once

#include "motion/PropertyValue.hpp"

#include <string>

namespace Kinetic {

class IMotionTarget;

/**
 * @brief Converts logical property values to presentation-state writes
 *
 * Numbers are written in pixels except for the unitless "opacity" and
 * "scale"; "scale" is written as a transform. With GPU acceleration on,
 * transform writes carry a translateZ(0) layer hint.
 */
class PropertyApplier {
public:
    explicit PropertyApplier(bool gpuAcceleration = true);

    /**
     * @brief Write every property to the target
     */
    void Apply(IMotionTarget& target, const PropertySet& properties) const;

    /**
     * @brief Starting values for an animation of the given properties
     */
    [[nodiscard]] PropertySet ReadInitialValues(const IMotionTarget& target,
                                                const PropertySet& properties) const;

    /**
     * @brief Format one value for writing ("12px", "0.5", verbatim strings)
     */
    [[nodiscard]] static std::string FormatValue(const std::string& property, const PropertyValue& value);

    /**
     * @brief Format a number, using unit if given, else px (or nothing for unitless properties)
     */
    [[nodiscard]] static std::string FormatNumber(const std::string& property, float value,
                                                  const std::string& unit = "");

    [[nodiscard]] static bool IsUnitless(const std::string& property);

    /**
     * @brief Style property actually written for a logical property
     *
     * "scale" and "transform.<channel>" both land on "transform".
     */
    [[nodiscard]] static std::string StyleKeyFor(const std::string& property);

    [[nodiscard]] bool IsGpuAccelerated() const { return m_gpuAcceleration; }

private:
    void WriteTransform(IMotionTarget& target, const std::string& transform) const;

    bool m_gpuAcceleration;
};

} // namespace Kinetic
