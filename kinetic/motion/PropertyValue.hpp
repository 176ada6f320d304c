#pragma once

#include <map>
#include <string>

namespace Kinetic {

/**
 * @brief Animatable property value
 *
 * Either a plain number or a string. Strings are a number with a unit
 * ("12px", "50%") or an opaque keyword/expression ("none", "rotate(4deg)").
 */
struct PropertyValue {
    enum class Type { Number, String };
    Type type = Type::Number;
    float numberValue = 0;
    std::string stringValue;

    static PropertyValue FromNumber(float value);
    static PropertyValue FromString(const std::string& value);

    /**
     * @brief Best-effort numeric reading (leading number of a string, 0 if none)
     */
    [[nodiscard]] float ToNumber() const;

    /**
     * @brief True for numbers and for strings that start with a number
     */
    [[nodiscard]] bool IsNumeric() const;

    /**
     * @brief Unit suffix following the number of a string value ("px", "%"), else empty
     */
    [[nodiscard]] std::string Unit() const;

    bool operator==(const PropertyValue& other) const;
};

/**
 * @brief Property name to value
 */
using PropertySet = std::map<std::string, PropertyValue>;

/**
 * @brief parseFloat-style parse: leading number of text, rest is the unit
 * @param text Input
 * @param unit Optional receiver for the trailing text (trimmed)
 * @return true if a finite number was found
 */
bool ParseLeadingNumber(const std::string& text, float& value, std::string* unit = nullptr);

} // namespace Kinetic
