#include "motion/PropertyValue.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace Kinetic {

namespace {

std::string Trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

} // namespace

bool ParseLeadingNumber(const std::string& text, float& value, std::string* unit) {
    const std::string trimmed = Trim(text);
    if (trimmed.empty()) {
        return false;
    }

    // strtof also accepts "inf"/"nan" and hex floats; only decimal input counts
    const char first = trimmed[0];
    const bool decimalStart = std::isdigit(static_cast<unsigned char>(first)) ||
                              first == '-' || first == '+' || first == '.';
    if (!decimalStart) {
        return false;
    }

    const char* begin = trimmed.c_str();
    char* end = nullptr;
    const float parsed = std::strtof(begin, &end);
    if (end == begin || !std::isfinite(parsed)) {
        return false;
    }

    value = parsed;
    if (unit) {
        *unit = Trim(std::string(end));
    }
    return true;
}

PropertyValue PropertyValue::FromNumber(float value) {
    PropertyValue pv;
    pv.type = Type::Number;
    pv.numberValue = value;
    return pv;
}

PropertyValue PropertyValue::FromString(const std::string& value) {
    PropertyValue pv;
    pv.type = Type::String;
    pv.stringValue = value;
    return pv;
}

float PropertyValue::ToNumber() const {
    if (type == Type::Number) {
        return std::isfinite(numberValue) ? numberValue : 0.0f;
    }
    float parsed = 0.0f;
    return ParseLeadingNumber(stringValue, parsed) ? parsed : 0.0f;
}

bool PropertyValue::IsNumeric() const {
    if (type == Type::Number) {
        return true;
    }
    float parsed = 0.0f;
    return ParseLeadingNumber(stringValue, parsed);
}

std::string PropertyValue::Unit() const {
    if (type == Type::Number) {
        return {};
    }
    float parsed = 0.0f;
    std::string unit;
    if (!ParseLeadingNumber(stringValue, parsed, &unit)) {
        return {};
    }
    return unit;
}

bool PropertyValue::operator==(const PropertyValue& other) const {
    if (type != other.type) {
        return false;
    }
    return type == Type::Number ? numberValue == other.numberValue
                                : stringValue == other.stringValue;
}

} // namespace Kinetic
