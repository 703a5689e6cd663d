/**
 * @file PropertyValue.hpp
 * @brief Tagged value returned by a property read.
 */

#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "domain/ObjectKind.hpp"

namespace bacnetinventory::domain {

struct TextValue {
    std::string text;               ///< UTF-8, possibly holding U+FFFD for undecodable input.
};

struct NumberValue {
    double number = 0.0;            ///< Real, double, unsigned or signed application values.
};

struct EnumeratedValue {
    std::uint32_t code = 0;
};

struct ObjectIdValue {
    ObjectId id;
};

/**
 * @brief One application-tagged value of a property.
 */
using PropertyValue = std::variant<TextValue, NumberValue, EnumeratedValue, ObjectIdValue>;

/**
 * @brief Renders any value as display text.
 */
inline std::string ValueToString(const PropertyValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, TextValue>) {
            return v.text;
        } else if constexpr (std::is_same_v<T, NumberValue>) {
            std::ostringstream ss;
            ss << v.number;
            return ss.str();
        } else if constexpr (std::is_same_v<T, EnumeratedValue>) {
            return std::to_string(v.code);
        } else {
            return KindFromObjectType(v.id.type)
                ? KindPrefix(*KindFromObjectType(v.id.type)) + "-" + std::to_string(v.id.instance)
                : std::to_string(v.id.type) + ":" + std::to_string(v.id.instance);
        }
    }, value);
}

} // namespace bacnetinventory::domain
