#pragma once

/// @file type_classifier.hpp
/// @brief Maps a value's intrinsic type tag to the shape that drives its
///        encoding.

#include <cstdint>
#include <string>
#include <string_view>

#include "gm/foundation/marshal_result.hpp"
#include "gm/marshal/value.hpp"

namespace gm::marshal {

/// Encodable shapes. Classification ignores user subclassing: an instance
/// of `class Stack < Array` is Shape::Array.
enum class Shape : uint8_t {
    Nil,
    True,
    False,
    Integer,
    BigInteger,
    Float,
    String,
    Array,
    Hash,
};

constexpr std::string_view shapeName(Shape shape) {
    switch (shape) {
        case Shape::Nil:        return "nil";
        case Shape::True:       return "true";
        case Shape::False:      return "false";
        case Shape::Integer:    return "integer";
        case Shape::BigInteger: return "big integer";
        case Shape::Float:      return "float";
        case Shape::String:     return "string";
        case Shape::Array:      return "array";
        case Shape::Hash:       return "hash";
    }
    return "unknown";
}

/// Classify @p value by its intrinsic type tag.
///
/// @return The shape, or
///   - UnsupportedShape for class, module, plain object, struct, regexp and
///     symbol values, which have no encoding here;
///   - UnrecognizedType for values outside the core type families and for
///     objects wrapping opaque native data.
[[nodiscard]] foundation::MarshalResult<Shape> classify(const Value& value);

/// Name used in diagnostics for the value's current type.
[[nodiscard]] std::string displayTypeName(const Value& value);

} // namespace gm::marshal
