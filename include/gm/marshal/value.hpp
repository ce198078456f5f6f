#pragma once

/// @file value.hpp
/// @brief Abstract view of the host runtime's object model.
///
/// The writer never owns or mutates values. A host embeds the library by
/// implementing Value and TypeRef over its own objects and classes; the
/// reference implementation lives in gm/model/heap.hpp.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gm/foundation/marshal_result.hpp"

namespace gm::marshal {

/// Built-in type tag a runtime assigns to a value at construction.
///
/// This is the value's *intrinsic* kind: a user subclass of Array still
/// carries ClassIndex::Array.
enum class ClassIndex : uint8_t {
    Nil,
    True,
    False,
    Fixnum,
    Bignum,
    Float,
    String,
    Symbol,
    Array,
    Hash,
    Class,
    Module,
    Object,
    BasicObject,
    Regexp,
    Struct,
};

/// Name of a built-in type tag, for diagnostics.
constexpr std::string_view classIndexName(ClassIndex index) {
    switch (index) {
        case ClassIndex::Nil:         return "nil";
        case ClassIndex::True:        return "true";
        case ClassIndex::False:       return "false";
        case ClassIndex::Fixnum:      return "fixnum";
        case ClassIndex::Bignum:      return "bignum";
        case ClassIndex::Float:       return "float";
        case ClassIndex::String:      return "string";
        case ClassIndex::Symbol:      return "symbol";
        case ClassIndex::Array:       return "array";
        case ClassIndex::Hash:        return "hash";
        case ClassIndex::Class:       return "class";
        case ClassIndex::Module:      return "module";
        case ClassIndex::Object:      return "object";
        case ClassIndex::BasicObject: return "basic object";
        case ClassIndex::Regexp:      return "regexp";
        case ClassIndex::Struct:      return "struct";
    }
    return "unknown";
}

/// Text encoding attached to string-like values.
struct TextEncoding {
    enum class Kind : uint8_t {
        Binary,   ///< Raw bytes; never annotated in the stream.
        UsAscii,  ///< ASCII-compatible; annotated as `E false`.
        Utf8,     ///< Annotated as `E true`.
        Named     ///< Any other charset; annotated by name.
    };

    Kind kind = Kind::Binary;
    std::string name;

    static TextEncoding binary() { return {}; }
    static TextEncoding usAscii() { return {Kind::UsAscii, "US-ASCII"}; }
    static TextEncoding utf8() { return {Kind::Utf8, "UTF-8"}; }
    static TextEncoding named(std::string charset) {
        return {Kind::Named, std::move(charset)};
    }

    [[nodiscard]] bool isBinary() const noexcept { return kind == Kind::Binary; }

    bool operator==(const TextEncoding&) const = default;
};

/// Arbitrary-precision integer as sign and little-endian magnitude bytes.
///
/// The magnitude never carries high zero bytes; zero has an empty
/// magnitude and is never negative.
struct BigInteger {
    bool negative = false;
    std::vector<uint8_t> magnitude;

    /// Convert a machine integer, including INT64_MIN.
    static BigInteger fromInt64(int64_t value);

    /// Parse an optionally signed decimal literal.
    /// @return InvalidBigInteger for empty input or non-digit characters.
    static foundation::MarshalResult<BigInteger> fromDecimal(std::string_view text);

    /// Drop high zero bytes and clear the sign of zero.
    void normalize();

    [[nodiscard]] bool isZero() const noexcept { return magnitude.empty(); }

    bool operator==(const BigInteger&) const = default;
};

/// A class, module, singleton class or included-module wrapper.
class TypeRef {
public:
    virtual ~TypeRef() = default;

    /// Fully qualified path ("Outer::Inner"); anonymous types start with '#'.
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// True for modules (including the module behind a wrapper).
    [[nodiscard]] virtual bool isModule() const = 0;

    /// True for a per-object singleton class.
    [[nodiscard]] virtual bool isSingleton() const = 0;

    /// True for the ancestry entry created when a module is mixed in.
    [[nodiscard]] virtual bool isIncludedModule() const = 0;

    /// For an included-module wrapper, the module it stands for.
    [[nodiscard]] virtual const TypeRef* includedModule() const = 0;

    /// Next type in the ancestry, or nullptr at the root.
    [[nodiscard]] virtual const TypeRef* superclass() const = 0;

    /// Tag of the built-in class this type *is* (not inherits from).
    [[nodiscard]] virtual std::optional<ClassIndex> builtinIndex() const = 0;

    /// True when methods were defined directly on this type.
    [[nodiscard]] virtual bool hasOwnMethods() const = 0;

    /// True when the type object itself carries instance variables.
    [[nodiscard]] virtual bool hasVariables() const = 0;
};

/// Path lookup used to check that a type name refers back to the type.
class TypeRegistry {
public:
    virtual ~TypeRegistry() = default;

    /// @return The type registered under @p path, or nullptr.
    [[nodiscard]] virtual const TypeRef* findType(std::string_view path) const = 0;
};

class Value;

/// One instance variable: name (e.g. "@size") and its value.
struct Variable {
    std::string name;
    const Value* value = nullptr;
};

/// One key/value pair of a hash, in insertion order.
struct HashEntry {
    const Value* key = nullptr;
    const Value* value = nullptr;
};

/// A runtime value as seen by the writer.
///
/// Payload accessors are only meaningful for the matching nativeIndex();
/// the defaults return empty payloads.
class Value {
public:
    virtual ~Value() = default;

    /// Stable identity used for backreferences.
    [[nodiscard]] virtual const void* identity() const { return this; }

    /// Intrinsic type tag; std::nullopt for values outside the core type
    /// families.
    [[nodiscard]] virtual std::optional<ClassIndex> nativeIndex() const = 0;

    /// True for objects wrapping opaque native data with no marshal hook.
    [[nodiscard]] virtual bool wrapsNativeData() const { return false; }

    /// Immediate values (nil, booleans, fixnums) have no identity.
    [[nodiscard]] virtual bool isImmediate() const = 0;

    /// Current type; may be a user subclass or a singleton class.
    [[nodiscard]] virtual const TypeRef& metaClass() const = 0;

    [[nodiscard]] virtual bool hasVariables() const { return false; }

    /// Snapshot of the instance variables in definition order.
    [[nodiscard]] virtual std::vector<Variable> variables() const { return {}; }

    /// Encoding of a string or regexp value.
    [[nodiscard]] virtual TextEncoding encoding() const { return {}; }

    [[nodiscard]] virtual int64_t integerValue() const { return 0; }
    [[nodiscard]] virtual double floatValue() const { return 0.0; }
    [[nodiscard]] virtual BigInteger bigIntegerValue() const { return {}; }

    /// Raw bytes of a string (or the source of a regexp).
    [[nodiscard]] virtual std::string_view bytes() const { return {}; }

    [[nodiscard]] virtual std::size_t length() const { return 0; }
    [[nodiscard]] virtual const Value* elementAt(std::size_t /*index*/) const { return nullptr; }

    [[nodiscard]] virtual std::vector<HashEntry> entries() const { return {}; }
};

} // namespace gm::marshal
