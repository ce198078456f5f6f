#pragma once

/// @file heap.hpp
/// @brief Reference object model: heap-owned values and types implementing
///        the writer's Value, TypeRef and TypeRegistry interfaces.
///
/// The model mirrors the parts of a dynamic runtime the writer observes:
/// built-in classes, user classes and modules, per-object singleton classes
/// with mixed-in modules, instance variables, and the core value families.

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gm/foundation/marshal_result.hpp"
#include "gm/marshal/value.hpp"

namespace gm::model {

class Heap;
class Object;

/// A class, module, singleton class or included-module wrapper.
class Type final : public marshal::TypeRef {
public:
    enum class Kind : uint8_t {
        Class,
        Module,
        Singleton,
        IncludedModule
    };

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] bool isModule() const override {
        return kind_ == Kind::Module || kind_ == Kind::IncludedModule;
    }
    [[nodiscard]] bool isSingleton() const override { return kind_ == Kind::Singleton; }
    [[nodiscard]] bool isIncludedModule() const override {
        return kind_ == Kind::IncludedModule;
    }
    [[nodiscard]] const TypeRef* includedModule() const override { return module_; }
    [[nodiscard]] const TypeRef* superclass() const override { return superclass_; }
    [[nodiscard]] std::optional<marshal::ClassIndex> builtinIndex() const override {
        return builtin_;
    }
    [[nodiscard]] bool hasOwnMethods() const override { return !methods_.empty(); }
    [[nodiscard]] bool hasVariables() const override { return !variables_.empty(); }

    /// Define a method directly on this type.
    void addMethod(std::string name);

    /// Set an instance variable on the type object itself.
    void setVariable(std::string name, const Object& value);

    [[nodiscard]] const std::vector<std::string>& methods() const noexcept { return methods_; }

private:
    friend class Heap;

    Type(Kind kind, std::string name, Type* superclass,
         std::optional<marshal::ClassIndex> builtin, const Type* module);

    Kind kind_;
    std::string name_;
    Type* superclass_;
    std::optional<marshal::ClassIndex> builtin_;
    const Type* module_;
    std::vector<std::string> methods_;
    std::vector<marshal::Variable> variables_;
};

/// A heap value. Which payload is meaningful depends on nativeIndex().
class Object final : public marshal::Value {
public:
    [[nodiscard]] std::optional<marshal::ClassIndex> nativeIndex() const override {
        return index_;
    }
    [[nodiscard]] bool wrapsNativeData() const override { return wrapsData_; }
    [[nodiscard]] bool isImmediate() const override;
    [[nodiscard]] const marshal::TypeRef& metaClass() const override { return *klass_; }

    [[nodiscard]] bool hasVariables() const override { return !variables_.empty(); }
    [[nodiscard]] std::vector<marshal::Variable> variables() const override {
        return variables_;
    }
    [[nodiscard]] marshal::TextEncoding encoding() const override { return encoding_; }

    [[nodiscard]] int64_t integerValue() const override { return integer_; }
    [[nodiscard]] double floatValue() const override { return float_; }
    [[nodiscard]] marshal::BigInteger bigIntegerValue() const override { return bigInteger_; }
    [[nodiscard]] std::string_view bytes() const override { return bytes_; }

    [[nodiscard]] std::size_t length() const override { return elements_.size(); }
    [[nodiscard]] const marshal::Value* elementAt(std::size_t index) const override;
    [[nodiscard]] std::vector<marshal::HashEntry> entries() const override {
        return entries_;
    }

    /// Append an element to an array.
    /// @return InvalidArgument when this value is not an array.
    foundation::MarshalResult<void> push(const Object& element);

    /// Insert or update a hash entry. Keys match when they are the same
    /// object or equal scalars (integers, floats, strings, symbols); an
    /// update keeps the entry's original position.
    /// @return InvalidArgument when this value is not a hash.
    foundation::MarshalResult<void> set(const Object& key, const Object& value);

    /// Insert or replace an instance variable, keeping definition order.
    /// @return InvalidArgument for immediate values.
    foundation::MarshalResult<void> setVariable(std::string_view name, const Object& value);

    [[nodiscard]] Type& type() const noexcept { return *klass_; }

private:
    friend class Heap;

    Object(std::optional<marshal::ClassIndex> index, Type& klass);

    [[nodiscard]] bool sameKey(const Object& other) const;

    std::optional<marshal::ClassIndex> index_;
    Type* klass_;
    bool wrapsData_ = false;

    int64_t integer_ = 0;
    double float_ = 0.0;
    marshal::BigInteger bigInteger_;
    std::string bytes_;
    marshal::TextEncoding encoding_;
    std::vector<const Object*> elements_;
    std::vector<marshal::HashEntry> entries_;
    std::vector<marshal::Variable> variables_;
};

/// Owns every value and type of one object graph.
///
/// Values and types are never freed before the heap, so references
/// returned by the factories stay valid for the heap's lifetime.
///
/// Example:
/// @code
///   Heap heap;
///   auto& list = heap.array();
///   auto& name = heap.string("x");
///   (void)list.push(name);
///   (void)list.push(name);   // written as a link the second time
///   auto bytes = marshal::dumpToBytes(list, {}, &heap);
/// @endcode
class Heap final : public marshal::TypeRegistry {
public:
    Heap();
    ~Heap() override;

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;
    Heap(Heap&&) = delete;
    Heap& operator=(Heap&&) = delete;

    // ── Types ───────────────────────────────────────────────────────────

    /// Built-in class for a type tag (Bignum maps to Integer).
    [[nodiscard]] Type& builtinClass(marshal::ClassIndex index);

    /// Define (or reopen) a named class. @p superclass defaults to Object.
    Type& defineClass(const std::string& path, Type* superclass = nullptr);

    /// Define a new class under @p path, detaching the previous holder of
    /// the path from it. The old class keeps its name but no longer
    /// resolves through findType().
    Type& redefineClass(const std::string& path, Type* superclass = nullptr);

    /// Define (or reopen) a named module.
    Type& defineModule(const std::string& path);

    /// Create a class with no name ("#<Class:0x...>").
    Type& anonymousClass(Type* superclass = nullptr);

    /// Create a module with no name ("#<Module:0x...>").
    Type& anonymousModule();

    /// Singleton class of @p value, created on first use.
    /// @return InvalidArgument for immediate values.
    foundation::MarshalResult<Type*> singletonOf(Object& value);

    /// Mix @p module into the singleton class of @p value.
    /// @return InvalidArgument if @p module is not a module or @p value is
    ///         immediate.
    foundation::MarshalResult<void> extend(Object& value, const Type& module);

    [[nodiscard]] const marshal::TypeRef* findType(std::string_view path) const override;

    // ── Values ──────────────────────────────────────────────────────────

    [[nodiscard]] Object& nil() noexcept { return *nil_; }
    [[nodiscard]] Object& trueValue() noexcept { return *true_; }
    [[nodiscard]] Object& falseValue() noexcept { return *false_; }
    [[nodiscard]] Object& boolean(bool value) noexcept { return value ? *true_ : *false_; }

    Object& integer(int64_t value);
    Object& floating(double value);
    Object& bigInteger(marshal::BigInteger value);

    /// Big integer from a decimal literal.
    /// @return InvalidBigInteger for malformed text.
    foundation::MarshalResult<Object*> bigIntegerFromDecimal(std::string_view text);

    Object& string(std::string_view bytes,
                   marshal::TextEncoding encoding = marshal::TextEncoding::utf8(),
                   Type* klass = nullptr);
    Object& array(Type* klass = nullptr);
    Object& hash(Type* klass = nullptr);

    /// Interned symbol: the same name always yields the same object.
    Object& symbol(std::string_view name);

    /// Instance of a user class with no built-in payload.
    Object& plainObject(Type& klass);

    Object& regexp(std::string_view source,
                   marshal::TextEncoding encoding = marshal::TextEncoding::usAscii());
    Object& structValue(Type& klass);

    /// Object wrapping opaque native data.
    Object& dataObject(Type& klass);

    /// A value outside every core type family.
    Object& foreign(Type& klass);

    /// The class or module object itself as a value.
    Object& typeValue(Type& type);

    [[nodiscard]] std::size_t objectCount() const noexcept { return objects_.size(); }
    [[nodiscard]] std::size_t typeCount() const noexcept { return types_.size(); }

private:
    Type& newType(Type::Kind kind, std::string name, Type* superclass,
                  std::optional<marshal::ClassIndex> builtin = std::nullopt,
                  const Type* module = nullptr);
    Object& newObject(std::optional<marshal::ClassIndex> index, Type& klass);
    std::string anonymousName(std::string_view kind);

    std::vector<std::unique_ptr<Type>> types_;
    std::vector<std::unique_ptr<Object>> objects_;
    std::unordered_map<std::string, Type*> paths_;
    std::unordered_map<std::string, Object*> symbols_;
    std::array<Type*, 16> builtins_{};

    Object* nil_ = nullptr;
    Object* true_ = nullptr;
    Object* false_ = nullptr;
    std::size_t anonymousCounter_ = 0;
};

} // namespace gm::model
