/// @file heap.cpp
/// @brief Reference object model implementation.

#include "gm/model/heap.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace gm::model {

using foundation::ErrorCode;
using foundation::MarshalError;
using foundation::MarshalResult;
using marshal::ClassIndex;

namespace {

std::size_t slot(ClassIndex index) {
    return static_cast<std::size_t>(index == ClassIndex::Bignum ? ClassIndex::Fixnum : index);
}

} // namespace

// ---------------------------------------------------------------------------
// Type
// ---------------------------------------------------------------------------

Type::Type(Kind kind, std::string name, Type* superclass,
           std::optional<ClassIndex> builtin, const Type* module)
    : kind_(kind),
      name_(std::move(name)),
      superclass_(superclass),
      builtin_(builtin),
      module_(module) {}

void Type::addMethod(std::string name) {
    methods_.push_back(std::move(name));
}

void Type::setVariable(std::string name, const Object& value) {
    for (auto& var : variables_) {
        if (var.name == name) {
            var.value = &value;
            return;
        }
    }
    variables_.push_back({std::move(name), &value});
}

// ---------------------------------------------------------------------------
// Object
// ---------------------------------------------------------------------------

Object::Object(std::optional<ClassIndex> index, Type& klass)
    : index_(index), klass_(&klass) {}

bool Object::isImmediate() const {
    if (!index_) {
        return false;
    }
    switch (*index_) {
        case ClassIndex::Nil:
        case ClassIndex::True:
        case ClassIndex::False:
        case ClassIndex::Fixnum:
            return true;
        default:
            return false;
    }
}

const marshal::Value* Object::elementAt(std::size_t index) const {
    return index < elements_.size() ? elements_[index] : nullptr;
}

MarshalResult<void> Object::push(const Object& element) {
    if (index_ != ClassIndex::Array) {
        return MarshalResult<void>::err(
            MarshalError(ErrorCode::InvalidArgument, "push on a non-array value"));
    }
    elements_.push_back(&element);
    return MarshalResult<void>::ok();
}

bool Object::sameKey(const Object& other) const {
    if (this == &other) {
        return true;
    }
    if (index_ != other.index_ || !index_) {
        return false;
    }
    switch (*index_) {
        case ClassIndex::Fixnum: return integer_ == other.integer_;
        case ClassIndex::Float:  return float_ == other.float_;
        case ClassIndex::Bignum: return bigInteger_ == other.bigInteger_;
        case ClassIndex::String:
        case ClassIndex::Symbol: return bytes_ == other.bytes_;
        default:                 return false;
    }
}

MarshalResult<void> Object::set(const Object& key, const Object& value) {
    if (index_ != ClassIndex::Hash) {
        return MarshalResult<void>::err(
            MarshalError(ErrorCode::InvalidArgument, "set on a non-hash value"));
    }
    for (auto& entry : entries_) {
        if (static_cast<const Object*>(entry.key)->sameKey(key)) {
            entry.value = &value;
            return MarshalResult<void>::ok();
        }
    }
    entries_.push_back({&key, &value});
    return MarshalResult<void>::ok();
}

MarshalResult<void> Object::setVariable(std::string_view name, const Object& value) {
    if (isImmediate()) {
        return MarshalResult<void>::err(MarshalError(
            ErrorCode::InvalidArgument,
            "can't set instance variable " + std::string(name) + " on an immediate value"));
    }
    for (auto& var : variables_) {
        if (var.name == name) {
            var.value = &value;
            return MarshalResult<void>::ok();
        }
    }
    variables_.push_back({std::string(name), &value});
    return MarshalResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Heap: construction
// ---------------------------------------------------------------------------

Heap::Heap() {
    auto& basic = newType(Type::Kind::Class, "BasicObject", nullptr, ClassIndex::BasicObject);
    auto& object = newType(Type::Kind::Class, "Object", &basic, ClassIndex::Object);
    auto& module = newType(Type::Kind::Class, "Module", &object, ClassIndex::Module);
    newType(Type::Kind::Class, "Class", &module, ClassIndex::Class);

    newType(Type::Kind::Class, "NilClass", &object, ClassIndex::Nil);
    newType(Type::Kind::Class, "TrueClass", &object, ClassIndex::True);
    newType(Type::Kind::Class, "FalseClass", &object, ClassIndex::False);
    newType(Type::Kind::Class, "Integer", &object, ClassIndex::Fixnum);
    newType(Type::Kind::Class, "Float", &object, ClassIndex::Float);
    newType(Type::Kind::Class, "String", &object, ClassIndex::String);
    newType(Type::Kind::Class, "Symbol", &object, ClassIndex::Symbol);
    newType(Type::Kind::Class, "Array", &object, ClassIndex::Array);
    newType(Type::Kind::Class, "Hash", &object, ClassIndex::Hash);
    newType(Type::Kind::Class, "Regexp", &object, ClassIndex::Regexp);
    newType(Type::Kind::Class, "Struct", &object, ClassIndex::Struct);

    nil_ = &newObject(ClassIndex::Nil, builtinClass(ClassIndex::Nil));
    true_ = &newObject(ClassIndex::True, builtinClass(ClassIndex::True));
    false_ = &newObject(ClassIndex::False, builtinClass(ClassIndex::False));
}

Heap::~Heap() = default;

Type& Heap::newType(Type::Kind kind, std::string name, Type* superclass,
                    std::optional<ClassIndex> builtin, const Type* module) {
    auto* type = new Type(kind, std::move(name), superclass, builtin, module);
    types_.emplace_back(type);

    if (builtin) {
        builtins_[slot(*builtin)] = type;
    }
    if (kind == Type::Kind::Class || kind == Type::Kind::Module) {
        if (!type->name_.empty() && type->name_.front() != '#') {
            paths_[type->name_] = type;
        }
    }
    return *type;
}

Object& Heap::newObject(std::optional<ClassIndex> index, Type& klass) {
    auto* object = new Object(index, klass);
    objects_.emplace_back(object);
    return *object;
}

std::string Heap::anonymousName(std::string_view kind) {
    std::ostringstream os;
    os << "#<" << kind << ":0x" << std::hex << std::setw(16) << std::setfill('0')
       << ++anonymousCounter_ << '>';
    return os.str();
}

// ---------------------------------------------------------------------------
// Heap: types
// ---------------------------------------------------------------------------

Type& Heap::builtinClass(ClassIndex index) {
    return *builtins_[slot(index)];
}

Type& Heap::defineClass(const std::string& path, Type* superclass) {
    auto it = paths_.find(path);
    if (it != paths_.end()) {
        return *it->second;
    }
    return redefineClass(path, superclass);
}

Type& Heap::redefineClass(const std::string& path, Type* superclass) {
    if (superclass == nullptr) {
        superclass = &builtinClass(ClassIndex::Object);
    }
    return newType(Type::Kind::Class, path, superclass);
}

Type& Heap::defineModule(const std::string& path) {
    auto it = paths_.find(path);
    if (it != paths_.end()) {
        return *it->second;
    }
    return newType(Type::Kind::Module, path, nullptr);
}

Type& Heap::anonymousClass(Type* superclass) {
    if (superclass == nullptr) {
        superclass = &builtinClass(ClassIndex::Object);
    }
    return newType(Type::Kind::Class, anonymousName("Class"), superclass);
}

Type& Heap::anonymousModule() {
    return newType(Type::Kind::Module, anonymousName("Module"), nullptr);
}

MarshalResult<Type*> Heap::singletonOf(Object& value) {
    if (value.isImmediate()) {
        return MarshalResult<Type*>::err(
            MarshalError(ErrorCode::InvalidArgument, "can't define singleton"));
    }
    if (value.klass_->isSingleton()) {
        return MarshalResult<Type*>::ok(value.klass_);
    }
    auto name = "#<Class:" + anonymousName(value.klass_->name()) + ">";
    auto& singleton = newType(Type::Kind::Singleton, std::move(name), value.klass_);
    value.klass_ = &singleton;
    return MarshalResult<Type*>::ok(&singleton);
}

MarshalResult<void> Heap::extend(Object& value, const Type& module) {
    if (module.kind() != Type::Kind::Module) {
        return MarshalResult<void>::err(MarshalError(
            ErrorCode::InvalidArgument,
            "wrong argument type " + std::string(module.name()) + " (expected Module)"));
    }
    auto singleton = singletonOf(value);
    GM_TRY(singleton);

    Type* owner = singleton.value();
    auto& wrapper = newType(Type::Kind::IncludedModule, std::string(module.name()),
                            owner->superclass_, std::nullopt, &module);
    owner->superclass_ = &wrapper;
    return MarshalResult<void>::ok();
}

const marshal::TypeRef* Heap::findType(std::string_view path) const {
    auto it = paths_.find(std::string(path));
    return it == paths_.end() ? nullptr : it->second;
}

// ---------------------------------------------------------------------------
// Heap: values
// ---------------------------------------------------------------------------

Object& Heap::integer(int64_t value) {
    auto& object = newObject(ClassIndex::Fixnum, builtinClass(ClassIndex::Fixnum));
    object.integer_ = value;
    return object;
}

Object& Heap::floating(double value) {
    auto& object = newObject(ClassIndex::Float, builtinClass(ClassIndex::Float));
    object.float_ = value;
    return object;
}

Object& Heap::bigInteger(marshal::BigInteger value) {
    value.normalize();
    auto& object = newObject(ClassIndex::Bignum, builtinClass(ClassIndex::Bignum));
    object.bigInteger_ = std::move(value);
    return object;
}

MarshalResult<Object*> Heap::bigIntegerFromDecimal(std::string_view text) {
    auto parsed = marshal::BigInteger::fromDecimal(text);
    GM_TRY(parsed);
    return MarshalResult<Object*>::ok(&bigInteger(std::move(parsed.value())));
}

Object& Heap::string(std::string_view bytes, marshal::TextEncoding encoding, Type* klass) {
    auto& object = newObject(ClassIndex::String,
                             klass != nullptr ? *klass : builtinClass(ClassIndex::String));
    object.bytes_ = std::string(bytes);
    object.encoding_ = std::move(encoding);
    return object;
}

Object& Heap::array(Type* klass) {
    return newObject(ClassIndex::Array,
                     klass != nullptr ? *klass : builtinClass(ClassIndex::Array));
}

Object& Heap::hash(Type* klass) {
    return newObject(ClassIndex::Hash,
                     klass != nullptr ? *klass : builtinClass(ClassIndex::Hash));
}

Object& Heap::symbol(std::string_view name) {
    std::string key(name);
    auto it = symbols_.find(key);
    if (it != symbols_.end()) {
        return *it->second;
    }
    auto& object = newObject(ClassIndex::Symbol, builtinClass(ClassIndex::Symbol));
    object.bytes_ = key;
    object.encoding_ = marshal::TextEncoding::usAscii();
    symbols_.emplace(std::move(key), &object);
    return object;
}

Object& Heap::plainObject(Type& klass) {
    return newObject(ClassIndex::Object, klass);
}

Object& Heap::regexp(std::string_view source, marshal::TextEncoding encoding) {
    auto& object = newObject(ClassIndex::Regexp, builtinClass(ClassIndex::Regexp));
    object.bytes_ = std::string(source);
    object.encoding_ = std::move(encoding);
    return object;
}

Object& Heap::structValue(Type& klass) {
    return newObject(ClassIndex::Struct, klass);
}

Object& Heap::dataObject(Type& klass) {
    auto& object = newObject(ClassIndex::Object, klass);
    object.wrapsData_ = true;
    return object;
}

Object& Heap::foreign(Type& klass) {
    return newObject(std::nullopt, klass);
}

Object& Heap::typeValue(Type& type) {
    auto index = type.isModule() ? ClassIndex::Module : ClassIndex::Class;
    return newObject(index, builtinClass(index));
}

} // namespace gm::model
