/// @file type_classifier.cpp
/// @brief Shape classification by intrinsic type tag.

#include "gm/marshal/type_classifier.hpp"

namespace gm::marshal {

using foundation::ErrorCode;
using foundation::MarshalError;
using foundation::MarshalResult;

std::string displayTypeName(const Value& value) {
    // Singleton classes and module wrappers are not what the user wrote;
    // report the first named class in the ancestry instead.
    const TypeRef* type = &value.metaClass();
    while (type != nullptr && (type->isSingleton() || type->isIncludedModule())) {
        type = type->superclass();
    }
    if (type == nullptr) {
        return std::string(value.metaClass().name());
    }
    return std::string(type->name());
}

MarshalResult<Shape> classify(const Value& value) {
    auto index = value.nativeIndex();
    if (!index) {
        return MarshalResult<Shape>::err(MarshalError(
            ErrorCode::UnrecognizedType, "can't dump " + displayTypeName(value)));
    }
    if (value.wrapsNativeData()) {
        return MarshalResult<Shape>::err(MarshalError(
            ErrorCode::UnrecognizedType,
            "no marshal_dump is defined for class " + displayTypeName(value)));
    }

    switch (*index) {
        case ClassIndex::Nil:    return MarshalResult<Shape>::ok(Shape::Nil);
        case ClassIndex::True:   return MarshalResult<Shape>::ok(Shape::True);
        case ClassIndex::False:  return MarshalResult<Shape>::ok(Shape::False);
        case ClassIndex::Fixnum: return MarshalResult<Shape>::ok(Shape::Integer);
        case ClassIndex::Bignum: return MarshalResult<Shape>::ok(Shape::BigInteger);
        case ClassIndex::Float:  return MarshalResult<Shape>::ok(Shape::Float);
        case ClassIndex::String: return MarshalResult<Shape>::ok(Shape::String);
        case ClassIndex::Array:  return MarshalResult<Shape>::ok(Shape::Array);
        case ClassIndex::Hash:   return MarshalResult<Shape>::ok(Shape::Hash);

        case ClassIndex::Class:
        case ClassIndex::Module:
        case ClassIndex::Object:
        case ClassIndex::BasicObject:
        case ClassIndex::Regexp:
        case ClassIndex::Struct:
        case ClassIndex::Symbol:
            return MarshalResult<Shape>::err(MarshalError(
                ErrorCode::UnsupportedShape,
                std::string(classIndexName(*index)) + " values are not supported (" +
                    displayTypeName(value) + ")"));
    }

    return MarshalResult<Shape>::err(MarshalError(
        ErrorCode::UnrecognizedType, "can't dump " + displayTypeName(value)));
}

} // namespace gm::marshal
