/// @file metadata_emitter.cpp
/// @brief Instance-variable tables, `C`/`e` records and encoding entries.

#include "gm/marshal/metadata_emitter.hpp"

#include <limits>
#include <string>
#include <utility>

#include "gm/marshal/marshal_writer.hpp"
#include "gm/marshal/stream_format.hpp"

namespace gm::marshal {

using foundation::ErrorCode;
using foundation::MarshalError;
using foundation::MarshalResult;

namespace {

bool isStringLike(ClassIndex index) {
    return index == ClassIndex::String || index == ClassIndex::Regexp;
}

/// Shapes whose current type is recorded with `e` and `C` records.
bool recordsCurrentType(ClassIndex index) {
    switch (index) {
        case ClassIndex::String:
        case ClassIndex::Regexp:
        case ClassIndex::Array:
        case ClassIndex::Hash:
            return true;
        default:
            return false;
    }
}

} // namespace

MetadataEmitter::MetadataEmitter(MarshalWriter& writer, const MarshalOptions& options,
                                 const TypeRegistry* registry)
    : writer_(writer), options_(options), registry_(registry) {}

bool MetadataEmitter::shouldAnnotateEncoding(const Value& value) const {
    if (options_.encodingPolicy != EncodingPolicy::Annotate) {
        return false;
    }
    auto index = value.nativeIndex();
    return index && isStringLike(*index) && !value.encoding().isBinary();
}

MarshalResult<std::string> MetadataEmitter::typePath(const TypeRef& type) const {
    std::string path(type.name());
    if (path.empty() || path.front() == '#') {
        return MarshalResult<std::string>::err(MarshalError(
            ErrorCode::AnonymousType,
            std::string("can't dump anonymous ") + (type.isModule() ? "module " : "class ") +
                path));
    }
    if (registry_ != nullptr && registry_->findType(path) != &type) {
        return MarshalResult<std::string>::err(
            MarshalError(ErrorCode::UnresolvableTypeReference, path + " can't be referred"));
    }
    return MarshalResult<std::string>::ok(std::move(path));
}

MarshalResult<ExtendedChain> MetadataEmitter::resolveExtendedChain(const TypeRef& type) const {
    ExtendedChain chain;
    const TypeRef* current = &type;

    if (current->isSingleton()) {
        if (current->hasOwnMethods() || current->hasVariables()) {
            return MarshalResult<ExtendedChain>::err(
                MarshalError(ErrorCode::StatefulSingleton, "singleton can't be dumped"));
        }
        current = current->superclass();
    }

    while (current != nullptr && current->isIncludedModule()) {
        const TypeRef* module = current->includedModule();
        if (module == nullptr) {
            return MarshalResult<ExtendedChain>::err(MarshalError(
                ErrorCode::InvalidArgument, "included module wrapper has no module"));
        }
        auto path = typePath(*module);
        GM_TRY(path);
        chain.modulePaths.push_back(std::move(path.value()));
        current = current->superclass();
    }

    if (current == nullptr) {
        return MarshalResult<ExtendedChain>::err(MarshalError(
            ErrorCode::InvalidArgument,
            "type " + std::string(type.name()) + " has no concrete class"));
    }
    chain.concrete = current;
    return MarshalResult<ExtendedChain>::ok(std::move(chain));
}

MarshalResult<std::optional<VariableList>> MetadataEmitter::writePrefix(const Value& value) {
    using PrefixResult = MarshalResult<std::optional<VariableList>>;

    auto index = value.nativeIndex();
    if (!index || *index == ClassIndex::Object || *index == ClassIndex::BasicObject) {
        return PrefixResult::ok(std::nullopt);
    }

    std::optional<VariableList> variables;
    if (shouldAnnotateEncoding(value) ||
        (!value.isImmediate() && value.hasVariables() && *index != ClassIndex::Class &&
         *index != ClassIndex::Module)) {
        variables = value.variables();
    }

    // Resolve every name up front; a failure must not leave a dangling
    // `I` or `e` record behind.
    ExtendedChain chain;
    std::optional<std::string> userClass;
    if (recordsCurrentType(*index)) {
        auto resolved = resolveExtendedChain(value.metaClass());
        GM_TRY(resolved);
        chain = std::move(resolved.value());

        if (chain.concrete->builtinIndex() != index) {
            auto path = typePath(*chain.concrete);
            GM_TRY(path);
            userClass = std::move(path.value());
        }
    }

    if (variables) {
        GM_TRY(writer_.writeByte(kTypeIvar));
    }
    for (const auto& module : chain.modulePaths) {
        GM_TRY(writer_.writeByte(kTypeExtended));
        GM_TRY(writer_.writeSymbol(module));
    }
    if (userClass) {
        GM_TRY(writer_.writeByte(kTypeUserClass));
        GM_TRY(writer_.writeSymbol(*userClass));
    }
    return PrefixResult::ok(std::move(variables));
}

MarshalResult<void> MetadataEmitter::writeVariableTable(const Value& value,
                                                        const VariableList& vars) {
    bool annotate = shouldAnnotateEncoding(value);
    std::size_t count = vars.size() + (annotate ? 1 : 0);
    if (count > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        return MarshalResult<void>::err(MarshalError(
            ErrorCode::InvalidArgument,
            "too many instance variables (" + std::to_string(vars.size()) + ")"));
    }

    GM_TRY(writer_.writeInt(static_cast<int32_t>(count)));
    if (annotate) {
        GM_TRY(writeEncoding(value.encoding()));
    }

    for (const auto& var : vars) {
        auto segment = "." + var.name;
        if (var.value == nullptr) {
            MarshalError err(ErrorCode::InvalidArgument, "instance variable has no value");
            err.prependLocation(segment);
            return MarshalResult<void>::err(std::move(err));
        }
        GM_TRY(writer_.writeSymbol(var.name));

        auto written = writer_.writeObject(*var.value);
        if (!written) {
            written.error().prependLocation(segment);
            return written;
        }
    }
    return MarshalResult<void>::ok();
}

MarshalResult<void> MetadataEmitter::writeEncoding(const TextEncoding& encoding) {
    switch (encoding.kind) {
        case TextEncoding::Kind::Binary:
        case TextEncoding::Kind::UsAscii:
            GM_TRY(writer_.writeSymbol(kSymbolEncodingShort));
            return writer_.writeByte(kTypeFalse);
        case TextEncoding::Kind::Utf8:
            GM_TRY(writer_.writeSymbol(kSymbolEncodingShort));
            return writer_.writeByte(kTypeTrue);
        case TextEncoding::Kind::Named:
            break;
    }
    // Charset names are written as plain strings and take no object index.
    GM_TRY(writer_.writeSymbol(kSymbolEncoding));
    GM_TRY(writer_.writeByte(kTypeString));
    return writer_.writeBytes(encoding.name);
}

} // namespace gm::marshal
