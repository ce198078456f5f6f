/// @file identity_cache.cpp
/// @brief IdentityCache implementation.

#include "gm/marshal/identity_cache.hpp"

#include <string>

#include "gm/foundation/marshal_logger.hpp"
#include "gm/marshal/stream_format.hpp"
#include "gm/marshal/varint.hpp"

namespace gm::marshal {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::MarshalError;
using foundation::MarshalResult;

namespace {

MarshalResult<void> writeTaggedIndex(ByteSink& sink, uint8_t tag, int32_t index) {
    uint8_t buf[1 + kVarIntMaxSize];
    buf[0] = tag;
    uint8_t encoded[kVarIntMaxSize];
    auto n = encodeVarInt(index, encoded);
    for (std::size_t i = 0; i < n; ++i) {
        buf[1 + i] = encoded[i];
    }
    return sink.write(std::span<const uint8_t>(buf, n + 1));
}

} // namespace

bool IdentityCache::shouldRegister(const Value& value) {
    auto index = value.nativeIndex();
    if (!index) {
        return true;
    }
    switch (*index) {
        case ClassIndex::Nil:
        case ClassIndex::True:
        case ClassIndex::False:
            return false;
        case ClassIndex::Fixnum: {
            auto v = value.integerValue();
            return v < kMinSmallInteger || v > kMaxSmallInteger;
        }
        default:
            return true;
    }
}

bool IdentityCache::isRegistered(const Value& value) const {
    return objects_.find(value.identity()) != objects_.end();
}

void IdentityCache::registerObject(const Value& value) {
    if (!shouldRegister(value)) {
        return;
    }
    auto next = static_cast<int32_t>(objects_.size());
    objects_.try_emplace(value.identity(), next);
}

bool IdentityCache::isSymbolRegistered(std::string_view name) const {
    return symbols_.find(name) != symbols_.end();
}

void IdentityCache::registerSymbol(std::string_view name) {
    if (isSymbolRegistered(name)) {
        return;
    }
    auto next = static_cast<int32_t>(symbols_.size());
    symbols_.emplace(std::string(name), next);
}

std::optional<int32_t> IdentityCache::linkIndex(const Value& value) const {
    auto it = objects_.find(value.identity());
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int32_t> IdentityCache::symbolIndex(std::string_view name) const {
    auto it = symbols_.find(name);
    if (it == symbols_.end()) {
        return std::nullopt;
    }
    return it->second;
}

MarshalResult<void> IdentityCache::writeLink(ByteSink& sink, const Value& value) const {
    auto index = linkIndex(value);
    if (!index) {
        return MarshalResult<void>::err(
            MarshalError(ErrorCode::NotFound, "link to an object that was never written"));
    }
    return writeTaggedIndex(sink, kTypeLink, *index);
}

MarshalResult<void> IdentityCache::writeSymbolLink(ByteSink& sink,
                                                   std::string_view name) const {
    auto index = symbolIndex(name);
    if (!index) {
        return MarshalResult<void>::err(MarshalError(
            ErrorCode::NotFound, "link to symbol :" + std::string(name) + " that was never written"));
    }
    return writeTaggedIndex(sink, kTypeSymbolLink, *index);
}

void IdentityCache::clear() {
    GM_LOG_DEBUG(LogCategory::Cache,
                 "cleared " + std::to_string(objects_.size()) + " objects, " +
                     std::to_string(symbols_.size()) + " symbols");
    objects_.clear();
    symbols_.clear();
}

} // namespace gm::marshal
