#pragma once

/// @file identity_cache.hpp
/// @brief Tracks objects and symbols already written to the stream.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gm/foundation/marshal_result.hpp"
#include "gm/marshal/byte_sink.hpp"
#include "gm/marshal/value.hpp"

namespace gm::marshal {

/// Emission indices for objects and symbols.
///
/// Objects are keyed by identity, never by value: two equal strings are two
/// entries. Symbols are keyed by name. Each table numbers its entries from 0
/// in first-seen order, and an assigned index never changes. The two
/// numbering spaces are independent.
class IdentityCache {
public:
    IdentityCache() = default;

    /// False for nil, booleans and integers in the small-integer range;
    /// such values have no meaningful identity.
    [[nodiscard]] static bool shouldRegister(const Value& value);

    [[nodiscard]] bool isRegistered(const Value& value) const;

    /// Assign the next object index to @p value if it is eligible and new.
    void registerObject(const Value& value);

    [[nodiscard]] bool isSymbolRegistered(std::string_view name) const;

    /// Assign the next symbol index to @p name if it is new.
    void registerSymbol(std::string_view name);

    [[nodiscard]] std::optional<int32_t> linkIndex(const Value& value) const;
    [[nodiscard]] std::optional<int32_t> symbolIndex(std::string_view name) const;

    /// Write `@` + VarInt(index) for a registered object.
    foundation::MarshalResult<void> writeLink(ByteSink& sink, const Value& value) const;

    /// Write `;` + VarInt(index) for a registered symbol.
    foundation::MarshalResult<void> writeSymbolLink(ByteSink& sink,
                                                    std::string_view name) const;

    [[nodiscard]] std::size_t objectCount() const noexcept { return objects_.size(); }
    [[nodiscard]] std::size_t symbolCount() const noexcept { return symbols_.size(); }

    /// Forget every registration.
    void clear();

private:
    // Heterogeneous lookup so symbol lookups do not allocate.
    struct NameHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view sv) const noexcept {
            return std::hash<std::string_view>{}(sv);
        }
    };

    std::unordered_map<const void*, int32_t> objects_;
    std::unordered_map<std::string, int32_t, NameHash, std::equal_to<>> symbols_;
};

} // namespace gm::marshal
