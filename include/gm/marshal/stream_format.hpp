#pragma once

/// @file stream_format.hpp
/// @brief Tag bytes of the marshal stream.

#include <cstdint>
#include <string_view>

namespace gm::marshal {

// ── Value tags ──────────────────────────────────────────────────────────────

inline constexpr uint8_t kTypeNil = '0';
inline constexpr uint8_t kTypeTrue = 'T';
inline constexpr uint8_t kTypeFalse = 'F';
inline constexpr uint8_t kTypeFixnum = 'i';
inline constexpr uint8_t kTypeBignum = 'l';
inline constexpr uint8_t kTypeFloat = 'f';
inline constexpr uint8_t kTypeString = '"';
inline constexpr uint8_t kTypeArray = '[';
inline constexpr uint8_t kTypeHash = '{';
inline constexpr uint8_t kTypeSymbol = ':';

// ── Backreferences ──────────────────────────────────────────────────────────

inline constexpr uint8_t kTypeLink = '@';
inline constexpr uint8_t kTypeSymbolLink = ';';

// ── Metadata records ────────────────────────────────────────────────────────

inline constexpr uint8_t kTypeIvar = 'I';
inline constexpr uint8_t kTypeUserClass = 'C';
inline constexpr uint8_t kTypeExtended = 'e';

// ── Encoding pseudo-variables ───────────────────────────────────────────────

/// Short form: value `false` means US-ASCII, `true` means UTF-8.
inline constexpr std::string_view kSymbolEncodingShort = "E";

/// Long form: value is the quoted charset name.
inline constexpr std::string_view kSymbolEncoding = "encoding";

// ── Integer ranges ──────────────────────────────────────────────────────────

/// Integers in [kMinSmallInteger, kMaxSmallInteger] are written as a fixnum
/// VarInt and are never entered into the identity cache.
inline constexpr int64_t kMaxSmallInteger = (int64_t{1} << 30) - 1;
inline constexpr int64_t kMinSmallInteger = -(int64_t{1} << 30);

} // namespace gm::marshal
