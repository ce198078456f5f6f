#pragma once

/// @file varint.hpp
/// @brief Signed variable-length integer codec used for every length and
///        small integer in the marshal stream.
///
/// Layout:
/// | Value range          | Bytes                                   |
/// |----------------------|-----------------------------------------|
/// | 0                    | `00`                                    |
/// | 1 .. 122             | `v + 5`                                 |
/// | -123 .. -1           | `(v - 5) & 0xFF`                        |
/// | anything else        | `±len` then `len` little-endian bytes   |
///
/// In the long form the bytes are the shortest two's-complement prefix of
/// the value; the sign of the length byte tells the reader whether the
/// missing high bytes are 0x00 or 0xFF.

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "gm/foundation/marshal_result.hpp"

namespace gm::marshal {

/// Largest value that still takes the single-byte form.
inline constexpr int32_t kVarIntShortMax = 122;

/// Smallest value that still takes the single-byte form.
inline constexpr int32_t kVarIntShortMin = -123;

/// Maximum encoded size of any 32-bit value.
inline constexpr std::size_t kVarIntMaxSize = 5;

/// Result of decoding one VarInt.
struct DecodedVarInt {
    int32_t value = 0;
    std::size_t consumed = 0;
};

/// Encode @p value into a fresh buffer.
[[nodiscard]] std::vector<uint8_t> encodeVarInt(int32_t value);

/// Append the encoding of @p value to @p out.
void appendVarInt(std::vector<uint8_t>& out, int32_t value);

/// Encode into a caller-provided array; returns the number of bytes used.
std::size_t encodeVarInt(int32_t value, uint8_t (&out)[kVarIntMaxSize]);

/// Number of bytes encodeVarInt() produces for @p value.
[[nodiscard]] std::size_t varIntSize(int32_t value) noexcept;

/// Decode one VarInt from the front of @p bytes.
/// @return The value and the bytes consumed, or InvalidVarInt for empty or
///         truncated input.
[[nodiscard]] foundation::MarshalResult<DecodedVarInt> decodeVarInt(
    std::span<const uint8_t> bytes);

} // namespace gm::marshal
