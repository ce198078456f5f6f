/// @file varint.cpp
/// @brief VarInt codec implementation.

#include "gm/marshal/varint.hpp"

#include <string>

namespace gm::marshal {

using foundation::ErrorCode;
using foundation::MarshalError;
using foundation::MarshalResult;

std::size_t encodeVarInt(int32_t value, uint8_t (&out)[kVarIntMaxSize]) {
    if (value == 0) {
        out[0] = 0;
        return 1;
    }
    if (value > 0 && value <= kVarIntShortMax) {
        out[0] = static_cast<uint8_t>(value + 5);
        return 1;
    }
    if (value < 0 && value >= kVarIntShortMin) {
        out[0] = static_cast<uint8_t>((value - 5) & 0xFF);
        return 1;
    }

    // Long form: emit low bytes until the rest is pure sign extension.
    // Right shift of a negative int32_t is arithmetic since C++20.
    std::size_t len = 0;
    int32_t rest = value;
    while (len < 4) {
        out[1 + len] = static_cast<uint8_t>(rest & 0xFF);
        ++len;
        rest >>= 8;
        if (rest == 0 || rest == -1) {
            break;
        }
    }
    auto signedLen = static_cast<int32_t>(len);
    out[0] = static_cast<uint8_t>(value < 0 ? -signedLen : signedLen);
    return len + 1;
}

std::vector<uint8_t> encodeVarInt(int32_t value) {
    std::vector<uint8_t> out;
    out.reserve(kVarIntMaxSize);
    appendVarInt(out, value);
    return out;
}

void appendVarInt(std::vector<uint8_t>& out, int32_t value) {
    uint8_t buf[kVarIntMaxSize];
    auto n = encodeVarInt(value, buf);
    out.insert(out.end(), buf, buf + n);
}

std::size_t varIntSize(int32_t value) noexcept {
    if (value >= kVarIntShortMin && value <= kVarIntShortMax) {
        return 1;
    }
    std::size_t len = 0;
    int32_t rest = value;
    while (len < 4) {
        ++len;
        rest >>= 8;
        if (rest == 0 || rest == -1) {
            break;
        }
    }
    return len + 1;
}

MarshalResult<DecodedVarInt> decodeVarInt(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return MarshalResult<DecodedVarInt>::err(
            MarshalError(ErrorCode::InvalidVarInt, "empty input"));
    }

    auto c = static_cast<int8_t>(bytes[0]);
    if (c == 0) {
        return MarshalResult<DecodedVarInt>::ok({0, 1});
    }
    if (c > 4) {
        return MarshalResult<DecodedVarInt>::ok({c - 5, 1});
    }
    if (c < -4) {
        return MarshalResult<DecodedVarInt>::ok({c + 5, 1});
    }

    auto len = static_cast<std::size_t>(c > 0 ? c : -c);
    if (bytes.size() < len + 1) {
        return MarshalResult<DecodedVarInt>::err(MarshalError(
            ErrorCode::InvalidVarInt,
            "truncated value: need " + std::to_string(len) + " bytes, have " +
                std::to_string(bytes.size() - 1)));
    }

    // Missing high bytes are 0x00 for a positive prefix, 0xFF for negative.
    uint32_t x = c > 0 ? 0u : 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        auto shift = static_cast<uint32_t>(8 * i);
        x &= ~(0xFFu << shift);
        x |= static_cast<uint32_t>(bytes[1 + i]) << shift;
    }
    return MarshalResult<DecodedVarInt>::ok(
        {static_cast<int32_t>(x), len + 1});
}

} // namespace gm::marshal
