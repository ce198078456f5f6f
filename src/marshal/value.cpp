/// @file value.cpp
/// @brief BigInteger conversions.

#include "gm/marshal/value.hpp"

namespace gm::marshal {

using foundation::ErrorCode;
using foundation::MarshalError;
using foundation::MarshalResult;

BigInteger BigInteger::fromInt64(int64_t value) {
    BigInteger out;
    out.negative = value < 0;
    // Negate in unsigned space so INT64_MIN does not overflow.
    uint64_t magnitude = out.negative ? ~static_cast<uint64_t>(value) + 1
                                      : static_cast<uint64_t>(value);
    while (magnitude != 0) {
        out.magnitude.push_back(static_cast<uint8_t>(magnitude & 0xFF));
        magnitude >>= 8;
    }
    out.normalize();
    return out;
}

MarshalResult<BigInteger> BigInteger::fromDecimal(std::string_view text) {
    BigInteger out;
    std::size_t pos = 0;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        out.negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size()) {
        return MarshalResult<BigInteger>::err(MarshalError(
            ErrorCode::InvalidBigInteger,
            "empty integer literal: '" + std::string(text) + "'"));
    }

    bool sawDigit = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '_') {
            continue;
        }
        if (c < '0' || c > '9') {
            return MarshalResult<BigInteger>::err(MarshalError(
                ErrorCode::InvalidBigInteger,
                "invalid digit in integer literal: '" + std::string(text) + "'"));
        }
        sawDigit = true;
        // magnitude = magnitude * 10 + digit
        uint32_t carry = static_cast<uint32_t>(c - '0');
        for (auto& byte : out.magnitude) {
            uint32_t v = static_cast<uint32_t>(byte) * 10 + carry;
            byte = static_cast<uint8_t>(v & 0xFF);
            carry = v >> 8;
        }
        while (carry != 0) {
            out.magnitude.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }

    if (!sawDigit) {
        return MarshalResult<BigInteger>::err(MarshalError(
            ErrorCode::InvalidBigInteger,
            "no digits in integer literal: '" + std::string(text) + "'"));
    }

    out.normalize();
    return MarshalResult<BigInteger>::ok(std::move(out));
}

void BigInteger::normalize() {
    while (!magnitude.empty() && magnitude.back() == 0) {
        magnitude.pop_back();
    }
    if (magnitude.empty()) {
        negative = false;
    }
}

} // namespace gm::marshal
