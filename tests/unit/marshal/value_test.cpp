#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <vector>

#include "gm/marshal/value.hpp"

using namespace gm::marshal;
using gm::foundation::ErrorCode;

using Bytes = std::vector<uint8_t>;

// ---------------------------------------------------------------------------
// BigInteger::fromInt64
// ---------------------------------------------------------------------------

TEST(BigIntegerTest, FromInt64Zero) {
    auto big = BigInteger::fromInt64(0);
    EXPECT_TRUE(big.isZero());
    EXPECT_FALSE(big.negative);
}

TEST(BigIntegerTest, FromInt64IsLittleEndianWithoutHighZeros) {
    auto big = BigInteger::fromInt64(0x1234);
    EXPECT_FALSE(big.negative);
    EXPECT_EQ(big.magnitude, Bytes({0x34, 0x12}));

    auto neg = BigInteger::fromInt64(-256);
    EXPECT_TRUE(neg.negative);
    EXPECT_EQ(neg.magnitude, Bytes({0x00, 0x01}));
}

TEST(BigIntegerTest, FromInt64HandlesExtremes) {
    auto min = BigInteger::fromInt64(std::numeric_limits<int64_t>::min());
    EXPECT_TRUE(min.negative);
    EXPECT_EQ(min.magnitude, Bytes({0, 0, 0, 0, 0, 0, 0, 0x80}));

    auto max = BigInteger::fromInt64(std::numeric_limits<int64_t>::max());
    EXPECT_FALSE(max.negative);
    EXPECT_EQ(max.magnitude, Bytes({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x7F}));
}

// ---------------------------------------------------------------------------
// BigInteger::fromDecimal
// ---------------------------------------------------------------------------

TEST(BigIntegerTest, FromDecimalBeyondSixtyFourBits) {
    auto big = BigInteger::fromDecimal("18446744073709551616");
    ASSERT_TRUE(big.hasValue());
    EXPECT_FALSE(big.value().negative);
    EXPECT_EQ(big.value().magnitude, Bytes({0, 0, 0, 0, 0, 0, 0, 0, 0x01}));
}

TEST(BigIntegerTest, FromDecimalMatchesFromInt64) {
    auto parsed = BigInteger::fromDecimal("-9223372036854775808");
    ASSERT_TRUE(parsed.hasValue());
    EXPECT_EQ(parsed.value(), BigInteger::fromInt64(std::numeric_limits<int64_t>::min()));

    auto plus = BigInteger::fromDecimal("+1_000_000");
    ASSERT_TRUE(plus.hasValue());
    EXPECT_EQ(plus.value(), BigInteger::fromInt64(1000000));
}

TEST(BigIntegerTest, NegativeZeroIsZero) {
    auto zero = BigInteger::fromDecimal("-000");
    ASSERT_TRUE(zero.hasValue());
    EXPECT_TRUE(zero.value().isZero());
    EXPECT_FALSE(zero.value().negative);
}

TEST(BigIntegerTest, FromDecimalRejectsMalformedText) {
    for (auto text : {"", "-", "12a", "1.5", " 7", "_", "+_", "-__"}) {
        auto parsed = BigInteger::fromDecimal(text);
        ASSERT_TRUE(parsed.hasError()) << "'" << text << "'";
        EXPECT_EQ(parsed.error().code(), ErrorCode::InvalidBigInteger);
    }
}

TEST(BigIntegerTest, NormalizeDropsHighZeroBytes) {
    BigInteger big{true, {0x05, 0x00, 0x00}};
    big.normalize();
    EXPECT_EQ(big.magnitude, Bytes({0x05}));
    EXPECT_TRUE(big.negative);

    BigInteger zero{true, {0x00}};
    zero.normalize();
    EXPECT_TRUE(zero.isZero());
    EXPECT_FALSE(zero.negative);
}

// ---------------------------------------------------------------------------
// Names and encodings
// ---------------------------------------------------------------------------

TEST(ClassIndexTest, NamesForDiagnostics) {
    EXPECT_EQ(classIndexName(ClassIndex::Bignum), "bignum");
    EXPECT_EQ(classIndexName(ClassIndex::BasicObject), "basic object");
    EXPECT_EQ(classIndexName(static_cast<ClassIndex>(200)), "unknown");
}

TEST(TextEncodingTest, Factories) {
    EXPECT_TRUE(TextEncoding::binary().isBinary());
    EXPECT_EQ(TextEncoding::utf8().name, "UTF-8");
    EXPECT_EQ(TextEncoding::usAscii().kind, TextEncoding::Kind::UsAscii);
    EXPECT_EQ(TextEncoding::named("Shift_JIS"),
              (TextEncoding{TextEncoding::Kind::Named, "Shift_JIS"}));
    EXPECT_NE(TextEncoding::named("UTF-8"), TextEncoding::utf8());
}
