#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "gm/marshal/byte_sink.hpp"
#include "gm/marshal/marshal_writer.hpp"
#include "gm/model/heap.hpp"

using namespace gm::marshal;
using gm::foundation::ErrorCode;
using gm::model::Heap;
using gm::model::Object;

using Bytes = std::vector<uint8_t>;

namespace {

Bytes bytesOf(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

/// Array whose second slot is empty.
class HoleyArray final : public Value {
public:
    HoleyArray(const Value& first, const TypeRef& klass) : first_(first), klass_(klass) {}

    std::optional<ClassIndex> nativeIndex() const override { return ClassIndex::Array; }
    bool isImmediate() const override { return false; }
    const TypeRef& metaClass() const override { return klass_; }
    std::size_t length() const override { return 2; }
    const Value* elementAt(std::size_t index) const override {
        return index == 0 ? &first_ : nullptr;
    }

private:
    const Value& first_;
    const TypeRef& klass_;
};

} // namespace

class MarshalWriterTest : public ::testing::Test {
protected:
    Bytes dump(const Value& value, MarshalOptions options = {}) {
        auto bytes = dumpToBytes(value, options, &heap_);
        EXPECT_TRUE(bytes.hasValue()) << (bytes ? "" : bytes.error().describe());
        return bytes.valueOr({});
    }

    Object& binary(std::string_view text) {
        return heap_.string(text, TextEncoding::binary());
    }

    Heap heap_;
};

// ---------------------------------------------------------------------------
// Scalars
// ---------------------------------------------------------------------------

TEST_F(MarshalWriterTest, NilAndBooleans) {
    EXPECT_EQ(dump(heap_.nil()), Bytes({'0'}));
    EXPECT_EQ(dump(heap_.trueValue()), Bytes({'T'}));
    EXPECT_EQ(dump(heap_.falseValue()), Bytes({'F'}));
}

TEST_F(MarshalWriterTest, SmallIntegers) {
    EXPECT_EQ(dump(heap_.integer(0)), Bytes({'i', 0x00}));
    EXPECT_EQ(dump(heap_.integer(1)), Bytes({'i', 0x06}));
    EXPECT_EQ(dump(heap_.integer(-1)), Bytes({'i', 0xFA}));
    EXPECT_EQ(dump(heap_.integer(300)), Bytes({'i', 0x02, 0x2C, 0x01}));
}

TEST_F(MarshalWriterTest, SmallIntegerRangeEdges) {
    EXPECT_EQ(dump(heap_.integer((int64_t{1} << 30) - 1)),
              Bytes({'i', 0x04, 0xFF, 0xFF, 0xFF, 0x3F}));
    EXPECT_EQ(dump(heap_.integer(-(int64_t{1} << 30))),
              Bytes({'i', 0xFC, 0x00, 0x00, 0x00, 0xC0}));
}

TEST_F(MarshalWriterTest, IntegersPastSmallRangeBecomeBigIntegers) {
    EXPECT_EQ(dump(heap_.integer(int64_t{1} << 30)),
              Bytes({'l', '+', 0x07, 0x00, 0x00, 0x00, 0x40}));
    EXPECT_EQ(dump(heap_.integer(-(int64_t{1} << 30) - 1)),
              Bytes({'l', '-', 0x07, 0x01, 0x00, 0x00, 0x40}));
}

TEST_F(MarshalWriterTest, BigIntegerPadsToWholeWords) {
    auto big = heap_.bigIntegerFromDecimal("18446744073709551616");
    ASSERT_TRUE(big.hasValue());
    EXPECT_EQ(dump(*big.value()),
              Bytes({'l', '+', 0x0A, 0, 0, 0, 0, 0, 0, 0, 0, 0x01, 0x00}));
}

TEST_F(MarshalWriterTest, BigIntegerZeroTakesOneWord) {
    EXPECT_EQ(dump(heap_.bigInteger(BigInteger{})), Bytes({'l', '+', 0x06, 0x00, 0x00}));
}

TEST_F(MarshalWriterTest, Floats) {
    EXPECT_EQ(dump(heap_.floating(1.5)), concat({{'f', 0x08}, bytesOf("1.5")}));
    EXPECT_EQ(dump(heap_.floating(-2.0)), concat({{'f', 0x07}, bytesOf("-2")}));
    EXPECT_EQ(dump(heap_.floating(std::numeric_limits<double>::infinity())),
              concat({{'f', 0x08}, bytesOf("inf")}));
}

// ---------------------------------------------------------------------------
// formatFloat
// ---------------------------------------------------------------------------

TEST(FormatFloatTest, SpecialValues) {
    EXPECT_EQ(formatFloat(std::numeric_limits<double>::quiet_NaN()), "nan");
    EXPECT_EQ(formatFloat(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(formatFloat(-std::numeric_limits<double>::infinity()), "-inf");
    EXPECT_EQ(formatFloat(0.0), "0");
    EXPECT_EQ(formatFloat(-0.0), "-0");
}

TEST(FormatFloatTest, PositionalWhenPointFallsWithinDigits) {
    EXPECT_EQ(formatFloat(1.0), "1");
    EXPECT_EQ(formatFloat(1.5), "1.5");
    EXPECT_EQ(formatFloat(123.456), "123.456");
    EXPECT_EQ(formatFloat(0.001), "0.001");
    EXPECT_EQ(formatFloat(-0.25), "-0.25");
    EXPECT_EQ(formatFloat(0.1), "0.1");
}

TEST(FormatFloatTest, ExponentOtherwise) {
    EXPECT_EQ(formatFloat(100.0), "1e2");
    EXPECT_EQ(formatFloat(1e-5), "1e-5");
    EXPECT_EQ(formatFloat(1.25e20), "1.25e20");
    EXPECT_EQ(formatFloat(-3e-7), "-3e-7");
}

TEST(FormatFloatTest, ShortestTextReadsBack) {
    for (double v : {0.1 + 0.2, 1.0 / 3.0, 6.02214076e23, 2.5e-300}) {
        EXPECT_EQ(std::stod(formatFloat(v)), v) << formatFloat(v);
    }
}

// ---------------------------------------------------------------------------
// Strings and containers
// ---------------------------------------------------------------------------

TEST_F(MarshalWriterTest, BinaryStringHasNoVariableTable) {
    EXPECT_EQ(dump(binary("abc")), concat({{'"', 0x08}, bytesOf("abc")}));
}

TEST_F(MarshalWriterTest, Utf8StringCarriesEncodingFlag) {
    EXPECT_EQ(dump(heap_.string("abc")),
              concat({{'I', '"', 0x08}, bytesOf("abc"), {0x06, ':', 0x06, 'E', 'T'}}));
}

TEST_F(MarshalWriterTest, OmitPolicyWritesRawBytes) {
    MarshalOptions options;
    options.encodingPolicy = EncodingPolicy::Omit;
    EXPECT_EQ(dump(heap_.string("abc"), options), concat({{'"', 0x08}, bytesOf("abc")}));
}

TEST_F(MarshalWriterTest, ArrayOfScalars) {
    auto& list = heap_.array();
    ASSERT_TRUE(list.push(heap_.integer(1)));
    ASSERT_TRUE(list.push(heap_.nil()));
    ASSERT_TRUE(list.push(heap_.trueValue()));
    EXPECT_EQ(dump(list), Bytes({'[', 0x08, 'i', 0x06, '0', 'T'}));
}

TEST_F(MarshalWriterTest, EmptyContainers) {
    EXPECT_EQ(dump(heap_.array()), Bytes({'[', 0x00}));
    EXPECT_EQ(dump(heap_.hash()), Bytes({'{', 0x00}));
}

TEST_F(MarshalWriterTest, HashKeepsInsertionOrder) {
    auto& map = heap_.hash();
    ASSERT_TRUE(map.set(heap_.integer(2), heap_.falseValue()));
    ASSERT_TRUE(map.set(heap_.integer(1), heap_.trueValue()));
    EXPECT_EQ(dump(map), Bytes({'{', 0x07, 'i', 0x07, 'F', 'i', 0x06, 'T'}));
}

// ---------------------------------------------------------------------------
// Identity
// ---------------------------------------------------------------------------

TEST_F(MarshalWriterTest, SharedStringIsWrittenOnceThenLinked) {
    auto& list = heap_.array();
    auto& text = binary("a");
    ASSERT_TRUE(list.push(text));
    ASSERT_TRUE(list.push(text));
    EXPECT_EQ(dump(list), Bytes({'[', 0x07, '"', 0x06, 'a', '@', 0x06}));
}

TEST_F(MarshalWriterTest, EqualStringsAreNotLinked) {
    auto& list = heap_.array();
    ASSERT_TRUE(list.push(binary("a")));
    ASSERT_TRUE(list.push(binary("a")));
    EXPECT_EQ(dump(list), Bytes({'[', 0x07, '"', 0x06, 'a', '"', 0x06, 'a'}));
}

TEST_F(MarshalWriterTest, SelfContainingArrayLinksToItself) {
    auto& list = heap_.array();
    ASSERT_TRUE(list.push(list));
    EXPECT_EQ(dump(list), Bytes({'[', 0x06, '@', 0x00}));
}

TEST_F(MarshalWriterTest, MutualCycleThroughHash) {
    auto& map = heap_.hash();
    auto& list = heap_.array();
    ASSERT_TRUE(list.push(map));
    ASSERT_TRUE(map.set(binary("k"), list));
    EXPECT_EQ(dump(map), Bytes({'{', 0x06, '"', 0x06, 'k', '[', 0x06, '@', 0x00}));
}

TEST_F(MarshalWriterTest, FloatsAndBigIntegersAreNeverLinked) {
    auto& list = heap_.array();
    auto& f = heap_.floating(0.5);
    auto& big = heap_.integer(int64_t{1} << 40);
    ASSERT_TRUE(list.push(f));
    ASSERT_TRUE(list.push(f));
    ASSERT_TRUE(list.push(big));
    ASSERT_TRUE(list.push(big));

    Bytes bigBytes = {'l', '+', 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01};
    EXPECT_EQ(dump(list), concat({{'[', 0x09},
                                  {'f', 0x08}, bytesOf("0.5"),
                                  {'f', 0x08}, bytesOf("0.5"),
                                  bigBytes, bigBytes}));
}

TEST_F(MarshalWriterTest, RepeatedSmallIntegerObjectIsNeverLinked) {
    constexpr std::size_t kRepeats = 50;
    auto& seven = heap_.integer(7);
    auto& edge = heap_.integer((int64_t{1} << 30) - 1);
    auto& list = heap_.array();
    for (std::size_t i = 0; i < kRepeats; ++i) {
        ASSERT_TRUE(list.push(seven));
    }
    ASSERT_TRUE(list.push(edge));
    ASSERT_TRUE(list.push(edge));

    BufferSink sink;
    MarshalWriter writer(sink, {}, &heap_);
    ASSERT_TRUE(writer.writeObject(seven));
    ASSERT_TRUE(writer.writeObject(seven));
    EXPECT_EQ(writer.cache().objectCount(), 0u);

    ASSERT_TRUE(writer.writeObject(list));
    // Only the array itself takes an index.
    EXPECT_EQ(writer.cache().objectCount(), 1u);

    Bytes expected = {'i', 0x0C, 'i', 0x0C, '[', 0x39};
    for (std::size_t i = 0; i < kRepeats; ++i) {
        expected.push_back('i');
        expected.push_back(0x0C);
    }
    Bytes edgeBytes = {'i', 0x04, 0xFF, 0xFF, 0xFF, 0x3F};
    expected = concat({expected, edgeBytes, edgeBytes});
    EXPECT_EQ(sink.data(), expected);
}

TEST_F(MarshalWriterTest, SymbolNamesAreLinkedAcrossValues) {
    auto& list = heap_.array();
    ASSERT_TRUE(list.push(heap_.string("a")));
    ASSERT_TRUE(list.push(heap_.string("b")));
    EXPECT_EQ(dump(list), Bytes({'[', 0x07,
                                 'I', '"', 0x06, 'a', 0x06, ':', 0x06, 'E', 'T',
                                 'I', '"', 0x06, 'b', 0x06, ';', 0x00, 'T'}));
}

// ---------------------------------------------------------------------------
// Writer scope
// ---------------------------------------------------------------------------

TEST_F(MarshalWriterTest, VersionHeaderPrefixesTopLevelOnly) {
    MarshalOptions options;
    options.writeVersionHeader = true;

    auto& list = heap_.array();
    ASSERT_TRUE(list.push(heap_.nil()));
    EXPECT_EQ(dump(list, options), Bytes({0x04, 0x08, '[', 0x06, '0'}));
}

TEST_F(MarshalWriterTest, WriterSharesCacheAcrossTopLevelCalls) {
    BufferSink sink;
    MarshalWriter writer(sink, {}, &heap_);
    auto& text = binary("x");

    ASSERT_TRUE(writer.writeObject(text));
    ASSERT_TRUE(writer.writeObject(text));
    EXPECT_EQ(sink.data(), Bytes({'"', 0x06, 'x', '@', 0x00}));
    EXPECT_EQ(sink.flushCount(), 2u);
    EXPECT_EQ(writer.depth(), 0u);
}

TEST_F(MarshalWriterTest, PreSeededObjectIsLinked) {
    BufferSink sink;
    MarshalWriter writer(sink);
    auto& list = heap_.array();
    writer.registerObject(list);
    writer.registerSymbol("E");

    ASSERT_TRUE(writer.writeObject(list));
    EXPECT_EQ(sink.data(), Bytes({'@', 0x00}));
    EXPECT_EQ(writer.cache().symbolIndex("E"), 0);
}

TEST_F(MarshalWriterTest, StreamPrimitives) {
    BufferSink sink;
    MarshalWriter writer(sink);
    ASSERT_TRUE(writer.writeByte('x'));
    ASSERT_TRUE(writer.writeInt(-124));
    ASSERT_TRUE(writer.writeBytes("hi"));
    ASSERT_TRUE(writer.writeSymbol("s"));
    ASSERT_TRUE(writer.writeSymbol("s"));
    EXPECT_EQ(sink.data(), Bytes({'x', 0xFF, 0x84, 0x07, 'h', 'i',
                                  ':', 0x06, 's', ';', 0x00}));
}

// ---------------------------------------------------------------------------
// Failures
// ---------------------------------------------------------------------------

TEST_F(MarshalWriterTest, FailureCarriesPathFromRoot) {
    auto& point = heap_.defineClass("Point");
    auto& inner = heap_.hash();
    ASSERT_TRUE(inner.set(binary("k"), heap_.plainObject(point)));
    auto& root = heap_.array();
    ASSERT_TRUE(root.push(heap_.nil()));
    ASSERT_TRUE(root.push(inner));

    auto bytes = dumpToBytes(root, {}, &heap_);
    ASSERT_TRUE(bytes.hasError());
    EXPECT_EQ(bytes.error().code(), ErrorCode::UnsupportedShape);
    EXPECT_EQ(bytes.error().location(), "[1]{0}.value");
    EXPECT_EQ(bytes.error().describe(),
              "object values are not supported (Point) (at [1]{0}.value)");
}

TEST_F(MarshalWriterTest, HashKeyFailureIsLocated) {
    auto& map = heap_.hash();
    ASSERT_TRUE(map.set(heap_.symbol("k"), heap_.nil()));

    auto bytes = dumpToBytes(map, {}, &heap_);
    ASSERT_TRUE(bytes.hasError());
    EXPECT_EQ(bytes.error().location(), "{0}.key");
}

TEST_F(MarshalWriterTest, InstanceVariableFailureIsLocated) {
    auto& handle = heap_.defineClass("Handle");
    auto& text = binary("t");
    ASSERT_TRUE(text.setVariable("@owner", heap_.foreign(handle)));
    auto& root = heap_.array();
    ASSERT_TRUE(root.push(text));

    auto bytes = dumpToBytes(root, {}, &heap_);
    ASSERT_TRUE(bytes.hasError());
    EXPECT_EQ(bytes.error().code(), ErrorCode::UnrecognizedType);
    EXPECT_EQ(bytes.error().location(), "[0].@owner");
}

TEST_F(MarshalWriterTest, MissingElementIsInvalidArgument) {
    HoleyArray holey(heap_.nil(), heap_.builtinClass(ClassIndex::Array));
    auto bytes = dumpToBytes(holey);
    ASSERT_TRUE(bytes.hasError());
    EXPECT_EQ(bytes.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(bytes.error().location(), "[1]");
}

TEST_F(MarshalWriterTest, FailedDumpIsNotFlushed) {
    BufferSink sink;
    MarshalWriter writer(sink, {}, &heap_);
    auto& root = heap_.array();
    ASSERT_TRUE(root.push(heap_.regexp("a+", TextEncoding::binary())));

    auto result = writer.writeObject(root);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(sink.flushCount(), 0u);
    EXPECT_EQ(writer.depth(), 0u);
    // The container header is already in the sink and is not rolled back.
    EXPECT_EQ(sink.data(), Bytes({'[', 0x06}));
}
