/// @file marshal_writer.cpp
/// @brief Graph writer: link-or-write dispatch and shape encodings.

#include "gm/marshal/marshal_writer.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

#include "gm/foundation/marshal_logger.hpp"
#include "gm/marshal/stream_format.hpp"
#include "gm/marshal/type_classifier.hpp"
#include "gm/marshal/varint.hpp"
#include "gm/version.hpp"

namespace gm::marshal {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogLevel;
using foundation::MarshalError;
using foundation::MarshalResult;

namespace {

constexpr std::size_t kMaxStreamLength =
    static_cast<std::size_t>(std::numeric_limits<int32_t>::max());

/// Attach a path segment to a failed child write.
MarshalResult<void> located(MarshalResult<void> result, const std::string& segment) {
    if (!result) {
        result.error().prependLocation(segment);
    }
    return result;
}

MarshalError lengthOverflow(std::string_view what, std::size_t length) {
    return MarshalError(ErrorCode::InvalidArgument,
                        std::string(what) + " of " + std::to_string(length) +
                            " exceeds the stream's 32-bit length field");
}

} // namespace

std::string formatFloat(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }
    if (value == 0.0) {
        return std::signbit(value) ? "-0" : "0";
    }

    // Shortest round-trip digits, e.g. "-1.2345e+02".
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value,
                                   std::chars_format::scientific);
    std::string_view sci(buf, static_cast<std::size_t>(end - buf));

    bool negative = false;
    if (!sci.empty() && sci.front() == '-') {
        negative = true;
        sci.remove_prefix(1);
    }
    auto ePos = sci.find('e');
    std::string digits;
    for (char c : sci.substr(0, ePos)) {
        if (c != '.') {
            digits += c;
        }
    }
    auto expText = sci.substr(ePos + 1);
    if (!expText.empty() && expText.front() == '+') {
        expText.remove_prefix(1);
    }
    int exponent = 0;
    std::from_chars(expText.data(), expText.data() + expText.size(), exponent);

    // Position of the decimal point relative to the first digit.
    int decpt = exponent + 1;
    auto digs = static_cast<int>(digits.size());

    std::string out;
    if (negative) {
        out += '-';
    }
    if (decpt < -3 || decpt > digs) {
        out += digits[0];
        if (digs > 1) {
            out += '.';
            out.append(digits, 1, std::string::npos);
        }
        out += 'e';
        out += std::to_string(decpt - 1);
    } else if (decpt > 0) {
        out.append(digits, 0, static_cast<std::size_t>(decpt));
        if (digs > decpt) {
            out += '.';
            out.append(digits, static_cast<std::size_t>(decpt), std::string::npos);
        }
    } else {
        out += "0.";
        out.append(static_cast<std::size_t>(-decpt), '0');
        out += digits;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

MarshalWriter::MarshalWriter(ByteSink& sink, MarshalOptions options,
                             const TypeRegistry* registry)
    : sink_(sink),
      options_(options),
      metadata_(*this, options_, registry) {}

MarshalWriter::~MarshalWriter() = default;

// ---------------------------------------------------------------------------
// Top level
// ---------------------------------------------------------------------------

MarshalResult<void> MarshalWriter::writeObject(const Value& value) {
    if (depth_ == 0 && options_.writeVersionHeader) {
        GM_TRY(writeByte(FormatVersion::major));
        GM_TRY(writeByte(FormatVersion::minor));
    }

    ++depth_;
    auto result = writeOrLink(value);
    if (!result && !failedDepth_) {
        // Innermost failure: the first frame to see the error.
        failedDepth_ = depth_;
        failedType_ = displayTypeName(value);
    }
    --depth_;

    if (depth_ != 0) {
        return result;
    }
    if (!result) {
        logAbort(result.error());
        return result;
    }
    return finishDump();
}

void MarshalWriter::logAbort(const MarshalError& error) {
    auto& logger = foundation::MarshalLogger::instance();
    if (logger.isEnabled(LogLevel::Warning, LogCategory::Writer)) {
        foundation::LogContext ctx;
        ctx.depth = failedDepth_;
        ctx.typeName = failedType_;
        logger.logWithContext(LogLevel::Warning, LogCategory::Writer,
                              "dump aborted: " + error.describe(), ctx);
    }
    failedDepth_.reset();
    failedType_.clear();
}

MarshalResult<void> MarshalWriter::finishDump() {
    auto flushed = sink_.flush();
    if (!flushed) {
        GM_LOG_WARN(LogCategory::Writer,
                    "flush after dump failed: " + std::string(flushed.error().message()));
        return flushed;
    }

    auto& logger = foundation::MarshalLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Writer)) {
        foundation::LogContext ctx;
        ctx.extra["objects"] = std::to_string(cache_.objectCount());
        ctx.extra["symbols"] = std::to_string(cache_.symbolCount());
        logger.logWithContext(LogLevel::Debug, LogCategory::Writer, "dump complete", ctx);
    }
    return MarshalResult<void>::ok();
}

void MarshalWriter::registerObject(const Value& value) {
    cache_.registerObject(value);
}

void MarshalWriter::registerSymbol(std::string_view name) {
    cache_.registerSymbol(name);
}

// ---------------------------------------------------------------------------
// Stream primitives
// ---------------------------------------------------------------------------

MarshalResult<void> MarshalWriter::writeByte(uint8_t byte) {
    return sink_.writeByte(byte);
}

MarshalResult<void> MarshalWriter::writeInt(int32_t value) {
    uint8_t buf[kVarIntMaxSize];
    auto n = encodeVarInt(value, buf);
    return sink_.write(std::span<const uint8_t>(buf, n));
}

MarshalResult<void> MarshalWriter::writeBytes(std::string_view bytes) {
    if (bytes.size() > kMaxStreamLength) {
        return MarshalResult<void>::err(lengthOverflow("byte string", bytes.size()));
    }
    GM_TRY(writeInt(static_cast<int32_t>(bytes.size())));
    return sink_.write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
}

MarshalResult<void> MarshalWriter::writeSymbol(std::string_view name) {
    if (cache_.isSymbolRegistered(name)) {
        return cache_.writeSymbolLink(sink_, name);
    }
    cache_.registerSymbol(name);
    GM_TRY(writeByte(kTypeSymbol));
    return writeBytes(name);
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

MarshalResult<void> MarshalWriter::writeOrLink(const Value& value) {
    if (cache_.isRegistered(value)) {
        return cache_.writeLink(sink_, value);
    }
    return writeDirect(value);
}

MarshalResult<void> MarshalWriter::writeDirect(const Value& value) {
    auto variables = metadata_.writePrefix(value);
    GM_TRY(variables);

    GM_TRY(writeShapeData(value));

    if (variables.value()) {
        GM_TRY(metadata_.writeVariableTable(value, *variables.value()));
    }
    return MarshalResult<void>::ok();
}

MarshalResult<void> MarshalWriter::writeShapeData(const Value& value) {
    auto shape = classify(value);
    GM_TRY(shape);

    switch (shape.value()) {
        case Shape::Nil:        return writeByte(kTypeNil);
        case Shape::True:       return writeByte(kTypeTrue);
        case Shape::False:      return writeByte(kTypeFalse);
        case Shape::Integer:    return writeInteger(value.integerValue());
        case Shape::BigInteger: return writeBigInteger(value.bigIntegerValue());
        case Shape::Float:      return writeFloat(value.floatValue());
        case Shape::String:     return writeString(value);
        case Shape::Array:      return writeArray(value);
        case Shape::Hash:       return writeHash(value);
    }
    return MarshalResult<void>::err(
        MarshalError(ErrorCode::UnrecognizedType, "can't dump " + displayTypeName(value)));
}

// ---------------------------------------------------------------------------
// Shape encodings
// ---------------------------------------------------------------------------

MarshalResult<void> MarshalWriter::writeInteger(int64_t value) {
    if (value < kMinSmallInteger || value > kMaxSmallInteger) {
        return writeBigInteger(BigInteger::fromInt64(value));
    }
    GM_TRY(writeByte(kTypeFixnum));
    return writeInt(static_cast<int32_t>(value));
}

MarshalResult<void> MarshalWriter::writeBigInteger(BigInteger value) {
    value.normalize();

    // Length is counted in 16-bit words; zero still occupies one word.
    std::size_t words = (value.magnitude.size() + 1) / 2;
    if (words == 0) {
        words = 1;
    }
    if (words > kMaxStreamLength) {
        return MarshalResult<void>::err(lengthOverflow("big integer", words));
    }
    value.magnitude.resize(words * 2, 0);

    GM_TRY(writeByte(kTypeBignum));
    GM_TRY(writeByte(value.negative ? '-' : '+'));
    GM_TRY(writeInt(static_cast<int32_t>(words)));
    return sink_.write(value.magnitude);
}

MarshalResult<void> MarshalWriter::writeFloat(double value) {
    GM_TRY(writeByte(kTypeFloat));
    return writeBytes(formatFloat(value));
}

MarshalResult<void> MarshalWriter::writeString(const Value& value) {
    cache_.registerObject(value);
    GM_TRY(writeByte(kTypeString));
    return writeBytes(value.bytes());
}

MarshalResult<void> MarshalWriter::writeArray(const Value& value) {
    cache_.registerObject(value);

    auto length = value.length();
    if (length > kMaxStreamLength) {
        return MarshalResult<void>::err(lengthOverflow("array length", length));
    }
    GM_TRY(writeByte(kTypeArray));
    GM_TRY(writeInt(static_cast<int32_t>(length)));

    for (std::size_t i = 0; i < length; ++i) {
        auto segment = "[" + std::to_string(i) + "]";
        const Value* element = value.elementAt(i);
        if (element == nullptr) {
            MarshalError err(ErrorCode::InvalidArgument, "array element is missing");
            err.prependLocation(segment);
            return MarshalResult<void>::err(std::move(err));
        }
        GM_TRY(located(writeObject(*element), segment));
    }
    return MarshalResult<void>::ok();
}

MarshalResult<void> MarshalWriter::writeHash(const Value& value) {
    cache_.registerObject(value);

    auto entries = value.entries();
    if (entries.size() > kMaxStreamLength) {
        return MarshalResult<void>::err(lengthOverflow("hash size", entries.size()));
    }
    GM_TRY(writeByte(kTypeHash));
    GM_TRY(writeInt(static_cast<int32_t>(entries.size())));

    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto segment = "{" + std::to_string(i) + "}";
        const auto& entry = entries[i];
        if (entry.key == nullptr || entry.value == nullptr) {
            MarshalError err(ErrorCode::InvalidArgument, "hash entry is missing its key or value");
            err.prependLocation(segment);
            return MarshalResult<void>::err(std::move(err));
        }
        GM_TRY(located(writeObject(*entry.key), segment + ".key"));
        GM_TRY(located(writeObject(*entry.value), segment + ".value"));
    }
    return MarshalResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

MarshalResult<void> serialize(const Value& root, ByteSink& sink,
                              const MarshalOptions& options,
                              const TypeRegistry* registry) {
    MarshalWriter writer(sink, options, registry);
    return writer.writeObject(root);
}

MarshalResult<std::vector<uint8_t>> dumpToBytes(const Value& root,
                                                const MarshalOptions& options,
                                                const TypeRegistry* registry) {
    BufferSink sink;
    GM_TRY(serialize(root, sink, options, registry));
    return MarshalResult<std::vector<uint8_t>>::ok(sink.take());
}

} // namespace gm::marshal
