/// @file document_loader.cpp
/// @brief YAML to heap value conversion.

#include "gm/model/document_loader.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <system_error>

#include <yaml-cpp/binary.h>

#include "gm/foundation/marshal_logger.hpp"

namespace gm::model {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::MarshalError;
using foundation::MarshalResult;

namespace {

constexpr std::string_view kTagPlain = "?";
constexpr std::string_view kTagQuoted = "!";
constexpr std::string_view kTagStr = "!str";
constexpr std::string_view kTagCoreStr = "tag:yaml.org,2002:str";
constexpr std::string_view kTagBinary = "!binary";
constexpr std::string_view kTagCoreBinary = "tag:yaml.org,2002:binary";
constexpr std::string_view kTagSymbol = "!sym";
constexpr std::string_view kTagBigInt = "!bigint";
constexpr std::string_view kTagCoreNull = "tag:yaml.org,2002:null";
constexpr std::string_view kTagCoreBool = "tag:yaml.org,2002:bool";
constexpr std::string_view kTagCoreInt = "tag:yaml.org,2002:int";
constexpr std::string_view kTagCoreFloat = "tag:yaml.org,2002:float";

std::string atLine(const YAML::Node& node) {
    return "line " + std::to_string(node.Mark().line + 1) + ": ";
}

MarshalError parseError(const YAML::Node& node, const std::string& message) {
    return MarshalError(ErrorCode::DocumentParseFailed, atLine(node) + message);
}

bool isOneOf(const std::string& text, std::initializer_list<std::string_view> words) {
    for (auto word : words) {
        if (text == word) {
            return true;
        }
    }
    return false;
}

/// Strip one leading sign; @p negative reports a '-'.
std::string_view unsignedPart(std::string_view text, bool& negative) {
    negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    return text;
}

bool isDecimalInteger(std::string_view text) {
    bool negative = false;
    auto digits = unsignedPart(text, negative);
    if (digits.empty()) {
        return false;
    }
    for (char c : digits) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

std::optional<double> parseFloat(std::string_view text) {
    bool negative = false;
    auto body = unsignedPart(text, negative);
    if (body.empty()) {
        return std::nullopt;
    }
    // Reject the words from_chars would accept ("inf", "nan").
    bool leadingDigit = std::isdigit(static_cast<unsigned char>(body.front())) != 0;
    bool leadingPoint = body.size() > 1 && body.front() == '.' &&
                        std::isdigit(static_cast<unsigned char>(body[1])) != 0;
    if (!leadingDigit && !leadingPoint) {
        return std::nullopt;
    }

    double value = 0.0;
    auto [end, ec] = std::from_chars(body.data(), body.data() + body.size(), value);
    if (ec == std::errc::invalid_argument || end != body.data() + body.size()) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        // from_chars leaves the value untouched; strtod rounds to infinity
        // on overflow and to zero or the nearest subnormal on underflow.
        value = std::strtod(std::string(body).c_str(), nullptr);
    }
    return negative ? -value : value;
}

/// `.inf`, `-.inf` and `.nan` in their YAML spellings.
std::optional<double> specialFloat(const std::string& text) {
    if (isOneOf(text, {".inf", ".Inf", ".INF", "+.inf", "+.Inf", "+.INF"})) {
        return std::numeric_limits<double>::infinity();
    }
    if (isOneOf(text, {"-.inf", "-.Inf", "-.INF"})) {
        return -std::numeric_limits<double>::infinity();
    }
    if (isOneOf(text, {".nan", ".NaN", ".NAN"})) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::nullopt;
}

bool isTrueWord(const std::string& text) {
    return isOneOf(text, {"true", "True", "TRUE"});
}

bool isFalseWord(const std::string& text) {
    return isOneOf(text, {"false", "False", "FALSE"});
}

} // namespace

MarshalResult<Object*> DocumentLoader::loadString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return MarshalResult<Object*>::err(MarshalError(
            ErrorCode::DocumentParseFailed, std::string("YAML parse error: ") + e.what()));
    }
    return loadRoot(root);
}

MarshalResult<Object*> DocumentLoader::loadFile(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return MarshalResult<Object*>::err(MarshalError(
            ErrorCode::DocumentParseFailed, "failed to open document: " + path.string()));
    } catch (const YAML::Exception& e) {
        return MarshalResult<Object*>::err(MarshalError(
            ErrorCode::DocumentParseFailed,
            path.string() + ": YAML parse error: " + e.what()));
    }
    return loadRoot(root);
}

MarshalResult<Object*> DocumentLoader::loadRoot(const YAML::Node& root) {
    converted_.clear();
    auto before = heap_.objectCount();
    auto result = convert(root);
    converted_.clear();
    if (result) {
        GM_LOG_DEBUG(LogCategory::Model,
                     "document loaded: " + std::to_string(heap_.objectCount() - before) +
                         " values");
    }
    return result;
}

Object* DocumentLoader::findConverted(const YAML::Node& node) const {
    auto bucket = converted_.find(node.Mark().pos);
    if (bucket == converted_.end()) {
        return nullptr;
    }
    for (const auto& [seen, object] : bucket->second) {
        if (seen.is(node)) {
            return object;
        }
    }
    return nullptr;
}

void DocumentLoader::remember(const YAML::Node& node, Object* object) {
    converted_[node.Mark().pos].emplace_back(node, object);
}

MarshalResult<Object*> DocumentLoader::convert(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        // Untagged nulls carry an empty tag; an explicit tag still decides.
        if (node.IsDefined() && !node.Tag().empty() && node.Tag() != kTagPlain &&
            node.Tag() != kTagQuoted && node.Tag() != kTagCoreNull) {
            return convertScalar(node);
        }
        return MarshalResult<Object*>::ok(&heap_.nil());
    }
    if (auto* existing = findConverted(node)) {
        return MarshalResult<Object*>::ok(existing);
    }

    switch (node.Type()) {
        case YAML::NodeType::Sequence: {
            auto& array = heap_.array();
            remember(node, &array);
            for (const auto& child : node) {
                auto element = convert(child);
                GM_TRY(element);
                GM_TRY(array.push(*element.value()));
            }
            return MarshalResult<Object*>::ok(&array);
        }
        case YAML::NodeType::Map: {
            auto& hash = heap_.hash();
            remember(node, &hash);
            for (auto it = node.begin(); it != node.end(); ++it) {
                auto key = convert(it->first);
                GM_TRY(key);
                auto value = convert(it->second);
                GM_TRY(value);
                GM_TRY(hash.set(*key.value(), *value.value()));
            }
            return MarshalResult<Object*>::ok(&hash);
        }
        case YAML::NodeType::Scalar: {
            auto scalar = convertScalar(node);
            GM_TRY(scalar);
            remember(node, scalar.value());
            return scalar;
        }
        default:
            return MarshalResult<Object*>::ok(&heap_.nil());
    }
}

MarshalResult<Object*> DocumentLoader::convertScalar(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    const std::string text = node.IsScalar() ? node.Scalar() : std::string();

    if (tag == kTagPlain) {
        return MarshalResult<Object*>::ok(&inferPlainScalar(text));
    }
    if (tag == kTagQuoted || tag == kTagStr || tag == kTagCoreStr) {
        return MarshalResult<Object*>::ok(&heap_.string(text));
    }
    if (tag == kTagSymbol) {
        if (text.empty()) {
            return MarshalResult<Object*>::err(parseError(node, "empty symbol"));
        }
        return MarshalResult<Object*>::ok(&heap_.symbol(text));
    }
    if (tag == kTagBinary || tag == kTagCoreBinary) {
        auto decoded = YAML::DecodeBase64(text);
        if (decoded.empty() && !text.empty()) {
            return MarshalResult<Object*>::err(parseError(node, "invalid base64 in !binary"));
        }
        std::string bytes(decoded.begin(), decoded.end());
        return MarshalResult<Object*>::ok(
            &heap_.string(bytes, marshal::TextEncoding::binary()));
    }
    if (tag == kTagCoreBool) {
        if (isTrueWord(text)) {
            return MarshalResult<Object*>::ok(&heap_.trueValue());
        }
        if (isFalseWord(text)) {
            return MarshalResult<Object*>::ok(&heap_.falseValue());
        }
        return MarshalResult<Object*>::err(parseError(node, "invalid !!bool '" + text + "'"));
    }
    if (tag == kTagCoreInt) {
        if (!isDecimalInteger(text)) {
            return MarshalResult<Object*>::err(
                parseError(node, "invalid !!int '" + text + "'"));
        }
        return MarshalResult<Object*>::ok(&inferPlainScalar(text));
    }
    if (tag == kTagCoreFloat) {
        auto number = specialFloat(text);
        if (!number) {
            number = parseFloat(text);
        }
        if (!number) {
            return MarshalResult<Object*>::err(
                parseError(node, "invalid !!float '" + text + "'"));
        }
        return MarshalResult<Object*>::ok(&heap_.floating(*number));
    }
    if (tag == kTagBigInt) {
        auto big = heap_.bigIntegerFromDecimal(text);
        if (!big) {
            return MarshalResult<Object*>::err(MarshalError(
                big.error().code(), atLine(node) + std::string(big.error().message())));
        }
        return big;
    }
    return MarshalResult<Object*>::err(parseError(node, "unsupported tag '" + tag + "'"));
}

Object& DocumentLoader::inferPlainScalar(const std::string& text) {
    if (isOneOf(text, {"", "~", "null", "Null", "NULL"})) {
        return heap_.nil();
    }
    if (isTrueWord(text)) {
        return heap_.trueValue();
    }
    if (isFalseWord(text)) {
        return heap_.falseValue();
    }
    if (auto special = specialFloat(text)) {
        return heap_.floating(*special);
    }

    if (isDecimalInteger(text)) {
        bool negative = false;
        auto digits = unsignedPart(text, negative);
        int64_t value = 0;
        auto [end, ec] = std::from_chars(text.data() + (text.size() - digits.size()),
                                         text.data() + text.size(), value);
        (void)end;
        if (ec == std::errc()) {
            return heap_.integer(negative ? -value : value);
        }
        // Beyond int64_t, or exactly INT64_MIN.
        auto big = marshal::BigInteger::fromDecimal(text);
        if (big) {
            return heap_.bigInteger(std::move(big.value()));
        }
    }

    if (auto number = parseFloat(text)) {
        return heap_.floating(*number);
    }
    return heap_.string(text);
}

} // namespace gm::model
