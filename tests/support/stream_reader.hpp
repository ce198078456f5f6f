#pragma once

/// @file stream_reader.hpp
/// @brief Test-only decoder for marshal streams produced by MarshalWriter.
///
/// Reads the stream back into a tree of Node objects. Object links resolve
/// to the same Node the first occurrence produced, so sharing and cycles
/// can be checked by pointer comparison. Malformed input throws
/// std::runtime_error.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gm/marshal/stream_format.hpp"
#include "gm/marshal/varint.hpp"

namespace gm::test {

struct Node {
    enum class Kind {
        Nil,
        True,
        False,
        Integer,
        BigInteger,
        Float,
        String,
        Array,
        Hash,
        Symbol
    };

    Kind kind = Kind::Nil;
    int64_t integer = 0;

    /// Big integer sign and little-endian magnitude as written (padded).
    bool negative = false;
    std::vector<uint8_t> magnitude;

    /// String bytes, float text or symbol name.
    std::string text;

    std::vector<const Node*> elements;
    std::vector<std::pair<const Node*, const Node*>> entries;

    /// Encoding recorded in the variable table ("US-ASCII", "UTF-8" or a
    /// charset name).
    std::optional<std::string> encoding;
    std::vector<std::pair<std::string, const Node*>> variables;

    /// Modules from `e` records, in stream order.
    std::vector<std::string> extendedBy;

    /// Class from a `C` record.
    std::optional<std::string> userClass;
};

class StreamReader {
public:
    explicit StreamReader(std::span<const uint8_t> bytes) : bytes_(bytes) {}

    /// Read one value.
    const Node* read() {
        auto tag = readByte();
        switch (tag) {
            case marshal::kTypeNil:   return make(Node::Kind::Nil);
            case marshal::kTypeTrue:  return make(Node::Kind::True);
            case marshal::kTypeFalse: return make(Node::Kind::False);

            case marshal::kTypeFixnum: {
                auto* node = make(Node::Kind::Integer);
                node->integer = readInt();
                return node;
            }
            case marshal::kTypeBignum: {
                auto* node = make(Node::Kind::BigInteger);
                auto sign = readByte();
                if (sign != '+' && sign != '-') {
                    throw std::runtime_error("bad bignum sign");
                }
                node->negative = sign == '-';
                auto shorts = readInt();
                if (shorts < 1) {
                    throw std::runtime_error("bad bignum length");
                }
                for (int32_t i = 0; i < shorts * 2; ++i) {
                    node->magnitude.push_back(readByte());
                }
                return node;
            }
            case marshal::kTypeFloat: {
                auto* node = make(Node::Kind::Float);
                node->text = readBytes();
                return node;
            }
            case marshal::kTypeString: {
                auto* node = make(Node::Kind::String);
                objects_.push_back(node);
                node->text = readBytes();
                return node;
            }
            case marshal::kTypeArray: {
                auto* node = make(Node::Kind::Array);
                objects_.push_back(node);
                auto count = readCount();
                for (int32_t i = 0; i < count; ++i) {
                    node->elements.push_back(read());
                }
                return node;
            }
            case marshal::kTypeHash: {
                auto* node = make(Node::Kind::Hash);
                objects_.push_back(node);
                auto count = readCount();
                for (int32_t i = 0; i < count; ++i) {
                    const Node* key = read();
                    const Node* value = read();
                    node->entries.emplace_back(key, value);
                }
                return node;
            }
            case marshal::kTypeSymbol:
            case marshal::kTypeSymbolLink: {
                auto* node = make(Node::Kind::Symbol);
                node->text = readSymbolBody(tag);
                return node;
            }
            case marshal::kTypeLink: {
                auto index = readInt();
                if (index < 0 || static_cast<std::size_t>(index) >= objects_.size()) {
                    throw std::runtime_error("object link out of range");
                }
                return objects_[static_cast<std::size_t>(index)];
            }
            case marshal::kTypeIvar: {
                auto* node = mutableRead();
                readVariables(*node);
                return node;
            }
            case marshal::kTypeExtended: {
                auto module = readSymbol();
                auto* node = mutableRead();
                node->extendedBy.insert(node->extendedBy.begin(), module);
                return node;
            }
            case marshal::kTypeUserClass: {
                auto name = readSymbol();
                auto* node = mutableRead();
                node->userClass = name;
                return node;
            }
            default:
                throw std::runtime_error("unknown tag " + std::to_string(tag));
        }
    }

    [[nodiscard]] bool atEnd() const noexcept { return pos_ == bytes_.size(); }
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    /// Objects in link-index order.
    [[nodiscard]] const std::vector<Node*>& objects() const noexcept { return objects_; }

    /// Symbols in link-index order.
    [[nodiscard]] const std::vector<std::string>& symbols() const noexcept { return symbols_; }

    uint8_t readByte() {
        if (pos_ >= bytes_.size()) {
            throw std::runtime_error("unexpected end of stream");
        }
        return bytes_[pos_++];
    }

    int32_t readInt() {
        auto decoded = marshal::decodeVarInt(bytes_.subspan(pos_));
        if (!decoded) {
            throw std::runtime_error(std::string(decoded.error().message()));
        }
        pos_ += decoded.value().consumed;
        return decoded.value().value;
    }

private:
    Node* make(Node::Kind kind) {
        nodes_.push_back(std::make_unique<Node>());
        nodes_.back()->kind = kind;
        return nodes_.back().get();
    }

    /// Wrapped values are fresh in the stream, so the read node is ours
    /// to annotate.
    Node* mutableRead() {
        const Node* node = read();
        for (auto& owned : nodes_) {
            if (owned.get() == node) {
                return owned.get();
            }
        }
        throw std::runtime_error("metadata record wraps a link");
    }

    int32_t readCount() {
        auto count = readInt();
        if (count < 0) {
            throw std::runtime_error("negative count");
        }
        return count;
    }

    std::string readBytes() {
        auto length = readCount();
        if (bytes_.size() - pos_ < static_cast<std::size_t>(length)) {
            throw std::runtime_error("byte string past end of stream");
        }
        std::string out(reinterpret_cast<const char*>(bytes_.data() + pos_),
                        static_cast<std::size_t>(length));
        pos_ += static_cast<std::size_t>(length);
        return out;
    }

    std::string readSymbolBody(uint8_t tag) {
        if (tag == marshal::kTypeSymbolLink) {
            auto index = readInt();
            if (index < 0 || static_cast<std::size_t>(index) >= symbols_.size()) {
                throw std::runtime_error("symbol link out of range");
            }
            return symbols_[static_cast<std::size_t>(index)];
        }
        if (tag != marshal::kTypeSymbol) {
            throw std::runtime_error("expected a symbol");
        }
        auto name = readBytes();
        symbols_.push_back(name);
        return name;
    }

    std::string readSymbol() { return readSymbolBody(readByte()); }

    void readVariables(Node& node) {
        auto count = readCount();
        for (int32_t i = 0; i < count; ++i) {
            auto name = readSymbol();
            if (name == marshal::kSymbolEncodingShort) {
                auto flag = readByte();
                node.encoding = flag == marshal::kTypeTrue ? "UTF-8" : "US-ASCII";
            } else if (name == marshal::kSymbolEncoding) {
                // Charset names carry no object index.
                if (readByte() != marshal::kTypeString) {
                    throw std::runtime_error("encoding name is not a string");
                }
                node.encoding = readBytes();
            } else {
                node.variables.emplace_back(name, read());
            }
        }
    }

    std::span<const uint8_t> bytes_;
    std::size_t pos_ = 0;
    std::vector<std::unique_ptr<Node>> nodes_;
    std::vector<Node*> objects_;
    std::vector<std::string> symbols_;
};

}  // namespace gm::test
