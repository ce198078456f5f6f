#pragma once

/// @file marshal_writer.hpp
/// @brief Recursive object-graph writer with identity-aware backreferences.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gm/foundation/marshal_result.hpp"
#include "gm/marshal/byte_sink.hpp"
#include "gm/marshal/identity_cache.hpp"
#include "gm/marshal/marshal_options.hpp"
#include "gm/marshal/metadata_emitter.hpp"
#include "gm/marshal/value.hpp"

namespace gm::marshal {

/// Writes object graphs to a ByteSink.
///
/// Each distinct object is written once; later encounters become a link to
/// its emission index. Containers are registered before their children are
/// written, so a container that (directly or indirectly) contains itself
/// is written as a link on the inner encounter instead of recursing
/// forever.
///
/// One writer is one dump scope: several writeObject() calls share the
/// identity cache, so a value written by an earlier call is linked by a
/// later one. The sink is flushed whenever a top-level writeObject()
/// completes successfully.
///
/// Not thread-safe; a writer belongs to the thread performing the dump.
///
/// Example:
/// @code
///   BufferSink sink;
///   MarshalWriter writer(sink);
///   auto result = writer.writeObject(root);
///   if (!result) {
///       std::cerr << result.error().describe() << '\n';
///   }
/// @endcode
class MarshalWriter {
public:
    explicit MarshalWriter(ByteSink& sink, MarshalOptions options = {},
                           const TypeRegistry* registry = nullptr);
    ~MarshalWriter();

    MarshalWriter(const MarshalWriter&) = delete;
    MarshalWriter& operator=(const MarshalWriter&) = delete;
    MarshalWriter(MarshalWriter&&) = delete;
    MarshalWriter& operator=(MarshalWriter&&) = delete;

    /// Write @p value and everything reachable from it.
    ///
    /// On failure the whole dump is invalid; bytes already handed to the
    /// sink stay there and the sink is not flushed.
    foundation::MarshalResult<void> writeObject(const Value& value);

    /// Pre-seed the cache with @p value (ignored for values without
    /// identity).
    void registerObject(const Value& value);

    /// Pre-seed the cache with a symbol name.
    void registerSymbol(std::string_view name);

    // ── Stream primitives ───────────────────────────────────────────────

    foundation::MarshalResult<void> writeByte(uint8_t byte);

    /// Write a VarInt.
    foundation::MarshalResult<void> writeInt(int32_t value);

    /// Write a length-prefixed byte string (no tag).
    foundation::MarshalResult<void> writeBytes(std::string_view bytes);

    /// Write `:name`, or a symbol link if the name was written before.
    foundation::MarshalResult<void> writeSymbol(std::string_view name);

    // ── Introspection ───────────────────────────────────────────────────

    [[nodiscard]] std::size_t depth() const noexcept { return depth_; }
    [[nodiscard]] const IdentityCache& cache() const noexcept { return cache_; }
    [[nodiscard]] const MarshalOptions& options() const noexcept { return options_; }

private:
    foundation::MarshalResult<void> writeOrLink(const Value& value);
    foundation::MarshalResult<void> writeDirect(const Value& value);
    foundation::MarshalResult<void> writeShapeData(const Value& value);

    foundation::MarshalResult<void> writeInteger(int64_t value);
    foundation::MarshalResult<void> writeBigInteger(BigInteger value);
    foundation::MarshalResult<void> writeFloat(double value);
    foundation::MarshalResult<void> writeString(const Value& value);
    foundation::MarshalResult<void> writeArray(const Value& value);
    foundation::MarshalResult<void> writeHash(const Value& value);

    foundation::MarshalResult<void> finishDump();
    void logAbort(const foundation::MarshalError& error);

    ByteSink& sink_;
    MarshalOptions options_;
    IdentityCache cache_;
    MetadataEmitter metadata_;
    std::size_t depth_ = 0;

    // Depth and type name of the value whose write failed first.
    std::optional<std::size_t> failedDepth_;
    std::string failedType_;
};

/// Serialize @p root into @p sink with a fresh writer.
foundation::MarshalResult<void> serialize(const Value& root, ByteSink& sink,
                                          const MarshalOptions& options = {},
                                          const TypeRegistry* registry = nullptr);

/// Serialize @p root into a byte vector.
[[nodiscard]] foundation::MarshalResult<std::vector<uint8_t>> dumpToBytes(
    const Value& root, const MarshalOptions& options = {},
    const TypeRegistry* registry = nullptr);

/// Text form of a float in the stream: `nan`, `inf`, `-inf`, `0`, `-0`, or
/// the shortest decimal that reads back to the same double, in positional
/// notation when the decimal point falls within the digits and `d.ddde<N>`
/// otherwise.
[[nodiscard]] std::string formatFloat(double value);

} // namespace gm::marshal
