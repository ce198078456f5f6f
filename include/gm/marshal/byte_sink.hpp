#pragma once

/// @file byte_sink.hpp
/// @brief Destinations for the encoded byte stream.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <vector>

#include "gm/foundation/marshal_result.hpp"

namespace gm::marshal {

/// Byte destination the writer streams into.
///
/// The writer calls flush() once, after a complete top-level dump. Bytes
/// written before a failed dump are not rolled back.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /// Append @p bytes to the destination.
    virtual foundation::MarshalResult<void> write(std::span<const uint8_t> bytes) = 0;

    /// Push buffered bytes to the underlying medium.
    virtual foundation::MarshalResult<void> flush() = 0;

    foundation::MarshalResult<void> writeByte(uint8_t byte) {
        return write(std::span<const uint8_t>(&byte, 1));
    }
};

/// In-memory sink collecting the stream into a byte vector.
class BufferSink final : public ByteSink {
public:
    BufferSink() = default;

    foundation::MarshalResult<void> write(std::span<const uint8_t> bytes) override;
    foundation::MarshalResult<void> flush() override;

    [[nodiscard]] const std::vector<uint8_t>& data() const noexcept { return buffer_; }
    [[nodiscard]] std::size_t size() const noexcept { return buffer_.size(); }

    /// Number of flush() calls seen so far.
    [[nodiscard]] std::size_t flushCount() const noexcept { return flushCount_; }

    /// Move the collected bytes out and reset the sink.
    [[nodiscard]] std::vector<uint8_t> take();

private:
    std::vector<uint8_t> buffer_;
    std::size_t flushCount_ = 0;
};

/// Sink writing to a file through a buffered std::ofstream.
///
/// Usage:
/// @code
///   auto sink = FileSink::open("graph.bin");
///   if (!sink) {
///       return sink.error();
///   }
///   serialize(root, *sink.value());
/// @endcode
class FileSink final : public ByteSink {
public:
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    /// Create or truncate @p path for writing.
    /// @return The sink, or SinkOpenFailed.
    [[nodiscard]] static foundation::MarshalResult<std::unique_ptr<FileSink>> open(
        const std::filesystem::path& path);

    foundation::MarshalResult<void> write(std::span<const uint8_t> bytes) override;
    foundation::MarshalResult<void> flush() override;

    /// Flush and close the file; later writes fail with SinkClosed.
    foundation::MarshalResult<void> close();

    [[nodiscard]] std::size_t bytesWritten() const noexcept { return bytesWritten_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileSink(std::filesystem::path path, std::ofstream stream);

    std::filesystem::path path_;
    std::ofstream stream_;
    std::size_t bytesWritten_ = 0;
};

} // namespace gm::marshal
