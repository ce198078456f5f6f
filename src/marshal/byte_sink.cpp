/// @file byte_sink.cpp
/// @brief BufferSink and FileSink implementations.

#include "gm/marshal/byte_sink.hpp"

#include <string>
#include <utility>

#include "gm/foundation/marshal_logger.hpp"

namespace gm::marshal {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::MarshalError;
using foundation::MarshalResult;

// -- BufferSink --------------------------------------------------------------

MarshalResult<void> BufferSink::write(std::span<const uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    return MarshalResult<void>::ok();
}

MarshalResult<void> BufferSink::flush() {
    ++flushCount_;
    return MarshalResult<void>::ok();
}

std::vector<uint8_t> BufferSink::take() {
    std::vector<uint8_t> out = std::move(buffer_);
    buffer_.clear();
    flushCount_ = 0;
    return out;
}

// -- FileSink ----------------------------------------------------------------

FileSink::FileSink(std::filesystem::path path, std::ofstream stream)
    : path_(std::move(path)), stream_(std::move(stream)) {}

FileSink::~FileSink() {
    if (stream_.is_open()) {
        auto result = close();
        if (!result) {
            GM_LOG_ERROR(LogCategory::Sink,
                         "closing " + path_.string() + " failed: " +
                             std::string(result.error().message()));
        }
    }
}

MarshalResult<std::unique_ptr<FileSink>> FileSink::open(
    const std::filesystem::path& path) {
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
        GM_LOG_WARN(LogCategory::Sink, "cannot open " + path.string());
        return MarshalResult<std::unique_ptr<FileSink>>::err(MarshalError(
            ErrorCode::SinkOpenFailed, "failed to open output file: " + path.string()));
    }
    return MarshalResult<std::unique_ptr<FileSink>>::ok(
        std::unique_ptr<FileSink>(new FileSink(path, std::move(stream))));
}

MarshalResult<void> FileSink::write(std::span<const uint8_t> bytes) {
    if (!stream_.is_open()) {
        return MarshalResult<void>::err(
            MarshalError(ErrorCode::SinkClosed, "write to closed file: " + path_.string()));
    }
    stream_.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    if (!stream_) {
        return MarshalResult<void>::err(
            MarshalError(ErrorCode::SinkWriteFailed, "write failed: " + path_.string()));
    }
    bytesWritten_ += bytes.size();
    return MarshalResult<void>::ok();
}

MarshalResult<void> FileSink::flush() {
    if (!stream_.is_open()) {
        return MarshalResult<void>::err(
            MarshalError(ErrorCode::SinkClosed, "flush of closed file: " + path_.string()));
    }
    stream_.flush();
    if (!stream_) {
        GM_LOG_WARN(LogCategory::Sink, "flush failed for " + path_.string());
        return MarshalResult<void>::err(
            MarshalError(ErrorCode::SinkFlushFailed, "flush failed: " + path_.string()));
    }
    return MarshalResult<void>::ok();
}

MarshalResult<void> FileSink::close() {
    if (!stream_.is_open()) {
        return MarshalResult<void>::ok();
    }
    stream_.flush();
    bool flushed = static_cast<bool>(stream_);
    stream_.close();
    if (!flushed || !stream_) {
        return MarshalResult<void>::err(
            MarshalError(ErrorCode::SinkFlushFailed, "close failed: " + path_.string()));
    }
    return MarshalResult<void>::ok();
}

} // namespace gm::marshal
