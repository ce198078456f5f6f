#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the marshal library.

#include <cstdint>
#include <string_view>

namespace gm::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    NotImplemented = 0x0005,

    // Marshal (0x0100 - 0x01FF)
    AnonymousType = 0x0100,
    UnresolvableTypeReference = 0x0101,
    StatefulSingleton = 0x0102,
    UnsupportedShape = 0x0103,
    UnrecognizedType = 0x0104,
    InvalidVarInt = 0x0105,

    // Sink (0x0200 - 0x02FF)
    SinkWriteFailed = 0x0200,
    SinkFlushFailed = 0x0201,
    SinkClosed = 0x0202,
    SinkOpenFailed = 0x0203,

    // Model (0x0300 - 0x03FF)
    DocumentParseFailed = 0x0300,
    InvalidBigInteger = 0x0301,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Marshal";
        case 0x0200: return "Sink";
        case 0x0300: return "Model";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace gm::foundation
