#pragma once

/// @file marshal_logger.hpp
/// @brief MarshalLogger wrapping kcenon logger_system for category-based
///        logging of dumps, sinks and document loading.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gm/foundation/marshal_result.hpp"

namespace gm::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Library setup and configuration
    Writer = 1, ///< Graph writer and metadata emission
    Cache  = 2, ///< Identity cache
    Sink   = 3, ///< Byte sinks
    Model  = 4, ///< Reference object model and document loading
    Tool   = 5  ///< Command-line tools
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 6;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Writer", "Cache", "Sink", "Model", "Tool"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in config files ("debug", "WARNING", ...).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.depth = 3;
///   ctx.typeName = "Config";
///   ctx.extra["objects"] = "17";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Writer,
///                         "dump finished", ctx);
/// @endcode
struct LogContext {
    std::optional<std::size_t> depth;
    std::optional<std::string> typeName;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging system.
///
/// Each category has its own runtime minimum level. Uses PIMPL to hide
/// kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Writer   | Info          |
/// | Cache    | Warning       |
/// | Sink     | Info          |
/// | Model    | Info          |
/// | Tool     | Info          |
class MarshalLogger {
public:
    MarshalLogger();
    ~MarshalLogger();

    MarshalLogger(const MarshalLogger&) = delete;
    MarshalLogger& operator=(const MarshalLogger&) = delete;
    MarshalLogger(MarshalLogger&&) noexcept;
    MarshalLogger& operator=(MarshalLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data appended as key=value.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set the same minimum level for every category.
    void setAllLevels(LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    MarshalResult<void> flush();

    /// Get the global MarshalLogger singleton instance.
    static MarshalLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gm::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// @name GM_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// GM_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef GM_MIN_LOG_LEVEL
    #define GM_MIN_LOG_LEVEL 0
#endif

#define GM_LOG(level, cat, msg)                                                  \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= GM_MIN_LOG_LEVEL &&                       \
            ::gm::foundation::MarshalLogger::instance().isEnabled((level), (cat))) \
        {                                                                        \
            ::gm::foundation::MarshalLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define GM_LOG_DEBUG(cat, msg) \
    GM_LOG(::gm::foundation::LogLevel::Debug, (cat), (msg))

#define GM_LOG_INFO(cat, msg) \
    GM_LOG(::gm::foundation::LogLevel::Info, (cat), (msg))

#define GM_LOG_WARN(cat, msg) \
    GM_LOG(::gm::foundation::LogLevel::Warning, (cat), (msg))

#define GM_LOG_ERROR(cat, msg) \
    GM_LOG(::gm::foundation::LogLevel::Error, (cat), (msg))

/// @}
