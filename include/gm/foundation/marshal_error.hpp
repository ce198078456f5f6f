#pragma once

/// @file marshal_error.hpp
/// @brief Error type used with Result<T, MarshalError>.

#include <string>
#include <string_view>
#include <utility>

#include "gm/foundation/error_code.hpp"

namespace gm::foundation {

/// Error carrying an error code, a human-readable message and the position
/// in the object graph where the failure was detected.
///
/// The location is built while the error unwinds out of the recursive
/// writer: each container prepends the segment that led to the failing
/// child, so the final location reads from the root downwards, e.g.
/// `[2]{0}.value.@name`.
class MarshalError {
public:
    MarshalError() = default;

    explicit MarshalError(ErrorCode code)
        : code_(code) {}

    MarshalError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Path from the root value to the value that failed (empty at the root).
    [[nodiscard]] std::string_view location() const noexcept { return location_; }

    /// Prepend one path segment; called by each enclosing container.
    void prependLocation(std::string_view segment) {
        location_.insert(0, segment);
    }

    /// Message and location combined for diagnostics.
    [[nodiscard]] std::string describe() const {
        std::string out(message_);
        if (!location_.empty()) {
            out += " (at ";
            out += location_;
            out += ')';
        }
        return out;
    }

    /// Check if this represents a success (no error).
    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::string location_;
};

} // namespace gm::foundation
