#pragma once

/// @file result.hpp
/// @brief Result<T,E> type for explicit error handling without exceptions,
///        plus GM_TRY for propagating failures out of recursive code.

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace gm {

/// Error information for Result type.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Carrier for an error on its way out of a function.
///
/// Converts implicitly into any Result<T, E>, which is what lets GM_TRY
/// return an error from a function without naming its success type.
template <typename E>
struct Failure {
    E error;
};

/// Wrap an error so it can be returned from any Result<T, E> function.
template <typename E>
[[nodiscard]] Failure<std::decay_t<E>> fail(E&& error) {
    return Failure<std::decay_t<E>>{std::forward<E>(error)};
}

/// Result type for explicit error propagation.
///
/// Every function that can fail returns Result<T, E> instead of throwing.
///
/// @tparam T The success value type.
/// @tparam E The error type (defaults to gm::Error).
///
/// Example:
/// @code
///   auto result = sink.write(bytes);
///   if (!result) {
///       log(result.error().message());
///   }
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    /// Construct a success result.
    static Result ok(T value) { return Result(std::move(value)); }

    /// Construct an error result.
    static Result err(E error) { return Result(std::move(error)); }

    // NOLINTNEXTLINE(google-explicit-constructor)
    Result(Failure<E> failure) : data_(std::in_place_index<1>, std::move(failure.error)) {}

    /// Check if this result holds a value.
    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }

    /// Check if this result holds an error.
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    /// Implicit conversion to bool (true if success).
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    /// Access value or return a default.
    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    explicit Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    explicit Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> data_;
};

/// Specialization for void success type.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true); }
    static Result err(E error) { return Result(std::move(error)); }

    // NOLINTNEXTLINE(google-explicit-constructor)
    Result(Failure<E> failure) : success_(false), error_(std::move(failure.error)) {}

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }
    [[nodiscard]] E& error() & { return error_; }

private:
    explicit Result(bool) : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

} // namespace gm

/// Evaluate a Result-returning expression and return its error from the
/// enclosing function if it failed. The enclosing function must return a
/// Result with the same error type.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define GM_TRY(expr)                                                           \
    do {                                                                       \
        auto&& gmTryResult_ = (expr);                                          \
        if (!gmTryResult_) {                                                   \
            return ::gm::fail(std::move(gmTryResult_.error()));                \
        }                                                                      \
    } while (0)
