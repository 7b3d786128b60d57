#pragma once

/// @file expected.h
/// @brief Generic expected<T, E> type for error handling without exceptions
///
/// Modeled after C++23's std::expected. Every fallible EasyBlink operation
/// returns one of these instead of throwing.
///
/// Example:
/// @code
/// enum class MyError { NOT_FOUND, INVALID };
///
/// expected<int, MyError> divide(int a, int b) {
///     if (b == 0) {
///         return expected<int, MyError>::failure(MyError::INVALID, "Division by zero");
///     }
///     return expected<int, MyError>::success(a / b);
/// }
///
/// auto result = divide(10, 2);
/// if (result.ok()) {
///     int value = result.value();
/// }
/// @endcode

#include <string>
#include <utility>
#include <variant>

namespace eb {

/// @brief Error information for expected type
/// @tparam E The error code type
template<typename E>
struct ErrorInfo {
    E code;
    std::string message;

    ErrorInfo(E err, std::string msg = std::string())
        : code(err), message(std::move(msg)) {}
};

/// @brief expected type for operations that can fail
/// @tparam T The type of the successful value
/// @tparam E The type of the error code (must be an enum or integral type)
template<typename T, typename E>
class expected {
public:
    /// @brief Check if operation succeeded
    bool ok() const { return std::holds_alternative<T>(mData); }

    /// @brief Get error code (only meaningful if !ok())
    E error() const {
        auto* err = std::get_if<ErrorInfo<E>>(&mData);
        return err ? err->code : E{};
    }

    /// @brief Get error message (only meaningful if !ok())
    const char* message() const {
        auto* err = std::get_if<ErrorInfo<E>>(&mData);
        return err ? err->message.c_str() : "";
    }

    /// @brief Get value (only valid if ok() == true)
    /// @warning Undefined behavior if called when !ok()
    T& value() { return *std::get_if<T>(&mData); }
    const T& value() const { return *std::get_if<T>(&mData); }

    explicit operator bool() const { return ok(); }

    /// @brief Create successful result
    static expected success(T value) {
        expected r;
        r.mData = std::move(value);
        return r;
    }

    /// @brief Create error result
    static expected failure(E err, std::string msg = std::string()) {
        expected r;
        r.mData = ErrorInfo<E>(err, std::move(msg));
        return r;
    }

    /// @brief Default constructor (creates error state)
    expected() : mData(ErrorInfo<E>(E{})) {}

    expected(expected&& other) = default;
    expected& operator=(expected&& other) = default;
    ~expected() = default;

private:
    std::variant<ErrorInfo<E>, T> mData;

    // Non-copyable
    expected(const expected&) = delete;
    expected& operator=(const expected&) = delete;
};

/// @brief Dummy type for void expected success state
struct VoidSuccess {};

/// @brief Specialization for void (no value to return)
template<typename E>
class expected<void, E> {
public:
    bool ok() const { return std::holds_alternative<VoidSuccess>(mData); }

    E error() const {
        auto* err = std::get_if<ErrorInfo<E>>(&mData);
        return err ? err->code : E{};
    }

    const char* message() const {
        auto* err = std::get_if<ErrorInfo<E>>(&mData);
        return err ? err->message.c_str() : "";
    }

    explicit operator bool() const { return ok(); }

    static expected success() {
        expected r;
        r.mData = VoidSuccess{};
        return r;
    }

    static expected failure(E err, std::string msg = std::string()) {
        expected r;
        r.mData = ErrorInfo<E>(err, std::move(msg));
        return r;
    }

    /// @brief Re-type the error of another expected as a void result.
    template<typename U>
    static expected from_error(const expected<U, E>& other) {
        return failure(other.error(), other.message());
    }

    /// @brief Default constructor (creates error state)
    expected() : mData(ErrorInfo<E>(E{})) {}

    expected(const expected&) = default;
    expected& operator=(const expected&) = default;
    expected(expected&&) = default;
    expected& operator=(expected&&) = default;

private:
    std::variant<ErrorInfo<E>, VoidSuccess> mData;
};

} // namespace eb
