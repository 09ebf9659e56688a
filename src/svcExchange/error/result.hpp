#pragma once

#include <cstdint>

#include <etl/optional.h>
#include <etl/utility.h>

namespace svcExchange {

// Common error codes
enum class error_code : int8_t {
    success = 0,
    overlap = -1
};

// Result type for error handling without exceptions
template<typename T, typename E = error_code>
class result {
private:
    etl::optional<T> value_;
    etl::optional<E> error_;

public:
    explicit result(const T& value) noexcept : value_(value) {}

    explicit result(T&& value) noexcept : value_(etl::forward<T>(value)) {}

    explicit result(const E& error) noexcept : error_(error) {}

    [[nodiscard]] bool is_ok() const noexcept { return value_.has_value(); }

    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    const T& value() const noexcept { return value_.value(); }

    T& value() noexcept { return value_.value(); }

    const E& error() const noexcept { return error_.value(); }

    E& error() noexcept { return error_.value(); }
};

// Specialization for void result type
template<typename E>
class result<void, E> {
private:
    etl::optional<E> error_;

public:
    result() noexcept : error_() {}

    explicit result(const E& error) noexcept : error_(error) {}

    [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }

    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    const E& error() const noexcept { return error_.value(); }

    E& error() noexcept { return error_.value(); }
};

// Helper function for creating successful void results
template<typename E = error_code>
inline result<void, E> ok() noexcept {
    return {};
}

// Helper function for creating successful results with a value
template<typename E = error_code, typename T>
inline result<T, E> ok(const T& value) noexcept {
    return result<T, E>(value);
}

// Helper function for creating failed results
template<typename T, typename E>
inline result<T, E> fail(const E& error) noexcept {
    return result<T, E>(error);
}

}  // namespace svcExchange
