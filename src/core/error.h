#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: failure classes reported by the ledger core
enum class ErrorCode : uint16_t {
    NONE                 = 0,
    // Decoding and configuration (100-199)
    PARSE_ERROR          = 100, PARSE_BAD_FORMAT     = 101,
    // Transaction and ledger rules (200-299)
    VALIDATION_ERROR     = 200, VALIDATION_RANGE     = 201,
    VALIDATION_INPUT     = 202, VALIDATION_DUPLICATE = 203,
    VALIDATION_UNDERFLOW = 204, VALIDATION_CYCLE     = 205,
    VALIDATION_REJECTED  = 206, VALIDATION_KNOWN     = 207,
    VALIDATION_POOL_FULL = 208,
    // Keys and signatures (400-499)
    CRYPTO_SIG_FAIL      = 400, CRYPTO_KEY_FAIL      = 401,
    // Undo records and log sinks (500-599)
    STORAGE_ERROR        = 500, STORAGE_NOT_FOUND    = 501,
    STORAGE_CORRUPT      = 502,
    INTERNAL_ERROR       = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// Error: code, message and the place it was raised
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }

    /// "CODE: message (file:line)"
    [[nodiscard]] std::string format() const;

    /// Errors compare by code only.
    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

namespace detail {
[[noreturn]] void throw_bad_result_access(const char* what);
} // namespace detail

// Result<T, E>: either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        check_value();
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        check_value();
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        check_value();
        return std::get<T>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        check_error();
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        check_error();
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        check_error();
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T fallback) const {
        return ok() ? std::get<T>(storage_) : std::move(fallback);
    }

    /// Result<U, E> holding func(value), or this error.
    template <typename F>
    [[nodiscard]] auto map(F&& func) const&
        -> Result<std::invoke_result_t<F, const T&>, E> {
        if (ok()) return func(std::get<T>(storage_));
        return std::get<E>(storage_);
    }

    /// func(value), which itself returns a Result, or this error.
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const&
        -> std::invoke_result_t<F, const T&> {
        if (ok()) return func(std::get<T>(storage_));
        return std::get<E>(storage_);
    }

private:
    void check_value() const {
        if (!ok()) detail::throw_bad_result_access("Result::value() on error");
    }
    void check_error() const {
        if (ok()) detail::throw_bad_result_access("Result::error() on value");
    }

    std::variant<T, E> storage_;
};

// Result<void, E>: success carries nothing
template <typename E>
class Result<void, E> {
public:
    Result() noexcept = default;
    Result(const E& err) : error_(err), failed_(true) {}             // NOLINT implicit
    Result(E&& err) : error_(std::move(err)), failed_(true) {}       // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept { return !failed_; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (failed_) detail::throw_bad_result_access("Result::value() on error");
    }
    [[nodiscard]] const E& error() const& {
        if (!failed_) detail::throw_bad_result_access("Result::error() on value");
        return error_;
    }
    [[nodiscard]] E&& error() && {
        if (!failed_) detail::throw_bad_result_access("Result::error() on value");
        return std::move(error_);
    }

private:
    E    error_{};
    bool failed_ = false;
};

[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// TXP_TRY: unwrap a Result or return its error (GCC/Clang
// statement-expression).
// Usage:  auto val = TXP_TRY(some_result_expr);
#define TXP_TRY(expr)                                                     \
    ({                                                                    \
        auto&& _txp_res = (expr);                                         \
        if (!_txp_res.ok()) return std::move(_txp_res).error();           \
        std::move(_txp_res).value();                                      \
    })

// TXP_TRY_VOID: return the error of a failed Result<void>
#define TXP_TRY_VOID(expr)                                                \
    do {                                                                  \
        auto _txp_tmp = (expr);                                           \
        if (!_txp_tmp.ok()) return std::move(_txp_tmp).error();           \
    } while (false)

} // namespace core
