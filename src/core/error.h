#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: categorized error codes for the ELMS stack
enum class ErrorCode : uint16_t {
    NONE                      = 0,
    // Syntax / descriptor text (100-199)
    PARSE_ERROR               = 100, UNEXPECTED          = 101,
    BAD_CHECKSUM              = 102, BAD_HEX             = 103,
    BAD_KEY                   = 104, BAD_NUMBER          = 105,
    // Miniscript typing (200-299)
    TYPE_CHECK                = 200, NON_TOP_LEVEL       = 201,
    TRAILING                  = 202, MALLEABLE           = 203,
    NON_MINIMAL_VERIFY        = 204, MIXED_TIMELOCKS     = 205,
    REPEATED_KEYS             = 206, SIG_FREE_PATH       = 207,
    BAD_COV_DESCRIPTOR        = 208, BAD_SCRIPT          = 209,
    // Script context limits (300-399)
    SCRIPT_SIZE_TOO_LARGE     = 300, MAX_REDEEM_SCRIPT_SIZE = 301,
    MAX_OPS_EXCEEDED          = 302, MAX_WITNESS_ITEMS   = 303,
    COMPRESSED_ONLY           = 304, XONLY_REQUIRED      = 305,
    MULTI_A_NOT_ALLOWED       = 306, MULTI_NOT_ALLOWED   = 307,
    NON_STANDARD_BARE_SCRIPT  = 308, MAX_SCRIPTSIG_SIZE  = 309,
    // Satisfaction (400-499)
    MISSING_SIG               = 400, MISSING_COV_SIGNATURE = 401,
    MISSING_SIGHASH_ITEM      = 402, COV_SIGHASH_TYPE_MISMATCH = 403,
    IMPOSSIBLE_SATISFACTION   = 404, COULD_NOT_SATISFY   = 405,
    // Interpreter (500-599)
    NON_EMPTY_WITNESS         = 500, NON_EMPTY_SCRIPT_SIG = 501,
    UNEXPECTED_STACK_END      = 502, EXPECTED_PUSH       = 503,
    INCORRECT_PUBKEY_HASH     = 504, INCORRECT_WPUBKEY_HASH = 505,
    INCORRECT_SCRIPT_HASH     = 506, INCORRECT_WSCRIPT_HASH = 507,
    UNCOMPRESSED_PUBKEY       = 508, PUBKEY_PARSE        = 509,
    XONLY_PUBKEY_PARSE        = 510, TAP_ANNEX_UNSUPPORTED = 511,
    CONTROL_BLOCK_PARSE       = 512, CONTROL_BLOCK_VERIFICATION = 513,
    // Addresses (600-699)
    BARE_DESCRIPTOR_ADDR      = 600, ADDRESS_ERROR       = 601,
    // Cryptography (700-799)
    CRYPTO_ERROR              = 700, CRYPTO_HASH_FAIL    = 701,
    CRYPTO_KEY_FAIL           = 702,
    // Configuration (800-899)
    CONFIG_ERROR              = 800,
    // Internal (900-999)
    INTERNAL_ERROR            = 900, NOT_IMPLEMENTED     = 901,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// Error: rich error value carrying code, message, and origin location
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

    /// Item index attached to errors that name a position, such as a
    /// missing covenant sighash component.
    [[nodiscard]] std::optional<uint32_t> index() const noexcept {
        return index_;
    }
    Error& with_index(uint32_t idx) noexcept {
        index_ = idx;
        return *this;
    }

    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }
    [[nodiscard]] std::string format() const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode               code_;
    std::string             message_;
    std::source_location    location_;
    std::optional<uint32_t> index_;
};

// Result<T, E>: a sum type holding either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T default_val) const {
        return ok() ? std::get<T>(storage_) : std::move(default_val);
    }

    // map: Result<T,E> -> (T -> U) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto map(F&& func) const&
        -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (ok()) return Result<U, E>{func(std::get<T>(storage_))};
        return Result<U, E>{std::get<E>(storage_)};
    }

    // and_then: Result<T,E> -> (T -> Result<U,E>) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const&
        -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (ok()) return func(std::get<T>(storage_));
        return R{std::get<E>(storage_)};
    }

private:
    std::variant<T, E> storage_;
};

// Void-specialization: Result<void, E> for check-only operations
template <typename E>
class Result<void, E> {
public:
    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (!ok()) throw std::runtime_error("Result::value() on error");
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

// Factory helpers
[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// ELMS_TRY: propagate errors (GCC/Clang statement-expression)
// Usage:  auto val = ELMS_TRY(some_result_expr);
#define ELMS_TRY(expr)                                                    \
    ({                                                                    \
        auto&& _elms_res = (expr);                                        \
        if (!_elms_res.ok()) return std::move(_elms_res).error();         \
        std::move(_elms_res).value();                                     \
    })

// ELMS_TRY_ASSIGN: portable alternative (no statement-expressions)
// Usage:  ELMS_TRY_ASSIGN(val, some_result_expr);
#define ELMS_TRY_ASSIGN(var, expr)                                        \
    auto _elms_tmp_##var = (expr);                                        \
    if (!_elms_tmp_##var.ok())                                            \
        return std::move(_elms_tmp_##var).error();                        \
    auto var = std::move(_elms_tmp_##var).value()

// ELMS_TRY_VOID: propagate errors from Result<void> expressions
#define ELMS_TRY_VOID(expr)                                               \
    do {                                                                  \
        auto _elms_tmp = (expr);                                          \
        if (!_elms_tmp.ok()) return std::move(_elms_tmp).error();         \
    } while (false)

} // namespace core
