/**
 * @file result.hpp
 * @brief Monadic error handling type for EdgeTwin.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Backend
 * unavailability, configuration problems and protocol failures are all
 * reported as values; exceptions are reserved for misuse of the Result
 * itself.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace edge_twin {

/**
 * @brief Broad classification of an error, used by callers that react
 *        differently to e.g. an unreachable backend and a malformed reply.
 */
enum class ErrorCode : uint8_t {
    Unknown,
    InvalidArgument,   ///< Rejected input or configuration
    Unavailable,       ///< Peer/backend not reachable or timed out
    NotFound,          ///< Entity absent
    Protocol,          ///< Unexpected status or malformed wire data
    Parse,             ///< Document could not be parsed
    Io                 ///< Local file or socket error
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown:          return "unknown";
        case ErrorCode::InvalidArgument:  return "invalid_argument";
        case ErrorCode::Unavailable:      return "unavailable";
        case ErrorCode::NotFound:         return "not_found";
        case ErrorCode::Protocol:         return "protocol";
        case ErrorCode::Parse:            return "parse";
        case ErrorCode::Io:               return "io";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a classification and a descriptive message.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Unknown};

    explicit Error(std::string msg, ErrorCode c = ErrorCode::Unknown)
        : message(std::move(msg)), code(c) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E> — a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(std::string message, ErrorCode code = ErrorCode::Unknown) {
    return Result<T, E>(E{std::move(message), code});
}

}  // namespace edge_twin
