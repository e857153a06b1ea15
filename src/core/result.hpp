/**
 * @file result.hpp
 * @brief Monadic error handling type for FlexResolver.
 *
 * Provides Result<T, E> as the error channel of every resolver path.
 * Errors carry an ErrorKind tag so callers can branch on the
 * classification (NotFound drives the force-refresh retry) instead of
 * on the message text.
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

namespace flex_resolver {

// ─────────────────────────────────────────────
// Error classification
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    NotFound,       ///< Queried node/VM/scale set does not exist upstream
    Upstream,       ///< Any other failure of the inventory API
    InvalidConfig   ///< Configuration or inventory file unreadable
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:      return "not_found";
        case ErrorKind::Upstream:      return "upstream";
        case ErrorKind::InvalidConfig: return "invalid_config";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a classification and a descriptive message.
 */
struct Error {
    ErrorKind kind;
    std::string message;

    explicit Error(std::string msg, ErrorKind k = ErrorKind::Upstream)
        : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is_not_found() const noexcept { return kind == ErrorKind::NotFound; }

    static Error not_found(std::string msg) { return Error{std::move(msg), ErrorKind::NotFound}; }
    static Error upstream(std::string msg) { return Error{std::move(msg), ErrorKind::Upstream}; }
    static Error invalid_config(std::string msg) {
        return Error{std::move(msg), ErrorKind::InvalidConfig};
    }
};

/**
 * @brief Result<T, E>: holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

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

    /// True when this result failed with ErrorKind::NotFound.
    [[nodiscard]] bool is_not_found() const noexcept {
        const auto* err = std::get_if<E>(&storage_);
        return err != nullptr && err->kind == ErrorKind::NotFound;
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
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
 * @brief Result for operations with no success payload.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

}  // namespace flex_resolver
