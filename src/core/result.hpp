/**
 * @file result.hpp
 * @brief Monadic error handling type for SquadRotation.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Every
 * failure the optimizer can report (bad input, conflicting constraints,
 * infeasible lineups, unreadable configuration) travels as an Error value
 * carrying a machine-readable code and the offending identifiers.
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
#include <vector>

namespace squad_rotation {

/**
 * @brief Error taxonomy.
 */
enum class ErrorCode : uint8_t {
    Validation,             ///< Malformed or out-of-range input, rejected before any solve
    ConstraintConflict,     ///< Locks/rejections/rest requests that contradict each other
    InfeasibleAssignment,   ///< No valid lineup exists under the constraints
    Config                  ///< Configuration file missing or unparsable
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Validation:           return "validation";
        case ErrorCode::ConstraintConflict:   return "constraint_conflict";
        case ErrorCode::InfeasibleAssignment: return "infeasible_assignment";
        case ErrorCode::Config:               return "config";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code, a descriptive message and the ids
 *        (workers, slots, events) it concerns.
 */
struct Error {
    ErrorCode code = ErrorCode::Validation;
    std::string message;
    std::vector<std::string> subjects;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::vector<std::string> ids = {})
        : code(c), message(std::move(msg)), subjects(std::move(ids)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
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

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 *
 * Used by the validators: the operation can fail but yields nothing.
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

// ── Helpers ──────────────────────────────────

[[nodiscard]] inline Error validation_error(std::string message,
                                            std::vector<std::string> subjects = {}) {
    return Error{ErrorCode::Validation, std::move(message), std::move(subjects)};
}

[[nodiscard]] inline Error conflict_error(std::string message,
                                          std::vector<std::string> subjects = {}) {
    return Error{ErrorCode::ConstraintConflict, std::move(message), std::move(subjects)};
}

[[nodiscard]] inline Error infeasible_error(std::string message,
                                            std::vector<std::string> subjects = {}) {
    return Error{ErrorCode::InfeasibleAssignment, std::move(message), std::move(subjects)};
}

}  // namespace squad_rotation
