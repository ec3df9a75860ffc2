/**
 * @file result.hpp
 * @brief Monadic error handling type for TaskOrchestrator.
 * @author Dimitris Kafetzis
 *
 * Result<T, E> is the only error channel between modules: storage failures,
 * not-found conditions and lifecycle gate violations all travel as an Error
 * with a distinguishable ErrorCode so the presentation layer can render
 * precise guidance.
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

namespace task_orchestrator {

// ─────────────────────────────────────────────
// Error Taxonomy
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    Internal,
    InvalidArgument,
    NotFound,                    ///< Unknown task id
    ProjectNotFound,
    DependencyEndpointNotFound,
    SelfDependency,
    CycleRejected,               ///< Only when eager cycle rejection is enabled
    ProjectMismatch,
    GateViolation,
    StorageFailure,
    ConfigError,
    AdvisorFailure
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Internal:                   return "internal";
        case ErrorCode::InvalidArgument:            return "invalid_argument";
        case ErrorCode::NotFound:                   return "task_not_found";
        case ErrorCode::ProjectNotFound:            return "project_not_found";
        case ErrorCode::DependencyEndpointNotFound: return "dependency_endpoint_not_found";
        case ErrorCode::SelfDependency:             return "self_dependency";
        case ErrorCode::CycleRejected:              return "cycle_rejected";
        case ErrorCode::ProjectMismatch:            return "project_mismatch";
        case ErrorCode::GateViolation:              return "gate_violation";
        case ErrorCode::StorageFailure:             return "storage_failure";
        case ErrorCode::ConfigError:                return "config_error";
        case ErrorCode::AdvisorFailure:             return "advisor_failure";
    }
    return "unknown";
}

/**
 * @brief Lifecycle gates. Each violation is user-correctable.
 */
enum class GateKind : uint8_t {
    SpecMissing,
    TestResultsMissing,
    TestsFailed,
    ApprovalRequired
};

[[nodiscard]] constexpr std::string_view to_string(GateKind kind) noexcept {
    switch (kind) {
        case GateKind::SpecMissing:        return "spec_missing";
        case GateKind::TestResultsMissing: return "test_results_missing";
        case GateKind::TestsFailed:        return "tests_failed";
        case GateKind::ApprovalRequired:   return "approval_required";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
    std::optional<GateKind> gate;   ///< Set iff code == GateViolation

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    static Error gate_violation(GateKind kind, std::string msg) {
        Error err{ErrorCode::GateViolation, std::move(msg)};
        err.gate = kind;
        return err;
    }

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }
    [[nodiscard]] bool is_gate(GateKind kind) const noexcept {
        return code == ErrorCode::GateViolation && gate == kind;
    }
};

// ─────────────────────────────────────────────
// Result<T, E>
// ─────────────────────────────────────────────

/**
 * @brief Holds either a success value of type T or an error of type E.
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
 * @brief Specialization of Result for operations with no success value.
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
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace task_orchestrator
