/**
 * @file result.hpp
 * @brief Monadic error handling type and error taxonomy for ComputeOrchestrator.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Errors carry
 * a kind from the orchestrator's taxonomy so callers can decide whether to
 * retry with different parameters, plus the migration stage where relevant.
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

namespace compute_orchestrator {

// ─────────────────────────────────────────────
// Error taxonomy
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    InsufficientCapacity,   ///< No node had enough free resource
    AffinityUnsatisfiable,  ///< Capacity existed but constraints excluded every candidate
    AllNodesUnavailable,    ///< Every node unhealthy or in maintenance
    ReservationConflict,    ///< Ledger changed between read and commit (transient)
    MigrationConflict,      ///< Workload already has an active migration job
    PreflightIncompatible,  ///< Live migration CPU/hypervisor mismatch
    StageTimeout,
    StageFailed,
    NotFound,
    InvalidArgument,
    Cancelled,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InsufficientCapacity:  return "insufficient_capacity";
        case ErrorKind::AffinityUnsatisfiable: return "affinity_unsatisfiable";
        case ErrorKind::AllNodesUnavailable:   return "all_nodes_unavailable";
        case ErrorKind::ReservationConflict:   return "reservation_conflict";
        case ErrorKind::MigrationConflict:     return "migration_conflict";
        case ErrorKind::PreflightIncompatible: return "preflight_incompatible";
        case ErrorKind::StageTimeout:          return "stage_timeout";
        case ErrorKind::StageFailed:           return "stage_failed";
        case ErrorKind::NotFound:              return "not_found";
        case ErrorKind::InvalidArgument:       return "invalid_argument";
        case ErrorKind::Cancelled:             return "cancelled";
        case ErrorKind::Internal:              return "internal";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a kind, a descriptive message and an optional stage.
 */
struct Error {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;
    std::string stage;                        ///< Migration stage name, empty otherwise

    explicit Error(std::string msg) : message(std::move(msg)) {}

    Error(ErrorKind k, std::string msg, std::string stage_name = {})
        : kind(k), message(std::move(msg)), stage(std::move(stage_name)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// "kind: message" or "kind [stage]: message".
    [[nodiscard]] std::string describe() const {
        std::string out{to_string(kind)};
        if (!stage.empty()) out += " [" + stage + "]";
        out += ": " + message;
        return out;
    }
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
Result<T, E> make_error(ErrorKind kind, std::string message) {
    return Result<T, E>(E{kind, std::move(message)});
}

}  // namespace compute_orchestrator
