/**
 * @file types.hpp
 * @brief Fundamental types used throughout ComputeOrchestrator.
 * @author Dimitris Kafetzis
 *
 * Defines NodeId, WorkloadId, Resources, ComputeNode, Workload, affinity
 * constraints and the small enums shared by every module. All types are
 * designed for value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace compute_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using WorkloadId = std::string;
using JobId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────

/**
 * @brief A three-dimensional resource amount (vCPU, memory MB, disk GB).
 *
 * Used both for requests and for capacities. Subtraction saturates at zero
 * so a free-capacity value can never go negative.
 */
struct Resources {
    uint64_t vcpus{0};
    uint64_t memory_mb{0};
    uint64_t disk_gb{0};

    auto operator<=>(const Resources&) const = default;

    /// True when every dimension of this amount is <= the same dimension of @p other.
    [[nodiscard]] constexpr bool fits_within(const Resources& other) const noexcept {
        return vcpus <= other.vcpus
            && memory_mb <= other.memory_mb
            && disk_gb <= other.disk_gb;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return vcpus == 0 && memory_mb == 0 && disk_gb == 0;
    }

    constexpr Resources& operator+=(const Resources& rhs) noexcept {
        vcpus += rhs.vcpus;
        memory_mb += rhs.memory_mb;
        disk_gb += rhs.disk_gb;
        return *this;
    }

    constexpr Resources& operator-=(const Resources& rhs) noexcept {
        vcpus = vcpus > rhs.vcpus ? vcpus - rhs.vcpus : 0;
        memory_mb = memory_mb > rhs.memory_mb ? memory_mb - rhs.memory_mb : 0;
        disk_gb = disk_gb > rhs.disk_gb ? disk_gb - rhs.disk_gb : 0;
        return *this;
    }

    friend constexpr Resources operator+(Resources lhs, const Resources& rhs) noexcept {
        return lhs += rhs;
    }

    friend constexpr Resources operator-(Resources lhs, const Resources& rhs) noexcept {
        return lhs -= rhs;
    }
};

[[nodiscard]] std::string to_string(const Resources& r);

// ─────────────────────────────────────────────
// Compute Node
// ─────────────────────────────────────────────

enum class HealthStatus : uint8_t {
    Unknown,
    Healthy,
    Unhealthy
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Unknown:   return "unknown";
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

/**
 * @brief A physical host offering capacity.
 *
 * Health and maintenance are not stored here: they are owned by the
 * HealthMonitor cache and read through it.
 */
struct ComputeNode {
    NodeId id;
    std::string address;                      ///< Host address probed by the health monitor
    Resources total;                          ///< Physical capacity
    double cpu_overcommit{1.0};
    double memory_overcommit{1.0};
    double disk_overcommit{1.0};
    std::string cpu_model;                    ///< Checked by live-migration preflight
    std::string hypervisor;                   ///< Hypervisor name and version

    /// Schedulable ceiling: total × overcommit ratio, per dimension.
    [[nodiscard]] Resources capacity() const noexcept;

    /// Every overcommit ratio is finite and >= 1.0.
    [[nodiscard]] bool has_valid_overcommit() const noexcept;
};

// ─────────────────────────────────────────────
// Workload
// ─────────────────────────────────────────────

enum class WorkloadState : uint8_t {
    Provisioning,
    Running,
    Stopped,
    Migrating,
    Error,
    Deleted
};

[[nodiscard]] constexpr std::string_view to_string(WorkloadState state) noexcept {
    switch (state) {
        case WorkloadState::Provisioning: return "provisioning";
        case WorkloadState::Running:      return "running";
        case WorkloadState::Stopped:      return "stopped";
        case WorkloadState::Migrating:    return "migrating";
        case WorkloadState::Error:        return "error";
        case WorkloadState::Deleted:      return "deleted";
    }
    return "unknown";
}

/// Whether a workload in @p state keeps its reservation on the owning node.
[[nodiscard]] constexpr bool holds_capacity(WorkloadState state) noexcept {
    return state != WorkloadState::Deleted;
}

/**
 * @brief Placement rules attached to a request.
 */
struct AffinityConstraints {
    std::vector<NodeId> preferred_nodes;      ///< Soft whitelist
    std::vector<NodeId> excluded_nodes;       ///< Hard blacklist
    std::optional<WorkloadId> co_locate_with;
    std::optional<WorkloadId> separate_from;

    [[nodiscard]] bool empty() const noexcept {
        return preferred_nodes.empty() && excluded_nodes.empty()
            && !co_locate_with && !separate_from;
    }
};

struct Workload {
    WorkloadId id;
    Resources request;
    std::optional<NodeId> owner;
    WorkloadState state{WorkloadState::Provisioning};
    AffinityConstraints affinity;
};

// ─────────────────────────────────────────────
// Strategy / Mode
// ─────────────────────────────────────────────

enum class PlacementStrategyKind : uint8_t {
    Balanced,
    Packed,
    Spread
};

[[nodiscard]] constexpr std::string_view to_string(PlacementStrategyKind kind) noexcept {
    switch (kind) {
        case PlacementStrategyKind::Balanced: return "balanced";
        case PlacementStrategyKind::Packed:   return "packed";
        case PlacementStrategyKind::Spread:   return "spread";
    }
    return "unknown";
}

[[nodiscard]] std::optional<PlacementStrategyKind> parse_strategy(std::string_view name) noexcept;

enum class MigrationMode : uint8_t {
    Offline,
    Live
};

[[nodiscard]] constexpr std::string_view to_string(MigrationMode mode) noexcept {
    switch (mode) {
        case MigrationMode::Offline: return "offline";
        case MigrationMode::Live:    return "live";
    }
    return "unknown";
}

[[nodiscard]] std::optional<MigrationMode> parse_migration_mode(std::string_view name) noexcept;

}  // namespace compute_orchestrator
