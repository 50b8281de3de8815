/**
 * @file cluster_manager.hpp
 * @brief Multi-workload operations: evacuation, rebalancing, cluster health.
 * @author Dimitris Kafetzis
 *
 * Evacuation is all-or-nothing at planning time: a dry run over one captured
 * cluster state must find a destination for every workload on the node before
 * the first migration starts. Execution is sequential and stops at the first
 * failed migration. Both long operations check a stop token between
 * migrations; a migration already started is always allowed to finish.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "health/health_monitor.hpp"
#include "ledger/resource_ledger.hpp"
#include "migration/migration_orchestrator.hpp"
#include "placement/placement_engine.hpp"

#include <optional>
#include <stop_token>
#include <string_view>
#include <vector>

namespace compute_orchestrator {

enum class MoveOutcome : uint8_t {
    Planned,          ///< Dry run: destination found, nothing executed
    Migrated,
    Failed,           ///< Migration ran and failed (rolled back or post-commit)
    NoDestination,    ///< Planning found no feasible node
    Blocked,          ///< Workload state does not allow migration
    Skipped           ///< Not attempted (earlier failure, cancellation or pre-check)
};

[[nodiscard]] constexpr std::string_view to_string(MoveOutcome outcome) noexcept {
    switch (outcome) {
        case MoveOutcome::Planned:       return "planned";
        case MoveOutcome::Migrated:      return "migrated";
        case MoveOutcome::Failed:        return "failed";
        case MoveOutcome::NoDestination: return "no_destination";
        case MoveOutcome::Blocked:       return "blocked";
        case MoveOutcome::Skipped:       return "skipped";
    }
    return "unknown";
}

/**
 * @brief Per-workload line of an evacuation or rebalance report.
 */
struct WorkloadMove {
    WorkloadId workload;
    NodeId source;
    std::optional<NodeId> target;
    MigrationMode mode{MigrationMode::Live};
    MoveOutcome outcome{MoveOutcome::Planned};
    double improvement{0.0};                  ///< Projected variance reduction (rebalance only)
    std::optional<JobId> job;
    std::optional<Error> error;
};

struct EvacuationReport {
    NodeId node;
    std::vector<WorkloadMove> moves;
    std::optional<Error> error;               ///< Set when the evacuation did not complete

    [[nodiscard]] bool succeeded() const noexcept { return !error.has_value(); }
    [[nodiscard]] size_t count(MoveOutcome outcome) const noexcept;
};

struct RebalanceReport {
    bool dry_run{true};
    size_t eligible_nodes{0};
    double variance_before{0.0};
    double variance_after{0.0};               ///< Projected from the plan
    std::vector<WorkloadMove> moves;
    std::optional<Error> error;

    [[nodiscard]] bool succeeded() const noexcept { return !error.has_value(); }
    [[nodiscard]] size_t count(MoveOutcome outcome) const noexcept;
};

enum class ClusterStatus : uint8_t {
    Healthy,
    Degraded
};

[[nodiscard]] constexpr std::string_view to_string(ClusterStatus status) noexcept {
    switch (status) {
        case ClusterStatus::Healthy:  return "healthy";
        case ClusterStatus::Degraded: return "degraded";
    }
    return "unknown";
}

struct UtilizationSummary {
    Resources capacity;                       ///< Sum of overcommitted capacity
    Resources allocated;
    double vcpu_percent{0.0};
    double memory_percent{0.0};
    double disk_percent{0.0};
};

struct ClusterHealth {
    size_t node_count{0};
    size_t healthy_count{0};
    size_t unhealthy_count{0};
    size_t unknown_count{0};
    size_t maintenance_count{0};
    size_t workload_count{0};
    size_t running_count{0};
    size_t stopped_count{0};
    size_t migrating_count{0};
    UtilizationSummary utilization;
    ClusterStatus status{ClusterStatus::Healthy};
};

/// Mean of vCPU and memory utilization against overcommitted capacity, in [0, 1].
[[nodiscard]] double node_utilization(const NodeAllocation& node) noexcept;

/// Population variance of node_utilization over @p nodes.
[[nodiscard]] double utilization_variance(const LedgerSnapshot& snapshot,
                                          const std::vector<NodeId>& nodes);

class ClusterManager {
public:
    ClusterManager(ResourceLedger& ledger,
                   PlacementEngine& placement,
                   HealthMonitor& health,
                   MigrationOrchestrator& migrations,
                   RebalanceConfig config,
                   PlacementStrategyKind strategy,
                   Logger& logger);

    /// Administrative maintenance flag. Does not move workloads.
    Result<void> set_maintenance(const NodeId& node, bool maintenance);

    /**
     * @brief Move every workload off @p node, or none of them.
     *
     * Returns NotFound for an unknown node; every other outcome, including a
     * failed pre-check, is described by the report.
     */
    Result<EvacuationReport> evacuate_node(const NodeId& node, std::stop_token stop = {});

    /**
     * @brief Plan (and unless @p dry_run, execute) moves that reduce
     *        utilization variance across healthy, non-maintenance nodes.
     */
    RebalanceReport rebalance_cluster(bool dry_run, std::stop_token stop = {});

    [[nodiscard]] ClusterHealth cluster_health() const;

private:
    /// Start one migration and wait for it; fills outcome, job and error.
    void execute_move(WorkloadMove& move);

    ResourceLedger& ledger_;
    PlacementEngine& placement_;
    HealthMonitor& health_;
    MigrationOrchestrator& migrations_;
    RebalanceConfig config_;
    PlacementStrategyKind strategy_;
    Logger& logger_;
};

}  // namespace compute_orchestrator
