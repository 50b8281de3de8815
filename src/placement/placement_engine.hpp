/**
 * @file placement_engine.hpp
 * @brief Placement Engine: picks a node for a resource request.
 * @author Dimitris Kafetzis
 *
 * Algorithm:
 *   1. Eligible  = nodes that are healthy, not in maintenance, not withheld
 *   2. Affinity  = eligible minus excluded-nodes / separate-from owner,
 *                  restricted to the co-locate-with owner when set
 *   3. Fit       = affinity set with available >= request on every dimension
 *   4. Preferred = fit ∩ preferred-nodes when that intersection is non-empty
 *   5. Rank by strategy score (descending), ties by node id (ascending)
 *   6. Compare-and-commit on the ledger; on conflict recompute and retry
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "health/health_monitor.hpp"
#include "ledger/resource_ledger.hpp"
#include "placement/placement_strategy.hpp"

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace compute_orchestrator {

/**
 * @brief Ledger snapshot joined with the health cache at one instant.
 */
struct ClusterState {
    LedgerSnapshot ledger;
    std::unordered_map<NodeId, NodeStatus> health;

    [[nodiscard]] bool schedulable(const NodeId& id) const;
};

struct PlacementRequest {
    WorkloadId workload;
    Resources resources;
    AffinityConstraints constraints;
    PlacementStrategyKind strategy{PlacementStrategyKind::Balanced};
};

struct ScoredNode {
    NodeId node_id;
    double score{0.0};
};

struct PlacementDecision {
    NodeId node_id;
    double score{0.0};
    size_t candidate_count{0};
    uint32_t attempts{0};
};

class PlacementEngine {
public:
    PlacementEngine(ResourceLedger& ledger,
                    const HealthMonitor& health,
                    Logger& logger,
                    uint32_t max_reservation_retries = 5);

    /// Join the current ledger snapshot with the cached health status.
    [[nodiscard]] ClusterState capture() const;

    /**
     * @brief Rank every feasible node for @p request against @p state.
     *
     * Pure function of its inputs: identical state, constraints and strategy
     * always produce the same ordering. @p withheld nodes are treated as
     * unavailable (e.g. the source node during evacuation).
     */
    [[nodiscard]] Result<std::vector<ScoredNode>> rank(
        const ClusterState& state,
        const Resources& request,
        const AffinityConstraints& constraints,
        PlacementStrategyKind strategy,
        const std::unordered_set<NodeId>& withheld = {}) const;

    /// First entry of rank(), without reserving anything.
    [[nodiscard]] Result<NodeId> select(
        const ClusterState& state,
        const Resources& request,
        const AffinityConstraints& constraints,
        PlacementStrategyKind strategy,
        const std::unordered_set<NodeId>& withheld = {}) const;

    /**
     * @brief Select a node and atomically reserve capacity and ownership for
     *        the workload, retrying on ledger conflicts.
     */
    Result<PlacementDecision> place(const PlacementRequest& request);

    /**
     * @brief Reserve capacity for an existing workload on a specific node,
     *        retrying on ledger conflicts. Used for migration targets.
     */
    Result<void> reserve_on(const NodeId& node,
                            const WorkloadId& workload,
                            const Resources& request);

    [[nodiscard]] uint32_t max_retries() const noexcept { return max_retries_; }

    /// Test helper: runs after the node version is read and before the
    /// compare-and-commit, so a test can make the commit lose a race.
    void set_before_commit(std::function<void(const NodeId&)> hook) { before_commit_ = std::move(hook); }

private:
    ResourceLedger& ledger_;
    const HealthMonitor& health_;
    Logger& logger_;
    uint32_t max_retries_;
    std::function<void(const NodeId&)> before_commit_;
};

}  // namespace compute_orchestrator
