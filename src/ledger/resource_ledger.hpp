/**
 * @file resource_ledger.hpp
 * @brief Authoritative record of node capacity, reservations and workload ownership.
 * @author Dimitris Kafetzis
 *
 * The ledger is the only mutable shared state in the orchestrator. Readers take
 * a versioned snapshot; writers commit with compare-and-commit against the
 * per-node version they observed. The internal mutex is held only for the
 * duration of a single compare or commit, never across hypervisor or probe I/O.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace compute_orchestrator {

/**
 * @brief Point-in-time view of one node's capacity and allocation.
 */
struct NodeAllocation {
    ComputeNode node;
    Resources capacity;                       ///< total × overcommit
    Resources allocated;                      ///< Sum of reservations held on the node
    size_t workload_count{0};                 ///< Number of reservations held on the node
    uint64_t version{0};                      ///< Bumped on every allocation change

    [[nodiscard]] Resources available() const noexcept { return capacity - allocated; }
};

/**
 * @brief Consistent copy of the whole ledger, ordered by node id.
 */
struct LedgerSnapshot {
    std::vector<NodeAllocation> nodes;
    std::unordered_map<WorkloadId, NodeId> owners;

    [[nodiscard]] const NodeAllocation* find(const NodeId& id) const;
    [[nodiscard]] NodeAllocation* find(const NodeId& id);
    [[nodiscard]] std::optional<NodeId> owner_of(const WorkloadId& id) const;

    /// Record a hypothetical reservation (dry-run planning only).
    void simulate_reserve(const NodeId& node, const Resources& request);
    /// Undo a hypothetical reservation (dry-run planning only).
    void simulate_release(const NodeId& node, const Resources& request);
};

enum class ReserveOutcome : uint8_t {
    Reserved,
    Conflict,                 ///< Node version changed since the caller's read
    InsufficientCapacity,
    UnknownNode,
    AlreadyPlaced             ///< Workload already owned by a node
};

[[nodiscard]] constexpr std::string_view to_string(ReserveOutcome outcome) noexcept {
    switch (outcome) {
        case ReserveOutcome::Reserved:             return "reserved";
        case ReserveOutcome::Conflict:             return "conflict";
        case ReserveOutcome::InsufficientCapacity: return "insufficient_capacity";
        case ReserveOutcome::UnknownNode:          return "unknown_node";
        case ReserveOutcome::AlreadyPlaced:        return "already_placed";
    }
    return "unknown";
}

/**
 * @brief Thread-safe resource ledger with optimistic concurrency.
 */
class ResourceLedger {
public:
    explicit ResourceLedger(Logger& logger);

    // Non-copyable
    ResourceLedger(const ResourceLedger&) = delete;
    ResourceLedger& operator=(const ResourceLedger&) = delete;

    // ── Node inventory ───────────────────────
    Result<void> register_node(ComputeNode node);
    /// Fails while any reservation is still held on the node.
    Result<void> remove_node(const NodeId& id);
    [[nodiscard]] std::optional<ComputeNode> node(const NodeId& id) const;
    [[nodiscard]] std::vector<NodeId> node_ids() const;

    // ── Capacity ─────────────────────────────
    [[nodiscard]] Result<Resources> available_capacity(const NodeId& id) const;
    [[nodiscard]] Result<NodeAllocation> read(const NodeId& id) const;
    [[nodiscard]] LedgerSnapshot snapshot() const;

    /**
     * @brief Compare-and-commit reservation of @p request for @p workload on @p node.
     *
     * Commits only if the node's version still equals @p expected_version and
     * the post-reservation allocation stays within capacity on every dimension.
     * Reserving again for a workload that already holds a reservation on the
     * node is a no-op returning Reserved.
     */
    ReserveOutcome try_reserve(const NodeId& node,
                               const WorkloadId& workload,
                               const Resources& request,
                               uint64_t expected_version);

    /// Read the current version, then compare-and-commit against it.
    ReserveOutcome try_reserve(const NodeId& node,
                               const WorkloadId& workload,
                               const Resources& request);

    /**
     * @brief Reserve on @p node and record @p workload as owned by it, atomically.
     *
     * Used for initial placement. Fails with AlreadyPlaced if the workload is
     * already owned by any node.
     */
    ReserveOutcome try_place(const NodeId& node,
                             const Workload& workload,
                             uint64_t expected_version);

    /// Remove a reservation. Idempotent: no-op if nothing is held.
    void release(const NodeId& node, const WorkloadId& workload);

    // ── Ownership ────────────────────────────

    /**
     * @brief Flip ownership of @p workload from @p from to @p to.
     *
     * Requires the workload to be owned by @p from and to already hold a
     * reservation on @p to. Releases the source reservation in the same
     * critical section.
     */
    Result<void> commit_transfer(const WorkloadId& workload,
                                 const NodeId& from,
                                 const NodeId& to);

    /**
     * @brief Lifecycle change requested by a caller.
     *
     * Fails with MigrationConflict while the workload is Migrating; only
     * end_migration() moves a workload out of that state. Setting Migrating
     * directly is rejected, use begin_migration().
     */
    Result<void> set_workload_state(const WorkloadId& workload, WorkloadState state);

    /// Mark deleted, clear the owner and release the reservation. Idempotent.
    /// Fails with MigrationConflict while the workload is Migrating.
    Result<void> release_workload(const WorkloadId& workload);

    /**
     * @brief Move a Running or Stopped workload into Migrating.
     *
     * Returns the state it held before, which end_migration() restores.
     */
    Result<WorkloadState> begin_migration(const WorkloadId& workload);

    /// Leave Migrating for @p state (anything but Migrating or Deleted).
    Result<void> end_migration(const WorkloadId& workload, WorkloadState state);

    [[nodiscard]] std::optional<Workload> workload(const WorkloadId& id) const;
    [[nodiscard]] std::vector<Workload> workloads() const;
    [[nodiscard]] std::vector<Workload> workloads_on(const NodeId& node) const;

private:
    struct NodeEntry {
        ComputeNode node;
        Resources capacity;
        Resources allocated;
        std::map<WorkloadId, Resources> reservations;
        uint64_t version{0};
    };

    [[nodiscard]] NodeAllocation to_allocation(const NodeEntry& entry) const;
    ReserveOutcome reserve_locked(NodeEntry& entry,
                                  const WorkloadId& workload,
                                  const Resources& request,
                                  uint64_t expected_version);

    Logger& logger_;
    mutable std::shared_mutex mutex_;
    std::map<NodeId, NodeEntry> nodes_;
    std::map<WorkloadId, Workload> workloads_;
};

}  // namespace compute_orchestrator
