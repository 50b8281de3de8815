/**
 * @file simulated_hypervisor.hpp
 * @brief In-memory hypervisor driver with fault, delay and gate injection.
 * @author Dimitris Kafetzis
 *
 * Used by the test suites and the --demo cluster. Keeps a domain table per
 * (node, workload) and applies each operation's effect atomically. Delays and
 * gates wait on a condition variable that also observes the caller's stop
 * token, so a stage timeout interrupts them.
 */

#pragma once

#include "hypervisor/driver.hpp"

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace compute_orchestrator {

class SimulatedHypervisor : public IHypervisorDriver {
public:
    enum class Operation : uint8_t {
        HostInfo,
        QueryState,
        CreateWorkload,
        Start,
        Stop,
        Destroy,
        CopyDisk,
        StreamMemory,
        Switchover
    };

    // ── IHypervisorDriver ────────────────────
    Result<HostInfo> host_info(const ComputeNode& node) override;
    Result<DomainState> query_state(const ComputeNode& node, const WorkloadId& id) override;
    Result<void> create_workload(const ComputeNode& node, const Workload& spec,
                                 std::stop_token stop) override;
    Result<void> start(const ComputeNode& node, const WorkloadId& id,
                       std::stop_token stop) override;
    Result<void> stop(const ComputeNode& node, const WorkloadId& id,
                      std::stop_token stop) override;
    Result<void> destroy(const ComputeNode& node, const WorkloadId& id,
                         std::stop_token stop) override;
    Result<void> copy_disk(const ComputeNode& source, const ComputeNode& target,
                           const WorkloadId& id, std::stop_token stop) override;
    Result<void> stream_memory_state(const ComputeNode& source, const ComputeNode& target,
                                     const WorkloadId& id, std::stop_token stop) override;
    Result<void> switchover(const ComputeNode& source, const ComputeNode& target,
                            const WorkloadId& id, std::stop_token stop) override;

    // ── Test helpers ─────────────────────────

    /// Define a domain directly (seeds pre-existing workloads).
    void set_domain(const NodeId& node, const WorkloadId& id, DomainState state);
    [[nodiscard]] DomainState domain(const NodeId& node, const WorkloadId& id) const;

    /// Override host info reported for a node (defaults to the ComputeNode fields).
    void set_host_info(const NodeId& node, HostInfo info);

    /// Fail the next @p count calls of @p op with @p detail.
    void fail_next(Operation op, std::string detail, uint32_t count = 1);
    /// Fail every call of @p op until cleared.
    void fail_always(Operation op, std::string detail);
    void clear_faults();

    /// Delay every call of @p op by @p delay (interruptible by stop token).
    void set_delay(Operation op, Duration delay);

    /// Block calls of @p op until release_gate(op) or stop is requested.
    void close_gate(Operation op);
    void release_gate(Operation op);
    /// Wait until at least @p count calls are blocked on the gate of @p op.
    bool wait_for_blocked(Operation op, size_t count, Duration timeout);

    [[nodiscard]] std::vector<std::string> call_log() const;
    [[nodiscard]] size_t call_count(Operation op) const;

private:
    using Key = std::pair<NodeId, WorkloadId>;

    struct Fault {
        std::string detail;
        uint32_t remaining{0};
        bool always{false};
    };

    /// Record the call, honour gate/delay, and return an injected fault if any.
    Result<void> enter(Operation op, const std::string& description, std::stop_token stop);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::map<Key, DomainState> domains_;
    std::set<Key> disks_;
    std::map<NodeId, HostInfo> host_overrides_;
    std::map<Operation, Fault> faults_;
    std::map<Operation, Duration> delays_;
    std::set<Operation> gates_;
    std::map<Operation, size_t> blocked_;
    std::map<Operation, size_t> calls_;
    std::vector<std::string> log_;
};

[[nodiscard]] std::string_view to_string(SimulatedHypervisor::Operation op) noexcept;

}  // namespace compute_orchestrator
