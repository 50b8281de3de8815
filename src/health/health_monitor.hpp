/**
 * @file health_monitor.hpp
 * @brief Periodic node probing with a cached, flap-resistant health status.
 * @author Dimitris Kafetzis
 *
 * State machine per node:
 *   unknown   --success-->               healthy
 *   unknown   --failure-->               unhealthy
 *   healthy   --N consecutive failures--> unhealthy
 *   unhealthy --success-->               healthy
 *
 * Probes run on a dedicated std::jthread at a fixed interval. Readers only
 * ever see the cached result, so placement never waits on a live probe.
 * Maintenance is an administrative flag that probing never clears.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "health/probe.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <vector>

namespace compute_orchestrator {

struct NodeStatus {
    NodeId node_id;
    HealthStatus health{HealthStatus::Unknown};
    bool maintenance{false};
    uint32_t consecutive_failures{0};
    std::optional<Timestamp> last_probe;
    std::string last_detail;

    /// Eligible for new placements: healthy and not in maintenance.
    [[nodiscard]] bool schedulable() const noexcept {
        return !maintenance && health == HealthStatus::Healthy;
    }
};

using HealthTransitionCallback =
    std::function<void(const NodeId&, HealthStatus from, HealthStatus to)>;

class HealthMonitor {
public:
    HealthMonitor(IHealthProbe& probe, HealthConfig config, Logger& logger);
    ~HealthMonitor();

    // Non-copyable
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // ── Inventory ────────────────────────────
    void track(const ComputeNode& node);
    void untrack(const NodeId& id);

    // ── Lifecycle ────────────────────────────
    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Run one probe round over every tracked node on the calling thread.
    void probe_all();

    /// Apply one probe outcome to the node's state machine.
    void record_probe(const NodeId& id, bool success, std::string detail = {});

    // ── Administrative ───────────────────────
    Result<void> set_maintenance(const NodeId& id, bool maintenance);

    // ── Queries (cache only) ─────────────────
    [[nodiscard]] std::optional<NodeStatus> status(const NodeId& id) const;
    [[nodiscard]] std::vector<NodeStatus> snapshot() const;
    [[nodiscard]] bool is_schedulable(const NodeId& id) const;

    void on_transition(HealthTransitionCallback callback);

private:
    void probe_loop(std::stop_token stop);
    void notify(const NodeId& id, HealthStatus from, HealthStatus to);

    IHealthProbe& probe_;
    HealthConfig config_;
    Logger& logger_;

    mutable std::shared_mutex cache_mutex_;
    std::map<NodeId, ComputeNode> targets_;
    std::map<NodeId, NodeStatus> cache_;

    std::mutex callback_mutex_;
    std::vector<HealthTransitionCallback> callbacks_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    std::jthread probe_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace compute_orchestrator
