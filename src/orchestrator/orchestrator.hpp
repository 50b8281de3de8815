/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade: ties all modules together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Placing workloads on compute nodes
 *   2. Migrating, evacuating and rebalancing workloads
 *   3. Maintenance control and cluster health reporting
 *
 * Template-parameterized on the probe and hypervisor driver for testability
 * (TcpProbe or MockProbe, SimulatedHypervisor or a real driver).
 */

#pragma once

#include "cluster/cluster_manager.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "health/health_monitor.hpp"
#include "health/probe.hpp"
#include "hypervisor/driver.hpp"
#include "hypervisor/simulated_hypervisor.hpp"
#include "ledger/resource_ledger.hpp"
#include "migration/migration_orchestrator.hpp"
#include "placement/placement_engine.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <concepts>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <type_traits>

namespace compute_orchestrator {

namespace detail {

template <typename ProbeT>
ProbeT make_probe(const HealthConfig& config) {
    if constexpr (std::is_constructible_v<ProbeT, uint16_t, uint32_t>) {
        return ProbeT(config.agent_port, config.probe_timeout_ms);
    } else {
        return ProbeT{};
    }
}

inline std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return std::make_unique<NullSink>();
    return sink;
}

}  // namespace detail

/**
 * @brief The top-level Orchestrator that wires all modules together.
 */
template <HealthProbeLike ProbeT = TcpProbe,
          std::derived_from<IHypervisorDriver> DriverT = SimulatedHypervisor>
class Orchestrator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> metrics_sink;
        LogLevel log_level = LogLevel::Info;
    };

    explicit Orchestrator(Options opts);
    ~Orchestrator();

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Register the configured inventory and start the health probe timer.
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Inventory ────────────────────────────
    Result<void> register_node(const ComputeNode& node);
    Result<void> remove_node(const NodeId& id);

    // ── Placement and workload lifecycle ─────
    Result<NodeId> place_workload(const WorkloadId& workload,
                                  const Resources& request,
                                  const AffinityConstraints& constraints = {},
                                  std::optional<PlacementStrategyKind> strategy = std::nullopt);
    Result<void> mark_running(const WorkloadId& workload);
    Result<void> mark_stopped(const WorkloadId& workload);
    Result<void> mark_error(const WorkloadId& workload);
    Result<void> release_workload(const WorkloadId& workload);

    // ── Migration ────────────────────────────
    Result<JobId> migrate_workload(const WorkloadId& workload,
                                   const NodeId& target,
                                   std::optional<MigrationMode> mode = std::nullopt);
    [[nodiscard]] Result<MigrationState> get_migration_status(const JobId& id) const;
    Result<MigrationJob> wait_for_migration(const JobId& id);

    // ── Cluster operations ───────────────────
    Result<void> set_maintenance(const NodeId& node, bool maintenance);
    Result<EvacuationReport> evacuate_node(const NodeId& node, std::stop_token stop = {});
    RebalanceReport rebalance_cluster(bool dry_run, std::stop_token stop = {});
    [[nodiscard]] ClusterHealth get_cluster_health() const;

    // ── Accessors (for testing) ─────────────
    ProbeT& probe() { return probe_; }
    DriverT& driver() { return driver_; }
    ResourceLedger& ledger() { return ledger_; }
    HealthMonitor& health() { return health_; }
    PlacementEngine& placement() { return placement_; }
    MigrationOrchestrator& migrations() { return migrations_; }
    ClusterManager& cluster() { return cluster_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }

private:
    Result<void> set_state(const WorkloadId& workload, WorkloadState state);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    PlacementStrategyKind default_strategy_;
    MigrationMode default_mode_;

    ProbeT probe_;
    DriverT driver_;

    ResourceLedger ledger_;
    HealthMonitor health_;
    PlacementEngine placement_;
    MigrationOrchestrator migrations_;
    ClusterManager cluster_;

    std::atomic<bool> running_{false};
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Orchestrator<ProbeT, DriverT>::Orchestrator(Options opts)
    : config_(std::move(opts.config))
    , logger_(detail::or_null_sink(std::move(opts.log_sink)),
              opts.log_level, config_.orchestrator.node_id)
    , metrics_(detail::or_null_sink(std::move(opts.metrics_sink)))
    , default_strategy_(parse_strategy(config_.placement.default_strategy)
                        .value_or(PlacementStrategyKind::Balanced))
    , default_mode_(parse_migration_mode(config_.migration.default_mode)
                    .value_or(MigrationMode::Live))
    , probe_(detail::make_probe<ProbeT>(config_.health))
    , ledger_(logger_)
    , health_(probe_, config_.health, logger_)
    , placement_(ledger_, health_, logger_, config_.placement.max_reservation_retries)
    , migrations_(ledger_, placement_, health_, driver_, config_.migration, logger_)
    , cluster_(ledger_, placement_, health_, migrations_, config_.rebalance,
               default_strategy_, logger_) {
    health_.on_transition([this](const NodeId& node, HealthStatus from, HealthStatus to) {
        metrics_.record_health_transition(node, from, to);
    });
    migrations_.on_transition([this](const MigrationJob& job, MigrationState from, MigrationState to) {
        metrics_.record_migration_transition(job, from, to);
    });
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Orchestrator<ProbeT, DriverT>::~Orchestrator() {
    stop();
    migrations_.shutdown();
    metrics_.flush();
    logger_.flush();
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<void> Orchestrator<ProbeT, DriverT>::start() {
    if (running_.exchange(true)) {
        return Error{ErrorKind::InvalidArgument, "Already running"};
    }

    logger_.info("Orchestrator starting: id=" + config_.orchestrator.node_id
                 + " strategy=" + std::string(to_string(default_strategy_))
                 + " nodes=" + std::to_string(config_.nodes.size()));

    for (const auto& node : config_.nodes) {
        if (ledger_.node(node.id)) continue;
        if (auto registered = register_node(node); !registered) {
            running_ = false;
            return registered.error();
        }
    }

    health_.start();
    logger_.info("Orchestrator started successfully");
    return Result<void>{};
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
void Orchestrator<ProbeT, DriverT>::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Orchestrator shutting down...");
    health_.stop();
    logger_.info("Orchestrator stopped");
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<void> Orchestrator<ProbeT, DriverT>::register_node(const ComputeNode& node) {
    auto registered = ledger_.register_node(node);
    if (!registered) return registered;
    health_.track(node);
    return Result<void>{};
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<void> Orchestrator<ProbeT, DriverT>::remove_node(const NodeId& id) {
    auto removed = ledger_.remove_node(id);
    if (!removed) return removed;
    health_.untrack(id);
    return Result<void>{};
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<NodeId> Orchestrator<ProbeT, DriverT>::place_workload(
    const WorkloadId& workload,
    const Resources& request,
    const AffinityConstraints& constraints,
    std::optional<PlacementStrategyKind> strategy) {

    PlacementRequest placement_request{
        .workload = workload,
        .resources = request,
        .constraints = constraints,
        .strategy = strategy.value_or(default_strategy_)
    };

    auto decision = placement_.place(placement_request);
    if (!decision) {
        metrics_.record_placement_failure(placement_request, decision.error());
        return decision.error();
    }
    metrics_.record_placement(placement_request, *decision);
    return decision->node_id;
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<void> Orchestrator<ProbeT, DriverT>::set_state(const WorkloadId& workload,
                                                      WorkloadState state) {
    if (migrations_.active_job_for(workload)) {
        return Error{ErrorKind::MigrationConflict,
                     "Workload " + workload + " is being migrated"};
    }
    return ledger_.set_workload_state(workload, state);
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<void> Orchestrator<ProbeT, DriverT>::mark_running(const WorkloadId& workload) {
    return set_state(workload, WorkloadState::Running);
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<void> Orchestrator<ProbeT, DriverT>::mark_stopped(const WorkloadId& workload) {
    return set_state(workload, WorkloadState::Stopped);
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<void> Orchestrator<ProbeT, DriverT>::mark_error(const WorkloadId& workload) {
    return set_state(workload, WorkloadState::Error);
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<void> Orchestrator<ProbeT, DriverT>::release_workload(const WorkloadId& workload) {
    if (migrations_.active_job_for(workload)) {
        return Error{ErrorKind::MigrationConflict,
                     "Workload " + workload + " is being migrated"};
    }
    return ledger_.release_workload(workload);
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<JobId> Orchestrator<ProbeT, DriverT>::migrate_workload(const WorkloadId& workload,
                                                             const NodeId& target,
                                                             std::optional<MigrationMode> mode) {
    return migrations_.start(workload, target, mode.value_or(default_mode_));
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<MigrationState> Orchestrator<ProbeT, DriverT>::get_migration_status(const JobId& id) const {
    auto job = migrations_.status(id);
    if (!job) return job.error();
    return job->state;
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<MigrationJob> Orchestrator<ProbeT, DriverT>::wait_for_migration(const JobId& id) {
    return migrations_.wait(id);
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<void> Orchestrator<ProbeT, DriverT>::set_maintenance(const NodeId& node, bool maintenance) {
    return cluster_.set_maintenance(node, maintenance);
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
Result<EvacuationReport> Orchestrator<ProbeT, DriverT>::evacuate_node(const NodeId& node,
                                                                      std::stop_token stop) {
    auto report = cluster_.evacuate_node(node, stop);
    if (report) metrics_.record_evacuation(*report);
    return report;
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
RebalanceReport Orchestrator<ProbeT, DriverT>::rebalance_cluster(bool dry_run,
                                                                 std::stop_token stop) {
    auto report = cluster_.rebalance_cluster(dry_run, stop);
    metrics_.record_rebalance(report);
    return report;
}

template <HealthProbeLike ProbeT, std::derived_from<IHypervisorDriver> DriverT>
ClusterHealth Orchestrator<ProbeT, DriverT>::get_cluster_health() const {
    return cluster_.cluster_health();
}

}  // namespace compute_orchestrator
