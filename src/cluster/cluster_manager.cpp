/**
 * @file cluster_manager.cpp
 * @brief ClusterManager implementation.
 * @author Dimitris Kafetzis
 */

#include "cluster/cluster_manager.hpp"

#include <algorithm>
#include <tuple>
#include <unordered_set>

namespace compute_orchestrator {

namespace {

double ratio(uint64_t part, uint64_t whole) noexcept {
    if (whole == 0) return 0.0;
    return static_cast<double>(part) / static_cast<double>(whole);
}

double percent(uint64_t part, uint64_t whole) noexcept {
    return ratio(part, whole) * 100.0;
}

MigrationMode mode_for(WorkloadState state) noexcept {
    return state == WorkloadState::Running ? MigrationMode::Live : MigrationMode::Offline;
}

bool movable(WorkloadState state) noexcept {
    return state == WorkloadState::Running || state == WorkloadState::Stopped;
}

/// Smaller requests first, then by id.
bool smaller_first(const Workload& a, const Workload& b) {
    return std::tie(a.request.vcpus, a.request.memory_mb, a.request.disk_gb, a.id)
         < std::tie(b.request.vcpus, b.request.memory_mb, b.request.disk_gb, b.id);
}

/// Nodes a move off @p source may not land on. Live moves also skip nodes
/// whose CPU model or hypervisor differs from the source.
std::unordered_set<NodeId> withheld_for(const ComputeNode& source,
                                        MigrationMode mode,
                                        const LedgerSnapshot& ledger) {
    std::unordered_set<NodeId> withheld{source.id};
    if (mode != MigrationMode::Live) return withheld;
    for (const auto& alloc : ledger.nodes) {
        if (!live_compatible(source, alloc.node)) withheld.insert(alloc.node.id);
    }
    return withheld;
}

void skip_remaining(std::vector<WorkloadMove>& moves, size_t from) {
    for (size_t i = from; i < moves.size(); ++i) {
        if (moves[i].outcome == MoveOutcome::Planned) moves[i].outcome = MoveOutcome::Skipped;
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Reports and metrics helpers
// ─────────────────────────────────────────────

size_t EvacuationReport::count(MoveOutcome outcome) const noexcept {
    return static_cast<size_t>(std::count_if(moves.begin(), moves.end(),
        [outcome](const WorkloadMove& m) { return m.outcome == outcome; }));
}

size_t RebalanceReport::count(MoveOutcome outcome) const noexcept {
    return static_cast<size_t>(std::count_if(moves.begin(), moves.end(),
        [outcome](const WorkloadMove& m) { return m.outcome == outcome; }));
}

double node_utilization(const NodeAllocation& node) noexcept {
    return (ratio(node.allocated.vcpus, node.capacity.vcpus)
          + ratio(node.allocated.memory_mb, node.capacity.memory_mb)) / 2.0;
}

double utilization_variance(const LedgerSnapshot& snapshot, const std::vector<NodeId>& nodes) {
    std::vector<double> values;
    values.reserve(nodes.size());
    for (const auto& id : nodes) {
        if (const auto* alloc = snapshot.find(id)) values.push_back(node_utilization(*alloc));
    }
    if (values.empty()) return 0.0;

    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= static_cast<double>(values.size());

    double variance = 0.0;
    for (double v : values) variance += (v - mean) * (v - mean);
    return variance / static_cast<double>(values.size());
}

// ─────────────────────────────────────────────
// ClusterManager
// ─────────────────────────────────────────────

ClusterManager::ClusterManager(ResourceLedger& ledger,
                               PlacementEngine& placement,
                               HealthMonitor& health,
                               MigrationOrchestrator& migrations,
                               RebalanceConfig config,
                               PlacementStrategyKind strategy,
                               Logger& logger)
    : ledger_(ledger)
    , placement_(placement)
    , health_(health)
    , migrations_(migrations)
    , config_(config)
    , strategy_(strategy)
    , logger_(logger) {}

Result<void> ClusterManager::set_maintenance(const NodeId& node, bool maintenance) {
    if (!ledger_.node(node)) {
        return Error{ErrorKind::NotFound, "Unknown node: " + node};
    }
    return health_.set_maintenance(node, maintenance);
}

void ClusterManager::execute_move(WorkloadMove& move) {
    auto started = migrations_.start(move.workload, *move.target, move.mode);
    if (!started) {
        move.outcome = MoveOutcome::Failed;
        move.error = started.error();
        return;
    }
    move.job = *started;

    auto finished = migrations_.wait(*started);
    if (!finished) {
        move.outcome = MoveOutcome::Failed;
        move.error = finished.error();
        return;
    }
    if (finished->succeeded()) {
        move.outcome = MoveOutcome::Migrated;
    } else {
        move.outcome = MoveOutcome::Failed;
        move.error = finished->failure;
    }
}

Result<EvacuationReport> ClusterManager::evacuate_node(const NodeId& node, std::stop_token stop) {
    auto source = ledger_.node(node);
    if (!source) {
        return Error{ErrorKind::NotFound, "Unknown node: " + node};
    }

    EvacuationReport report{.node = node};
    auto workloads = ledger_.workloads_on(node);
    std::sort(workloads.begin(), workloads.end(),
              [](const Workload& a, const Workload& b) { return a.id < b.id; });

    logger_.info("Evacuating " + node + ": " + std::to_string(workloads.size()) + " workloads");

    // ── Dry run: every workload needs a destination ──
    auto state = placement_.capture();
    bool feasible = true;

    for (const auto& w : workloads) {
        WorkloadMove move{
            .workload = w.id,
            .source = node,
            .mode = mode_for(w.state)
        };

        if (!movable(w.state)) {
            move.outcome = MoveOutcome::Blocked;
            move.error = Error{ErrorKind::InvalidArgument,
                               "Workload is " + std::string(to_string(w.state))};
            feasible = false;
            report.moves.push_back(std::move(move));
            continue;
        }

        auto withheld = withheld_for(*source, move.mode, state.ledger);
        auto destination = placement_.select(state, w.request, w.affinity, strategy_, withheld);
        if (!destination) {
            move.outcome = MoveOutcome::NoDestination;
            move.error = destination.error();
            feasible = false;
            // Distinguish "fits only on incompatible hosts" from a plain shortage.
            if (move.mode == MigrationMode::Live
                && placement_.select(state, w.request, w.affinity, strategy_, {node})) {
                move.error = Error{ErrorKind::PreflightIncompatible,
                                   "No node matching " + source->cpu_model + "/"
                                   + source->hypervisor + " can take " + w.id};
            }
        } else {
            move.target = *destination;
            state.ledger.simulate_reserve(*destination, w.request);
            state.ledger.owners[w.id] = *destination;
        }
        report.moves.push_back(std::move(move));
    }

    if (!feasible) {
        skip_remaining(report.moves, 0);
        // Report the cause of the first workload without a destination.
        auto kind = ErrorKind::InvalidArgument;
        auto first = std::find_if(report.moves.begin(), report.moves.end(),
            [](const WorkloadMove& m) { return m.outcome == MoveOutcome::NoDestination; });
        if (first != report.moves.end() && first->error) kind = first->error->kind;

        report.error = Error{kind,
                             "Evacuation pre-check failed for " + node + ": "
                             + std::to_string(report.count(MoveOutcome::NoDestination))
                             + " without destination, "
                             + std::to_string(report.count(MoveOutcome::Blocked)) + " blocked"};
        logger_.warn(report.error->describe());
        return report;
    }

    // ── Execute one by one ──
    for (size_t i = 0; i < report.moves.size(); ++i) {
        if (stop.stop_requested()) {
            skip_remaining(report.moves, i);
            report.error = Error{ErrorKind::Cancelled, "Evacuation of " + node + " cancelled"};
            logger_.warn(report.error->describe());
            return report;
        }

        auto& move = report.moves[i];
        const auto* w = &workloads[i];

        // Re-select against the live state; the dry run only proved feasibility.
        auto current = placement_.capture();
        auto destination = placement_.select(current, w->request, w->affinity, strategy_,
                                             withheld_for(*source, move.mode, current.ledger));
        if (!destination) {
            move.outcome = MoveOutcome::NoDestination;
            move.error = destination.error();
        } else {
            move.target = *destination;
            execute_move(move);
        }

        if (move.outcome != MoveOutcome::Migrated) {
            skip_remaining(report.moves, i + 1);
            report.error = Error{ErrorKind::StageFailed,
                                 "Evacuation of " + node + " stopped at " + move.workload};
            if (move.error) {
                report.error->kind = move.error->kind;
                report.error->message += ": " + move.error->message;
                report.error->stage = move.error->stage;
            }
            logger_.error(report.error->describe());
            return report;
        }
    }

    logger_.info("Evacuated " + node + ": " + std::to_string(report.moves.size()) + " workloads moved");
    return report;
}

RebalanceReport ClusterManager::rebalance_cluster(bool dry_run, std::stop_token stop) {
    RebalanceReport report{.dry_run = dry_run};

    auto state = placement_.capture();
    std::vector<NodeId> eligible;
    for (const auto& alloc : state.ledger.nodes) {
        if (state.schedulable(alloc.node.id)) eligible.push_back(alloc.node.id);
    }
    report.eligible_nodes = eligible.size();
    report.variance_before = utilization_variance(state.ledger, eligible);
    report.variance_after = report.variance_before;

    if (eligible.size() < 2) {
        logger_.info("Rebalance skipped: " + std::to_string(eligible.size()) + " eligible nodes");
        return report;
    }

    const std::unordered_set<NodeId> eligible_set(eligible.begin(), eligible.end());
    auto candidates = ledger_.workloads();
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
        [&](const Workload& w) {
            return !w.owner || !movable(w.state) || eligible_set.count(*w.owner) == 0;
        }), candidates.end());
    std::sort(candidates.begin(), candidates.end(), smaller_first);

    std::unordered_set<WorkloadId> moved;
    double variance = report.variance_before;

    // ── Greedy plan: best single move per round ──
    while (report.moves.size() < config_.max_moves) {
        std::optional<WorkloadMove> best;
        double best_variance = variance;

        for (const auto& w : candidates) {
            if (moved.count(w.id) > 0) continue;
            auto owner = state.ledger.owner_of(w.id).value_or(*w.owner);
            const auto* source = state.ledger.find(owner);
            if (!source) continue;

            auto withheld = withheld_for(source->node, mode_for(w.state), state.ledger);
            auto ranked = placement_.rank(state, w.request, w.affinity, strategy_, withheld);
            if (!ranked) continue;

            for (const auto& target : *ranked) {
                state.ledger.simulate_release(owner, w.request);
                state.ledger.simulate_reserve(target.node_id, w.request);
                double projected = utilization_variance(state.ledger, eligible);
                state.ledger.simulate_release(target.node_id, w.request);
                state.ledger.simulate_reserve(owner, w.request);

                // Ties: the smaller workload wins, then the lower node id.
                bool better = projected < best_variance
                    || (best && projected == best_variance && target.node_id < *best->target
                        && best->workload == w.id);
                if (better) {
                    best_variance = projected;
                    best = WorkloadMove{
                        .workload = w.id,
                        .source = owner,
                        .target = target.node_id,
                        .mode = mode_for(w.state),
                        .improvement = variance - projected
                    };
                }
            }
        }

        if (!best || best->improvement < config_.min_improvement) break;

        const auto* record = &*std::find_if(candidates.begin(), candidates.end(),
            [&](const Workload& w) { return w.id == best->workload; });
        state.ledger.simulate_release(best->source, record->request);
        state.ledger.simulate_reserve(*best->target, record->request);
        state.ledger.owners[best->workload] = *best->target;
        moved.insert(best->workload);
        variance = best_variance;
        report.moves.push_back(std::move(*best));
    }
    report.variance_after = variance;

    logger_.info("Rebalance plan: " + std::to_string(report.moves.size())
                 + " moves, variance " + std::to_string(report.variance_before)
                 + " -> " + std::to_string(report.variance_after)
                 + (dry_run ? " (dry run)" : ""));
    if (dry_run) return report;

    // ── Execute in plan order ──
    for (size_t i = 0; i < report.moves.size(); ++i) {
        if (stop.stop_requested()) {
            skip_remaining(report.moves, i);
            report.error = Error{ErrorKind::Cancelled, "Rebalance cancelled"};
            logger_.warn(report.error->describe());
            return report;
        }

        auto& move = report.moves[i];
        execute_move(move);
        if (move.outcome != MoveOutcome::Migrated) {
            skip_remaining(report.moves, i + 1);
            report.error = Error{ErrorKind::StageFailed,
                                 "Rebalance stopped at " + move.workload};
            if (move.error) {
                report.error->kind = move.error->kind;
                report.error->message += ": " + move.error->message;
                report.error->stage = move.error->stage;
            }
            logger_.error(report.error->describe());
            return report;
        }
    }
    return report;
}

ClusterHealth ClusterManager::cluster_health() const {
    ClusterHealth health;
    auto snapshot = ledger_.snapshot();
    bool degraded = false;

    for (const auto& alloc : snapshot.nodes) {
        ++health.node_count;
        health.utilization.capacity += alloc.capacity;
        health.utilization.allocated += alloc.allocated;

        auto status = health_.status(alloc.node.id);
        auto current = status ? status->health : HealthStatus::Unknown;
        bool maintenance = status && status->maintenance;
        switch (current) {
            case HealthStatus::Healthy:   ++health.healthy_count; break;
            case HealthStatus::Unhealthy: ++health.unhealthy_count; break;
            case HealthStatus::Unknown:   ++health.unknown_count; break;
        }
        if (maintenance) {
            ++health.maintenance_count;
        } else if (current != HealthStatus::Healthy) {
            degraded = true;
        }
    }

    for (const auto& w : ledger_.workloads()) {
        if (w.state == WorkloadState::Deleted) continue;
        ++health.workload_count;
        if (w.state == WorkloadState::Running) ++health.running_count;
        if (w.state == WorkloadState::Stopped) ++health.stopped_count;
        if (w.state == WorkloadState::Migrating) ++health.migrating_count;
    }

    auto& util = health.utilization;
    util.vcpu_percent = percent(util.allocated.vcpus, util.capacity.vcpus);
    util.memory_percent = percent(util.allocated.memory_mb, util.capacity.memory_mb);
    util.disk_percent = percent(util.allocated.disk_gb, util.capacity.disk_gb);
    health.status = degraded ? ClusterStatus::Degraded : ClusterStatus::Healthy;
    return health;
}

}  // namespace compute_orchestrator
