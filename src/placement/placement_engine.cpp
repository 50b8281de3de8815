/**
 * @file placement_engine.cpp
 * @brief PlacementEngine implementation.
 * @author Dimitris Kafetzis
 */

#include "placement/placement_engine.hpp"

#include <algorithm>

namespace compute_orchestrator {

namespace {

bool contains(const std::vector<NodeId>& list, const NodeId& id) {
    return std::find(list.begin(), list.end(), id) != list.end();
}

}  // anonymous namespace

bool ClusterState::schedulable(const NodeId& id) const {
    auto it = health.find(id);
    return it != health.end() && it->second.schedulable();
}

PlacementEngine::PlacementEngine(ResourceLedger& ledger,
                                 const HealthMonitor& health,
                                 Logger& logger,
                                 uint32_t max_reservation_retries)
    : ledger_(ledger)
    , health_(health)
    , logger_(logger)
    , max_retries_(max_reservation_retries == 0 ? 1 : max_reservation_retries) {}

ClusterState PlacementEngine::capture() const {
    ClusterState state;
    state.ledger = ledger_.snapshot();
    for (auto& status : health_.snapshot()) {
        auto id = status.node_id;
        state.health.emplace(std::move(id), std::move(status));
    }
    return state;
}

Result<std::vector<ScoredNode>> PlacementEngine::rank(
    const ClusterState& state,
    const Resources& request,
    const AffinityConstraints& constraints,
    PlacementStrategyKind strategy,
    const std::unordered_set<NodeId>& withheld) const {

    // 1. Health / maintenance
    std::vector<const NodeAllocation*> eligible;
    for (const auto& alloc : state.ledger.nodes) {
        if (withheld.count(alloc.node.id) > 0) continue;
        if (!state.schedulable(alloc.node.id)) continue;
        eligible.push_back(&alloc);
    }
    if (eligible.empty()) {
        return Error{ErrorKind::AllNodesUnavailable,
                     "No healthy node outside maintenance"};
    }

    // 2. Hard affinity
    auto co_locate_owner = constraints.co_locate_with
        ? state.ledger.owner_of(*constraints.co_locate_with) : std::nullopt;
    auto separate_owner = constraints.separate_from
        ? state.ledger.owner_of(*constraints.separate_from) : std::nullopt;

    auto passes_affinity = [&](const NodeAllocation& alloc) {
        if (contains(constraints.excluded_nodes, alloc.node.id)) return false;
        if (co_locate_owner && alloc.node.id != *co_locate_owner) return false;
        if (separate_owner && alloc.node.id == *separate_owner) return false;
        return true;
    };

    // 3. Capacity
    std::vector<const NodeAllocation*> fit;
    bool capacity_anywhere = false;
    for (const auto* alloc : eligible) {
        if (!request.fits_within(alloc->available())) continue;
        capacity_anywhere = true;
        if (passes_affinity(*alloc)) fit.push_back(alloc);
    }
    if (fit.empty()) {
        if (capacity_anywhere) {
            return Error{ErrorKind::AffinityUnsatisfiable,
                         "Affinity constraints exclude every node with capacity for "
                         + to_string(request)};
        }
        return Error{ErrorKind::InsufficientCapacity,
                     "No node has " + to_string(request) + " available"};
    }

    // 4. Soft preference
    if (!constraints.preferred_nodes.empty()) {
        std::vector<const NodeAllocation*> preferred;
        for (const auto* alloc : fit) {
            if (contains(constraints.preferred_nodes, alloc->node.id)) preferred.push_back(alloc);
        }
        if (!preferred.empty()) fit = std::move(preferred);
    }

    // 5. Score and rank
    auto scorer = make_strategy(strategy);
    std::vector<ScoredNode> ranked;
    ranked.reserve(fit.size());
    for (const auto* alloc : fit) {
        ranked.push_back(ScoredNode{.node_id = alloc->node.id, .score = scorer->score(*alloc)});
    }
    std::sort(ranked.begin(), ranked.end(), [](const ScoredNode& a, const ScoredNode& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.node_id < b.node_id;
    });
    return ranked;
}

Result<NodeId> PlacementEngine::select(const ClusterState& state,
                                       const Resources& request,
                                       const AffinityConstraints& constraints,
                                       PlacementStrategyKind strategy,
                                       const std::unordered_set<NodeId>& withheld) const {
    auto ranked = rank(state, request, constraints, strategy, withheld);
    if (!ranked) return ranked.error();
    return ranked->front().node_id;
}

Result<PlacementDecision> PlacementEngine::place(const PlacementRequest& request) {
    if (request.workload.empty()) {
        return Error{ErrorKind::InvalidArgument, "Workload id must not be empty"};
    }
    if (request.resources.is_zero()) {
        return Error{ErrorKind::InvalidArgument, "Empty resource request for " + request.workload};
    }

    Workload workload{
        .id = request.workload,
        .request = request.resources,
        .owner = std::nullopt,
        .state = WorkloadState::Provisioning,
        .affinity = request.constraints
    };

    for (uint32_t attempt = 1; attempt <= max_retries_; ++attempt) {
        auto state = capture();
        auto ranked = rank(state, request.resources, request.constraints, request.strategy);
        if (!ranked) {
            logger_.warn("Placement of " + request.workload + " failed: "
                         + ranked.error().describe());
            return ranked.error();
        }

        const auto& best = ranked->front();
        const auto* alloc = state.ledger.find(best.node_id);
        if (before_commit_) before_commit_(best.node_id);
        auto outcome = ledger_.try_place(best.node_id, workload, alloc->version);

        switch (outcome) {
            case ReserveOutcome::Reserved:
                logger_.info("Placed " + request.workload + " on " + best.node_id
                             + " (" + std::string{to_string(request.strategy)}
                             + ", attempt " + std::to_string(attempt) + ")");
                return PlacementDecision{
                    .node_id = best.node_id,
                    .score = best.score,
                    .candidate_count = ranked->size(),
                    .attempts = attempt
                };
            case ReserveOutcome::AlreadyPlaced:
                return Error{ErrorKind::InvalidArgument,
                             "Workload " + request.workload + " is already placed"};
            case ReserveOutcome::Conflict:
            case ReserveOutcome::InsufficientCapacity:
            case ReserveOutcome::UnknownNode:
                logger_.debug("Reservation of " + request.workload + " on " + best.node_id
                              + " lost a race (" + std::string{to_string(outcome)}
                              + "), retrying");
                break;
        }
    }

    return Error{ErrorKind::ReservationConflict,
                 "Gave up placing " + request.workload + " after "
                 + std::to_string(max_retries_) + " conflicting attempts"};
}

Result<void> PlacementEngine::reserve_on(const NodeId& node,
                                         const WorkloadId& workload,
                                         const Resources& request) {
    for (uint32_t attempt = 1; attempt <= max_retries_; ++attempt) {
        auto current = ledger_.read(node);
        if (!current) return current.error();

        if (!request.fits_within(current->available())) {
            return Error{ErrorKind::InsufficientCapacity,
                         "Node " + node + " lacks " + to_string(request)};
        }

        if (before_commit_) before_commit_(node);
        switch (ledger_.try_reserve(node, workload, request, current->version)) {
            case ReserveOutcome::Reserved:
                return Result<void>{};
            case ReserveOutcome::UnknownNode:
                return Error{ErrorKind::NotFound, "Unknown node: " + node};
            case ReserveOutcome::Conflict:
            case ReserveOutcome::InsufficientCapacity:
            case ReserveOutcome::AlreadyPlaced:
                break;
        }
    }
    return Error{ErrorKind::ReservationConflict,
                 "Gave up reserving " + workload + " on " + node};
}

}  // namespace compute_orchestrator
