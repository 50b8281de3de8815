/**
 * @file resource_ledger.cpp
 * @brief ResourceLedger implementation.
 * @author Dimitris Kafetzis
 */

#include "ledger/resource_ledger.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace compute_orchestrator {

// ── LedgerSnapshot ───────────────────────────

const NodeAllocation* LedgerSnapshot::find(const NodeId& id) const {
    auto it = std::lower_bound(nodes.begin(), nodes.end(), id,
        [](const NodeAllocation& a, const NodeId& key) { return a.node.id < key; });
    if (it == nodes.end() || it->node.id != id) return nullptr;
    return &*it;
}

NodeAllocation* LedgerSnapshot::find(const NodeId& id) {
    return const_cast<NodeAllocation*>(std::as_const(*this).find(id));
}

std::optional<NodeId> LedgerSnapshot::owner_of(const WorkloadId& id) const {
    auto it = owners.find(id);
    if (it == owners.end()) return std::nullopt;
    return it->second;
}

void LedgerSnapshot::simulate_reserve(const NodeId& node, const Resources& request) {
    if (auto* alloc = find(node)) {
        alloc->allocated += request;
        ++alloc->workload_count;
    }
}

void LedgerSnapshot::simulate_release(const NodeId& node, const Resources& request) {
    if (auto* alloc = find(node)) {
        alloc->allocated -= request;
        if (alloc->workload_count > 0) --alloc->workload_count;
    }
}

// ── ResourceLedger ───────────────────────────

ResourceLedger::ResourceLedger(Logger& logger) : logger_(logger) {}

Result<void> ResourceLedger::register_node(ComputeNode node) {
    if (node.id.empty()) {
        return Error{ErrorKind::InvalidArgument, "Node id must not be empty"};
    }
    if (!node.has_valid_overcommit()) {
        return Error{ErrorKind::InvalidArgument,
                     "Overcommit ratios must be finite and >= 1.0 for node " + node.id};
    }

    std::unique_lock lock(mutex_);
    if (nodes_.count(node.id) > 0) {
        return Error{ErrorKind::InvalidArgument, "Node already registered: " + node.id};
    }

    NodeEntry entry;
    entry.capacity = node.capacity();
    entry.node = std::move(node);
    auto id = entry.node.id;
    auto capacity = entry.capacity;
    nodes_.emplace(id, std::move(entry));
    lock.unlock();

    logger_.info("Registered node " + id + " capacity " + to_string(capacity));
    return Result<void>{};
}

Result<void> ResourceLedger::remove_node(const NodeId& id) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorKind::NotFound, "Unknown node: " + id};
    }
    if (!it->second.reservations.empty()) {
        return Error{ErrorKind::InvalidArgument,
                     "Node " + id + " still holds "
                     + std::to_string(it->second.reservations.size()) + " reservations"};
    }
    nodes_.erase(it);
    lock.unlock();

    logger_.info("Removed node " + id);
    return Result<void>{};
}

std::optional<ComputeNode> ResourceLedger::node(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second.node;
}

std::vector<NodeId> ResourceLedger::node_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, entry] : nodes_) ids.push_back(id);
    return ids;
}

Result<Resources> ResourceLedger::available_capacity(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorKind::NotFound, "Unknown node: " + id};
    }
    return it->second.capacity - it->second.allocated;
}

Result<NodeAllocation> ResourceLedger::read(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Error{ErrorKind::NotFound, "Unknown node: " + id};
    }
    return to_allocation(it->second);
}

LedgerSnapshot ResourceLedger::snapshot() const {
    std::shared_lock lock(mutex_);
    LedgerSnapshot snap;
    snap.nodes.reserve(nodes_.size());
    for (const auto& [id, entry] : nodes_) {
        snap.nodes.push_back(to_allocation(entry));
    }
    for (const auto& [id, w] : workloads_) {
        if (w.owner && holds_capacity(w.state)) {
            snap.owners.emplace(id, *w.owner);
        }
    }
    return snap;
}

ReserveOutcome ResourceLedger::try_reserve(const NodeId& node,
                                           const WorkloadId& workload,
                                           const Resources& request,
                                           uint64_t expected_version) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(node);
    if (it == nodes_.end()) return ReserveOutcome::UnknownNode;
    return reserve_locked(it->second, workload, request, expected_version);
}

ReserveOutcome ResourceLedger::try_reserve(const NodeId& node,
                                           const WorkloadId& workload,
                                           const Resources& request) {
    auto current = read(node);
    if (!current) return ReserveOutcome::UnknownNode;
    return try_reserve(node, workload, request, current->version);
}

ReserveOutcome ResourceLedger::try_place(const NodeId& node,
                                         const Workload& workload,
                                         uint64_t expected_version) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(node);
    if (it == nodes_.end()) return ReserveOutcome::UnknownNode;

    auto existing = workloads_.find(workload.id);
    if (existing != workloads_.end() && existing->second.owner
        && holds_capacity(existing->second.state)) {
        return ReserveOutcome::AlreadyPlaced;
    }

    auto outcome = reserve_locked(it->second, workload.id, workload.request, expected_version);
    if (outcome != ReserveOutcome::Reserved) return outcome;

    Workload record = workload;
    record.owner = node;
    record.state = WorkloadState::Provisioning;
    workloads_.insert_or_assign(record.id, std::move(record));
    return outcome;
}

ReserveOutcome ResourceLedger::reserve_locked(NodeEntry& entry,
                                              const WorkloadId& workload,
                                              const Resources& request,
                                              uint64_t expected_version) {
    if (entry.version != expected_version) {
        return ReserveOutcome::Conflict;
    }
    if (entry.reservations.count(workload) > 0) {
        return ReserveOutcome::Reserved;
    }

    // Compare against the remaining headroom; allocated + request may wrap.
    if (!request.fits_within(entry.capacity - entry.allocated)) {
        return ReserveOutcome::InsufficientCapacity;
    }

    entry.reservations.emplace(workload, request);
    entry.allocated += request;
    ++entry.version;
    return ReserveOutcome::Reserved;
}

void ResourceLedger::release(const NodeId& node, const WorkloadId& workload) {
    std::unique_lock lock(mutex_);
    auto it = nodes_.find(node);
    if (it == nodes_.end()) return;

    auto& entry = it->second;
    auto res = entry.reservations.find(workload);
    if (res == entry.reservations.end()) return;

    entry.allocated -= res->second;
    entry.reservations.erase(res);
    ++entry.version;
}

Result<void> ResourceLedger::commit_transfer(const WorkloadId& workload,
                                             const NodeId& from,
                                             const NodeId& to) {
    std::unique_lock lock(mutex_);
    auto w = workloads_.find(workload);
    if (w == workloads_.end()) {
        return Error{ErrorKind::NotFound, "Unknown workload: " + workload};
    }
    if (!w->second.owner || *w->second.owner != from) {
        return Error{ErrorKind::InvalidArgument,
                     "Workload " + workload + " is not owned by " + from};
    }

    auto target = nodes_.find(to);
    if (target == nodes_.end() || target->second.reservations.count(workload) == 0) {
        return Error{ErrorKind::InvalidArgument,
                     "No reservation for " + workload + " on target " + to};
    }

    w->second.owner = to;

    auto source = nodes_.find(from);
    if (source != nodes_.end()) {
        auto res = source->second.reservations.find(workload);
        if (res != source->second.reservations.end()) {
            source->second.allocated -= res->second;
            source->second.reservations.erase(res);
            ++source->second.version;
        }
    }
    ++target->second.version;
    lock.unlock();

    logger_.info("Ownership of " + workload + " moved " + from + " -> " + to);
    return Result<void>{};
}

Result<void> ResourceLedger::set_workload_state(const WorkloadId& workload, WorkloadState state) {
    if (state == WorkloadState::Deleted) {
        return release_workload(workload);
    }

    std::unique_lock lock(mutex_);
    auto it = workloads_.find(workload);
    if (it == workloads_.end()) {
        return Error{ErrorKind::NotFound, "Unknown workload: " + workload};
    }
    if (it->second.state == WorkloadState::Deleted) {
        return Error{ErrorKind::InvalidArgument, "Workload " + workload + " is deleted"};
    }
    if (it->second.state == WorkloadState::Migrating) {
        return Error{ErrorKind::MigrationConflict, "Workload " + workload + " is migrating"};
    }
    if (state == WorkloadState::Migrating) {
        return Error{ErrorKind::InvalidArgument,
                     "Workload " + workload + " can only enter migrating through a migration job"};
    }
    it->second.state = state;
    return Result<void>{};
}

Result<WorkloadState> ResourceLedger::begin_migration(const WorkloadId& workload) {
    std::unique_lock lock(mutex_);
    auto it = workloads_.find(workload);
    if (it == workloads_.end()) {
        return Error{ErrorKind::NotFound, "Unknown workload: " + workload};
    }
    auto prior = it->second.state;
    if (prior == WorkloadState::Migrating) {
        return Error{ErrorKind::MigrationConflict, "Workload " + workload + " is already migrating"};
    }
    if (prior != WorkloadState::Running && prior != WorkloadState::Stopped) {
        return Error{ErrorKind::InvalidArgument,
                     "Workload " + workload + " cannot be migrated while "
                     + std::string(to_string(prior))};
    }
    it->second.state = WorkloadState::Migrating;
    return prior;
}

Result<void> ResourceLedger::end_migration(const WorkloadId& workload, WorkloadState state) {
    if (state == WorkloadState::Migrating || state == WorkloadState::Deleted) {
        return Error{ErrorKind::InvalidArgument,
                     "Migration cannot end in " + std::string(to_string(state))};
    }
    std::unique_lock lock(mutex_);
    auto it = workloads_.find(workload);
    if (it == workloads_.end()) {
        return Error{ErrorKind::NotFound, "Unknown workload: " + workload};
    }
    if (it->second.state != WorkloadState::Migrating) {
        return Error{ErrorKind::InvalidArgument, "Workload " + workload + " is not migrating"};
    }
    it->second.state = state;
    return Result<void>{};
}

Result<void> ResourceLedger::release_workload(const WorkloadId& workload) {
    std::unique_lock lock(mutex_);
    auto it = workloads_.find(workload);
    if (it == workloads_.end()) {
        return Error{ErrorKind::NotFound, "Unknown workload: " + workload};
    }
    if (it->second.state == WorkloadState::Deleted) {
        return Result<void>{};
    }
    if (it->second.state == WorkloadState::Migrating) {
        return Error{ErrorKind::MigrationConflict, "Workload " + workload + " is migrating"};
    }

    // Drop every reservation the workload holds, including a pending
    // migration reservation on a target node.
    for (auto& [id, entry] : nodes_) {
        auto res = entry.reservations.find(workload);
        if (res != entry.reservations.end()) {
            entry.allocated -= res->second;
            entry.reservations.erase(res);
            ++entry.version;
        }
    }
    it->second.owner.reset();
    it->second.state = WorkloadState::Deleted;
    lock.unlock();

    logger_.info("Released workload " + workload);
    return Result<void>{};
}

std::optional<Workload> ResourceLedger::workload(const WorkloadId& id) const {
    std::shared_lock lock(mutex_);
    auto it = workloads_.find(id);
    if (it == workloads_.end()) return std::nullopt;
    return it->second;
}

std::vector<Workload> ResourceLedger::workloads() const {
    std::shared_lock lock(mutex_);
    std::vector<Workload> result;
    result.reserve(workloads_.size());
    for (const auto& [id, w] : workloads_) result.push_back(w);
    return result;
}

std::vector<Workload> ResourceLedger::workloads_on(const NodeId& node) const {
    std::shared_lock lock(mutex_);
    std::vector<Workload> result;
    for (const auto& [id, w] : workloads_) {
        if (w.owner && *w.owner == node && holds_capacity(w.state)) {
            result.push_back(w);
        }
    }
    return result;
}

NodeAllocation ResourceLedger::to_allocation(const NodeEntry& entry) const {
    return NodeAllocation{
        .node = entry.node,
        .capacity = entry.capacity,
        .allocated = entry.allocated,
        .workload_count = entry.reservations.size(),
        .version = entry.version
    };
}

}  // namespace compute_orchestrator
