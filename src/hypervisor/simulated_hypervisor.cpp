/**
 * @file simulated_hypervisor.cpp
 * @brief SimulatedHypervisor implementation.
 * @author Dimitris Kafetzis
 */

#include "hypervisor/simulated_hypervisor.hpp"

namespace compute_orchestrator {

std::string_view to_string(SimulatedHypervisor::Operation op) noexcept {
    using Op = SimulatedHypervisor::Operation;
    switch (op) {
        case Op::HostInfo:       return "host_info";
        case Op::QueryState:     return "query_state";
        case Op::CreateWorkload: return "create_workload";
        case Op::Start:          return "start";
        case Op::Stop:           return "stop";
        case Op::Destroy:        return "destroy";
        case Op::CopyDisk:       return "copy_disk";
        case Op::StreamMemory:   return "stream_memory_state";
        case Op::Switchover:     return "switchover";
    }
    return "unknown";
}

// ── Injection plumbing ───────────────────────

Result<void> SimulatedHypervisor::enter(Operation op,
                                        const std::string& description,
                                        std::stop_token stop) {
    std::unique_lock lock(mutex_);
    log_.push_back(std::string(to_string(op)) + " " + description);
    ++calls_[op];

    if (gates_.count(op) > 0) {
        ++blocked_[op];
        cv_.notify_all();
        cv_.wait(lock, stop, [&] { return gates_.count(op) == 0; });
        --blocked_[op];
        if (stop.stop_requested()) {
            return Error{ErrorKind::Cancelled,
                         std::string(to_string(op)) + " interrupted while blocked"};
        }
    }

    if (auto it = delays_.find(op); it != delays_.end() && it->second.count() > 0) {
        auto delay = it->second;
        cv_.wait_for(lock, stop, delay, [] { return false; });
        if (stop.stop_requested()) {
            return Error{ErrorKind::Cancelled,
                         std::string(to_string(op)) + " interrupted after partial progress"};
        }
    }

    if (auto it = faults_.find(op); it != faults_.end()) {
        auto detail = it->second.detail;
        if (!it->second.always && --it->second.remaining == 0) {
            faults_.erase(it);
        }
        return Error{ErrorKind::StageFailed, detail};
    }
    return Result<void>{};
}

void SimulatedHypervisor::set_domain(const NodeId& node, const WorkloadId& id, DomainState state) {
    std::lock_guard lock(mutex_);
    if (state == DomainState::Absent) {
        domains_.erase({node, id});
    } else {
        domains_[{node, id}] = state;
    }
}

DomainState SimulatedHypervisor::domain(const NodeId& node, const WorkloadId& id) const {
    std::lock_guard lock(mutex_);
    auto it = domains_.find({node, id});
    return it == domains_.end() ? DomainState::Absent : it->second;
}

void SimulatedHypervisor::set_host_info(const NodeId& node, HostInfo info) {
    std::lock_guard lock(mutex_);
    host_overrides_[node] = std::move(info);
}

void SimulatedHypervisor::fail_next(Operation op, std::string detail, uint32_t count) {
    if (count == 0) return;
    std::lock_guard lock(mutex_);
    faults_[op] = Fault{.detail = std::move(detail), .remaining = count, .always = false};
}

void SimulatedHypervisor::fail_always(Operation op, std::string detail) {
    std::lock_guard lock(mutex_);
    faults_[op] = Fault{.detail = std::move(detail), .remaining = 0, .always = true};
}

void SimulatedHypervisor::clear_faults() {
    std::lock_guard lock(mutex_);
    faults_.clear();
}

void SimulatedHypervisor::set_delay(Operation op, Duration delay) {
    std::lock_guard lock(mutex_);
    delays_[op] = delay;
}

void SimulatedHypervisor::close_gate(Operation op) {
    std::lock_guard lock(mutex_);
    gates_.insert(op);
}

void SimulatedHypervisor::release_gate(Operation op) {
    {
        std::lock_guard lock(mutex_);
        gates_.erase(op);
    }
    cv_.notify_all();
}

bool SimulatedHypervisor::wait_for_blocked(Operation op, size_t count, Duration timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return blocked_[op] >= count; });
}

std::vector<std::string> SimulatedHypervisor::call_log() const {
    std::lock_guard lock(mutex_);
    return log_;
}

size_t SimulatedHypervisor::call_count(Operation op) const {
    std::lock_guard lock(mutex_);
    auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

// ── IHypervisorDriver ────────────────────────

Result<HostInfo> SimulatedHypervisor::host_info(const ComputeNode& node) {
    if (auto r = enter(Operation::HostInfo, node.id, {}); !r) return r.error();
    std::lock_guard lock(mutex_);
    if (auto it = host_overrides_.find(node.id); it != host_overrides_.end()) {
        return it->second;
    }
    return HostInfo{.cpu_model = node.cpu_model, .hypervisor = node.hypervisor};
}

Result<DomainState> SimulatedHypervisor::query_state(const ComputeNode& node, const WorkloadId& id) {
    if (auto r = enter(Operation::QueryState, node.id + "/" + id, {}); !r) return r.error();
    std::lock_guard lock(mutex_);
    auto it = domains_.find({node.id, id});
    return it == domains_.end() ? DomainState::Absent : it->second;
}

Result<void> SimulatedHypervisor::create_workload(const ComputeNode& node,
                                                  const Workload& spec,
                                                  std::stop_token stop) {
    if (auto r = enter(Operation::CreateWorkload, node.id + "/" + spec.id, stop); !r) return r;
    std::lock_guard lock(mutex_);
    auto [it, inserted] = domains_.try_emplace({node.id, spec.id}, DomainState::Stopped);
    if (!inserted && it->second == DomainState::Running) {
        return Error{ErrorKind::StageFailed,
                     "Domain " + spec.id + " already running on " + node.id};
    }
    return Result<void>{};
}

Result<void> SimulatedHypervisor::start(const ComputeNode& node, const WorkloadId& id,
                                        std::stop_token stop) {
    if (auto r = enter(Operation::Start, node.id + "/" + id, stop); !r) return r;
    std::lock_guard lock(mutex_);
    auto it = domains_.find({node.id, id});
    if (it == domains_.end()) {
        return Error{ErrorKind::StageFailed, "Domain " + id + " not defined on " + node.id};
    }
    it->second = DomainState::Running;
    return Result<void>{};
}

Result<void> SimulatedHypervisor::stop(const ComputeNode& node, const WorkloadId& id,
                                       std::stop_token stop) {
    if (auto r = enter(Operation::Stop, node.id + "/" + id, stop); !r) return r;
    std::lock_guard lock(mutex_);
    auto it = domains_.find({node.id, id});
    if (it == domains_.end()) {
        return Error{ErrorKind::StageFailed, "Domain " + id + " not defined on " + node.id};
    }
    it->second = DomainState::Stopped;
    return Result<void>{};
}

Result<void> SimulatedHypervisor::destroy(const ComputeNode& node, const WorkloadId& id,
                                          std::stop_token stop) {
    if (auto r = enter(Operation::Destroy, node.id + "/" + id, stop); !r) return r;
    std::lock_guard lock(mutex_);
    domains_.erase({node.id, id});
    disks_.erase({node.id, id});
    return Result<void>{};
}

Result<void> SimulatedHypervisor::copy_disk(const ComputeNode& source,
                                            const ComputeNode& target,
                                            const WorkloadId& id,
                                            std::stop_token stop) {
    if (auto r = enter(Operation::CopyDisk, source.id + "->" + target.id + "/" + id, stop); !r) {
        return r;
    }
    std::lock_guard lock(mutex_);
    if (domains_.count({source.id, id}) == 0) {
        return Error{ErrorKind::StageFailed, "No source disk for " + id + " on " + source.id};
    }
    disks_.insert({target.id, id});
    return Result<void>{};
}

Result<void> SimulatedHypervisor::stream_memory_state(const ComputeNode& source,
                                                      const ComputeNode& target,
                                                      const WorkloadId& id,
                                                      std::stop_token stop) {
    if (auto r = enter(Operation::StreamMemory, source.id + "->" + target.id + "/" + id, stop); !r) {
        return r;
    }
    std::lock_guard lock(mutex_);
    auto src = domains_.find({source.id, id});
    if (src == domains_.end() || src->second != DomainState::Running) {
        return Error{ErrorKind::StageFailed, "Source domain " + id + " is not running"};
    }
    // Streaming defines the domain on the target if it is not there yet.
    domains_[{target.id, id}] = DomainState::Paused;
    return Result<void>{};
}

Result<void> SimulatedHypervisor::switchover(const ComputeNode& source,
                                             const ComputeNode& target,
                                             const WorkloadId& id,
                                             std::stop_token stop) {
    if (auto r = enter(Operation::Switchover, source.id + "->" + target.id + "/" + id, stop); !r) {
        return r;
    }
    std::lock_guard lock(mutex_);
    auto dst = domains_.find({target.id, id});
    if (dst == domains_.end() || dst->second != DomainState::Paused) {
        return Error{ErrorKind::StageFailed, "Target domain " + id + " has no streamed state"};
    }
    dst->second = DomainState::Running;
    if (auto src = domains_.find({source.id, id}); src != domains_.end()) {
        src->second = DomainState::Stopped;
    }
    return Result<void>{};
}

}  // namespace compute_orchestrator
