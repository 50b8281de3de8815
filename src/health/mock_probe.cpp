/**
 * @file mock_probe.cpp
 * @brief MockProbe implementation: scripted probe outcomes for testing.
 * @author Dimitris Kafetzis
 */

#include "health/probe.hpp"

namespace compute_orchestrator {

ProbeResult MockProbe::probe(const ComputeNode& node) {
    std::lock_guard lock(mutex_);
    auto& script = scripts_[node.id];
    ++script.calls;

    bool reachable = script.reachable;
    if (!script.queued.empty()) {
        reachable = script.queued.front();
        script.queued.pop_front();
    }
    return ProbeResult{.reachable = reachable,
                       .detail = reachable ? "ok" : "scripted failure",
                       .latency = Duration{0}};
}

void MockProbe::set_reachable(const NodeId& node, bool reachable) {
    std::lock_guard lock(mutex_);
    scripts_[node].reachable = reachable;
}

void MockProbe::push_outcome(const NodeId& node, bool reachable) {
    std::lock_guard lock(mutex_);
    scripts_[node].queued.push_back(reachable);
}

size_t MockProbe::probe_count(const NodeId& node) const {
    std::lock_guard lock(mutex_);
    auto it = scripts_.find(node);
    return it == scripts_.end() ? 0 : it->second.calls;
}

}  // namespace compute_orchestrator
