/**
 * @file health_monitor.cpp
 * @brief HealthMonitor implementation.
 * @author Dimitris Kafetzis
 */

#include "health/health_monitor.hpp"

#include <chrono>

namespace compute_orchestrator {

HealthMonitor::HealthMonitor(IHealthProbe& probe, HealthConfig config, Logger& logger)
    : probe_(probe), config_(config), logger_(logger) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::track(const ComputeNode& node) {
    std::unique_lock lock(cache_mutex_);
    targets_[node.id] = node;
    cache_.try_emplace(node.id, NodeStatus{.node_id = node.id});
}

void HealthMonitor::untrack(const NodeId& id) {
    std::unique_lock lock(cache_mutex_);
    targets_.erase(id);
    cache_.erase(id);
}

void HealthMonitor::start() {
    if (running_.exchange(true)) return;

    probe_thread_ = std::jthread([this](std::stop_token stop) {
        probe_loop(stop);
    });
    logger_.info("Health monitor started (interval "
                 + std::to_string(config_.probe_interval_ms) + "ms, threshold "
                 + std::to_string(config_.failure_threshold) + ")");
}

void HealthMonitor::stop() {
    if (!running_.exchange(false)) return;

    probe_thread_.request_stop();
    wake_cv_.notify_all();
    if (probe_thread_.joinable()) probe_thread_.join();
    logger_.info("Health monitor stopped");
}

void HealthMonitor::probe_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        probe_all();

        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, stop, std::chrono::milliseconds(config_.probe_interval_ms),
                          [] { return false; });
    }
}

void HealthMonitor::probe_all() {
    std::vector<ComputeNode> targets;
    {
        std::shared_lock lock(cache_mutex_);
        targets.reserve(targets_.size());
        for (const auto& [id, node] : targets_) targets.push_back(node);
    }

    // Probes may block for up to the probe timeout; no lock is held here.
    for (const auto& node : targets) {
        auto result = probe_.probe(node);
        record_probe(node.id, result.reachable, std::move(result.detail));
    }
}

void HealthMonitor::record_probe(const NodeId& id, bool success, std::string detail) {
    HealthStatus before;
    HealthStatus after;
    {
        std::unique_lock lock(cache_mutex_);
        auto it = cache_.find(id);
        if (it == cache_.end()) return;

        auto& status = it->second;
        before = status.health;
        status.last_probe = std::chrono::system_clock::now();
        status.last_detail = std::move(detail);

        if (success) {
            status.consecutive_failures = 0;
            status.health = HealthStatus::Healthy;
        } else {
            ++status.consecutive_failures;
            if (status.health == HealthStatus::Unknown
                || status.consecutive_failures >= config_.failure_threshold) {
                status.health = HealthStatus::Unhealthy;
            }
        }
        after = status.health;
    }

    if (before != after) {
        notify(id, before, after);
    }
}

Result<void> HealthMonitor::set_maintenance(const NodeId& id, bool maintenance) {
    {
        std::unique_lock lock(cache_mutex_);
        auto it = cache_.find(id);
        if (it == cache_.end()) {
            return Error{ErrorKind::NotFound, "Unknown node: " + id};
        }
        it->second.maintenance = maintenance;
    }
    logger_.info("Node " + id + (maintenance ? " entered" : " left") + " maintenance");
    return Result<void>{};
}

std::optional<NodeStatus> HealthMonitor::status(const NodeId& id) const {
    std::shared_lock lock(cache_mutex_);
    auto it = cache_.find(id);
    if (it == cache_.end()) return std::nullopt;
    return it->second;
}

std::vector<NodeStatus> HealthMonitor::snapshot() const {
    std::shared_lock lock(cache_mutex_);
    std::vector<NodeStatus> result;
    result.reserve(cache_.size());
    for (const auto& [id, status] : cache_) result.push_back(status);
    return result;
}

bool HealthMonitor::is_schedulable(const NodeId& id) const {
    std::shared_lock lock(cache_mutex_);
    auto it = cache_.find(id);
    return it != cache_.end() && it->second.schedulable();
}

void HealthMonitor::on_transition(HealthTransitionCallback callback) {
    std::lock_guard lock(callback_mutex_);
    callbacks_.push_back(std::move(callback));
}

void HealthMonitor::notify(const NodeId& id, HealthStatus from, HealthStatus to) {
    auto message = "Node " + id + " health " + std::string{to_string(from)}
                 + " -> " + std::string{to_string(to)};
    if (to == HealthStatus::Unhealthy) {
        logger_.warn(message);
    } else {
        logger_.info(message);
    }

    std::lock_guard lock(callback_mutex_);
    for (const auto& cb : callbacks_) cb(id, from, to);
}

}  // namespace compute_orchestrator
