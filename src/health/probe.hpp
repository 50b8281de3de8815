/**
 * @file probe.hpp
 * @brief Health probe interface and implementations.
 * @author Dimitris Kafetzis
 *
 * Provides TcpProbe (connects to the node agent port) and MockProbe (testing).
 * Probes are I/O-bound and called from the health monitor's own thread, so
 * virtual dispatch is used for runtime selection.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace compute_orchestrator {

struct ProbeResult {
    bool reachable{false};
    std::string detail;
    Duration latency{0};
};

/**
 * @brief Abstract reachability/resource query against one node.
 */
class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;
    virtual ProbeResult probe(const ComputeNode& node) = 0;
};

// ─────────────────────────────────────────────
// TcpProbe
// ─────────────────────────────────────────────

/**
 * @brief Treats a node as reachable when its agent port accepts a TCP connection.
 *
 * Uses a non-blocking connect() followed by poll() so that a dead host costs
 * at most @p timeout_ms.
 */
class TcpProbe : public IHealthProbe {
public:
    TcpProbe(uint16_t port, uint32_t timeout_ms);

    ProbeResult probe(const ComputeNode& node) override;

private:
    uint16_t port_;
    uint32_t timeout_ms_;
};

// ─────────────────────────────────────────────
// MockProbe
// ─────────────────────────────────────────────

/**
 * @brief Scripted probe for tests and the demo cluster.
 *
 * Each node answers from its queued outcomes first, then from its static
 * reachability (default: reachable).
 */
class MockProbe : public IHealthProbe {
public:
    ProbeResult probe(const ComputeNode& node) override;

    void set_reachable(const NodeId& node, bool reachable);
    void push_outcome(const NodeId& node, bool reachable);
    [[nodiscard]] size_t probe_count(const NodeId& node) const;

private:
    struct Script {
        bool reachable{true};
        std::deque<bool> queued;
        size_t calls{0};
    };

    mutable std::mutex mutex_;
    std::unordered_map<NodeId, Script> scripts_;
};

// Verify concept satisfaction at compile time
static_assert(HealthProbeLike<TcpProbe>);
static_assert(HealthProbeLike<MockProbe>);

}  // namespace compute_orchestrator
