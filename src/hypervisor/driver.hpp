/**
 * @file driver.hpp
 * @brief Hypervisor driver interface consumed by the migration orchestrator.
 * @author Dimitris Kafetzis
 *
 * The driver performs the actual domain operations on a compute node. Every
 * call may block on I/O; long-running calls take a std::stop_token and are
 * expected to return promptly once stop is requested (stage timeout).
 * Failures are reported through Result with a message that carries the
 * partial-failure detail (e.g. "disk copy interrupted at 40%").
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <stop_token>
#include <string>
#include <string_view>

namespace compute_orchestrator {

enum class DomainState : uint8_t {
    Absent,       ///< Not defined on the node
    Stopped,      ///< Defined, not running
    Paused,       ///< Receiving state during live migration
    Running,
    Crashed
};

[[nodiscard]] constexpr std::string_view to_string(DomainState state) noexcept {
    switch (state) {
        case DomainState::Absent:  return "absent";
        case DomainState::Stopped: return "stopped";
        case DomainState::Paused:  return "paused";
        case DomainState::Running: return "running";
        case DomainState::Crashed: return "crashed";
    }
    return "unknown";
}

struct HostInfo {
    std::string cpu_model;
    std::string hypervisor;
};

class IHypervisorDriver {
public:
    virtual ~IHypervisorDriver() = default;

    virtual Result<HostInfo> host_info(const ComputeNode& node) = 0;
    virtual Result<DomainState> query_state(const ComputeNode& node, const WorkloadId& id) = 0;

    virtual Result<void> create_workload(const ComputeNode& node,
                                         const Workload& spec,
                                         std::stop_token stop) = 0;
    virtual Result<void> start(const ComputeNode& node, const WorkloadId& id,
                               std::stop_token stop) = 0;
    virtual Result<void> stop(const ComputeNode& node, const WorkloadId& id,
                              std::stop_token stop) = 0;
    virtual Result<void> destroy(const ComputeNode& node, const WorkloadId& id,
                                 std::stop_token stop) = 0;

    virtual Result<void> copy_disk(const ComputeNode& source,
                                   const ComputeNode& target,
                                   const WorkloadId& id,
                                   std::stop_token stop) = 0;
    virtual Result<void> stream_memory_state(const ComputeNode& source,
                                             const ComputeNode& target,
                                             const WorkloadId& id,
                                             std::stop_token stop) = 0;
    virtual Result<void> switchover(const ComputeNode& source,
                                    const ComputeNode& target,
                                    const WorkloadId& id,
                                    std::stop_token stop) = 0;
};

}  // namespace compute_orchestrator
