/**
 * @file migration_job.hpp
 * @brief MigrationJob record and the per-mode stage tables.
 * @author Dimitris Kafetzis
 *
 * Offline: Pending → StoppingSource → CopyingDisk → ProvisioningTarget →
 *          Verifying → StartingTarget → UpdatingOwnership → CleaningSource → Completed
 * Live:    Pending → PreflightCheck → StreamingState → Switchover →
 *          Verifying → UpdatingOwnership → CleaningSource → Completed
 *
 * UpdatingOwnership is the commit point. A failure before it enters
 * RollingBack and ends Failed with ownership unchanged; a failure after it
 * ends Failed with ownership on the target.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace compute_orchestrator {

enum class MigrationState : uint8_t {
    Pending,
    PreflightCheck,
    StoppingSource,
    CopyingDisk,
    ProvisioningTarget,
    StreamingState,
    Switchover,
    Verifying,
    StartingTarget,
    UpdatingOwnership,
    CleaningSource,
    RollingBack,
    Completed,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(MigrationState state) noexcept {
    switch (state) {
        case MigrationState::Pending:            return "pending";
        case MigrationState::PreflightCheck:     return "preflight_check";
        case MigrationState::StoppingSource:     return "stopping_source";
        case MigrationState::CopyingDisk:        return "copying_disk";
        case MigrationState::ProvisioningTarget: return "provisioning_target";
        case MigrationState::StreamingState:     return "streaming_state";
        case MigrationState::Switchover:         return "switchover";
        case MigrationState::Verifying:          return "verifying";
        case MigrationState::StartingTarget:     return "starting_target";
        case MigrationState::UpdatingOwnership:  return "updating_ownership";
        case MigrationState::CleaningSource:     return "cleaning_source";
        case MigrationState::RollingBack:        return "rolling_back";
        case MigrationState::Completed:          return "completed";
        case MigrationState::Failed:             return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(MigrationState state) noexcept {
    return state == MigrationState::Completed || state == MigrationState::Failed;
}

[[nodiscard]] constexpr bool is_commit_point(MigrationState state) noexcept {
    return state == MigrationState::UpdatingOwnership;
}

/// Working stages for @p mode, in execution order (excludes Pending and terminals).
[[nodiscard]] std::span<const MigrationState> stages_for(MigrationMode mode) noexcept;

/// Node records agree on CPU model and hypervisor, which live preflight requires.
[[nodiscard]] bool live_compatible(const ComputeNode& source, const ComputeNode& target) noexcept;

struct StateTransition {
    MigrationState from;
    MigrationState to;
    Timestamp at;
    std::string detail;
};

/**
 * @brief One relocation of one workload.
 */
struct MigrationJob {
    JobId id;
    WorkloadId workload;
    NodeId source;
    NodeId target;
    MigrationMode mode{MigrationMode::Live};
    MigrationState state{MigrationState::Pending};
    WorkloadState prior_state{WorkloadState::Running};  ///< Workload state before the job
    Timestamp started_at;
    std::optional<Timestamp> completed_at;
    std::optional<Error> failure;
    std::vector<StateTransition> history;
    bool committed{false};                    ///< Ownership flipped to target

    [[nodiscard]] bool active() const noexcept { return !is_terminal(state); }
    [[nodiscard]] bool succeeded() const noexcept { return state == MigrationState::Completed; }
};

}  // namespace compute_orchestrator
