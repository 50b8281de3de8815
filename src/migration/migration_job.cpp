/**
 * @file migration_job.cpp
 * @brief Stage tables.
 * @author Dimitris Kafetzis
 */

#include "migration/migration_job.hpp"

#include <array>

namespace compute_orchestrator {

namespace {

constexpr std::array kOfflineStages{
    MigrationState::StoppingSource,
    MigrationState::CopyingDisk,
    MigrationState::ProvisioningTarget,
    MigrationState::Verifying,
    MigrationState::StartingTarget,
    MigrationState::UpdatingOwnership,
    MigrationState::CleaningSource
};

constexpr std::array kLiveStages{
    MigrationState::PreflightCheck,
    MigrationState::StreamingState,
    MigrationState::Switchover,
    MigrationState::Verifying,
    MigrationState::UpdatingOwnership,
    MigrationState::CleaningSource
};

}  // anonymous namespace

std::span<const MigrationState> stages_for(MigrationMode mode) noexcept {
    switch (mode) {
        case MigrationMode::Offline: return kOfflineStages;
        case MigrationMode::Live:    return kLiveStages;
    }
    return {};
}

bool live_compatible(const ComputeNode& source, const ComputeNode& target) noexcept {
    return source.cpu_model == target.cpu_model && source.hypervisor == target.hypervisor;
}

}  // namespace compute_orchestrator
