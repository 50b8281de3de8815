/**
 * @file migration_orchestrator.hpp
 * @brief Drives workloads through the migration state machine.
 * @author Dimitris Kafetzis
 *
 * start() performs an atomic check-and-create of the job (one active job per
 * workload), validates the move, reserves capacity on the target and hands
 * the job to a worker. Workers take a slot from a cluster-wide semaphore
 * before touching the hypervisor, so at most migration.max_concurrent jobs
 * execute at once. Each stage runs on the stage pool under a deadline; on
 * expiry the stage's stop token is triggered and the stage counts as failed.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "health/health_monitor.hpp"
#include "hypervisor/driver.hpp"
#include "ledger/resource_ledger.hpp"
#include "migration/migration_job.hpp"
#include "placement/placement_engine.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <semaphore>
#include <stop_token>
#include <vector>

namespace compute_orchestrator {

using MigrationTransitionCallback =
    std::function<void(const MigrationJob&, MigrationState from, MigrationState to)>;

class MigrationOrchestrator {
public:
    MigrationOrchestrator(ResourceLedger& ledger,
                          PlacementEngine& placement,
                          const HealthMonitor& health,
                          IHypervisorDriver& driver,
                          MigrationConfig config,
                          Logger& logger);
    ~MigrationOrchestrator();

    // Non-copyable
    MigrationOrchestrator(const MigrationOrchestrator&) = delete;
    MigrationOrchestrator& operator=(const MigrationOrchestrator&) = delete;

    /**
     * @brief Check whether @p workload can move to @p target in @p mode.
     *
     * Rejects unknown workloads, moves onto the current owner, unknown or
     * unschedulable targets, targets without room, and live moves of a
     * workload that is not running.
     */
    [[nodiscard]] Result<void> can_migrate(const WorkloadId& workload,
                                           const NodeId& target,
                                           MigrationMode mode) const;

    /// Create and launch a job. Fails with MigrationConflict if one is active.
    Result<JobId> start(const WorkloadId& workload, const NodeId& target, MigrationMode mode);

    /// Block until the job reaches a terminal state.
    Result<MigrationJob> wait(const JobId& id);

    /// Block up to @p timeout; returns the job as it stands then.
    Result<MigrationJob> wait_for(const JobId& id, Duration timeout);

    [[nodiscard]] Result<MigrationJob> status(const JobId& id) const;
    [[nodiscard]] std::optional<JobId> active_job_for(const WorkloadId& workload) const;
    [[nodiscard]] std::vector<MigrationJob> jobs() const;
    [[nodiscard]] size_t in_flight() const noexcept { return executing_.load(); }
    [[nodiscard]] size_t max_concurrent() const noexcept { return config_.max_concurrent; }

    void on_transition(MigrationTransitionCallback callback);

    /// Finish every accepted job and stop the workers.
    void shutdown();

private:
    void execute(const JobId& id);

    /// Run @p action on the stage pool under the stage deadline.
    Result<void> run_guarded(MigrationState stage,
                             std::function<Result<void>(std::stop_token)> action);

    Result<void> run_stage(const MigrationJob& job, MigrationState stage,
                           const ComputeNode& source, const ComputeNode& target);

    void roll_back(const MigrationJob& job, const Error& failure,
                   const ComputeNode& source, const ComputeNode& target);

    /// Record a state change; terminal states also stamp completion and free the workload.
    void transition(const JobId& id, MigrationState to, std::string detail = {},
                    std::optional<Error> failure = std::nullopt);
    void discard(const JobId& id);
    [[nodiscard]] MigrationJob copy_job(const JobId& id) const;

    ResourceLedger& ledger_;
    PlacementEngine& placement_;
    const HealthMonitor& health_;
    IHypervisorDriver& driver_;
    MigrationConfig config_;
    Logger& logger_;
    Duration stage_timeout_;

    mutable std::mutex jobs_mutex_;
    std::condition_variable jobs_cv_;
    std::map<JobId, MigrationJob> jobs_;
    std::map<WorkloadId, JobId> active_;
    uint64_t next_job_{1};

    std::mutex callback_mutex_;
    std::vector<MigrationTransitionCallback> callbacks_;

    std::counting_semaphore<> slots_;
    std::atomic<size_t> executing_{0};
    std::atomic<bool> accepting_{true};

    ThreadPool stage_pool_;
    ThreadPool job_pool_;
};

}  // namespace compute_orchestrator
