/**
 * @file migration_orchestrator.cpp
 * @brief MigrationOrchestrator implementation.
 * @author Dimitris Kafetzis
 */

#include "migration/migration_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <future>

namespace compute_orchestrator {

namespace {

/// Holds one slot of the cluster-wide migration semaphore.
class SlotLease {
public:
    SlotLease(std::counting_semaphore<>& slots, std::atomic<size_t>& executing)
        : slots_(slots), executing_(executing) {
        slots_.acquire();
        ++executing_;
    }
    ~SlotLease() {
        --executing_;
        slots_.release();
    }

    SlotLease(const SlotLease&) = delete;
    SlotLease& operator=(const SlotLease&) = delete;

private:
    std::counting_semaphore<>& slots_;
    std::atomic<size_t>& executing_;
};

std::string stage_name(MigrationState stage) {
    return std::string(to_string(stage));
}

}  // anonymous namespace

MigrationOrchestrator::MigrationOrchestrator(ResourceLedger& ledger,
                                             PlacementEngine& placement,
                                             const HealthMonitor& health,
                                             IHypervisorDriver& driver,
                                             MigrationConfig config,
                                             Logger& logger)
    : ledger_(ledger)
    , placement_(placement)
    , health_(health)
    , driver_(driver)
    , config_(std::move(config))
    , logger_(logger)
    , stage_timeout_(config_.stage_timeout_ms)
    , slots_(static_cast<std::ptrdiff_t>(std::max<uint32_t>(config_.max_concurrent, 1)))
    , stage_pool_(std::max<size_t>(config_.max_concurrent, 1) * 2, "migration-stage")
    , job_pool_(std::max<uint32_t>(config_.worker_threads, 1), "migration-job") {}

MigrationOrchestrator::~MigrationOrchestrator() {
    shutdown();
}

void MigrationOrchestrator::shutdown() {
    accepting_ = false;
    job_pool_.shutdown();
    stage_pool_.shutdown();
}

// ─────────────────────────────────────────────
// Admission
// ─────────────────────────────────────────────

Result<void> MigrationOrchestrator::can_migrate(const WorkloadId& workload,
                                                const NodeId& target,
                                                MigrationMode mode) const {
    auto record = ledger_.workload(workload);
    if (!record || record->state == WorkloadState::Deleted) {
        return Error{ErrorKind::NotFound, "Unknown workload: " + workload};
    }
    if (!record->owner) {
        return Error{ErrorKind::InvalidArgument, "Workload " + workload + " is not placed"};
    }
    if (*record->owner == target) {
        return Error{ErrorKind::InvalidArgument,
                     "Workload " + workload + " is already on " + target};
    }
    if (!ledger_.node(target)) {
        return Error{ErrorKind::NotFound, "Unknown target node: " + target};
    }
    if (!health_.is_schedulable(target)) {
        return Error{ErrorKind::InvalidArgument,
                     "Target node " + target + " is unhealthy or in maintenance"};
    }

    switch (record->state) {
        case WorkloadState::Running:
            break;
        case WorkloadState::Stopped:
            if (mode == MigrationMode::Live) {
                return Error{ErrorKind::InvalidArgument,
                             "Live migration requires a running workload; "
                             + workload + " is stopped"};
            }
            break;
        case WorkloadState::Migrating:
            return Error{ErrorKind::MigrationConflict,
                         "Workload " + workload + " is already migrating"};
        default:
            return Error{ErrorKind::InvalidArgument,
                         "Workload " + workload + " cannot be migrated while "
                         + std::string(to_string(record->state))};
    }

    auto available = ledger_.available_capacity(target);
    if (!available) return available.error();
    if (!record->request.fits_within(*available)) {
        return Error{ErrorKind::InsufficientCapacity,
                     "Target " + target + " has " + to_string(*available)
                     + " free, workload needs " + to_string(record->request)};
    }
    return Result<void>{};
}

Result<JobId> MigrationOrchestrator::start(const WorkloadId& workload,
                                           const NodeId& target,
                                           MigrationMode mode) {
    if (!accepting_) {
        return Error{ErrorKind::Cancelled, "Migration orchestrator is shutting down"};
    }

    // Atomic check-and-create: the job exists from here on, so a concurrent
    // request for the same workload sees it and is rejected.
    JobId id;
    {
        std::lock_guard lock(jobs_mutex_);
        if (auto it = active_.find(workload); it != active_.end()) {
            logger_.warn("Rejected migration of " + workload + ": job "
                         + it->second + " is active");
            return Error{ErrorKind::MigrationConflict,
                         "Workload " + workload + " already has active migration " + it->second};
        }
        id = "mig-" + std::to_string(next_job_++);
        jobs_.emplace(id, MigrationJob{
            .id = id,
            .workload = workload,
            .target = target,
            .mode = mode,
            .started_at = std::chrono::system_clock::now()
        });
        active_.emplace(workload, id);
    }

    if (auto valid = can_migrate(workload, target, mode); !valid) {
        discard(id);
        logger_.warn("Rejected migration of " + workload + " to " + target + ": "
                     + valid.error().describe());
        return valid.error();
    }

    auto record = ledger_.workload(workload);
    if (!record || !record->owner) {
        discard(id);
        return Error{ErrorKind::NotFound, "Workload " + workload + " disappeared"};
    }

    auto reserved = placement_.reserve_on(target, workload, record->request);
    if (!reserved) {
        discard(id);
        logger_.warn("Could not reserve " + to_string(record->request) + " on " + target
                     + " for " + workload + ": " + reserved.error().describe());
        return reserved.error();
    }

    // The state may have changed since can_migrate(); the ledger re-checks it
    // under its own lock.
    auto prior = ledger_.begin_migration(workload);
    if (!prior) {
        ledger_.release(target, workload);
        discard(id);
        logger_.warn("Rejected migration of " + workload + ": " + prior.error().describe());
        return prior.error();
    }
    if (mode == MigrationMode::Live && *prior != WorkloadState::Running) {
        if (auto restored = ledger_.end_migration(workload, *prior); !restored) {
            logger_.warn("Could not restore state of " + workload + ": "
                         + restored.error().message);
        }
        ledger_.release(target, workload);
        discard(id);
        return Error{ErrorKind::InvalidArgument,
                     "Live migration requires a running workload; " + workload + " is "
                     + std::string(to_string(*prior))};
    }

    {
        std::lock_guard lock(jobs_mutex_);
        auto& job = jobs_.at(id);
        job.source = *record->owner;
        job.prior_state = *prior;
    }

    logger_.info("Migration " + id + " accepted: " + workload + " " + *record->owner
                 + " -> " + target + " (" + std::string(to_string(mode)) + ")");

    job_pool_.submit([this, id] { execute(id); });
    return id;
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

void MigrationOrchestrator::execute(const JobId& id) {
    SlotLease lease(slots_, executing_);

    auto job = copy_job(id);
    auto source = ledger_.node(job.source);
    auto target = ledger_.node(job.target);
    if (!source || !target) {
        Error failure{ErrorKind::NotFound, "Source or target node no longer registered"};
        ledger_.release(job.target, job.workload);
        if (auto restored = ledger_.end_migration(job.workload, job.prior_state); !restored) {
            logger_.warn("Could not restore state of " + job.workload + ": "
                         + restored.error().message);
        }
        logger_.error("Migration " + id + " aborted: " + failure.message);
        transition(id, MigrationState::Failed, failure.message, failure);
        return;
    }

    for (auto stage : stages_for(job.mode)) {
        transition(id, stage);

        Result<void> outcome;
        if (is_commit_point(stage)) {
            auto committed = ledger_.commit_transfer(job.workload, job.source, job.target);
            if (committed) {
                job.committed = true;
                std::lock_guard lock(jobs_mutex_);
                jobs_.at(id).committed = true;
            } else {
                outcome = Error{ErrorKind::StageFailed, committed.error().message, stage_name(stage)};
            }
        } else {
            outcome = run_stage(job, stage, *source, *target);
        }

        if (outcome) continue;

        if (job.committed) {
            // Target is canonical: keep ownership, report the job as failed.
            logger_.error("Migration " + id + " failed after commit at "
                          + stage_name(stage) + ": " + outcome.error().message
                          + "; " + job.workload + " stays on " + job.target);
            if (auto restored = ledger_.end_migration(job.workload, job.prior_state); !restored) {
                logger_.warn("Could not restore state of " + job.workload + ": "
                             + restored.error().message);
            }
            transition(id, MigrationState::Failed, outcome.error().describe(), outcome.error());
        } else {
            roll_back(job, outcome.error(), *source, *target);
        }
        return;
    }

    if (auto restored = ledger_.end_migration(job.workload, job.prior_state); !restored) {
        logger_.warn("Could not restore state of " + job.workload + ": "
                     + restored.error().message);
    }
    transition(id, MigrationState::Completed);
}

Result<void> MigrationOrchestrator::run_guarded(MigrationState stage,
                                                std::function<Result<void>(std::stop_token)> action) {
    std::stop_source stop;
    auto future = stage_pool_.submit(
        [action = std::move(action), token = stop.get_token()] { return action(token); });

    if (future.wait_for(stage_timeout_) == std::future_status::timeout) {
        stop.request_stop();
        // Bounded grace period for the driver to observe the stop request.
        if (future.wait_for(stage_timeout_) == std::future_status::timeout) {
            logger_.error("Stage " + stage_name(stage) + " ignored its stop request");
        }
        return Error{ErrorKind::StageTimeout,
                     "Stage exceeded " + std::to_string(stage_timeout_.count()) + " ms",
                     stage_name(stage)};
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return Error{ErrorKind::Internal, e.what(), stage_name(stage)};
    }
}

Result<void> MigrationOrchestrator::run_stage(const MigrationJob& job,
                                              MigrationState stage,
                                              const ComputeNode& source,
                                              const ComputeNode& target) {
    IHypervisorDriver* driver = &driver_;
    const WorkloadId wid = job.workload;
    const MigrationMode mode = job.mode;
    const bool was_running = job.prior_state == WorkloadState::Running;

    std::function<Result<void>(std::stop_token)> action;
    switch (stage) {
        case MigrationState::PreflightCheck:
            action = [=](std::stop_token) -> Result<void> {
                auto src = driver->host_info(source);
                if (!src) return src.error();
                auto dst = driver->host_info(target);
                if (!dst) return dst.error();
                if (src->cpu_model != dst->cpu_model) {
                    return Error{ErrorKind::PreflightIncompatible,
                                 "CPU model mismatch: " + src->cpu_model + " on " + source.id
                                 + " vs " + dst->cpu_model + " on " + target.id};
                }
                if (src->hypervisor != dst->hypervisor) {
                    return Error{ErrorKind::PreflightIncompatible,
                                 "Hypervisor mismatch: " + src->hypervisor + " on " + source.id
                                 + " vs " + dst->hypervisor + " on " + target.id};
                }
                auto state = driver->query_state(source, wid);
                if (!state) return state.error();
                if (*state != DomainState::Running) {
                    return Error{ErrorKind::StageFailed,
                                 "Source domain is " + std::string(to_string(*state))};
                }
                return Result<void>{};
            };
            break;

        case MigrationState::StoppingSource:
            action = [=](std::stop_token stop) -> Result<void> {
                auto state = driver->query_state(source, wid);
                if (!state) return state.error();
                if (*state != DomainState::Running) return Result<void>{};
                return driver->stop(source, wid, stop);
            };
            break;

        case MigrationState::CopyingDisk:
            action = [=](std::stop_token stop) {
                return driver->copy_disk(source, target, wid, stop);
            };
            break;

        case MigrationState::ProvisioningTarget: {
            auto record = ledger_.workload(wid);
            if (!record) {
                return Error{ErrorKind::StageFailed, "Workload record missing", stage_name(stage)};
            }
            action = [=, spec = *record](std::stop_token stop) {
                return driver->create_workload(target, spec, stop);
            };
            break;
        }

        case MigrationState::StreamingState:
            action = [=](std::stop_token stop) {
                return driver->stream_memory_state(source, target, wid, stop);
            };
            break;

        case MigrationState::Switchover:
            action = [=](std::stop_token stop) {
                return driver->switchover(source, target, wid, stop);
            };
            break;

        case MigrationState::Verifying:
            action = [=](std::stop_token) -> Result<void> {
                auto expected = mode == MigrationMode::Live ? DomainState::Running
                                                            : DomainState::Stopped;
                auto state = driver->query_state(target, wid);
                if (!state) return state.error();
                if (*state != expected) {
                    return Error{ErrorKind::StageFailed,
                                 "Target domain is " + std::string(to_string(*state))
                                 + ", expected " + std::string(to_string(expected))};
                }
                return Result<void>{};
            };
            break;

        case MigrationState::StartingTarget:
            action = [=](std::stop_token stop) -> Result<void> {
                if (!was_running) return Result<void>{};
                if (auto started = driver->start(target, wid, stop); !started) return started;
                auto state = driver->query_state(target, wid);
                if (!state) return state.error();
                if (*state != DomainState::Running) {
                    return Error{ErrorKind::StageFailed,
                                 "Target domain is " + std::string(to_string(*state))
                                 + " after start"};
                }
                return Result<void>{};
            };
            break;

        case MigrationState::CleaningSource:
            action = [=](std::stop_token stop) {
                return driver->destroy(source, wid, stop);
            };
            break;

        default:
            return Error{ErrorKind::Internal, "No action for stage", stage_name(stage)};
    }

    auto result = run_guarded(stage, std::move(action));
    if (result) return result;

    const auto& err = result.error();
    if (err.kind == ErrorKind::PreflightIncompatible || err.kind == ErrorKind::StageTimeout) {
        return Error{err.kind, err.message, stage_name(stage)};
    }
    return Error{ErrorKind::StageFailed, err.message, stage_name(stage)};
}

void MigrationOrchestrator::roll_back(const MigrationJob& job,
                                      const Error& failure,
                                      const ComputeNode& source,
                                      const ComputeNode& target) {
    logger_.error("Migration " + job.id + " failed: " + failure.describe() + "; rolling back");
    transition(job.id, MigrationState::RollingBack, failure.describe());

    IHypervisorDriver* driver = &driver_;
    const WorkloadId wid = job.workload;

    ledger_.release(job.target, wid);

    auto cleanup = run_guarded(MigrationState::RollingBack,
        [=](std::stop_token stop) { return driver->destroy(target, wid, stop); });
    if (!cleanup) {
        logger_.warn("Could not remove " + wid + " from " + target.id + ": "
                     + cleanup.error().message);
    }

    bool restored = true;
    if (job.prior_state == WorkloadState::Running) {
        auto restart = run_guarded(MigrationState::RollingBack,
            [=](std::stop_token stop) -> Result<void> {
                auto state = driver->query_state(source, wid);
                if (!state) return state.error();
                if (*state == DomainState::Running) return Result<void>{};
                return driver->start(source, wid, stop);
            });
        if (!restart) {
            restored = false;
            logger_.error("Could not restart " + wid + " on " + source.id + ": "
                          + restart.error().message);
        }
    }

    auto final_state = restored ? job.prior_state : WorkloadState::Error;
    if (auto updated = ledger_.end_migration(wid, final_state); !updated) {
        logger_.warn("Could not restore state of " + wid + ": " + updated.error().message);
    }
    transition(job.id, MigrationState::Failed, failure.describe(), failure);
}

// ─────────────────────────────────────────────
// Job records
// ─────────────────────────────────────────────

void MigrationOrchestrator::transition(const JobId& id,
                                       MigrationState to,
                                       std::string detail,
                                       std::optional<Error> failure) {
    MigrationJob copy;
    MigrationState from;
    {
        std::lock_guard lock(jobs_mutex_);
        auto& job = jobs_.at(id);
        from = job.state;
        auto now = std::chrono::system_clock::now();
        job.state = to;
        job.history.push_back(StateTransition{
            .from = from, .to = to, .at = now, .detail = std::move(detail)});
        if (is_terminal(to)) {
            job.completed_at = now;
            job.failure = std::move(failure);
            active_.erase(job.workload);
        }
        copy = job;
    }

    if (to == MigrationState::Completed) {
        logger_.info("Migration " + id + " completed: " + copy.workload + " now on " + copy.target);
    } else {
        logger_.debug("Migration " + id + " " + std::string(to_string(from)) + " -> "
                      + std::string(to_string(to)));
    }

    std::vector<MigrationTransitionCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = callbacks_;
    }
    for (const auto& cb : callbacks) cb(copy, from, to);

    jobs_cv_.notify_all();
}

void MigrationOrchestrator::discard(const JobId& id) {
    std::lock_guard lock(jobs_mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;
    if (auto active = active_.find(it->second.workload);
        active != active_.end() && active->second == id) {
        active_.erase(active);
    }
    jobs_.erase(it);
}

MigrationJob MigrationOrchestrator::copy_job(const JobId& id) const {
    std::lock_guard lock(jobs_mutex_);
    return jobs_.at(id);
}

Result<MigrationJob> MigrationOrchestrator::wait(const JobId& id) {
    std::unique_lock lock(jobs_mutex_);
    if (jobs_.count(id) == 0) {
        return Error{ErrorKind::NotFound, "Unknown migration job: " + id};
    }
    jobs_cv_.wait(lock, [&] { return is_terminal(jobs_.at(id).state); });
    return jobs_.at(id);
}

Result<MigrationJob> MigrationOrchestrator::wait_for(const JobId& id, Duration timeout) {
    std::unique_lock lock(jobs_mutex_);
    if (jobs_.count(id) == 0) {
        return Error{ErrorKind::NotFound, "Unknown migration job: " + id};
    }
    jobs_cv_.wait_for(lock, timeout, [&] { return is_terminal(jobs_.at(id).state); });
    return jobs_.at(id);
}

Result<MigrationJob> MigrationOrchestrator::status(const JobId& id) const {
    std::lock_guard lock(jobs_mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Error{ErrorKind::NotFound, "Unknown migration job: " + id};
    }
    return it->second;
}

std::optional<JobId> MigrationOrchestrator::active_job_for(const WorkloadId& workload) const {
    std::lock_guard lock(jobs_mutex_);
    auto it = active_.find(workload);
    if (it == active_.end()) return std::nullopt;
    return it->second;
}

std::vector<MigrationJob> MigrationOrchestrator::jobs() const {
    std::lock_guard lock(jobs_mutex_);
    std::vector<MigrationJob> result;
    result.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) result.push_back(job);
    return result;
}

void MigrationOrchestrator::on_transition(MigrationTransitionCallback callback) {
    std::lock_guard lock(callback_mutex_);
    callbacks_.push_back(std::move(callback));
}

}  // namespace compute_orchestrator
