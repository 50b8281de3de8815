/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "cluster/cluster_manager.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "migration/migration_job.hpp"
#include "placement/placement_engine.hpp"

#include <memory>
#include <mutex>

namespace compute_orchestrator {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_placement(const PlacementRequest& request, const PlacementDecision& decision);
    void record_placement_failure(const PlacementRequest& request, const Error& error);
    void record_migration_transition(const MigrationJob& job, MigrationState from, MigrationState to);
    void record_health_transition(const NodeId& node, HealthStatus from, HealthStatus to);
    void record_evacuation(const EvacuationReport& report);
    void record_rebalance(const RebalanceReport& report);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace compute_orchestrator
