/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace compute_orchestrator {

namespace {

void write_moves(std::ostringstream& oss, const std::vector<WorkloadMove>& moves) {
    oss << R"(,"moves":[)";
    for (size_t i = 0; i < moves.size(); ++i) {
        const auto& m = moves[i];
        if (i > 0) oss << ',';
        oss << R"({"workload":")" << json_escape(m.workload) << "\""
            << R"(,"source":")" << json_escape(m.source) << "\""
            << R"(,"target":)";
        if (m.target) {
            oss << "\"" << json_escape(*m.target) << "\"";
        } else {
            oss << "null";
        }
        oss << R"(,"mode":")" << to_string(m.mode) << "\""
            << R"(,"outcome":")" << to_string(m.outcome) << "\"";
        if (m.error) {
            oss << R"(,"error":")" << to_string(m.error->kind) << "\"";
        }
        oss << "}";
    }
    oss << "]";
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_placement(const PlacementRequest& request,
                                        const PlacementDecision& decision) {
    std::ostringstream oss;
    oss << R"({"event":"placement_decision")"
        << R"(,"workload":")" << json_escape(request.workload) << "\""
        << R"(,"node":")" << json_escape(decision.node_id) << "\""
        << R"(,"strategy":")" << to_string(request.strategy) << "\""
        << R"(,"score":)" << decision.score
        << R"(,"candidates":)" << decision.candidate_count
        << R"(,"attempts":)" << decision.attempts
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_placement_failure(const PlacementRequest& request,
                                                const Error& error) {
    std::ostringstream oss;
    oss << R"({"event":"placement_failure")"
        << R"(,"workload":")" << json_escape(request.workload) << "\""
        << R"(,"strategy":")" << to_string(request.strategy) << "\""
        << R"(,"kind":")" << to_string(error.kind) << "\""
        << R"(,"message":")" << json_escape(error.message) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_migration_transition(const MigrationJob& job,
                                                   MigrationState from,
                                                   MigrationState to) {
    std::ostringstream oss;
    oss << R"({"event":"migration_transition")"
        << R"(,"job":")" << json_escape(job.id) << "\""
        << R"(,"workload":")" << json_escape(job.workload) << "\""
        << R"(,"mode":")" << to_string(job.mode) << "\""
        << R"(,"from":")" << to_string(from) << "\""
        << R"(,"to":")" << to_string(to) << "\"";
    if (job.failure && is_terminal(to)) {
        oss << R"(,"kind":")" << to_string(job.failure->kind) << "\""
            << R"(,"stage":")" << json_escape(job.failure->stage) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_health_transition(const NodeId& node,
                                                HealthStatus from,
                                                HealthStatus to) {
    std::ostringstream oss;
    oss << R"({"event":"health_transition")"
        << R"(,"node":")" << json_escape(node) << "\""
        << R"(,"from":")" << to_string(from) << "\""
        << R"(,"to":")" << to_string(to) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_evacuation(const EvacuationReport& report) {
    std::ostringstream oss;
    oss << R"({"event":"evacuation_summary")"
        << R"(,"node":")" << json_escape(report.node) << "\""
        << R"(,"success":)" << (report.succeeded() ? "true" : "false")
        << R"(,"migrated":)" << report.count(MoveOutcome::Migrated);
    write_moves(oss, report.moves);
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_rebalance(const RebalanceReport& report) {
    std::ostringstream oss;
    oss << R"({"event":"rebalance_summary")"
        << R"(,"dry_run":)" << (report.dry_run ? "true" : "false")
        << R"(,"success":)" << (report.succeeded() ? "true" : "false")
        << R"(,"variance_before":)" << report.variance_before
        << R"(,"variance_after":)" << report.variance_after;
    write_moves(oss, report.moves);
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace compute_orchestrator
