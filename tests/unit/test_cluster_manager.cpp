/**
 * @file test_cluster_manager.cpp
 * @brief Unit tests for evacuation, rebalancing and cluster health.
 */

#include "cluster/cluster_manager.hpp"
#include "hypervisor/simulated_hypervisor.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace compute_orchestrator;
using Op = SimulatedHypervisor::Operation;

namespace {

ComputeNode make_node(const NodeId& id, uint64_t vcpus) {
    return ComputeNode{
        .id = id,
        .address = "127.0.0.1",
        .total = Resources{.vcpus = vcpus, .memory_mb = 16384, .disk_gb = 200},
        .cpu_model = "EPYC-Rome",
        .hypervisor = "qemu-8.2"
    };
}

}  // namespace

class ClusterManagerTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Error, "test"};
    MockProbe probe_;
    HealthMonitor health_{probe_, HealthConfig{.failure_threshold = 1}, logger_};
    ResourceLedger ledger_{logger_};
    PlacementEngine engine_{ledger_, health_, logger_};
    SimulatedHypervisor hv_;
    MigrationOrchestrator migrations_{ledger_, engine_, health_, hv_,
                                      MigrationConfig{.max_concurrent = 2, .stage_timeout_ms = 5000},
                                      logger_};
    ClusterManager cluster_{ledger_, engine_, health_, migrations_,
                            RebalanceConfig{}, PlacementStrategyKind::Balanced, logger_};

    void add_nodes(std::initializer_list<std::pair<NodeId, uint64_t>> nodes) {
        for (const auto& [id, cpus] : nodes) {
            auto node = make_node(id, cpus);
            ASSERT_TRUE(ledger_.register_node(node));
            health_.track(node);
        }
        health_.probe_all();
    }

    void add_host(const NodeId& id, uint64_t vcpus, const std::string& cpu_model) {
        auto node = make_node(id, vcpus);
        node.cpu_model = cpu_model;
        ASSERT_TRUE(ledger_.register_node(node));
        health_.track(node);
        health_.probe_all();
    }

    void seed(const WorkloadId& id, const NodeId& node, uint64_t vcpus,
              WorkloadState state = WorkloadState::Running) {
        auto version = ledger_.read(node)->version;
        Workload w{.id = id, .request = {.vcpus = vcpus, .memory_mb = 1024, .disk_gb = 10}};
        ASSERT_EQ(ledger_.try_place(node, w, version), ReserveOutcome::Reserved);
        ASSERT_TRUE(ledger_.set_workload_state(id, state));
        hv_.set_domain(node, id, state == WorkloadState::Running ? DomainState::Running
                                                                 : DomainState::Stopped);
    }
};

// ─────────────────────────────────────────────
// Evacuation
// ─────────────────────────────────────────────

TEST_F(ClusterManagerTest, EvacuationFailsUpFrontWhenClusterCannotAbsorb) {
    add_nodes({{"node-a", 12}, {"node-b", 5}, {"node-c", 5}});
    seed("vm-1", "node-a", 4);
    seed("vm-2", "node-a", 4);
    seed("vm-3", "node-a", 4);

    auto report = cluster_.evacuate_node("node-a");
    ASSERT_TRUE(report);
    EXPECT_FALSE(report->succeeded());
    ASSERT_TRUE(report->error.has_value());
    EXPECT_EQ(report->error->kind, ErrorKind::InsufficientCapacity);
    EXPECT_EQ(report->count(MoveOutcome::Migrated), 0u);
    EXPECT_EQ(report->count(MoveOutcome::NoDestination), 1u);
    EXPECT_EQ(report->count(MoveOutcome::Skipped), 2u);

    EXPECT_EQ(ledger_.workloads_on("node-a").size(), 3u);
    EXPECT_EQ(ledger_.read("node-a")->workload_count, 3u);
    EXPECT_TRUE(migrations_.jobs().empty());
    EXPECT_TRUE(hv_.call_log().empty());
}

TEST_F(ClusterManagerTest, EvacuationMovesEveryWorkload) {
    add_nodes({{"node-a", 16}, {"node-b", 16}, {"node-c", 16}});
    seed("vm-1", "node-a", 4);
    seed("vm-2", "node-a", 4, WorkloadState::Stopped);
    seed("vm-3", "node-a", 4);
    ASSERT_TRUE(cluster_.set_maintenance("node-a", true));

    auto report = cluster_.evacuate_node("node-a");
    ASSERT_TRUE(report);
    EXPECT_TRUE(report->succeeded()) << report->error->describe();
    EXPECT_EQ(report->count(MoveOutcome::Migrated), 3u);

    for (const auto& move : report->moves) {
        ASSERT_TRUE(move.target.has_value());
        EXPECT_NE(*move.target, "node-a");
        EXPECT_TRUE(move.job.has_value());
    }
    EXPECT_EQ(report->moves[1].mode, MigrationMode::Offline);
    EXPECT_EQ(report->moves[0].mode, MigrationMode::Live);

    EXPECT_TRUE(ledger_.workloads_on("node-a").empty());
    EXPECT_EQ(ledger_.workload("vm-2")->state, WorkloadState::Stopped);
    EXPECT_EQ(ledger_.workload("vm-1")->state, WorkloadState::Running);
}

TEST_F(ClusterManagerTest, EvacuationPreCheckHonoursLiveCompatibility) {
    add_host("node-a", 16, "EPYC-Rome");
    add_host("node-b", 16, "Xeon-Gold");
    seed("vm-1", "node-a", 2, WorkloadState::Stopped);
    seed("vm-2", "node-a", 2);

    auto report = cluster_.evacuate_node("node-a");
    ASSERT_TRUE(report);
    EXPECT_FALSE(report->succeeded());
    ASSERT_TRUE(report->error.has_value());
    EXPECT_EQ(report->error->kind, ErrorKind::PreflightIncompatible);
    ASSERT_EQ(report->moves.size(), 2u);
    EXPECT_EQ(report->moves[0].outcome, MoveOutcome::Skipped);
    EXPECT_EQ(report->moves[1].outcome, MoveOutcome::NoDestination);
    EXPECT_EQ(report->moves[1].mode, MigrationMode::Live);

    EXPECT_EQ(ledger_.workloads_on("node-a").size(), 2u);
    EXPECT_TRUE(migrations_.jobs().empty());
    EXPECT_TRUE(hv_.call_log().empty());
}

TEST_F(ClusterManagerTest, EvacuationSendsLiveMovesToMatchingHosts) {
    add_host("node-a", 16, "EPYC-Rome");
    add_host("node-b", 16, "Xeon-Gold");
    add_host("node-c", 4, "EPYC-Rome");
    seed("vm-1", "node-a", 2, WorkloadState::Stopped);
    seed("vm-2", "node-a", 2);

    auto report = cluster_.evacuate_node("node-a");
    ASSERT_TRUE(report);
    EXPECT_TRUE(report->succeeded()) << report->error->describe();
    EXPECT_EQ(report->count(MoveOutcome::Migrated), 2u);
    EXPECT_EQ(*report->moves[1].target, "node-c");
    EXPECT_EQ(ledger_.workload("vm-2")->owner, NodeId{"node-c"});
    EXPECT_EQ(ledger_.workload("vm-2")->state, WorkloadState::Running);
    EXPECT_TRUE(ledger_.workloads_on("node-a").empty());
}

TEST_F(ClusterManagerTest, EvacuationBlockedByWorkloadState) {
    add_nodes({{"node-a", 16}, {"node-b", 16}});
    seed("vm-1", "node-a", 2);
    seed("vm-bad", "node-a", 2, WorkloadState::Error);

    auto report = cluster_.evacuate_node("node-a");
    ASSERT_TRUE(report);
    EXPECT_FALSE(report->succeeded());
    EXPECT_EQ(report->error->kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(report->count(MoveOutcome::Blocked), 1u);
    EXPECT_EQ(ledger_.workloads_on("node-a").size(), 2u);
}

TEST_F(ClusterManagerTest, EvacuationOfUnknownNode) {
    add_nodes({{"node-a", 4}});
    auto report = cluster_.evacuate_node("node-z");
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().kind, ErrorKind::NotFound);
}

TEST_F(ClusterManagerTest, EvacuationOfEmptyNodeSucceeds) {
    add_nodes({{"node-a", 4}, {"node-b", 4}});
    auto report = cluster_.evacuate_node("node-a");
    ASSERT_TRUE(report);
    EXPECT_TRUE(report->succeeded());
    EXPECT_TRUE(report->moves.empty());
}

TEST_F(ClusterManagerTest, EvacuationHonoursCancellation) {
    add_nodes({{"node-a", 16}, {"node-b", 16}});
    seed("vm-1", "node-a", 2);
    seed("vm-2", "node-a", 2);

    std::stop_source cancel;
    cancel.request_stop();
    auto report = cluster_.evacuate_node("node-a", cancel.get_token());
    ASSERT_TRUE(report);
    EXPECT_EQ(report->error->kind, ErrorKind::Cancelled);
    EXPECT_EQ(report->count(MoveOutcome::Skipped), 2u);
    EXPECT_EQ(ledger_.workloads_on("node-a").size(), 2u);
}

TEST_F(ClusterManagerTest, EvacuationStopsAtFirstFailedMigration) {
    add_nodes({{"node-a", 16}, {"node-b", 16}});
    seed("vm-1", "node-a", 2);
    seed("vm-2", "node-a", 2);
    hv_.fail_next(Op::StreamMemory, "network drop");

    auto report = cluster_.evacuate_node("node-a");
    ASSERT_TRUE(report);
    EXPECT_FALSE(report->succeeded());
    EXPECT_EQ(report->moves[0].outcome, MoveOutcome::Failed);
    EXPECT_EQ(report->moves[1].outcome, MoveOutcome::Skipped);
    EXPECT_EQ(report->error->stage, "streaming_state");
    EXPECT_EQ(ledger_.workloads_on("node-a").size(), 2u);
}

// ─────────────────────────────────────────────
// Rebalance
// ─────────────────────────────────────────────

TEST_F(ClusterManagerTest, RebalanceDryRunPlansWithoutMoving) {
    add_nodes({{"node-a", 8}, {"node-b", 8}, {"node-c", 8}});
    for (int i = 0; i < 4; ++i) seed("vm-" + std::to_string(i), "node-a", 2);

    auto plan = cluster_.rebalance_cluster(true);
    EXPECT_TRUE(plan.dry_run);
    EXPECT_TRUE(plan.succeeded());
    EXPECT_EQ(plan.eligible_nodes, 3u);
    EXPECT_FALSE(plan.moves.empty());
    EXPECT_LT(plan.variance_after, plan.variance_before);
    EXPECT_EQ(plan.count(MoveOutcome::Planned), plan.moves.size());

    for (const auto& move : plan.moves) {
        EXPECT_EQ(move.source, "node-a");
        EXPECT_GE(move.improvement, RebalanceConfig{}.min_improvement);
    }
    EXPECT_EQ(ledger_.workloads_on("node-a").size(), 4u);
    EXPECT_TRUE(migrations_.jobs().empty());
}

TEST_F(ClusterManagerTest, RebalanceExecutesPlan) {
    add_nodes({{"node-a", 8}, {"node-b", 8}, {"node-c", 8}});
    for (int i = 0; i < 4; ++i) seed("vm-" + std::to_string(i), "node-a", 2);

    auto before = utilization_variance(ledger_.snapshot(), ledger_.node_ids());
    auto report = cluster_.rebalance_cluster(false);
    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.count(MoveOutcome::Migrated), report.moves.size());

    auto after = utilization_variance(ledger_.snapshot(), ledger_.node_ids());
    EXPECT_LT(after, before);
    EXPECT_NEAR(after, report.variance_after, 1e-9);
    EXPECT_LT(ledger_.workloads_on("node-a").size(), 4u);
}

TEST_F(ClusterManagerTest, BalancedClusterNeedsNoMoves) {
    add_nodes({{"node-a", 8}, {"node-b", 8}});
    seed("vm-1", "node-a", 2);
    seed("vm-2", "node-b", 2);

    auto plan = cluster_.rebalance_cluster(true);
    EXPECT_TRUE(plan.moves.empty());
    EXPECT_DOUBLE_EQ(plan.variance_before, 0.0);
}

TEST_F(ClusterManagerTest, RebalanceDropsMovesBelowMinImprovement) {
    add_nodes({{"node-a", 8}, {"node-b", 8}});
    seed("vm-1", "node-a", 2);
    seed("vm-2", "node-a", 1);

    // Best move: vm-2 to node-b, variance 0.015625 -> 0.0009765625.
    ClusterManager strict{ledger_, engine_, health_, migrations_,
                          RebalanceConfig{.min_improvement = 0.05},
                          PlacementStrategyKind::Balanced, logger_};
    auto dropped = strict.rebalance_cluster(true);
    EXPECT_GT(dropped.variance_before, 0.0);
    EXPECT_TRUE(dropped.moves.empty());
    EXPECT_DOUBLE_EQ(dropped.variance_after, dropped.variance_before);

    ClusterManager lenient{ledger_, engine_, health_, migrations_,
                           RebalanceConfig{.min_improvement = 0.01},
                           PlacementStrategyKind::Balanced, logger_};
    auto kept = lenient.rebalance_cluster(true);
    ASSERT_EQ(kept.moves.size(), 1u);
    EXPECT_EQ(kept.moves[0].workload, "vm-2");
    EXPECT_NEAR(kept.moves[0].improvement, 0.0146484375, 1e-12);
}

TEST_F(ClusterManagerTest, RebalanceKeepsLiveMovesOnMatchingHosts) {
    add_host("node-a", 8, "EPYC-Rome");
    add_host("node-b", 8, "Xeon-Gold");
    for (int i = 0; i < 4; ++i) seed("vm-" + std::to_string(i), "node-a", 2);

    auto running = cluster_.rebalance_cluster(true);
    EXPECT_GT(running.variance_before, 0.0);
    EXPECT_TRUE(running.moves.empty());

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(ledger_.set_workload_state("vm-" + std::to_string(i), WorkloadState::Stopped));
    }
    auto stopped = cluster_.rebalance_cluster(true);
    ASSERT_FALSE(stopped.moves.empty());
    for (const auto& move : stopped.moves) {
        EXPECT_EQ(move.mode, MigrationMode::Offline);
        EXPECT_EQ(*move.target, "node-b");
    }
}

TEST_F(ClusterManagerTest, RebalanceNeedsTwoEligibleNodes) {
    add_nodes({{"node-a", 8}, {"node-b", 8}});
    seed("vm-1", "node-a", 4);
    ASSERT_TRUE(cluster_.set_maintenance("node-b", true));

    auto plan = cluster_.rebalance_cluster(false);
    EXPECT_EQ(plan.eligible_nodes, 1u);
    EXPECT_TRUE(plan.moves.empty());
    EXPECT_TRUE(plan.succeeded());
}

TEST_F(ClusterManagerTest, RebalanceRespectsMaxMoves) {
    ClusterManager limited{ledger_, engine_, health_, migrations_,
                           RebalanceConfig{.min_improvement = 0.0, .max_moves = 1},
                           PlacementStrategyKind::Balanced, logger_};
    add_nodes({{"node-a", 8}, {"node-b", 8}, {"node-c", 8}});
    for (int i = 0; i < 4; ++i) seed("vm-" + std::to_string(i), "node-a", 2);

    auto plan = limited.rebalance_cluster(true);
    EXPECT_EQ(plan.moves.size(), 1u);
}

// ─────────────────────────────────────────────
// Health summary
// ─────────────────────────────────────────────

TEST_F(ClusterManagerTest, ClusterHealthSummary) {
    add_nodes({{"node-a", 8}, {"node-b", 8}, {"node-c", 8}});
    seed("vm-1", "node-a", 4);
    seed("vm-2", "node-b", 2, WorkloadState::Stopped);

    auto health = cluster_.cluster_health();
    EXPECT_EQ(health.node_count, 3u);
    EXPECT_EQ(health.healthy_count, 3u);
    EXPECT_EQ(health.workload_count, 2u);
    EXPECT_EQ(health.running_count, 1u);
    EXPECT_EQ(health.stopped_count, 1u);
    EXPECT_EQ(health.utilization.allocated.vcpus, 6u);
    EXPECT_DOUBLE_EQ(health.utilization.vcpu_percent, 25.0);
    EXPECT_EQ(health.status, ClusterStatus::Healthy);

    ASSERT_TRUE(cluster_.set_maintenance("node-c", true));
    health_.record_probe("node-c", false);
    EXPECT_EQ(cluster_.cluster_health().status, ClusterStatus::Healthy);
    EXPECT_EQ(cluster_.cluster_health().maintenance_count, 1u);

    health_.record_probe("node-b", false);
    auto degraded = cluster_.cluster_health();
    EXPECT_EQ(degraded.status, ClusterStatus::Degraded);
    EXPECT_EQ(degraded.unhealthy_count, 2u);
}

TEST_F(ClusterManagerTest, MaintenanceOnUnknownNode) {
    auto result = cluster_.set_maintenance("node-z", true);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST(UtilizationTest, VarianceOfEqualNodesIsZero) {
    LedgerSnapshot snap;
    snap.nodes.push_back(NodeAllocation{.node = {.id = "a"}, .capacity = {.vcpus = 10, .memory_mb = 100}});
    snap.nodes.push_back(NodeAllocation{.node = {.id = "b"}, .capacity = {.vcpus = 10, .memory_mb = 100}});
    EXPECT_DOUBLE_EQ(utilization_variance(snap, {"a", "b"}), 0.0);

    snap.simulate_reserve("a", {.vcpus = 10, .memory_mb = 100});
    EXPECT_DOUBLE_EQ(node_utilization(*snap.find("a")), 1.0);
    EXPECT_DOUBLE_EQ(utilization_variance(snap, {"a", "b"}), 0.25);
}
