/**
 * @file test_resource_ledger.cpp
 * @brief Unit tests for ResourceLedger.
 */

#include "ledger/resource_ledger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <limits>
#include <thread>
#include <vector>

using namespace compute_orchestrator;

namespace {

ComputeNode make_node(const NodeId& id, uint64_t vcpus, uint64_t memory_mb = 16384) {
    return ComputeNode{
        .id = id,
        .address = "127.0.0.1",
        .total = Resources{.vcpus = vcpus, .memory_mb = memory_mb, .disk_gb = 100},
        .cpu_model = "EPYC",
        .hypervisor = "qemu"
    };
}

Workload make_workload(const WorkloadId& id, uint64_t vcpus) {
    return Workload{.id = id, .request = Resources{.vcpus = vcpus, .memory_mb = 1024, .disk_gb = 10}};
}

}  // namespace

class ResourceLedgerTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Error, "test"};
    ResourceLedger ledger_{logger_};

    void SetUp() override {
        ASSERT_TRUE(ledger_.register_node(make_node("node-a", 8)));
        ASSERT_TRUE(ledger_.register_node(make_node("node-b", 8)));
    }

    void place(const NodeId& node, const Workload& w) {
        auto version = ledger_.read(node)->version;
        ASSERT_EQ(ledger_.try_place(node, w, version), ReserveOutcome::Reserved);
    }
};

TEST_F(ResourceLedgerTest, RejectsDuplicateAndInvalidNodes) {
    auto dup = ledger_.register_node(make_node("node-a", 4));
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().kind, ErrorKind::InvalidArgument);

    auto bad = make_node("node-c", 4);
    bad.cpu_overcommit = 0.5;
    EXPECT_FALSE(ledger_.register_node(bad));

    EXPECT_FALSE(ledger_.register_node(make_node("", 4)));
}

TEST_F(ResourceLedgerTest, CapacityAppliesOvercommit) {
    auto node = make_node("node-c", 8);
    node.cpu_overcommit = 2.0;
    ASSERT_TRUE(ledger_.register_node(node));

    auto available = ledger_.available_capacity("node-c");
    ASSERT_TRUE(available);
    EXPECT_EQ(available->vcpus, 16u);
    EXPECT_EQ(available->memory_mb, 16384u);
}

TEST_F(ResourceLedgerTest, ReserveBumpsVersion) {
    auto before = ledger_.read("node-a");
    ASSERT_TRUE(before);

    EXPECT_EQ(ledger_.try_reserve("node-a", "w1", {.vcpus = 2}, before->version),
              ReserveOutcome::Reserved);

    auto after = ledger_.read("node-a");
    EXPECT_EQ(after->version, before->version + 1);
    EXPECT_EQ(after->allocated.vcpus, 2u);
    EXPECT_EQ(after->workload_count, 1u);
}

TEST_F(ResourceLedgerTest, StaleVersionConflicts) {
    auto stale = ledger_.read("node-a")->version;
    ASSERT_EQ(ledger_.try_reserve("node-a", "w1", {.vcpus = 2}, stale), ReserveOutcome::Reserved);

    EXPECT_EQ(ledger_.try_reserve("node-a", "w2", {.vcpus = 2}, stale), ReserveOutcome::Conflict);
    EXPECT_EQ(ledger_.read("node-a")->allocated.vcpus, 2u);
}

TEST_F(ResourceLedgerTest, RejectsOverCapacity) {
    EXPECT_EQ(ledger_.try_reserve("node-a", "w1", {.vcpus = 9}), ReserveOutcome::InsufficientCapacity);
    EXPECT_EQ(ledger_.try_reserve("node-a", "w1", {.vcpus = 8}), ReserveOutcome::Reserved);
    EXPECT_EQ(ledger_.try_reserve("node-a", "w2", {.vcpus = 1}), ReserveOutcome::InsufficientCapacity);
    EXPECT_EQ(ledger_.try_reserve("node-z", "w3", {.vcpus = 1}), ReserveOutcome::UnknownNode);
}

TEST_F(ResourceLedgerTest, HugeRequestDoesNotWrapPastCapacity) {
    auto node = make_node("node-c", 4);
    node.total.memory_mb = 4096;
    ASSERT_TRUE(ledger_.register_node(node));
    ASSERT_EQ(ledger_.try_reserve("node-c", "w1", {.vcpus = 2, .memory_mb = 2}),
              ReserveOutcome::Reserved);

    constexpr auto max = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(ledger_.try_reserve("node-c", "w2", {.vcpus = max}),
              ReserveOutcome::InsufficientCapacity);
    EXPECT_EQ(ledger_.try_reserve("node-c", "w3", {.vcpus = 1, .memory_mb = max - 1}),
              ReserveOutcome::InsufficientCapacity);

    auto alloc = ledger_.read("node-c");
    EXPECT_EQ(alloc->allocated.vcpus, 2u);
    EXPECT_EQ(alloc->workload_count, 1u);
    EXPECT_TRUE(alloc->allocated.fits_within(alloc->capacity));
}

TEST_F(ResourceLedgerTest, ReleaseIsIdempotent) {
    ASSERT_EQ(ledger_.try_reserve("node-a", "w1", {.vcpus = 4}), ReserveOutcome::Reserved);
    ledger_.release("node-a", "w1");
    auto version = ledger_.read("node-a")->version;
    ledger_.release("node-a", "w1");
    ledger_.release("node-z", "w1");

    EXPECT_EQ(ledger_.read("node-a")->version, version);
    EXPECT_EQ(ledger_.available_capacity("node-a")->vcpus, 8u);
}

TEST_F(ResourceLedgerTest, PlaceRecordsOwnership) {
    place("node-a", make_workload("w1", 2));

    auto w = ledger_.workload("w1");
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(w->owner, NodeId{"node-a"});
    EXPECT_EQ(w->state, WorkloadState::Provisioning);
    EXPECT_EQ(ledger_.snapshot().owner_of("w1"), NodeId{"node-a"});

    auto version = ledger_.read("node-b")->version;
    EXPECT_EQ(ledger_.try_place("node-b", make_workload("w1", 2), version),
              ReserveOutcome::AlreadyPlaced);
}

TEST_F(ResourceLedgerTest, ConcurrentReservationsNeverOvercommit) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 20;
    std::atomic<int> reserved{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto id = "w-" + std::to_string(t) + "-" + std::to_string(i);
                for (;;) {
                    auto outcome = ledger_.try_reserve("node-a", id, {.vcpus = 1});
                    if (outcome == ReserveOutcome::Conflict) continue;
                    if (outcome == ReserveOutcome::Reserved) reserved.fetch_add(1);
                    break;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    auto alloc = ledger_.read("node-a");
    EXPECT_EQ(reserved.load(), 8);
    EXPECT_EQ(alloc->allocated.vcpus, 8u);
    EXPECT_LE(alloc->allocated.vcpus, alloc->capacity.vcpus);
    EXPECT_EQ(alloc->workload_count, 8u);
}

TEST_F(ResourceLedgerTest, CommitTransferMovesOwnershipAndReleasesSource) {
    place("node-a", make_workload("w1", 4));
    ASSERT_EQ(ledger_.try_reserve("node-b", "w1", {.vcpus = 4, .memory_mb = 1024, .disk_gb = 10}),
              ReserveOutcome::Reserved);

    ASSERT_TRUE(ledger_.commit_transfer("w1", "node-a", "node-b"));

    EXPECT_EQ(ledger_.workload("w1")->owner, NodeId{"node-b"});
    EXPECT_EQ(ledger_.available_capacity("node-a")->vcpus, 8u);
    EXPECT_EQ(ledger_.available_capacity("node-b")->vcpus, 4u);
}

TEST_F(ResourceLedgerTest, CommitTransferRequiresTargetReservation) {
    place("node-a", make_workload("w1", 4));

    auto missing = ledger_.commit_transfer("w1", "node-a", "node-b");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ErrorKind::InvalidArgument);

    auto wrong_owner = ledger_.commit_transfer("w1", "node-b", "node-a");
    EXPECT_FALSE(wrong_owner);
    EXPECT_EQ(ledger_.workload("w1")->owner, NodeId{"node-a"});
}

TEST_F(ResourceLedgerTest, RemoveNodeRefusedWhileReserved) {
    place("node-a", make_workload("w1", 2));

    auto refused = ledger_.remove_node("node-a");
    ASSERT_FALSE(refused);
    EXPECT_EQ(refused.error().kind, ErrorKind::InvalidArgument);

    ASSERT_TRUE(ledger_.release_workload("w1"));
    EXPECT_TRUE(ledger_.remove_node("node-a"));
    EXPECT_FALSE(ledger_.node("node-a").has_value());

    auto unknown = ledger_.remove_node("node-a");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().kind, ErrorKind::NotFound);
}

TEST_F(ResourceLedgerTest, ReleaseWorkloadDropsAllReservations) {
    place("node-a", make_workload("w1", 2));
    ASSERT_EQ(ledger_.try_reserve("node-b", "w1", {.vcpus = 2}), ReserveOutcome::Reserved);

    ASSERT_TRUE(ledger_.release_workload("w1"));
    EXPECT_TRUE(ledger_.release_workload("w1"));

    auto w = ledger_.workload("w1");
    EXPECT_EQ(w->state, WorkloadState::Deleted);
    EXPECT_FALSE(w->owner.has_value());
    EXPECT_EQ(ledger_.read("node-a")->workload_count, 0u);
    EXPECT_EQ(ledger_.read("node-b")->workload_count, 0u);
    EXPECT_TRUE(ledger_.workloads_on("node-a").empty());

    EXPECT_FALSE(ledger_.set_workload_state("w1", WorkloadState::Running));
}

TEST_F(ResourceLedgerTest, MigratingStateIsOwnedByTheMigration) {
    place("node-a", make_workload("w1", 2));
    ASSERT_TRUE(ledger_.set_workload_state("w1", WorkloadState::Running));

    auto direct = ledger_.set_workload_state("w1", WorkloadState::Migrating);
    ASSERT_FALSE(direct);
    EXPECT_EQ(direct.error().kind, ErrorKind::InvalidArgument);

    auto prior = ledger_.begin_migration("w1");
    ASSERT_TRUE(prior);
    EXPECT_EQ(*prior, WorkloadState::Running);

    auto again = ledger_.begin_migration("w1");
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().kind, ErrorKind::MigrationConflict);
    EXPECT_EQ(ledger_.release_workload("w1").error().kind, ErrorKind::MigrationConflict);
    EXPECT_EQ(ledger_.set_workload_state("w1", WorkloadState::Deleted).error().kind,
              ErrorKind::MigrationConflict);
    EXPECT_EQ(ledger_.set_workload_state("w1", WorkloadState::Stopped).error().kind,
              ErrorKind::MigrationConflict);
    EXPECT_EQ(ledger_.read("node-a")->workload_count, 1u);

    EXPECT_FALSE(ledger_.end_migration("w1", WorkloadState::Deleted));
    ASSERT_TRUE(ledger_.end_migration("w1", WorkloadState::Running));
    EXPECT_EQ(ledger_.workload("w1")->state, WorkloadState::Running);
    EXPECT_FALSE(ledger_.end_migration("w1", WorkloadState::Running));
    EXPECT_TRUE(ledger_.release_workload("w1"));
}

TEST_F(ResourceLedgerTest, OnlyRunningOrStoppedWorkloadsMigrate) {
    place("node-a", make_workload("w1", 2));
    auto provisioning = ledger_.begin_migration("w1");
    ASSERT_FALSE(provisioning);
    EXPECT_EQ(provisioning.error().kind, ErrorKind::InvalidArgument);

    ASSERT_TRUE(ledger_.set_workload_state("w1", WorkloadState::Stopped));
    auto prior = ledger_.begin_migration("w1");
    ASSERT_TRUE(prior);
    EXPECT_EQ(*prior, WorkloadState::Stopped);

    EXPECT_EQ(ledger_.begin_migration("w9").error().kind, ErrorKind::NotFound);
}

TEST_F(ResourceLedgerTest, SnapshotIsOrderedAndDetached) {
    place("node-b", make_workload("w1", 2));
    auto snap = ledger_.snapshot();
    ASSERT_EQ(snap.nodes.size(), 2u);
    EXPECT_EQ(snap.nodes[0].node.id, "node-a");
    EXPECT_EQ(snap.nodes[1].node.id, "node-b");

    snap.simulate_reserve("node-a", {.vcpus = 3});
    EXPECT_EQ(snap.find("node-a")->allocated.vcpus, 3u);
    EXPECT_EQ(ledger_.read("node-a")->allocated.vcpus, 0u);
}
