/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace compute_orchestrator;

TEST(ResourcesTest, FitsWithinEveryDimension) {
    Resources request{.vcpus = 2, .memory_mb = 4096, .disk_gb = 20};
    Resources roomy{.vcpus = 4, .memory_mb = 8192, .disk_gb = 40};
    Resources tight_disk{.vcpus = 4, .memory_mb = 8192, .disk_gb = 10};

    EXPECT_TRUE(request.fits_within(roomy));
    EXPECT_TRUE(request.fits_within(request));
    EXPECT_FALSE(request.fits_within(tight_disk));
}

TEST(ResourcesTest, SubtractionSaturatesAtZero) {
    Resources a{.vcpus = 2, .memory_mb = 1024, .disk_gb = 10};
    Resources b{.vcpus = 4, .memory_mb = 512, .disk_gb = 10};

    auto diff = a - b;
    EXPECT_EQ(diff.vcpus, 0u);
    EXPECT_EQ(diff.memory_mb, 512u);
    EXPECT_EQ(diff.disk_gb, 0u);
    EXPECT_TRUE((b - b).is_zero());
}

TEST(ResourcesTest, AdditionAndComparison) {
    Resources a{.vcpus = 1, .memory_mb = 2, .disk_gb = 3};
    auto sum = a + a;
    EXPECT_EQ(sum, (Resources{.vcpus = 2, .memory_mb = 4, .disk_gb = 6}));
    EXPECT_TRUE(a < sum);
    EXPECT_EQ(to_string(a), "1 vcpu/2 MB/3 GB");
}

TEST(ComputeNodeTest, CapacityAppliesOvercommit) {
    ComputeNode node{
        .id = "node-a",
        .total = {.vcpus = 10, .memory_mb = 1000, .disk_gb = 100},
        .cpu_overcommit = 1.5,
        .memory_overcommit = 1.25,
        .disk_overcommit = 1.0
    };

    auto cap = node.capacity();
    EXPECT_EQ(cap.vcpus, 15u);
    EXPECT_EQ(cap.memory_mb, 1250u);
    EXPECT_EQ(cap.disk_gb, 100u);
}

TEST(ComputeNodeTest, CapacityFloorsFractionalResults) {
    ComputeNode node{.id = "n", .total = {.vcpus = 3, .memory_mb = 3, .disk_gb = 3},
                     .cpu_overcommit = 1.5};
    EXPECT_EQ(node.capacity().vcpus, 4u);
}

TEST(ComputeNodeTest, NonFiniteOvercommitIsInvalid) {
    ComputeNode node{.id = "n", .total = {.vcpus = 4, .memory_mb = 4, .disk_gb = 4}};
    EXPECT_TRUE(node.has_valid_overcommit());

    node.cpu_overcommit = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(node.has_valid_overcommit());
    EXPECT_EQ(node.capacity().vcpus, 4u);

    node.cpu_overcommit = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(node.has_valid_overcommit());
}

TEST(ComputeNodeTest, HugeOvercommitSaturates) {
    ComputeNode node{.id = "n", .total = {.vcpus = 1000, .memory_mb = 4, .disk_gb = 4},
                     .cpu_overcommit = 1e300};
    EXPECT_TRUE(node.has_valid_overcommit());
    EXPECT_EQ(node.capacity().vcpus, std::numeric_limits<uint64_t>::max());
}

TEST(WorkloadStateTest, ToStringAndCapacity) {
    EXPECT_EQ(to_string(WorkloadState::Provisioning), "provisioning");
    EXPECT_EQ(to_string(WorkloadState::Migrating), "migrating");
    EXPECT_EQ(to_string(WorkloadState::Deleted), "deleted");

    EXPECT_TRUE(holds_capacity(WorkloadState::Running));
    EXPECT_TRUE(holds_capacity(WorkloadState::Error));
    EXPECT_FALSE(holds_capacity(WorkloadState::Deleted));
}

TEST(StrategyTest, ParseRoundTrip) {
    for (auto kind : {PlacementStrategyKind::Balanced, PlacementStrategyKind::Packed,
                      PlacementStrategyKind::Spread}) {
        EXPECT_EQ(parse_strategy(to_string(kind)), kind);
    }
    EXPECT_FALSE(parse_strategy("random").has_value());
}

TEST(MigrationModeTest, Parse) {
    EXPECT_EQ(parse_migration_mode("live"), MigrationMode::Live);
    EXPECT_EQ(parse_migration_mode("offline"), MigrationMode::Offline);
    EXPECT_FALSE(parse_migration_mode("cold").has_value());
}

TEST(AffinityConstraintsTest, Empty) {
    AffinityConstraints none;
    EXPECT_TRUE(none.empty());

    AffinityConstraints apart{.separate_from = "db-1"};
    EXPECT_FALSE(apart.empty());
}
