/**
 * @file test_simulated_hypervisor.cpp
 * @brief Unit tests for the in-memory hypervisor driver.
 */

#include "hypervisor/simulated_hypervisor.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <thread>

using namespace compute_orchestrator;
using Op = SimulatedHypervisor::Operation;

namespace {

ComputeNode make_node(const NodeId& id) {
    return ComputeNode{.id = id, .address = "127.0.0.1", .total = {.vcpus = 8},
                       .cpu_model = "EPYC", .hypervisor = "qemu-8.2"};
}

}  // namespace

class SimulatedHypervisorTest : public ::testing::Test {
protected:
    SimulatedHypervisor hv_;
    ComputeNode a_ = make_node("node-a");
    ComputeNode b_ = make_node("node-b");
};

TEST_F(SimulatedHypervisorTest, LifecycleOnOneNode) {
    Workload w{.id = "vm-1", .request = {.vcpus = 1}};

    ASSERT_TRUE(hv_.create_workload(a_, w, {}));
    EXPECT_EQ(hv_.domain("node-a", "vm-1"), DomainState::Stopped);

    ASSERT_TRUE(hv_.start(a_, "vm-1", {}));
    EXPECT_EQ(*hv_.query_state(a_, "vm-1"), DomainState::Running);

    auto again = hv_.create_workload(a_, w, {});
    EXPECT_FALSE(again);

    ASSERT_TRUE(hv_.stop(a_, "vm-1", {}));
    EXPECT_EQ(hv_.domain("node-a", "vm-1"), DomainState::Stopped);

    ASSERT_TRUE(hv_.destroy(a_, "vm-1", {}));
    EXPECT_TRUE(hv_.destroy(a_, "vm-1", {}));
    EXPECT_EQ(hv_.domain("node-a", "vm-1"), DomainState::Absent);
}

TEST_F(SimulatedHypervisorTest, StartRequiresDefinedDomain) {
    auto result = hv_.start(a_, "ghost", {});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::StageFailed);
}

TEST_F(SimulatedHypervisorTest, LiveTransferSequence) {
    hv_.set_domain("node-a", "vm-1", DomainState::Running);

    ASSERT_TRUE(hv_.stream_memory_state(a_, b_, "vm-1", {}));
    EXPECT_EQ(hv_.domain("node-b", "vm-1"), DomainState::Paused);

    ASSERT_TRUE(hv_.switchover(a_, b_, "vm-1", {}));
    EXPECT_EQ(hv_.domain("node-b", "vm-1"), DomainState::Running);
    EXPECT_EQ(hv_.domain("node-a", "vm-1"), DomainState::Stopped);
}

TEST_F(SimulatedHypervisorTest, SwitchoverWithoutStreamFails) {
    hv_.set_domain("node-a", "vm-1", DomainState::Running);
    EXPECT_FALSE(hv_.switchover(a_, b_, "vm-1", {}));
    EXPECT_FALSE(hv_.stream_memory_state(b_, a_, "vm-1", {}));
}

TEST_F(SimulatedHypervisorTest, HostInfoDefaultsAndOverrides) {
    auto info = hv_.host_info(a_);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->cpu_model, "EPYC");

    hv_.set_host_info("node-a", HostInfo{.cpu_model = "Xeon", .hypervisor = "qemu-7.0"});
    EXPECT_EQ(hv_.host_info(a_)->cpu_model, "Xeon");
}

TEST_F(SimulatedHypervisorTest, FailNextCountsDown) {
    hv_.set_domain("node-a", "vm-1", DomainState::Stopped);
    hv_.fail_next(Op::Start, "boom", 2);

    auto first = hv_.start(a_, "vm-1", {});
    ASSERT_FALSE(first);
    EXPECT_EQ(first.error().message, "boom");
    EXPECT_FALSE(hv_.start(a_, "vm-1", {}));
    EXPECT_TRUE(hv_.start(a_, "vm-1", {}));
    EXPECT_EQ(hv_.call_count(Op::Start), 3u);
}

TEST_F(SimulatedHypervisorTest, FailAlwaysUntilCleared) {
    hv_.fail_always(Op::HostInfo, "unreachable");
    EXPECT_FALSE(hv_.host_info(a_));
    EXPECT_FALSE(hv_.host_info(a_));
    hv_.clear_faults();
    EXPECT_TRUE(hv_.host_info(a_));
}

TEST_F(SimulatedHypervisorTest, DelayIsInterruptedByStop) {
    hv_.set_domain("node-a", "vm-1", DomainState::Running);
    hv_.set_delay(Op::CopyDisk, std::chrono::seconds(30));

    std::stop_source source;
    auto pending = std::async(std::launch::async, [&] {
        return hv_.copy_disk(a_, b_, "vm-1", source.get_token());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    source.request_stop();

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto result = pending.get();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
}

TEST_F(SimulatedHypervisorTest, GateBlocksUntilReleased) {
    hv_.set_domain("node-a", "vm-1", DomainState::Stopped);
    hv_.close_gate(Op::Start);

    auto pending = std::async(std::launch::async, [&] {
        return hv_.start(a_, "vm-1", {});
    });
    ASSERT_TRUE(hv_.wait_for_blocked(Op::Start, 1, std::chrono::seconds(5)));
    EXPECT_EQ(hv_.domain("node-a", "vm-1"), DomainState::Stopped);

    hv_.release_gate(Op::Start);
    EXPECT_TRUE(pending.get());
    EXPECT_EQ(hv_.domain("node-a", "vm-1"), DomainState::Running);
}

TEST_F(SimulatedHypervisorTest, CallLogRecordsOperations) {
    hv_.set_domain("node-a", "vm-1", DomainState::Stopped);
    ASSERT_TRUE(hv_.start(a_, "vm-1", {}));
    ASSERT_TRUE(hv_.stop(a_, "vm-1", {}));

    auto log = hv_.call_log();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], "start node-a/vm-1");
    EXPECT_EQ(log[1], "stop node-a/vm-1");
}
