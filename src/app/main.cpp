/**
 * @file main.cpp
 * @brief ComputeOrchestrator daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into a complete orchestration pipeline:
 *   Config → Logger → Ledger → HealthMonitor → Placement → Migration → ClusterManager → Telemetry
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "health/probe.hpp"
#include "hypervisor/simulated_hypervisor.hpp"
#include "orchestrator/orchestrator.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace compute_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║       ComputeOrchestrator v1.0.0          ║
  ║   Workload Placement and Live Migration   ║
  ║   for Virtualized Compute Clusters        ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: compute_orchestrator [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --log-dir <path>   Log output directory\n"
                      << "  --demo             Run a simulated cluster walkthrough, then exit\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

void log_health(Logger& logger, const ClusterHealth& health) {
    logger.info("Cluster " + std::string(to_string(health.status)) + ": "
                + std::to_string(health.healthy_count) + "/" + std::to_string(health.node_count)
                + " nodes healthy, " + std::to_string(health.maintenance_count) + " in maintenance, "
                + std::to_string(health.workload_count) + " workloads, vCPU "
                + std::to_string(static_cast<int>(health.utilization.vcpu_percent)) + "%, mem "
                + std::to_string(static_cast<int>(health.utilization.memory_percent)) + "%");
}

ComputeNode demo_node(const std::string& id, uint64_t vcpus, uint64_t memory_mb) {
    return ComputeNode{
        .id = id,
        .address = "127.0.0.1",
        .total = Resources{.vcpus = vcpus, .memory_mb = memory_mb, .disk_gb = 500},
        .cpu_overcommit = 2.0,
        .memory_overcommit = 1.0,
        .disk_overcommit = 1.0,
        .cpu_model = "EPYC-Rome",
        .hypervisor = "qemu-8.2"
    };
}

/**
 * @brief Run a walkthrough on a simulated three-node cluster: place,
 *        live-migrate, evacuate and rebalance.
 */
int run_demo(Config config) {
    config.migration.stage_timeout_ms = 5000;
    config.nodes = {
        demo_node("node-a", 16, 65536),
        demo_node("node-b", 16, 65536),
        demo_node("node-c", 8, 32768)
    };

    Orchestrator<MockProbe, SimulatedHypervisor> orchestrator({
        .config = std::move(config),
        .log_sink = std::make_unique<StdoutSink>(),
        .metrics_sink = std::make_unique<StdoutSink>(),
        .log_level = LogLevel::Info
    });
    auto& logger = orchestrator.logger();
    logger.info("=== Demo Mode ===");

    if (auto started = orchestrator.start(); !started) {
        logger.error("Demo start failed: " + started.error().describe());
        return 1;
    }
    orchestrator.health().probe_all();

    // Place six workloads with alternating strategies and start them.
    const Resources small{.vcpus = 2, .memory_mb = 4096, .disk_gb = 20};
    const Resources large{.vcpus = 6, .memory_mb = 16384, .disk_gb = 80};
    for (int i = 0; i < 6; ++i) {
        auto id = "vm-" + std::to_string(i);
        auto strategy = i % 2 == 0 ? PlacementStrategyKind::Balanced : PlacementStrategyKind::Packed;
        auto node = orchestrator.place_workload(id, i < 4 ? small : large, {}, strategy);
        if (!node) {
            logger.warn("Placement of " + id + " failed: " + node.error().describe());
            continue;
        }
        orchestrator.driver().set_domain(*node, id, DomainState::Running);
        if (auto running = orchestrator.mark_running(id); !running) {
            logger.warn(running.error().describe());
        }
    }
    log_health(logger, orchestrator.get_cluster_health());

    // Live-migrate vm-0 to whichever node does not hold it.
    if (auto vm0 = orchestrator.ledger().workload("vm-0"); vm0 && vm0->owner) {
        auto target = *vm0->owner == "node-c" ? NodeId{"node-b"} : NodeId{"node-c"};
        auto job = orchestrator.migrate_workload("vm-0", target, MigrationMode::Live);
        if (job) {
            auto finished = orchestrator.wait_for_migration(*job);
            if (finished) {
                logger.info("Migration " + *job + " ended "
                            + std::string(to_string(finished->state)));
            }
        } else {
            logger.warn("Migration rejected: " + job.error().describe());
        }
    }

    // Maintenance and evacuation of node-a.
    if (auto maintenance = orchestrator.set_maintenance("node-a", true); !maintenance) {
        logger.warn(maintenance.error().describe());
    }
    if (auto report = orchestrator.evacuate_node("node-a"); report) {
        logger.info("Evacuation " + std::string(report->succeeded() ? "succeeded" : "failed")
                    + ": " + std::to_string(report->count(MoveOutcome::Migrated)) + " migrated");
    }
    if (auto maintenance = orchestrator.set_maintenance("node-a", false); !maintenance) {
        logger.warn(maintenance.error().describe());
    }

    auto plan = orchestrator.rebalance_cluster(true);
    logger.info("Rebalance dry run proposes " + std::to_string(plan.moves.size()) + " moves");
    log_health(logger, orchestrator.get_cluster_health());

    logger.info("=== Demo Complete ===");
    orchestrator.stop();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().describe() << std::endl;
        if (config_result.error().kind != ErrorKind::NotFound) return 1;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        return run_demo(std::move(config));
    }

    // ── Initialize sinks ─────────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "compute_orchestrator",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "events",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
        metrics_sink = std::make_unique<NullSink>();
    }

    // TODO: replace SimulatedHypervisor with a libvirt-backed driver.
    Orchestrator<TcpProbe, SimulatedHypervisor> orchestrator({
        .config = std::move(config),
        .log_sink = std::move(log_sink),
        .metrics_sink = std::move(metrics_sink),
        .log_level = level
    });
    auto& logger = orchestrator.logger();

    if (auto started = orchestrator.start(); !started) {
        logger.error("Startup failed: " + started.error().describe());
        std::cerr << "Startup failed: " << started.error().describe() << std::endl;
        return 1;
    }

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    const auto status_interval = std::chrono::seconds(30);
    auto next_status = std::chrono::steady_clock::now() + status_interval;
    while (!g_shutdown_requested) {
        if (std::chrono::steady_clock::now() >= next_status) {
            log_health(logger, orchestrator.get_cluster_health());
            next_status += status_interval;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    orchestrator.stop();
    logger.info("ComputeOrchestrator stopped.");
    return 0;
}
