/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace compute_orchestrator {

struct OrchestratorConfig {
    std::string node_id = "orchestrator-01";
};

struct PlacementConfig {
    std::string default_strategy = "balanced";    ///< "balanced", "packed", "spread"
    uint32_t max_reservation_retries = 5;
};

struct HealthConfig {
    uint32_t probe_interval_ms = 5000;
    uint32_t probe_timeout_ms = 1000;
    uint32_t failure_threshold = 3;               ///< Consecutive failures before healthy -> unhealthy
    uint16_t agent_port = 16509;
};

struct MigrationConfig {
    uint32_t max_concurrent = 2;                  ///< Cluster-wide in-flight migrations
    uint32_t stage_timeout_ms = 600000;
    std::string default_mode = "live";            ///< "offline", "live"
    uint32_t worker_threads = 4;
};

struct RebalanceConfig {
    double min_improvement = 0.0025;              ///< Minimum variance reduction per move
    uint32_t max_moves = 10;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level orchestrator configuration.
 */
struct Config {
    OrchestratorConfig orchestrator;
    PlacementConfig placement;
    HealthConfig health;
    MigrationConfig migration;
    RebalanceConfig rebalance;
    TelemetryConfig telemetry;
    std::vector<ComputeNode> nodes;               ///< Static inventory from [[nodes]]
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults; the result is validated before it is
 * returned.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Reject unknown strategy/mode names, ratios below 1.0 and empty nodes.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace compute_orchestrator
