/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <unordered_set>

namespace compute_orchestrator {

namespace {

ComputeNode parse_node(const toml::table& entry) {
    ComputeNode node;
    node.id = entry["id"].value_or(std::string{});
    node.address = entry["address"].value_or(std::string{});
    node.total.vcpus = static_cast<uint64_t>(entry["vcpus"].value_or(int64_t{0}));
    node.total.memory_mb = static_cast<uint64_t>(entry["memory_mb"].value_or(int64_t{0}));
    node.total.disk_gb = static_cast<uint64_t>(entry["disk_gb"].value_or(int64_t{0}));
    node.cpu_overcommit = entry["cpu_overcommit"].value_or(1.0);
    node.memory_overcommit = entry["memory_overcommit"].value_or(1.0);
    node.disk_overcommit = entry["disk_overcommit"].value_or(1.0);
    node.cpu_model = entry["cpu_model"].value_or(std::string{});
    node.hypervisor = entry["hypervisor"].value_or(std::string{});
    return node;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::NotFound, "Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [orchestrator]
        if (auto orch = tbl["orchestrator"]; orch.is_table()) {
            config.orchestrator.node_id = orch["node_id"].value_or(std::string{"orchestrator-01"});
        }

        // [placement]
        if (auto placement = tbl["placement"]; placement.is_table()) {
            config.placement.default_strategy =
                placement["default_strategy"].value_or(std::string{"balanced"});
            config.placement.max_reservation_retries = static_cast<uint32_t>(
                placement["max_reservation_retries"].value_or(int64_t{5}));
        }

        // [health]
        if (auto health = tbl["health"]; health.is_table()) {
            config.health.probe_interval_ms = static_cast<uint32_t>(
                health["probe_interval_ms"].value_or(int64_t{5000}));
            config.health.probe_timeout_ms = static_cast<uint32_t>(
                health["probe_timeout_ms"].value_or(int64_t{1000}));
            config.health.failure_threshold = static_cast<uint32_t>(
                health["failure_threshold"].value_or(int64_t{3}));
            config.health.agent_port = static_cast<uint16_t>(
                health["agent_port"].value_or(int64_t{16509}));
        }

        // [migration]
        if (auto migration = tbl["migration"]; migration.is_table()) {
            config.migration.max_concurrent = static_cast<uint32_t>(
                migration["max_concurrent"].value_or(int64_t{2}));
            config.migration.stage_timeout_ms = static_cast<uint32_t>(
                migration["stage_timeout_ms"].value_or(int64_t{600000}));
            config.migration.default_mode = migration["default_mode"].value_or(std::string{"live"});
            config.migration.worker_threads = static_cast<uint32_t>(
                migration["worker_threads"].value_or(int64_t{4}));
        }

        // [rebalance]
        if (auto rebalance = tbl["rebalance"]; rebalance.is_table()) {
            config.rebalance.min_improvement = rebalance["min_improvement"].value_or(0.0025);
            config.rebalance.max_moves = static_cast<uint32_t>(
                rebalance["max_moves"].value_or(int64_t{10}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        // [[nodes]]
        if (auto* nodes = tbl["nodes"].as_array()) {
            for (const auto& element : *nodes) {
                if (const auto* entry = element.as_table()) {
                    config.nodes.push_back(parse_node(*entry));
                }
            }
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::InvalidArgument,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    if (!parse_strategy(config.placement.default_strategy)) {
        return Error{ErrorKind::InvalidArgument,
                     "Unknown placement strategy: " + config.placement.default_strategy};
    }
    if (!parse_migration_mode(config.migration.default_mode)) {
        return Error{ErrorKind::InvalidArgument,
                     "Unknown migration mode: " + config.migration.default_mode};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorKind::InvalidArgument,
                     "Unknown log level: " + config.telemetry.log_level};
    }
    if (config.migration.max_concurrent == 0) {
        return Error{ErrorKind::InvalidArgument, "migration.max_concurrent must be at least 1"};
    }
    if (config.health.failure_threshold == 0) {
        return Error{ErrorKind::InvalidArgument, "health.failure_threshold must be at least 1"};
    }
    if (config.rebalance.min_improvement < 0.0) {
        return Error{ErrorKind::InvalidArgument, "rebalance.min_improvement must not be negative"};
    }

    std::unordered_set<NodeId> seen;
    for (const auto& node : config.nodes) {
        if (node.id.empty()) {
            return Error{ErrorKind::InvalidArgument, "Node entry without id"};
        }
        if (!seen.insert(node.id).second) {
            return Error{ErrorKind::InvalidArgument, "Duplicate node id: " + node.id};
        }
        if (node.total.vcpus == 0 || node.total.memory_mb == 0 || node.total.disk_gb == 0) {
            return Error{ErrorKind::InvalidArgument, "Node " + node.id + " has zero capacity"};
        }
        if (!node.has_valid_overcommit()) {
            return Error{ErrorKind::InvalidArgument,
                         "Node " + node.id + " has an overcommit ratio below 1.0 or not finite"};
        }
    }
    return Result<void>{};
}

Config default_config() {
    return Config{};
}

}  // namespace compute_orchestrator
