/**
 * @file types.cpp
 * @brief Vocabulary type helpers.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <cmath>
#include <limits>

namespace compute_orchestrator {

namespace {

bool valid_ratio(double ratio) noexcept {
    return std::isfinite(ratio) && ratio >= 1.0;
}

uint64_t scaled(uint64_t total, double ratio) noexcept {
    if (!valid_ratio(ratio)) ratio = 1.0;
    double product = std::floor(static_cast<double>(total) * ratio);
    // 2^64: anything at or above it does not fit in uint64_t.
    if (product >= 18446744073709551616.0) return std::numeric_limits<uint64_t>::max();
    return static_cast<uint64_t>(product);
}

}  // anonymous namespace

std::string to_string(const Resources& r) {
    return std::to_string(r.vcpus) + " vcpu/"
         + std::to_string(r.memory_mb) + " MB/"
         + std::to_string(r.disk_gb) + " GB";
}

bool ComputeNode::has_valid_overcommit() const noexcept {
    return valid_ratio(cpu_overcommit) && valid_ratio(memory_overcommit)
        && valid_ratio(disk_overcommit);
}

Resources ComputeNode::capacity() const noexcept {
    return Resources{
        .vcpus = scaled(total.vcpus, cpu_overcommit),
        .memory_mb = scaled(total.memory_mb, memory_overcommit),
        .disk_gb = scaled(total.disk_gb, disk_overcommit)
    };
}

std::optional<PlacementStrategyKind> parse_strategy(std::string_view name) noexcept {
    if (name == "balanced") return PlacementStrategyKind::Balanced;
    if (name == "packed")   return PlacementStrategyKind::Packed;
    if (name == "spread")   return PlacementStrategyKind::Spread;
    return std::nullopt;
}

std::optional<MigrationMode> parse_migration_mode(std::string_view name) noexcept {
    if (name == "offline") return MigrationMode::Offline;
    if (name == "live")    return MigrationMode::Live;
    return std::nullopt;
}

}  // namespace compute_orchestrator
