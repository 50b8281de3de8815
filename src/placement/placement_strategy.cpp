/**
 * @file placement_strategy.cpp
 * @brief Balanced, packed and spread scoring.
 * @author Dimitris Kafetzis
 *
 *   balanced: score =  free(node)
 *   packed:   score = -free(node)
 *   spread:   score = -workload_count(node)
 *
 * where free(node) is the equal-weight mean of the free fraction of each
 * resource dimension against the overcommitted capacity.
 */

#include "placement/placement_strategy.hpp"

namespace compute_orchestrator {

namespace {

double free_fraction(uint64_t available, uint64_t capacity) noexcept {
    if (capacity == 0) return 0.0;
    return static_cast<double>(available) / static_cast<double>(capacity);
}

}  // anonymous namespace

double normalized_free_capacity(const NodeAllocation& node) noexcept {
    auto available = node.available();
    return (free_fraction(available.vcpus, node.capacity.vcpus)
          + free_fraction(available.memory_mb, node.capacity.memory_mb)
          + free_fraction(available.disk_gb, node.capacity.disk_gb)) / 3.0;
}

double BalancedStrategy::score(const NodeAllocation& node) const {
    return normalized_free_capacity(node);
}

double PackedStrategy::score(const NodeAllocation& node) const {
    return -normalized_free_capacity(node);
}

double SpreadStrategy::score(const NodeAllocation& node) const {
    return -static_cast<double>(node.workload_count);
}

std::unique_ptr<IPlacementStrategy> make_strategy(PlacementStrategyKind kind) {
    switch (kind) {
        case PlacementStrategyKind::Packed: return std::make_unique<PackedStrategy>();
        case PlacementStrategyKind::Spread: return std::make_unique<SpreadStrategy>();
        case PlacementStrategyKind::Balanced: break;
    }
    return std::make_unique<BalancedStrategy>();
}

}  // namespace compute_orchestrator
