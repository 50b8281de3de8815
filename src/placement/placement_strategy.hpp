/**
 * @file placement_strategy.hpp
 * @brief Placement strategies: score a candidate node, higher wins.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/concepts.hpp"
#include "core/types.hpp"
#include "ledger/resource_ledger.hpp"

#include <memory>
#include <string_view>

namespace compute_orchestrator {

/**
 * @brief Mean over vCPU/memory/disk of available / (total × ratio), in [0, 1].
 */
[[nodiscard]] double normalized_free_capacity(const NodeAllocation& node) noexcept;

/**
 * @brief Abstract interface for placement strategies (runtime polymorphism).
 *
 * Ties are never resolved by the strategy; the engine breaks them by node id.
 */
class IPlacementStrategy {
public:
    virtual ~IPlacementStrategy() = default;
    [[nodiscard]] virtual double score(const NodeAllocation& node) const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual PlacementStrategyKind kind() const noexcept = 0;
};

/// Most free capacity first: spreads load evenly.
class BalancedStrategy : public IPlacementStrategy {
public:
    [[nodiscard]] double score(const NodeAllocation& node) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "balanced"; }
    [[nodiscard]] PlacementStrategyKind kind() const noexcept override {
        return PlacementStrategyKind::Balanced;
    }
};

/// Least free capacity first: fills partially used nodes before fresh ones.
class PackedStrategy : public IPlacementStrategy {
public:
    [[nodiscard]] double score(const NodeAllocation& node) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "packed"; }
    [[nodiscard]] PlacementStrategyKind kind() const noexcept override {
        return PlacementStrategyKind::Packed;
    }
};

/// Fewest workloads first, regardless of utilization.
class SpreadStrategy : public IPlacementStrategy {
public:
    [[nodiscard]] double score(const NodeAllocation& node) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "spread"; }
    [[nodiscard]] PlacementStrategyKind kind() const noexcept override {
        return PlacementStrategyKind::Spread;
    }
};

[[nodiscard]] std::unique_ptr<IPlacementStrategy> make_strategy(PlacementStrategyKind kind);

// Verify concept satisfaction at compile time
static_assert(PlacementStrategyLike<BalancedStrategy>);
static_assert(PlacementStrategyLike<PackedStrategy>);
static_assert(PlacementStrategyLike<SpreadStrategy>);

}  // namespace compute_orchestrator
