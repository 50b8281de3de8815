/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for ComputeOrchestrator interfaces.
 * @author Dimitris Kafetzis
 *
 * Compile-time interface constraints checked against every concrete
 * implementation with static_assert next to its declaration.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <string_view>

namespace compute_orchestrator {

// Forward declarations
struct NodeAllocation;
struct ProbeResult;

// ─────────────────────────────────────────────
// PlacementStrategyLike
// ─────────────────────────────────────────────

/**
 * @concept PlacementStrategyLike
 * @brief Constrains types that can score a candidate node (higher is better).
 *
 * Scoring runs once per candidate per placement attempt.
 */
template <typename T>
concept PlacementStrategyLike = requires(const T strategy, const NodeAllocation& node) {
    { strategy.score(node) } -> std::convertible_to<double>;
    { strategy.name() } -> std::convertible_to<std::string_view>;
    { strategy.kind() } -> std::same_as<PlacementStrategyKind>;
};

// ─────────────────────────────────────────────
// HealthProbeLike
// ─────────────────────────────────────────────

/**
 * @concept HealthProbeLike
 * @brief Constrains types that can probe a compute node.
 */
template <typename T>
concept HealthProbeLike = requires(T probe, const ComputeNode& node) {
    { probe.probe(node) } -> std::same_as<ProbeResult>;
};

}  // namespace compute_orchestrator
