/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for SquadRotation interfaces.
 *
 * Defines compile-time interface constraints for the components evaluated
 * inside the solver's inner loops (multiplier curves, matching algorithms).
 * These are resolved statically; nothing on the cost-matrix path pays for
 * virtual dispatch.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <cstddef>
#include <vector>

namespace squad_rotation {

// ─────────────────────────────────────────────
// MultiplierCurveLike
// ─────────────────────────────────────────────

/**
 * @concept MultiplierCurveLike
 * @brief A pure function object mapping a [0,1] quantity to a multiplier.
 *
 * Evaluated once per (worker, slot) cell and again for every projected
 * future event during shadow pricing.
 */
template <typename T>
concept MultiplierCurveLike = requires(const T curve, double x) {
    { curve(x) } -> std::convertible_to<double>;
};

// ─────────────────────────────────────────────
// MatchingAlgorithmLike
// ─────────────────────────────────────────────

/**
 * @concept MatchingAlgorithmLike
 * @brief Minimum-cost perfect matching on a square cost matrix.
 *
 * Given an n x n row-major matrix, returns for each row the column it is
 * matched to.
 */
template <typename T>
concept MatchingAlgorithmLike = requires(T algorithm,
                                         const std::vector<double>& costs,
                                         size_t n) {
    { algorithm.solve(costs, n) } -> std::same_as<std::vector<size_t>>;
};

}  // namespace squad_rotation
