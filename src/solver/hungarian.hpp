/**
 * @file hungarian.hpp
 * @brief Minimum-cost perfect matching on a square matrix.
 *
 * Shortest augmenting path formulation with row/column potentials, O(n³).
 * Rows are inserted in index order and the first minimal column wins every
 * comparison, so identical input always yields the identical matching.
 */

#pragma once

#include "core/concepts.hpp"

#include <cstddef>
#include <vector>

namespace squad_rotation {

class HungarianMatcher {
public:
    /**
     * @param costs Row-major n x n matrix. Entries must be finite.
     * @param n     Dimension.
     * @return For each row, the column it is matched to.
     */
    [[nodiscard]] std::vector<size_t> solve(const std::vector<double>& costs, size_t n) const;

    /// Sum of the matched cells.
    [[nodiscard]] static double total_cost(const std::vector<double>& costs,
                                           size_t n,
                                           const std::vector<size_t>& matching);
};

static_assert(MatchingAlgorithmLike<HungarianMatcher>);

}  // namespace squad_rotation
