/**
 * @file hungarian.cpp
 * @brief Hungarian algorithm (potentials / shortest augmenting path).
 */

#include "solver/hungarian.hpp"

#include <limits>

namespace squad_rotation {

std::vector<size_t> HungarianMatcher::solve(const std::vector<double>& costs, size_t n) const {
    if (n == 0) return {};

    constexpr double kInf = std::numeric_limits<double>::infinity();

    // 1-based potentials; column 0 is the virtual source of each augmentation
    std::vector<double> u(n + 1, 0.0);
    std::vector<double> v(n + 1, 0.0);
    std::vector<size_t> match(n + 1, 0);    // match[col] = row, 0 = free
    std::vector<size_t> way(n + 1, 0);

    for (size_t row = 1; row <= n; ++row) {
        match[0] = row;
        size_t col0 = 0;
        std::vector<double> min_slack(n + 1, kInf);
        std::vector<bool> used(n + 1, false);

        do {
            used[col0] = true;
            size_t row0 = match[col0];
            size_t col1 = 0;
            double delta = kInf;

            for (size_t col = 1; col <= n; ++col) {
                if (used[col]) continue;
                double slack = costs[(row0 - 1) * n + (col - 1)] - u[row0] - v[col];
                if (slack < min_slack[col]) {
                    min_slack[col] = slack;
                    way[col] = col0;
                }
                if (min_slack[col] < delta) {
                    delta = min_slack[col];
                    col1 = col;
                }
            }

            for (size_t col = 0; col <= n; ++col) {
                if (used[col]) {
                    u[match[col]] += delta;
                    v[col] -= delta;
                } else {
                    min_slack[col] -= delta;
                }
            }
            col0 = col1;
        } while (match[col0] != 0);

        // Walk the alternating path back to the source
        do {
            size_t col1 = way[col0];
            match[col0] = match[col1];
            col0 = col1;
        } while (col0 != 0);
    }

    std::vector<size_t> assignment(n, 0);
    for (size_t col = 1; col <= n; ++col) {
        assignment[match[col] - 1] = col - 1;
    }
    return assignment;
}

double HungarianMatcher::total_cost(const std::vector<double>& costs,
                                    size_t n,
                                    const std::vector<size_t>& matching) {
    double total = 0.0;
    for (size_t row = 0; row < matching.size(); ++row) {
        total += costs[row * n + matching[row]];
    }
    return total;
}

}  // namespace squad_rotation
