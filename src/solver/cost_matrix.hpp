/**
 * @file cost_matrix.hpp
 * @brief Square worker × (slots + rest sinks) cost matrix.
 *
 * With N workers and S slots the matrix has S slot columns followed by
 * R = N − S rest columns. Rest sinks are ordinary columns with their own
 * cost, so a perfect matching both fills every slot and rests everyone else.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <vector>

namespace squad_rotation {

enum class CellStatus : uint8_t {
    Open,
    Forbidden,
    Locked
};

class CostMatrix {
public:
    CostMatrix(size_t workers, size_t slots, double forbidden_cost);

    [[nodiscard]] size_t dimension() const noexcept { return n_; }
    [[nodiscard]] size_t slot_count() const noexcept { return slots_; }
    [[nodiscard]] size_t rest_count() const noexcept { return n_ - slots_; }
    [[nodiscard]] bool is_rest_column(size_t col) const noexcept { return col >= slots_; }

    /// Natural cost of playing worker at slot.
    void set_play(size_t worker, size_t slot, double cost);
    /// Natural cost of resting worker (same for every rest column).
    void set_rest(size_t worker, double cost);

    void forbid(size_t worker, size_t slot);
    void forbid_rest(size_t worker);
    /// Pin worker to slot: every other cell of the row becomes forbidden.
    void lock(size_t worker, size_t slot);

    [[nodiscard]] CellStatus status(size_t row, size_t col) const noexcept;
    [[nodiscard]] bool forbidden(size_t row, size_t col) const noexcept {
        return status(row, col) == CellStatus::Forbidden;
    }

    /// Cost the matcher sees (forbidden and locked cells substituted).
    [[nodiscard]] double cost(size_t row, size_t col) const noexcept;
    /// Cost before constraint substitution, used for reporting.
    [[nodiscard]] double natural_cost(size_t row, size_t col) const noexcept;

    /// Row-major matrix for the matcher.
    [[nodiscard]] std::vector<double> solver_costs() const;

    /// Number of rows with a non-forbidden cell in the slot column.
    [[nodiscard]] size_t candidates(size_t slot) const noexcept;

private:
    [[nodiscard]] size_t index(size_t row, size_t col) const noexcept { return row * n_ + col; }

    size_t n_;
    size_t slots_;
    double forbidden_cost_;
    std::vector<double> natural_;
    std::vector<CellStatus> status_;
};

/**
 * @brief Rest-sink cost for one worker.
 *
 *   utility × mean eligible GSS + sharpness_need × (1 − sharpness) × scale
 *   − fatigue_relief × relief(load) × scale
 */
[[nodiscard]] double rest_cost(const RestWeights& weights,
                               double mean_eligible_gss,
                               double sharpness,
                               LoadCategory load,
                               const SolverConfig& config);

}  // namespace squad_rotation
