/**
 * @file cost_matrix.cpp
 * @brief Cost matrix storage and rest-sink costs.
 */

#include "solver/cost_matrix.hpp"

#include <stdexcept>

namespace squad_rotation {

CostMatrix::CostMatrix(size_t workers, size_t slots, double forbidden_cost)
    : n_(workers)
    , slots_(slots)
    , forbidden_cost_(forbidden_cost)
    , natural_(workers * workers, 0.0)
    , status_(workers * workers, CellStatus::Open) {
    if (workers < slots) {
        throw std::invalid_argument("CostMatrix: fewer workers than slots");
    }
}

void CostMatrix::set_play(size_t worker, size_t slot, double cost) {
    natural_[index(worker, slot)] = cost;
}

void CostMatrix::set_rest(size_t worker, double cost) {
    for (size_t col = slots_; col < n_; ++col) {
        natural_[index(worker, col)] = cost;
    }
}

void CostMatrix::forbid(size_t worker, size_t slot) {
    auto& cell = status_[index(worker, slot)];
    if (cell != CellStatus::Locked) cell = CellStatus::Forbidden;
}

void CostMatrix::forbid_rest(size_t worker) {
    for (size_t col = slots_; col < n_; ++col) {
        status_[index(worker, col)] = CellStatus::Forbidden;
    }
}

void CostMatrix::lock(size_t worker, size_t slot) {
    for (size_t col = 0; col < n_; ++col) {
        status_[index(worker, col)] = col == slot ? CellStatus::Locked : CellStatus::Forbidden;
    }
}

CellStatus CostMatrix::status(size_t row, size_t col) const noexcept {
    return status_[index(row, col)];
}

double CostMatrix::cost(size_t row, size_t col) const noexcept {
    switch (status(row, col)) {
        case CellStatus::Forbidden: return forbidden_cost_;
        case CellStatus::Locked:    return -forbidden_cost_;
        case CellStatus::Open:      break;
    }
    return natural_[index(row, col)];
}

double CostMatrix::natural_cost(size_t row, size_t col) const noexcept {
    return natural_[index(row, col)];
}

std::vector<double> CostMatrix::solver_costs() const {
    std::vector<double> costs(n_ * n_);
    for (size_t row = 0; row < n_; ++row) {
        for (size_t col = 0; col < n_; ++col) {
            costs[index(row, col)] = cost(row, col);
        }
    }
    return costs;
}

size_t CostMatrix::candidates(size_t slot) const noexcept {
    size_t count = 0;
    for (size_t row = 0; row < n_; ++row) {
        if (!forbidden(row, slot)) ++count;
    }
    return count;
}

double rest_cost(const RestWeights& weights,
                 double mean_eligible_gss,
                 double sharpness,
                 LoadCategory load,
                 const SolverConfig& config) {
    double relief = config.fatigue_relief[static_cast<size_t>(load)];
    return weights.utility * mean_eligible_gss
         + weights.sharpness_need * (1.0 - sharpness) * config.rest_scale
         - weights.fatigue_relief * relief * config.rest_scale;
}

}  // namespace squad_rotation
