/**
 * @file test_cost_matrix.cpp
 * @brief Unit tests for the square cost matrix and rest-sink costs.
 */

#include "solver/cost_matrix.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace squad_rotation;

TEST(CostMatrixTest, Dimensions) {
    CostMatrix m(5, 3, 1.0e6);
    EXPECT_EQ(m.dimension(), 5u);
    EXPECT_EQ(m.slot_count(), 3u);
    EXPECT_EQ(m.rest_count(), 2u);
    EXPECT_FALSE(m.is_rest_column(2));
    EXPECT_TRUE(m.is_rest_column(3));
}

TEST(CostMatrixTest, FewerWorkersThanSlotsThrows) {
    EXPECT_THROW(CostMatrix(2, 3, 1.0e6), std::invalid_argument);
}

TEST(CostMatrixTest, RestCostFillsEveryRestColumn) {
    CostMatrix m(4, 2, 1.0e6);
    m.set_rest(1, 12.5);
    EXPECT_DOUBLE_EQ(m.cost(1, 2), 12.5);
    EXPECT_DOUBLE_EQ(m.cost(1, 3), 12.5);
    EXPECT_DOUBLE_EQ(m.cost(1, 0), 0.0);
}

TEST(CostMatrixTest, ForbiddenCellsUseForbiddenCost) {
    CostMatrix m(3, 2, 1.0e6);
    m.set_play(0, 1, -140.0);
    m.forbid(0, 1);
    EXPECT_TRUE(m.forbidden(0, 1));
    EXPECT_DOUBLE_EQ(m.cost(0, 1), 1.0e6);
    EXPECT_DOUBLE_EQ(m.natural_cost(0, 1), -140.0);
    EXPECT_EQ(m.candidates(1), 2u);
    EXPECT_EQ(m.candidates(0), 3u);

    m.forbid_rest(2);
    EXPECT_TRUE(m.forbidden(2, 2));
}

TEST(CostMatrixTest, LockPinsTheRow) {
    CostMatrix m(3, 2, 1.0e6);
    m.set_play(1, 0, -120.0);
    m.lock(1, 0);

    EXPECT_EQ(m.status(1, 0), CellStatus::Locked);
    EXPECT_DOUBLE_EQ(m.cost(1, 0), -1.0e6);
    EXPECT_DOUBLE_EQ(m.natural_cost(1, 0), -120.0);
    EXPECT_TRUE(m.forbidden(1, 1));
    EXPECT_TRUE(m.forbidden(1, 2));

    // A later forbid does not undo the lock
    m.forbid(1, 0);
    EXPECT_EQ(m.status(1, 0), CellStatus::Locked);
}

TEST(CostMatrixTest, SolverCostsSubstituteConstraints) {
    CostMatrix m(2, 1, 500.0);
    m.set_play(0, 0, -10.0);
    m.set_play(1, 0, -20.0);
    m.set_rest(0, 3.0);
    m.set_rest(1, 4.0);
    m.forbid(1, 0);

    auto costs = m.solver_costs();
    EXPECT_EQ(costs, (std::vector<double>{-10.0, 3.0, 500.0, 4.0}));
}

TEST(RestCostTest, Formula) {
    SolverConfig config;
    RestWeights weights{.utility = 0.15, .sharpness_need = 0.10, .fatigue_relief = 0.30};
    // 0.15 * 100 + 0.10 * 0.2 * 100 - 0.30 * 0.6 * 100
    EXPECT_NEAR(rest_cost(weights, 100.0, 0.8, LoadCategory::Tired, config), -1.0, 1e-9);
    // Fresh workers earn no relief
    EXPECT_NEAR(rest_cost(weights, 100.0, 1.0, LoadCategory::Fresh, config), 15.0, 1e-9);
}

TEST(RestCostTest, JadedWorkersAreCheapestToRest) {
    SolverConfig config;
    const auto& weights = config.rest[Importance::Low];
    double fresh = rest_cost(weights, 120.0, 0.9, LoadCategory::Fresh, config);
    double tired = rest_cost(weights, 120.0, 0.9, LoadCategory::Tired, config);
    double jaded = rest_cost(weights, 120.0, 0.9, LoadCategory::Jaded, config);
    EXPECT_GT(fresh, tired);
    EXPECT_GT(tired, jaded);
}
