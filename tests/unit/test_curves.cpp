/**
 * @file test_curves.cpp
 * @brief Unit tests for multiplier curves.
 */

#include "scoring/curves.hpp"

#include <gtest/gtest.h>

using namespace squad_rotation;

TEST(CurveTest, LogisticNormalizedAtOne) {
    auto curve = MultiplierCurve::logistic(25.0, 0.88, 0.05);
    EXPECT_NEAR(curve(1.0), 1.0, 1e-12);
}

TEST(CurveTest, LogisticApproachesFloorAtZero) {
    auto curve = MultiplierCurve::logistic(25.0, 0.88, 0.05);
    EXPECT_NEAR(curve(0.0), 0.05, 1e-6);
    EXPECT_GE(curve(0.0), 0.05);
}

TEST(CurveTest, LogisticIsMonotoneIncreasing) {
    auto curve = MultiplierCurve::logistic(15.0, 0.75, 0.0);
    double previous = curve(0.0);
    for (int i = 1; i <= 100; ++i) {
        double value = curve(i / 100.0);
        EXPECT_GE(value, previous);
        previous = value;
    }
}

TEST(CurveTest, InverseLogisticNormalizedAtZero) {
    auto curve = MultiplierCurve::inverse_logistic(15.0, 0.75, 0.25);
    EXPECT_NEAR(curve(0.0), 1.0, 1e-12);
    EXPECT_LT(curve(1.0), 0.3);
    EXPECT_GE(curve(1.0), 0.25);
    EXPECT_GT(curve(0.3), curve(0.9));
}

TEST(CurveTest, LinearEndpoints) {
    auto curve = MultiplierCurve::linear(0.7);
    EXPECT_DOUBLE_EQ(curve(0.0), 0.7);
    EXPECT_DOUBLE_EQ(curve(1.0), 1.0);
    EXPECT_NEAR(curve(0.5), 0.85, 1e-12);
}

TEST(CurveTest, InputIsClamped) {
    auto curve = MultiplierCurve::linear(0.7);
    EXPECT_DOUBLE_EQ(curve(-3.0), 0.7);
    EXPECT_DOUBLE_EQ(curve(2.0), 1.0);

    auto logistic = MultiplierCurve::logistic(25.0, 0.82, 0.1);
    EXPECT_NEAR(logistic(1.7), 1.0, 1e-12);
}

TEST(CurveTest, StaysWithinFloorAndOne) {
    for (auto curve : {MultiplierCurve::logistic(40.0, 0.9, 0.1),
                       MultiplierCurve::inverse_logistic(40.0, 0.1, 0.3),
                       MultiplierCurve::linear(0.2)}) {
        for (int i = 0; i <= 20; ++i) {
            double value = curve(i / 20.0);
            EXPECT_GE(value, curve.floor) << to_string(curve.kind);
            EXPECT_LE(value, 1.0) << to_string(curve.kind);
        }
    }
}

TEST(LoadMultiplierTest, StepPerCategory) {
    LoadMultiplier omega({1.0, 0.9, 0.7, 0.4});
    EXPECT_DOUBLE_EQ(omega(LoadCategory::Fresh), 1.0);
    EXPECT_DOUBLE_EQ(omega(LoadCategory::Fit), 0.9);
    EXPECT_DOUBLE_EQ(omega(LoadCategory::Tired), 0.7);
    EXPECT_DOUBLE_EQ(omega(LoadCategory::Jaded), 0.4);
}
