/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and validation.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace squad_rotation;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "sr_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_DOUBLE_EQ(config.scoring.readiness_floor, 0.91);
    EXPECT_DOUBLE_EQ(config.scoring.readiness[Importance::High].midpoint, 0.82);
    EXPECT_DOUBLE_EQ(config.scoring.readiness[Importance::Low].floor, 0.0);
    EXPECT_EQ(config.propagation.window_days, 14);
    EXPECT_EQ(config.shadow.horizon, 5u);
    EXPECT_DOUBLE_EQ(config.shadow.discount, 0.85);
    EXPECT_EQ(config.solver.bench_size, 7u);
    EXPECT_EQ(config.executor.thread_count, 0u);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [scoring.readiness]
        steepness = 20.0
        hard_floor = 0.88

        [scoring.readiness.high]
        midpoint = 0.80
        floor = 0.2

        [scoring.familiarity]
        weight = 0.6
        gap_penalty = 0.2

        [scoring.load]
        multipliers = [1.0, 0.95, 0.8, 0.5]

        [propagation]
        window_days = 21
        training = "high"

        [propagation.event_intensity]
        high = 1.3

        [shadow]
        horizon = 3
        discount = 0.9

        [shadow.importance_weights]
        low = 0.25

        [solver]
        bench_size = 9
        fatigue_relief = [0.0, 0.2, 0.5, 0.9]

        [solver.stability]
        switch_cost = 7.5
        anchor_threshold = 4

        [solver.rest.low]
        utility = 0.02

        [planner]
        trailing_days = 5

        [executor]
        thread_count = 2

        [telemetry]
        log_dir = "/tmp/sr_logs"
        log_level = "debug"
        plan_trace = true
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_DOUBLE_EQ(config.scoring.readiness_steepness, 20.0);
    EXPECT_DOUBLE_EQ(config.scoring.readiness_floor, 0.88);
    EXPECT_DOUBLE_EQ(config.scoring.readiness[Importance::High].midpoint, 0.80);
    EXPECT_DOUBLE_EQ(config.scoring.readiness[Importance::High].floor, 0.2);
    EXPECT_DOUBLE_EQ(config.scoring.familiarity_weight, 0.6);
    EXPECT_DOUBLE_EQ(config.scoring.load_multipliers[1], 0.95);
    EXPECT_EQ(config.propagation.window_days, 21);
    EXPECT_EQ(config.propagation.training, TrainingIntensity::High);
    EXPECT_DOUBLE_EQ(config.propagation.event_intensity[Importance::High], 1.3);
    EXPECT_DOUBLE_EQ(config.propagation.event_intensity[Importance::Medium], 1.0);
    EXPECT_EQ(config.shadow.horizon, 3u);
    EXPECT_DOUBLE_EQ(config.shadow.discount, 0.9);
    EXPECT_DOUBLE_EQ(config.shadow.importance_weights[Importance::Low], 0.25);
    EXPECT_EQ(config.solver.bench_size, 9u);
    EXPECT_DOUBLE_EQ(config.solver.fatigue_relief[3], 0.9);
    EXPECT_DOUBLE_EQ(config.solver.stability.switch_cost, 7.5);
    EXPECT_EQ(config.solver.stability.anchor_threshold, 4u);
    EXPECT_DOUBLE_EQ(config.solver.rest[Importance::Low].utility, 0.02);
    EXPECT_DOUBLE_EQ(config.solver.rest[Importance::Low].fatigue_relief, 0.50);
    EXPECT_EQ(config.planner.trailing_days, 5u);
    EXPECT_EQ(config.executor.thread_count, 2u);
    EXPECT_EQ(config.telemetry.log_dir, std::filesystem::path{"/tmp/sr_logs"});
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_TRUE(config.telemetry.plan_trace);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [shadow]
        horizon = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->shadow.horizon, 2u);
    // Defaults for everything else
    EXPECT_DOUBLE_EQ(result->shadow.discount, 0.85);
    EXPECT_DOUBLE_EQ(result->scoring.readiness_floor, 0.91);
    EXPECT_EQ(result->propagation.training, TrainingIntensity::Medium);
}

TEST_F(ConfigTest, ShippedDefaultsMatchBuiltIns) {
    auto result = load_config(std::filesystem::path{SQUAD_ROTATION_SOURCE_DIR} / "config" / "default.toml");
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto builtin = default_config();
    EXPECT_DOUBLE_EQ(result->scoring.readiness_floor, builtin.scoring.readiness_floor);
    EXPECT_DOUBLE_EQ(result->scoring.readiness[Importance::SharpnessBuilding].midpoint,
                     builtin.scoring.readiness[Importance::SharpnessBuilding].midpoint);
    EXPECT_NEAR(result->propagation.sharpness_decay_per_day,
                builtin.propagation.sharpness_decay_per_day, 1e-9);
    EXPECT_DOUBLE_EQ(result->shadow.current_scaling[Importance::Low],
                     builtin.shadow.current_scaling[Importance::Low]);
    EXPECT_DOUBLE_EQ(result->solver.rest[Importance::High].utility,
                     builtin.solver.rest[Importance::High].utility);
    EXPECT_EQ(result->solver.stability.anchor_threshold, builtin.solver.stability.anchor_threshold);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, RejectsExcessiveGapPenalty) {
    auto path = write_toml(R"(
        [scoring.familiarity]
        weight = 0.8
        gap_penalty = 0.3
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
}

TEST_F(ConfigTest, RejectsIncreasingLoadMultipliers) {
    auto path = write_toml(R"(
        [scoring.load]
        multipliers = [0.9, 1.0, 0.7, 0.4]
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, RejectsDiscountOutOfRange) {
    auto config = default_config();
    config.shadow.discount = 1.5;
    auto valid = validate_config(config);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::Validation);

    config.shadow.discount = 1.0;
    EXPECT_FALSE(validate_config(config).has_value());
    EXPECT_FALSE(validate_shadow_config(config.shadow).has_value());

    config.shadow.discount = 0.0;
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, RejectsNegativeSolverWeights) {
    auto config = default_config();
    config.solver.forbidden_cost = 0.0;
    EXPECT_FALSE(validate_solver_config(config.solver).has_value());

    config = default_config();
    config.solver.rest[Importance::Low].fatigue_relief = -0.1;
    EXPECT_FALSE(validate_solver_config(config.solver).has_value());

    config = default_config();
    config.solver.stability.switch_cost = -5.0;
    auto valid = validate_config(config);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::Validation);
    EXPECT_TRUE(validate_solver_config(default_config().solver).has_value());
}

TEST_F(ConfigTest, RejectsDegenerateReadinessMidpoint) {
    auto config = default_config();
    config.scoring.readiness[Importance::Medium].midpoint = 1.0;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.scoring.sharpness_steepness = 0.0;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.solver.minutes_per_start = 0;
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, UnknownTrainingKeepsDefault) {
    auto path = write_toml(R"(
        [propagation]
        training = "extreme"
    )");
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->propagation.training, TrainingIntensity::Medium);
}
