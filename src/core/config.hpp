/**
 * @file config.hpp
 * @brief Optimizer configuration with TOML deserialization.
 *
 * Every tunable of the scoring curves, the state dynamics, shadow pricing,
 * the assignment solver and the planner lives here. Defaults reproduce the
 * calibrated values; a TOML file only needs to name what it overrides.
 */

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace squad_rotation {

// ─────────────────────────────────────────────
// Scoring
// ─────────────────────────────────────────────

struct ReadinessCurveParams {
    double midpoint = 0.88;     ///< T: readiness at the curve's inflection
    double floor = 0.05;        ///< α: multiplier never drops below this
};

struct ScoringConfig {
    double readiness_steepness = 25.0;
    ByImportance<ReadinessCurveParams> readiness{{{
        {0.82, 0.10},   // High
        {0.88, 0.05},   // Medium
        {0.92, 0.00},   // Low
        {0.86, 0.05},   // SharpnessBuilding
    }}};
    double readiness_floor = 0.91;          ///< Hard floor: never start below this

    double sharpness_steepness = 15.0;
    double sharpness_midpoint = 0.75;
    double sharpness_floor = 0.0;
    double sharpness_building_floor = 0.25; ///< Floor of the inverted curve

    double familiarity_weight = 0.5;        ///< w: in-possession share
    double familiarity_gap_penalty = 0.25;  ///< Must stay <= min(w, 1 - w)
    double familiarity_floor = 0.70;

    /// Ω per LoadCategory (Fresh, Fit, Tired, Jaded); must be non-increasing.
    std::array<double, kLoadCategories> load_multipliers{1.0, 0.9, 0.7, 0.4};

    /// Combined familiarity at the goalkeeper slot's kind that makes a
    /// worker goalkeeper-type.
    double goalkeeper_familiarity = 0.65;
};

// ─────────────────────────────────────────────
// State propagation
// ─────────────────────────────────────────────

struct PropagationConfig {
    double readiness_loss_per_90 = 0.15;
    double sharpness_gain_per_90 = 0.05;
    double recovery_per_day = 0.05;
    double sharpness_decay_per_day = 0.02 / 7.0;

    int window_days = 14;                   ///< W: rolling appearance window
    double base_load_threshold = 400.0;     ///< Window minutes before jadedness risk
    double min_load_threshold = 200.0;
    double max_load_threshold = 550.0;
    double fresh_ratio = 0.5;               ///< window/threshold below this is Fresh
    double fit_ratio = 0.8;                 ///< ... below this is Fit, else Tired
    int jaded_streak = 3;
    int jaded_recovery_days = 10;

    TrainingIntensity training = TrainingIntensity::Medium;

    /// Physical demand of an event relative to a Medium one.
    ByImportance<double> event_intensity{{{1.1, 1.0, 0.9, 0.9}}};
    /// Sharpness gained relative to a Medium event.
    ByImportance<double> competitiveness{{{1.2, 1.0, 0.8, 1.0}}};
};

// ─────────────────────────────────────────────
// Shadow pricing
// ─────────────────────────────────────────────

struct ShadowConfig {
    uint32_t horizon = 5;                   ///< H: future events considered
    double discount = 0.85;                 ///< γ
    double scarcity_lambda = 1.0;           ///< λ
    double scarcity_cap = 0.5;
    uint32_t assumed_future_minutes = 90;
    ByImportance<double> importance_weights{{{3.0, 1.5, 0.5, 0.3}}};
    /// Scaling applied according to the importance of the current event.
    ByImportance<double> current_scaling{{{0.3, 0.7, 1.0, 0.5}}};
};

// ─────────────────────────────────────────────
// Assignment solver
// ─────────────────────────────────────────────

struct StabilityConfig {
    double inertia_weight = 1.0;
    double continuity_bonus = 2.0;
    double switch_cost = 5.0;
    uint32_t anchor_threshold = 3;
    double anchor_multiplier = 2.0;
};

struct RestWeights {
    double utility = 0.15;          ///< Cost of idling a useful worker
    double sharpness_need = 0.10;   ///< Cost of idling a rusty worker
    double fatigue_relief = 0.30;   ///< Benefit of resting a loaded worker
};

struct SolverConfig {
    double forbidden_cost = 1.0e6;
    uint32_t minutes_per_start = 90;
    uint32_t bench_size = 7;
    double fallback_familiarity = 0.45;     ///< Below this a starter is a fallback pick
    double rest_scale = 100.0;              ///< GSS units for the rest-cell terms
    /// relief(load) per LoadCategory (Fresh, Fit, Tired, Jaded).
    std::array<double, kLoadCategories> fatigue_relief{0.0, 0.25, 0.6, 1.0};
    ByImportance<RestWeights> rest{{{
        {0.30, 0.00, 0.10},   // High
        {0.15, 0.10, 0.30},   // Medium
        {0.05, 0.20, 0.50},   // Low
        {0.05, 0.50, 0.30},   // SharpnessBuilding
    }}};
    StabilityConfig stability;
};

// ─────────────────────────────────────────────
// Planner / executor / telemetry
// ─────────────────────────────────────────────

struct PlannerConfig {
    uint32_t trailing_days = 3;             ///< Rest applied after the last event
};

struct ExecutorConfig {
    uint32_t thread_count = 0;              ///< 0 = hardware_concurrency
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool plan_trace = false;
};

/**
 * @brief Top-level optimizer configuration.
 */
struct Config {
    ScoringConfig scoring;
    PropagationConfig propagation;
    ShadowConfig shadow;
    SolverConfig solver;
    PlannerConfig planner;
    ExecutorConfig executor;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Keys absent from the file keep their defaults. The loaded configuration
 * is validated before it is returned.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check ranges and cross-field constraints.
 *
 * Out-of-range values fail with ErrorCode::Validation; ErrorCode::Config is
 * reserved for unreadable or malformed files.
 */
Result<void> validate_config(const Config& config);

Result<void> validate_scoring_config(const ScoringConfig& config);
Result<void> validate_propagation_config(const PropagationConfig& config);
Result<void> validate_shadow_config(const ShadowConfig& config);
Result<void> validate_solver_config(const SolverConfig& config);

}  // namespace squad_rotation
