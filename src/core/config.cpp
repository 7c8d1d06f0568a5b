/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <algorithm>
#include <format>
#include <type_traits>

#include <toml++/toml.hpp>

namespace squad_rotation {

namespace {

template <typename T>
void read_number(toml::node_view<toml::node> node, std::string_view key, T& out) {
    if constexpr (std::is_floating_point_v<T>) {
        out = static_cast<T>(node[key].value_or(static_cast<double>(out)));
    } else {
        out = static_cast<T>(node[key].value_or(static_cast<int64_t>(out)));
    }
}

void read_by_importance(toml::node_view<toml::node> node, ByImportance<double>& out) {
    if (!node.is_table()) return;
    for (auto importance : kAllImportances) {
        read_number(node, to_string(importance), out[importance]);
    }
}

template <size_t N>
void read_array(toml::node_view<toml::node> node, std::array<double, N>& out) {
    auto* arr = node.as_array();
    if (arr == nullptr) return;
    for (size_t i = 0; i < N && i < arr->size(); ++i) {
        out[i] = (*arr)[i].value_or(out[i]);
    }
}

TrainingIntensity parse_training(std::string_view name, TrainingIntensity fallback) {
    if (name == "low") return TrainingIntensity::Low;
    if (name == "medium") return TrainingIntensity::Medium;
    if (name == "high") return TrainingIntensity::High;
    return fallback;
}

Error config_error(std::string message) {
    return Error{ErrorCode::Config, std::move(message)};
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return config_error("Configuration file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [scoring]
        if (auto scoring = tbl["scoring"]; scoring.is_table()) {
            auto& sc = config.scoring;

            // [scoring.readiness] and [scoring.readiness.<importance>]
            if (auto readiness = scoring["readiness"]; readiness.is_table()) {
                read_number(readiness, "steepness", sc.readiness_steepness);
                read_number(readiness, "hard_floor", sc.readiness_floor);
                for (auto importance : kAllImportances) {
                    auto level = readiness[to_string(importance)];
                    if (!level.is_table()) continue;
                    read_number(level, "midpoint", sc.readiness[importance].midpoint);
                    read_number(level, "floor", sc.readiness[importance].floor);
                }
            }

            // [scoring.sharpness]
            if (auto sharpness = scoring["sharpness"]; sharpness.is_table()) {
                read_number(sharpness, "steepness", sc.sharpness_steepness);
                read_number(sharpness, "midpoint", sc.sharpness_midpoint);
                read_number(sharpness, "floor", sc.sharpness_floor);
                read_number(sharpness, "building_floor", sc.sharpness_building_floor);
            }

            // [scoring.familiarity]
            if (auto familiarity = scoring["familiarity"]; familiarity.is_table()) {
                read_number(familiarity, "weight", sc.familiarity_weight);
                read_number(familiarity, "gap_penalty", sc.familiarity_gap_penalty);
                read_number(familiarity, "floor", sc.familiarity_floor);
                read_number(familiarity, "goalkeeper_threshold", sc.goalkeeper_familiarity);
            }

            // [scoring.load]
            if (auto load = scoring["load"]; load.is_table()) {
                read_array(load["multipliers"], sc.load_multipliers);
            }
        }

        // [propagation]
        if (auto prop = tbl["propagation"]; prop.is_table()) {
            auto& pc = config.propagation;
            read_number(prop, "readiness_loss_per_90", pc.readiness_loss_per_90);
            read_number(prop, "sharpness_gain_per_90", pc.sharpness_gain_per_90);
            read_number(prop, "recovery_per_day", pc.recovery_per_day);
            read_number(prop, "sharpness_decay_per_day", pc.sharpness_decay_per_day);
            read_number(prop, "window_days", pc.window_days);
            read_number(prop, "base_load_threshold", pc.base_load_threshold);
            read_number(prop, "min_load_threshold", pc.min_load_threshold);
            read_number(prop, "max_load_threshold", pc.max_load_threshold);
            read_number(prop, "fresh_ratio", pc.fresh_ratio);
            read_number(prop, "fit_ratio", pc.fit_ratio);
            read_number(prop, "jaded_streak", pc.jaded_streak);
            read_number(prop, "jaded_recovery_days", pc.jaded_recovery_days);
            pc.training = parse_training(
                prop["training"].value_or(std::string{to_string(pc.training)}), pc.training);
            read_by_importance(prop["event_intensity"], pc.event_intensity);
            read_by_importance(prop["competitiveness"], pc.competitiveness);
        }

        // [shadow]
        if (auto shadow = tbl["shadow"]; shadow.is_table()) {
            auto& sh = config.shadow;
            read_number(shadow, "horizon", sh.horizon);
            read_number(shadow, "discount", sh.discount);
            read_number(shadow, "scarcity_lambda", sh.scarcity_lambda);
            read_number(shadow, "scarcity_cap", sh.scarcity_cap);
            read_number(shadow, "assumed_future_minutes", sh.assumed_future_minutes);
            read_by_importance(shadow["importance_weights"], sh.importance_weights);
            read_by_importance(shadow["current_scaling"], sh.current_scaling);
        }

        // [solver]
        if (auto solver = tbl["solver"]; solver.is_table()) {
            auto& sv = config.solver;
            read_number(solver, "forbidden_cost", sv.forbidden_cost);
            read_number(solver, "minutes_per_start", sv.minutes_per_start);
            read_number(solver, "bench_size", sv.bench_size);
            read_number(solver, "fallback_familiarity", sv.fallback_familiarity);
            read_number(solver, "rest_scale", sv.rest_scale);
            read_array(solver["fatigue_relief"], sv.fatigue_relief);

            // [solver.stability]
            if (auto stability = solver["stability"]; stability.is_table()) {
                read_number(stability, "inertia_weight", sv.stability.inertia_weight);
                read_number(stability, "continuity_bonus", sv.stability.continuity_bonus);
                read_number(stability, "switch_cost", sv.stability.switch_cost);
                read_number(stability, "anchor_threshold", sv.stability.anchor_threshold);
                read_number(stability, "anchor_multiplier", sv.stability.anchor_multiplier);
            }

            // [solver.rest.<importance>]
            if (auto rest = solver["rest"]; rest.is_table()) {
                for (auto importance : kAllImportances) {
                    auto level = rest[to_string(importance)];
                    if (!level.is_table()) continue;
                    read_number(level, "utility", sv.rest[importance].utility);
                    read_number(level, "sharpness_need", sv.rest[importance].sharpness_need);
                    read_number(level, "fatigue_relief", sv.rest[importance].fatigue_relief);
                }
            }
        }

        // [planner]
        if (auto planner = tbl["planner"]; planner.is_table()) {
            read_number(planner, "trailing_days", config.planner.trailing_days);
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            read_number(executor, "thread_count", config.executor.thread_count);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            read_number(telemetry, "max_file_size_mb", config.telemetry.max_file_size_mb);
            read_number(telemetry, "rotate_count", config.telemetry.rotate_count);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.plan_trace = telemetry["plan_trace"].value_or(false);
        }

        if (auto valid = validate_config(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return config_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Config default_config() {
    return Config{};
}

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

Result<void> validate_scoring_config(const ScoringConfig& sc) {
    for (auto importance : kAllImportances) {
        const auto& curve = sc.readiness[importance];
        if (curve.midpoint <= 0.0 || curve.midpoint >= 1.0 || curve.floor < 0.0 || curve.floor >= 1.0) {
            return validation_error(std::format(
                "scoring.readiness.{}: midpoint must be in (0,1) and floor in [0,1)",
                to_string(importance)));
        }
    }
    if (sc.readiness_steepness <= 0.0 || sc.sharpness_steepness <= 0.0) {
        return validation_error("scoring: curve steepness must be positive");
    }
    if (sc.readiness_floor < 0.0 || sc.readiness_floor > 1.0) {
        return validation_error("scoring.readiness.hard_floor must be in [0,1]");
    }
    if (sc.familiarity_weight < 0.0 || sc.familiarity_weight > 1.0) {
        return validation_error("scoring.familiarity.weight must be in [0,1]");
    }
    if (sc.familiarity_gap_penalty < 0.0 ||
        sc.familiarity_gap_penalty > std::min(sc.familiarity_weight, 1.0 - sc.familiarity_weight)) {
        return validation_error("scoring.familiarity.gap_penalty must be in [0, min(w, 1-w)]");
    }
    for (size_t i = 0; i < sc.load_multipliers.size(); ++i) {
        if (sc.load_multipliers[i] < 0.0 || sc.load_multipliers[i] > 1.0) {
            return validation_error("scoring.load.multipliers must be in [0,1]");
        }
        if (i > 0 && sc.load_multipliers[i] > sc.load_multipliers[i - 1]) {
            return validation_error("scoring.load.multipliers must be non-increasing");
        }
    }
    return {};
}

Result<void> validate_propagation_config(const PropagationConfig& pc) {
    if (pc.readiness_loss_per_90 < 0.0 || pc.sharpness_gain_per_90 < 0.0 ||
        pc.recovery_per_day < 0.0 || pc.sharpness_decay_per_day < 0.0) {
        return validation_error("propagation: rates must be non-negative");
    }
    if (pc.window_days <= 0 || pc.jaded_streak <= 0 || pc.jaded_recovery_days < 0) {
        return validation_error("propagation: window_days and jaded_streak must be positive");
    }
    if (pc.min_load_threshold <= 0.0 || pc.min_load_threshold > pc.max_load_threshold) {
        return validation_error("propagation: load threshold bounds are inconsistent");
    }
    if (pc.fresh_ratio <= 0.0 || pc.fresh_ratio > pc.fit_ratio) {
        return validation_error("propagation: fresh_ratio must be positive and <= fit_ratio");
    }
    return {};
}

Result<void> validate_shadow_config(const ShadowConfig& sh) {
    if (sh.discount < 0.0 || sh.discount >= 1.0) {
        return validation_error("shadow.discount must be in [0,1)");
    }
    if (sh.scarcity_lambda < 0.0 || sh.scarcity_cap < 0.0) {
        return validation_error("shadow: scarcity parameters must be non-negative");
    }
    for (auto importance : kAllImportances) {
        if (sh.importance_weights[importance] < 0.0 || sh.current_scaling[importance] < 0.0) {
            return validation_error(std::format("shadow: weights for '{}' must be non-negative",
                                                to_string(importance)));
        }
    }
    return {};
}

Result<void> validate_solver_config(const SolverConfig& sv) {
    if (sv.forbidden_cost <= 0.0) {
        return validation_error("solver.forbidden_cost must be positive");
    }
    if (sv.minutes_per_start == 0) {
        return validation_error("solver.minutes_per_start must be positive");
    }
    if (sv.rest_scale < 0.0 || sv.fallback_familiarity < 0.0 || sv.fallback_familiarity > 1.0) {
        return validation_error("solver: rest_scale must be non-negative and fallback_familiarity in [0,1]");
    }
    for (auto relief : sv.fatigue_relief) {
        if (relief < 0.0) return validation_error("solver.fatigue_relief must be non-negative");
    }
    for (auto importance : kAllImportances) {
        const auto& w = sv.rest[importance];
        if (w.utility < 0.0 || w.sharpness_need < 0.0 || w.fatigue_relief < 0.0) {
            return validation_error(std::format("solver.rest.{}: weights must be non-negative",
                                                to_string(importance)));
        }
    }
    const auto& st = sv.stability;
    if (st.inertia_weight < 0.0 || st.continuity_bonus < 0.0 || st.switch_cost < 0.0 ||
        st.anchor_multiplier < 0.0) {
        return validation_error("solver.stability: weights must be non-negative");
    }
    return {};
}

Result<void> validate_config(const Config& config) {
    if (auto r = validate_scoring_config(config.scoring); !r) return r;
    if (auto r = validate_propagation_config(config.propagation); !r) return r;
    if (auto r = validate_shadow_config(config.shadow); !r) return r;
    return validate_solver_config(config.solver);
}

}  // namespace squad_rotation
