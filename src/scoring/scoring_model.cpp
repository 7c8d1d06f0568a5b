/**
 * @file scoring_model.cpp
 * @brief GSS evaluation.
 */

#include "scoring/scoring_model.hpp"

#include "roster/validation.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace squad_rotation {

ScoringModel::ScoringModel(const ScoringConfig& scoring, const PropagationConfig& propagation)
    : scoring_(scoring)
    , propagation_(propagation)
    , familiarity_curve_(MultiplierCurve::linear(scoring.familiarity_floor))
    , load_multiplier_(scoring.load_multipliers) {
    for (auto importance : kAllImportances) {
        const auto& params = scoring.readiness[importance];
        readiness_curves_[importance] =
            MultiplierCurve::logistic(scoring.readiness_steepness, params.midpoint, params.floor);

        sharpness_curves_[importance] = importance == Importance::SharpnessBuilding
            ? MultiplierCurve::inverse_logistic(scoring.sharpness_steepness,
                                                scoring.sharpness_midpoint,
                                                scoring.sharpness_building_floor)
            : MultiplierCurve::logistic(scoring.sharpness_steepness,
                                        scoring.sharpness_midpoint,
                                        scoring.sharpness_floor);
    }
}

double ScoringModel::base_rating(const Worker& worker, const TaskKind& kind) const {
    auto rating = worker.rating_at(kind);
    if (!rating) return 0.0;

    double ip = rating->in_possession;
    double oop = rating->out_of_possession;
    if (ip <= 0.0 || oop <= 0.0) return 0.0;
    return 2.0 * ip * oop / (ip + oop);
}

double ScoringModel::combined_familiarity(const Worker& worker, const TaskKind& kind) const {
    auto fam = worker.familiarity_at(kind);
    double w = scoring_.familiarity_weight;
    double combined = w * fam.in_possession
                    + (1.0 - w) * fam.out_of_possession
                    - scoring_.familiarity_gap_penalty
                        * std::abs(fam.in_possession - fam.out_of_possession);
    return std::clamp(combined, 0.0, 1.0);
}

Result<GssBreakdown> ScoringModel::score(const Worker& worker,
                                         const WorkerState& state,
                                         const TaskSlot& slot,
                                         Importance importance) const {
    if (auto valid = validate_state(worker.id, state); !valid) {
        return valid.error();
    }
    if (auto rating = worker.rating_at(slot.kind);
        rating && (rating->in_possession < 0.0 || rating->out_of_possession < 0.0)) {
        return validation_error(
            std::format("worker '{}': negative rating at '{}'", worker.id, slot.kind), {worker.id});
    }

    GssBreakdown b;
    b.base_rating = base_rating(worker, slot.kind);
    b.familiarity = combined_familiarity(worker, slot.kind);
    b.tier = familiarity_tier(b.familiarity);
    b.load = load_of(worker, state);

    b.readiness_multiplier = readiness_curves_[importance](state.readiness);
    b.sharpness_multiplier = sharpness_curves_[importance](state.sharpness);
    b.familiarity_multiplier = familiarity_curve_(b.familiarity);
    b.load_multiplier = load_multiplier_(b.load);

    b.gss = b.base_rating * b.readiness_multiplier * b.sharpness_multiplier
          * b.familiarity_multiplier * b.load_multiplier;
    return b;
}

double ScoringModel::best_score(const Worker& worker,
                                const WorkerState& state,
                                const Formation& formation,
                                Importance importance) const {
    double best = 0.0;
    for (const auto& slot : formation.slots) {
        if (!is_eligible(worker, state, slot, formation)) continue;
        auto breakdown = score(worker, state, slot, importance);
        if (breakdown) {
            best = std::max(best, breakdown->gss);
        }
    }
    return best;
}

bool ScoringModel::is_able(const Worker& worker, const TaskSlot& slot) const {
    return base_rating(worker, slot.kind) > 0.0 && combined_familiarity(worker, slot.kind) > 0.0;
}

bool ScoringModel::is_goalkeeper_type(const Worker& worker, const Formation& formation) const {
    const auto* keeper = formation.goalkeeper_slot();
    if (keeper == nullptr) return false;
    return combined_familiarity(worker, keeper->kind) >= scoring_.goalkeeper_familiarity;
}

bool ScoringModel::below_readiness_floor(const WorkerState& state) const noexcept {
    return state.readiness < scoring_.readiness_floor;
}

LoadCategory ScoringModel::load_of(const Worker& worker, const WorkerState& state) const {
    return load_category(state, worker.profile, propagation_);
}

bool ScoringModel::is_eligible(const Worker& worker,
                               const WorkerState& state,
                               const TaskSlot& slot,
                               const Formation& formation) const {
    if (!worker.available() || below_readiness_floor(state)) return false;
    if (!is_able(worker, slot)) return false;
    if (slot.goalkeeper && !is_goalkeeper_type(worker, formation)) return false;
    return true;
}

}  // namespace squad_rotation
