/**
 * @file scoring_model.hpp
 * @brief Game-Selection Score (GSS) for a worker at a slot.
 *
 * GSS = BaseRating × Φ(readiness) × Ψ(sharpness) × Θ(familiarity) × Ω(load)
 *
 * - BaseRating: harmonic mean of the in/out-of-possession ratings at the
 *   slot's kind (0 when either phase is unrated).
 * - Φ: logistic per importance, with a hard floor enforced by the solver.
 * - Ψ: logistic, inverted for sharpness-building events.
 * - Θ: linear over the combined phase familiarity.
 * - Ω: step function over the load category.
 *
 * Every multiplier is in [0,1], so GSS ∈ [0, BaseRating].
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "roster/event.hpp"
#include "roster/worker.hpp"
#include "scoring/curves.hpp"

namespace squad_rotation {

/**
 * @brief A GSS with every factor that produced it.
 */
struct GssBreakdown {
    double base_rating = 0.0;
    double readiness_multiplier = 0.0;
    double sharpness_multiplier = 0.0;
    double familiarity_multiplier = 0.0;
    double load_multiplier = 0.0;
    double familiarity = 0.0;           ///< Combined phase familiarity in [0,1]
    LoadCategory load = LoadCategory::Fresh;
    FamiliarityTier tier = FamiliarityTier::Awkward;
    double gss = 0.0;
};

class ScoringModel {
public:
    ScoringModel(const ScoringConfig& scoring, const PropagationConfig& propagation);

    [[nodiscard]] double base_rating(const Worker& worker, const TaskKind& kind) const;
    [[nodiscard]] double combined_familiarity(const Worker& worker, const TaskKind& kind) const;

    /**
     * @brief Score a worker in a hypothetical or current state.
     *
     * The state is passed separately from the worker so the same function
     * serves projected states during shadow pricing.
     *
     * @return Validation error if the state is out of range or the worker
     *         carries negative ratings.
     */
    [[nodiscard]] Result<GssBreakdown> score(const Worker& worker,
                                             const WorkerState& state,
                                             const TaskSlot& slot,
                                             Importance importance) const;

    /**
     * @brief Highest GSS over the formation's slots the worker is eligible
     *        for; 0 if none (unavailable, below the floor, no able slot).
     */
    [[nodiscard]] double best_score(const Worker& worker,
                                    const WorkerState& state,
                                    const Formation& formation,
                                    Importance importance) const;

    /// Has a rating and non-zero familiarity at the slot's kind.
    [[nodiscard]] bool is_able(const Worker& worker, const TaskSlot& slot) const;

    /// Combined familiarity at the goalkeeper kind reaches the threshold.
    [[nodiscard]] bool is_goalkeeper_type(const Worker& worker, const Formation& formation) const;

    [[nodiscard]] bool below_readiness_floor(const WorkerState& state) const noexcept;

    [[nodiscard]] LoadCategory load_of(const Worker& worker, const WorkerState& state) const;

    /// Available, able, not below the floor, and keeper-type for the keeper slot.
    [[nodiscard]] bool is_eligible(const Worker& worker,
                                   const WorkerState& state,
                                   const TaskSlot& slot,
                                   const Formation& formation) const;

    [[nodiscard]] const MultiplierCurve& readiness_curve(Importance importance) const noexcept {
        return readiness_curves_[importance];
    }
    [[nodiscard]] const MultiplierCurve& sharpness_curve(Importance importance) const noexcept {
        return sharpness_curves_[importance];
    }
    [[nodiscard]] const ScoringConfig& config() const noexcept { return scoring_; }

private:
    ScoringConfig scoring_;
    PropagationConfig propagation_;
    ByImportance<MultiplierCurve> readiness_curves_;
    ByImportance<MultiplierCurve> sharpness_curves_;
    MultiplierCurve familiarity_curve_;
    LoadMultiplier load_multiplier_;
};

}  // namespace squad_rotation
