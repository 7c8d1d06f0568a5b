/**
 * @file assignment_solver.hpp
 * @brief Single-event lineup selection as a minimum-cost perfect matching.
 *
 * Pipeline:
 *   1. Validate roster, formation and constraint ids      (Validation)
 *   2. Detect contradictory constraints                   (ConstraintConflict)
 *   3. Feasibility pre-check per slot                     (InfeasibleAssignment)
 *   4. Build the square cost matrix with rest sinks
 *   5. Hungarian matching
 *   6. Post-solve verification                            (InfeasibleAssignment)
 *   7. Bench selection among rested workers
 *
 * No partially filled lineup is ever returned.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "planning/shadow_pricing.hpp"
#include "roster/event.hpp"
#include "roster/worker.hpp"
#include "scoring/scoring_model.hpp"
#include "solver/assignment.hpp"
#include "solver/cost_matrix.hpp"
#include "solver/hungarian.hpp"
#include "solver/stability.hpp"

namespace squad_rotation {

class AssignmentSolver {
public:
    AssignmentSolver(const ScoringModel& scoring, const SolverConfig& config, Logger* logger = nullptr);

    /**
     * @brief Choose the lineup for one event.
     *
     * @param shadow  Shadow prices in roster order, or empty for none.
     * @param history Previous lineups, for the stability term.
     */
    [[nodiscard]] Result<Assignment> solve(const Roster& roster,
                                           const Event& event,
                                           size_t event_index,
                                           const ConstraintSet& constraints,
                                           const ShadowPrices& shadow,
                                           const AssignmentHistory& history) const;

    /**
     * @brief Reject constraint sets that cannot all hold.
     *
     * A lock and a rejection on the same pair, two workers locked to one
     * slot, one worker locked to two slots, and locks on workers that may
     * not play (unavailable, forced to rest, below the readiness floor
     * without an override, or unable to fill the slot).
     */
    [[nodiscard]] Result<void> check_conflicts(const Roster& roster,
                                               const Event& event,
                                               const ConstraintSet& constraints) const;

    /**
     * @brief Build the cost matrix without solving it.
     *
     * Fails with InfeasibleAssignment when there are fewer playable workers
     * than slots.
     */
    struct Matrix {
        CostMatrix costs;
        std::vector<GssBreakdown> breakdowns;   ///< worker-major, slot-minor
        std::vector<double> stability;          ///< worker-major, slot-minor
        bool goalkeeper_relaxed = false;
    };
    [[nodiscard]] Result<Matrix> build_matrix(const Roster& roster,
                                              const Event& event,
                                              const ConstraintSet& constraints,
                                              const ShadowPrices& shadow,
                                              const AssignmentHistory& history) const;

private:
    [[nodiscard]] bool may_play(const Worker& worker, const ConstraintSet& constraints) const;
    [[nodiscard]] std::string explain_empty_slot(const Roster& roster,
                                                 const Event& event,
                                                 const TaskSlot& slot,
                                                 const ConstraintSet& constraints) const;

    const ScoringModel& scoring_;
    SolverConfig config_;
    Logger* logger_;
    HungarianMatcher matcher_;
};

}  // namespace squad_rotation
