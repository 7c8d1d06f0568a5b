/**
 * @file formation_evaluator.hpp
 * @brief Compare candidate formations by planning each horizon in parallel.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/evaluation_pool.hpp"
#include "planning/horizon_planner.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace squad_rotation {

/**
 * @brief One formation to try across the whole horizon.
 */
struct FormationCandidate {
    Formation formation;
    std::vector<ConstraintSet> constraints;     ///< Empty, or one per event
};

struct FormationEvaluation {
    std::vector<Result<HorizonPlan>> plans;     ///< Candidate order
    std::optional<size_t> best;                 ///< Highest total GSS among successes

    [[nodiscard]] size_t successes() const;
};

class FormationEvaluator {
public:
    explicit FormationEvaluator(const Config& config, Logger* logger = nullptr);

    /**
     * @brief Plan the events once per candidate, each with the candidate's
     *        formation substituted into every event.
     *
     * Each run works on its own copy of the roster. Ties on total GSS go to
     * the earlier candidate.
     */
    [[nodiscard]] FormationEvaluation evaluate(const Roster& roster,
                                               std::span<const Event> events,
                                               std::span<const FormationCandidate> candidates);

    [[nodiscard]] size_t thread_count() const noexcept { return pool_.thread_count(); }

private:
    Config config_;
    Logger* logger_;
    EvaluationPool pool_;
};

/// Copy of events with every formation replaced.
[[nodiscard]] std::vector<Event> with_formation(std::span<const Event> events, const Formation& formation);

}  // namespace squad_rotation
