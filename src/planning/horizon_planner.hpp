/**
 * @file horizon_planner.hpp
 * @brief Multi-event rotation planning.
 *
 * For each event k in order:
 *   1. shadow prices over events k+1..k+H
 *   2. solve the lineup for k (stability history threaded forward)
 *   3. propagate every worker over the event and the days until k+1
 *      (trailing_days after the last event)
 *
 * The first failure stops the run and is returned with the event index
 * prepended to its message.
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
#include "solver/assignment_solver.hpp"
#include "telemetry/plan_recorder.hpp"

#include <optional>
#include <span>
#include <vector>

namespace squad_rotation {

/**
 * @brief Lineups and the state trajectory of a whole horizon.
 */
struct HorizonPlan {
    std::vector<Assignment> assignments;
    /// trajectory[0] is the initial roster, trajectory[k] the roster entering
    /// event k, and the last entry the roster after the trailing rest.
    std::vector<Roster> trajectory;
    std::vector<ShadowPrices> shadow_prices;    ///< One per event, roster order
    double total_gss = 0.0;
    double total_cost = 0.0;

    /// Events the worker started.
    [[nodiscard]] size_t starts(const WorkerId& worker) const;
    /// Every worker who started at least one event, first-start order.
    [[nodiscard]] std::vector<WorkerId> distinct_starters() const;
    /// State of a worker entering event k (k == size() gives the final state).
    [[nodiscard]] const WorkerState* state_before(size_t k, const WorkerId& worker) const;
};

class HorizonPlanner {
public:
    explicit HorizonPlanner(const Config& config, Logger* logger = nullptr, PlanRecorder* recorder = nullptr);

    // Non-copyable, non-movable (the pricer and solver refer to scoring_)
    HorizonPlanner(const HorizonPlanner&) = delete;
    HorizonPlanner& operator=(const HorizonPlanner&) = delete;

    /**
     * @param constraints      Empty, or one set per event.
     * @param initial_previous Lineup of the event before the horizon, seeding
     *                         the stability term.
     */
    [[nodiscard]] Result<HorizonPlan> plan(const Roster& roster,
                                           std::span<const Event> events,
                                           std::span<const ConstraintSet> constraints = {},
                                           const std::optional<Assignment>& initial_previous = std::nullopt) const;

    [[nodiscard]] const ScoringModel& scoring() const noexcept { return scoring_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    Config config_;
    Logger* logger_;
    PlanRecorder* recorder_;
    ScoringModel scoring_;
    ShadowPricer pricer_;
    AssignmentSolver solver_;
};

}  // namespace squad_rotation
