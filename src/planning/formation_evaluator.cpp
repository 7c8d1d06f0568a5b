/**
 * @file formation_evaluator.cpp
 * @brief FormationEvaluator implementation.
 */

#include "planning/formation_evaluator.hpp"

#include <algorithm>
#include <format>

namespace squad_rotation {

size_t FormationEvaluation::successes() const {
    return static_cast<size_t>(std::count_if(plans.begin(), plans.end(),
        [](const Result<HorizonPlan>& p) { return p.has_value(); }));
}

std::vector<Event> with_formation(std::span<const Event> events, const Formation& formation) {
    std::vector<Event> out(events.begin(), events.end());
    for (auto& event : out) {
        event.formation = formation;
    }
    return out;
}

FormationEvaluator::FormationEvaluator(const Config& config, Logger* logger)
    : config_(config)
    , logger_(logger)
    , pool_(config.executor.thread_count) {}

FormationEvaluation FormationEvaluator::evaluate(const Roster& roster,
                                                 std::span<const Event> events,
                                                 std::span<const FormationCandidate> candidates) {
    FormationEvaluation evaluation;
    evaluation.plans = pool_.run_indexed(candidates.size(), [&](size_t i) -> Result<HorizonPlan> {
        const auto& candidate = candidates[i];
        Roster local = roster;
        auto local_events = with_formation(events, candidate.formation);

        HorizonPlanner planner(config_, logger_);
        return planner.plan(local, local_events, candidate.constraints);
    });

    for (size_t i = 0; i < evaluation.plans.size(); ++i) {
        const auto& plan = evaluation.plans[i];
        if (!plan) {
            if (logger_ != nullptr) {
                logger_->warn(std::format("formation '{}' rejected: {}",
                                          candidates[i].formation.name, plan.error().message));
            }
            continue;
        }
        if (!evaluation.best || plan->total_gss > evaluation.plans[*evaluation.best]->total_gss) {
            evaluation.best = i;
        }
    }

    if (logger_ != nullptr && evaluation.best) {
        logger_->info(std::format("formation '{}' selected: total gss {:.1f} over {} events",
                                  candidates[*evaluation.best].formation.name,
                                  evaluation.plans[*evaluation.best]->total_gss, events.size()));
    }
    return evaluation;
}

}  // namespace squad_rotation
