/**
 * @file horizon_planner.cpp
 * @brief HorizonPlanner implementation.
 */

#include "planning/horizon_planner.hpp"

#include "roster/validation.hpp"
#include "simulation/propagation.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

namespace squad_rotation {

// ─────────────────────────────────────────────
// HorizonPlan
// ─────────────────────────────────────────────

size_t HorizonPlan::starts(const WorkerId& worker) const {
    return static_cast<size_t>(std::count_if(assignments.begin(), assignments.end(),
        [&](const Assignment& a) { return a.starts(worker); }));
}

std::vector<WorkerId> HorizonPlan::distinct_starters() const {
    std::vector<WorkerId> seen;
    for (const auto& assignment : assignments) {
        for (const auto& entry : assignment.lineup) {
            if (std::find(seen.begin(), seen.end(), entry.worker) == seen.end()) {
                seen.push_back(entry.worker);
            }
        }
    }
    return seen;
}

const WorkerState* HorizonPlan::state_before(size_t k, const WorkerId& worker) const {
    if (k >= trajectory.size()) return nullptr;
    const Worker* w = find_worker(trajectory[k], worker);
    return w == nullptr ? nullptr : &w->state;
}

// ─────────────────────────────────────────────
// HorizonPlanner
// ─────────────────────────────────────────────

HorizonPlanner::HorizonPlanner(const Config& config, Logger* logger, PlanRecorder* recorder)
    : config_(config)
    , logger_(logger)
    , recorder_(recorder)
    , scoring_(config_.scoring, config_.propagation)
    , pricer_(scoring_, config_.shadow, config_.propagation, config_.solver.minutes_per_start)
    , solver_(scoring_, config_.solver, logger) {}

Result<HorizonPlan> HorizonPlanner::plan(const Roster& roster,
                                         std::span<const Event> events,
                                         std::span<const ConstraintSet> constraints,
                                         const std::optional<Assignment>& initial_previous) const {
    if (auto r = validate_config(config_); !r) return r.error();
    if (auto r = validate_roster(roster); !r) return r.error();
    if (auto r = validate_events(events); !r) return r.error();
    if (!constraints.empty() && constraints.size() != events.size()) {
        return validation_error(std::format("{} constraint sets for {} events",
                                            constraints.size(), events.size()));
    }

    HorizonPlan result;
    result.trajectory.reserve(events.size() + 1);
    result.trajectory.push_back(roster);

    AssignmentHistory history;
    if (initial_previous) {
        history.record(*initial_previous);
    }

    const ConstraintSet no_constraints;
    Roster current = roster;

    for (size_t k = 0; k < events.size(); ++k) {
        const auto& event = events[k];
        const auto& event_constraints = constraints.empty() ? no_constraints : constraints[k];

        if (recorder_ != nullptr) {
            recorder_->record_states(k, current, config_.propagation);
        }

        auto prices = pricer_.compute(current, events, k, event_constraints);
        auto assignment = solver_.solve(current, event, k, event_constraints, prices, history);
        if (!assignment) {
            auto err = assignment.error();
            err.message = std::format("event {} ('{}'): {}", k, event.id, err.message);
            if (logger_ != nullptr) logger_->warn(err.message);
            if (recorder_ != nullptr) recorder_->record_infeasible(k, err);
            return err;
        }

        if (logger_ != nullptr) {
            auto preserved = most_preserved(current, prices, 3);
            std::string names;
            for (const auto& [id, price] : preserved) {
                names += std::format("{}{}={:.1f}", names.empty() ? "" : ", ", id, price);
            }
            logger_->info(std::format("event {} ('{}', {}): gss={:.1f} cost={:.1f} bench={} preserved=[{}]",
                                      k, event.id, to_string(event.importance),
                                      assignment->total_gss, assignment->total_cost,
                                      assignment->bench.size(), names));
        }
        if (recorder_ != nullptr) {
            recorder_->record_assignment(*assignment);
        }

        std::unordered_map<WorkerId, Participation> participations;
        for (const auto& entry : assignment->lineup) {
            const TaskSlot* slot = event.formation.find_slot(entry.slot);
            participations.emplace(entry.worker, Participation{
                .minutes = config_.solver.minutes_per_start,
                .importance = event.importance,
                .slot_intensity = slot != nullptr ? slot->intensity : 1.0
            });
        }

        int days = k + 1 < events.size()
            ? days_between(event, events[k + 1])
            : static_cast<int>(config_.planner.trailing_days);
        current = advance_roster(current, participations, event.importance, days, config_.propagation);

        history.record(*assignment);
        result.total_gss += assignment->total_gss;
        result.total_cost += assignment->total_cost;
        result.shadow_prices.push_back(std::move(prices));
        result.assignments.push_back(std::move(*assignment));
        result.trajectory.push_back(current);
    }

    return result;
}

}  // namespace squad_rotation
