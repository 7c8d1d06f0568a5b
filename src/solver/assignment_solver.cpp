/**
 * @file assignment_solver.cpp
 * @brief Cost matrix construction, matching and lineup assembly.
 */

#include "solver/assignment_solver.hpp"

#include "roster/validation.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <numeric>

namespace squad_rotation {

AssignmentSolver::AssignmentSolver(const ScoringModel& scoring, const SolverConfig& config, Logger* logger)
    : scoring_(scoring)
    , config_(config)
    , logger_(logger) {}

bool AssignmentSolver::may_play(const Worker& worker, const ConstraintSet& constraints) const {
    if (!worker.available() || constraints.is_forced_rest(worker.id)) return false;
    if (scoring_.below_readiness_floor(worker.state) && !constraints.has_floor_override(worker.id)) {
        return false;
    }
    return true;
}

// ─────────────────────────────────────────────
// Conflict detection
// ─────────────────────────────────────────────

Result<void> AssignmentSolver::check_conflicts(const Roster& roster,
                                               const Event& event,
                                               const ConstraintSet& constraints) const {
    std::map<SlotId, WorkerId> slot_owner;
    std::map<WorkerId, SlotId> worker_slot;

    for (const auto& lock : constraints.locks) {
        if (constraints.is_rejected(lock.worker, lock.slot)) {
            return conflict_error(std::format("worker '{}' is both locked to and rejected from slot '{}'",
                                              lock.worker, lock.slot),
                                  {lock.worker, lock.slot});
        }

        if (auto [it, inserted] = slot_owner.emplace(lock.slot, lock.worker);
            !inserted && it->second != lock.worker) {
            return conflict_error(std::format("slot '{}' is locked to both '{}' and '{}'",
                                              lock.slot, it->second, lock.worker),
                                  {lock.slot, it->second, lock.worker});
        }
        if (auto [it, inserted] = worker_slot.emplace(lock.worker, lock.slot);
            !inserted && it->second != lock.slot) {
            return conflict_error(std::format("worker '{}' is locked to both '{}' and '{}'",
                                              lock.worker, it->second, lock.slot),
                                  {lock.worker, it->second, lock.slot});
        }

        const Worker* worker = find_worker(roster, lock.worker);
        const TaskSlot* slot = event.formation.find_slot(lock.slot);
        if (worker == nullptr || slot == nullptr) {
            return validation_error(std::format("lock names unknown worker '{}' or slot '{}'",
                                                lock.worker, lock.slot),
                                    {lock.worker, lock.slot});
        }

        if (constraints.is_forced_rest(worker->id)) {
            return conflict_error(std::format("worker '{}' is both locked to '{}' and forced to rest",
                                              worker->id, slot->id),
                                  {worker->id, slot->id});
        }
        if (!worker->available()) {
            return conflict_error(std::format("locked worker '{}' is {}", worker->id,
                                              worker->availability.injured ? "injured" : "suspended"),
                                  {worker->id, slot->id});
        }
        if (scoring_.below_readiness_floor(worker->state) && !constraints.has_floor_override(worker->id)) {
            return conflict_error(
                std::format("locked worker '{}' is below the readiness floor ({:.2f} < {:.2f}) without an override",
                            worker->id, worker->state.readiness, scoring_.config().readiness_floor),
                {worker->id, slot->id});
        }
        if (!scoring_.is_able(*worker, *slot)) {
            return conflict_error(std::format("worker '{}' cannot fill locked slot '{}'", worker->id, slot->id),
                                  {worker->id, slot->id});
        }
    }
    return {};
}

// ─────────────────────────────────────────────
// Matrix construction
// ─────────────────────────────────────────────

Result<AssignmentSolver::Matrix> AssignmentSolver::build_matrix(const Roster& roster,
                                                                const Event& event,
                                                                const ConstraintSet& constraints,
                                                                const ShadowPrices& shadow,
                                                                const AssignmentHistory& history) const {
    const auto& formation = event.formation;
    const auto& slots = formation.slots;
    const size_t n = roster.size();
    const size_t s = slots.size();

    std::vector<bool> playable(n, false);
    for (size_t i = 0; i < n; ++i) {
        playable[i] = may_play(roster[i], constraints);
    }
    size_t playable_count = static_cast<size_t>(std::count(playable.begin(), playable.end(), true));
    if (playable_count < s) {
        return infeasible_error(std::format("event '{}': only {} workers may play for {} slots",
                                            event.id, playable_count, s),
                                {event.id});
    }

    // The keeper restriction holds only while a goalkeeper-type worker can
    // still take the keeper slot under this event's constraints
    bool keeper_available = false;
    if (const TaskSlot* keeper = formation.goalkeeper_slot()) {
        for (size_t i = 0; i < n && !keeper_available; ++i) {
            const auto& worker = roster[i];
            if (!playable[i] || !scoring_.is_goalkeeper_type(worker, formation)) continue;
            if (!scoring_.is_able(worker, *keeper) || constraints.is_rejected(worker.id, keeper->id)) continue;
            const SlotLock* lock = constraints.lock_for(worker.id);
            keeper_available = lock == nullptr || lock->slot == keeper->id;
        }
    }

    Matrix m{
        .costs = CostMatrix(n, s, config_.forbidden_cost),
        .breakdowns = std::vector<GssBreakdown>(n * s),
        .stability = std::vector<double>(n * s, 0.0),
        .goalkeeper_relaxed = !keeper_available
    };

    const auto& rest_weights = config_.rest[event.importance];

    for (size_t i = 0; i < n; ++i) {
        const auto& worker = roster[i];
        double shadow_price = i < shadow.size() ? shadow[i].price : 0.0;
        double eligible_gss = 0.0;
        size_t eligible_slots = 0;

        for (size_t j = 0; j < s; ++j) {
            const auto& slot = slots[j];

            auto breakdown = scoring_.score(worker, worker.state, slot, event.importance);
            if (!breakdown) return breakdown.error();

            double stab = stability_cost(history, worker.id, slot.id, config_.stability);
            m.breakdowns[i * s + j] = *breakdown;
            m.stability[i * s + j] = stab;
            m.costs.set_play(i, j, -breakdown->gss + shadow_price + stab);

            bool allowed = playable[i] && !constraints.is_rejected(worker.id, slot.id);
            if (allowed) {
                if (slot.goalkeeper && keeper_available) {
                    allowed = scoring_.is_goalkeeper_type(worker, formation) && scoring_.is_able(worker, slot);
                } else if (!slot.goalkeeper) {
                    allowed = scoring_.is_able(worker, slot);
                }
            }

            if (allowed) {
                eligible_gss += breakdown->gss;
                ++eligible_slots;
            } else {
                m.costs.forbid(i, j);
            }
        }

        double mean_gss = eligible_slots > 0 ? eligible_gss / static_cast<double>(eligible_slots) : 0.0;
        m.costs.set_rest(i, rest_cost(rest_weights, mean_gss, worker.state.sharpness,
                                      scoring_.load_of(worker, worker.state), config_));
    }

    for (const auto& lock : constraints.locks) {
        auto row = std::find_if(roster.begin(), roster.end(),
                                [&](const Worker& w) { return w.id == lock.worker; });
        auto col = std::find_if(slots.begin(), slots.end(),
                                [&](const TaskSlot& t) { return t.id == lock.slot; });
        if (row == roster.end() || col == slots.end()) continue;
        m.costs.lock(static_cast<size_t>(row - roster.begin()), static_cast<size_t>(col - slots.begin()));
    }

    return m;
}

std::string AssignmentSolver::explain_empty_slot(const Roster& roster,
                                                 const Event& event,
                                                 const TaskSlot& slot,
                                                 const ConstraintSet& constraints) const {
    size_t able = 0, unavailable = 0, resting = 0, below_floor = 0, rejected = 0, not_keeper = 0;
    for (const auto& worker : roster) {
        if (!scoring_.is_able(worker, slot)) continue;
        ++able;
        if (!worker.available()) ++unavailable;
        else if (constraints.is_forced_rest(worker.id)) ++resting;
        else if (scoring_.below_readiness_floor(worker.state) && !constraints.has_floor_override(worker.id)) ++below_floor;
        else if (constraints.is_rejected(worker.id, slot.id)) ++rejected;
        else if (slot.goalkeeper && !scoring_.is_goalkeeper_type(worker, event.formation)) ++not_keeper;
    }
    if (able == 0) {
        return std::format("event '{}': no worker in the roster can fill slot '{}'", event.id, slot.id);
    }
    return std::format("event '{}': slot '{}' has no eligible worker ({} able: {} unavailable, "
                       "{} forced to rest, {} below readiness floor, {} rejected, {} not goalkeeper-type)",
                       event.id, slot.id, able, unavailable, resting, below_floor, rejected, not_keeper);
}

// ─────────────────────────────────────────────
// Solve
// ─────────────────────────────────────────────

Result<Assignment> AssignmentSolver::solve(const Roster& roster,
                                           const Event& event,
                                           size_t event_index,
                                           const ConstraintSet& constraints,
                                           const ShadowPrices& shadow,
                                           const AssignmentHistory& history) const {
    if (auto r = validate_scoring_config(scoring_.config()); !r) return r.error();
    if (auto r = validate_solver_config(config_); !r) return r.error();
    if (auto r = validate_roster(roster); !r) return r.error();
    if (auto r = validate_formation(event.formation); !r) return r.error();
    if (auto r = validate_constraints(constraints, roster, event.formation); !r) return r.error();
    if (!shadow.empty() && shadow.size() != roster.size()) {
        return validation_error(std::format("event '{}': {} shadow prices for {} workers",
                                            event.id, shadow.size(), roster.size()));
    }

    if (auto r = check_conflicts(roster, event, constraints); !r) return r.error();

    auto built = build_matrix(roster, event, constraints, shadow, history);
    if (!built) return built.error();
    auto& m = *built;

    const auto& slots = event.formation.slots;
    const size_t n = roster.size();
    const size_t s = slots.size();

    for (size_t j = 0; j < s; ++j) {
        if (m.costs.candidates(j) == 0) {
            return infeasible_error(explain_empty_slot(roster, event, slots[j], constraints), {slots[j].id});
        }
    }

    if (m.goalkeeper_relaxed && logger_ != nullptr) {
        logger_->warn(std::format("event '{}': no eligible goalkeeper-type worker, keeper slot opened to all",
                                  event.id));
    }

    auto matching = matcher_.solve(m.costs.solver_costs(), n);

    // Verification: a forbidden cell in the matching means some slots
    // compete for the same few workers
    std::vector<std::string> starved;
    for (size_t i = 0; i < n; ++i) {
        size_t col = matching[i];
        if (!m.costs.forbidden(i, col)) continue;
        if (col < s) {
            starved.push_back(slots[col].id);
        } else {
            starved.push_back(roster[i].id);
        }
    }
    if (!starved.empty()) {
        std::sort(starved.begin(), starved.end());
        std::string names;
        for (const auto& id : starved) {
            names += names.empty() ? id : ", " + id;
        }
        return infeasible_error(std::format("event '{}': no feasible distinct assignment for {}",
                                            event.id, names),
                                std::move(starved));
    }

    Assignment result;
    result.event_index = event_index;
    result.event_id = event.id;
    result.importance = event.importance;
    result.goalkeeper_relaxed = m.goalkeeper_relaxed;
    result.lineup.resize(s);

    std::vector<bool> starting(n, false);
    for (size_t i = 0; i < n; ++i) {
        size_t col = matching[i];
        result.total_cost += m.costs.natural_cost(i, col);
        if (col >= s) continue;

        const auto& breakdown = m.breakdowns[i * s + col];
        starting[i] = true;
        result.lineup[col] = SlotAssignment{
            .slot = slots[col].id,
            .worker = roster[i].id,
            .breakdown = breakdown,
            .shadow_price = i < shadow.size() ? shadow[i].price : 0.0,
            .stability_cost = m.stability[i * s + col],
            .cost = m.costs.natural_cost(i, col),
            .locked = m.costs.status(i, col) == CellStatus::Locked,
            .fallback = breakdown.familiarity < config_.fallback_familiarity
        };
        result.total_gss += breakdown.gss;
    }

    // Bench: rested workers who could have played, best single-slot GSS first
    std::vector<std::pair<size_t, double>> candidates;
    for (size_t i = 0; i < n; ++i) {
        if (starting[i]) continue;
        result.rested.push_back(roster[i].id);

        double best = -1.0;
        for (size_t j = 0; j < s; ++j) {
            if (m.costs.forbidden(i, j)) continue;
            best = std::max(best, m.breakdowns[i * s + j].gss);
        }
        if (best >= 0.0) candidates.emplace_back(i, best);
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    for (size_t k = 0; k < candidates.size() && k < config_.bench_size; ++k) {
        result.bench.push_back(roster[candidates[k].first].id);
    }

    return result;
}

}  // namespace squad_rotation
