/**
 * @file shadow_pricing.cpp
 * @brief Two-branch projection and scarcity amplification.
 */

#include "planning/shadow_pricing.hpp"

#include "simulation/propagation.hpp"

#include <algorithm>
#include <cmath>

namespace squad_rotation {

int days_between(const Event& from, const Event& to) noexcept {
    return std::max(0, static_cast<int>((to.date - from.date).count()));
}

ShadowPricer::ShadowPricer(const ScoringModel& scoring,
                           const ShadowConfig& shadow,
                           const PropagationConfig& propagation,
                           uint32_t minutes_per_start)
    : scoring_(scoring)
    , shadow_(shadow)
    , propagation_(propagation)
    , minutes_per_start_(minutes_per_start) {}

double ShadowPricer::likely_intensity(const Worker& worker,
                                      const WorkerState& state,
                                      const Event& event) const {
    double best_gss = -1.0;
    double intensity = 1.0;
    for (const auto& slot : event.formation.slots) {
        if (!scoring_.is_eligible(worker, state, slot, event.formation)) continue;
        auto breakdown = scoring_.score(worker, state, slot, event.importance);
        if (breakdown && breakdown->gss > best_gss) {
            best_gss = breakdown->gss;
            intensity = slot.intensity;
        }
    }
    return intensity;
}

double ShadowPricer::future_loss(const Worker& worker,
                                 std::span<const Event> events,
                                 size_t k) const {
    if (k + 1 >= events.size()) return 0.0;

    const auto& now = events[k];
    size_t last = std::min(events.size() - 1, k + static_cast<size_t>(shadow_.horizon));
    int gap = days_between(now, events[k + 1]);

    // Both branches share every step after event k
    WorkerState rested = propagate(worker.state, worker.profile,
                                   Participation::rested(now.importance), gap, propagation_);
    WorkerState played = propagate(worker.state, worker.profile,
                                   Participation{
                                       .minutes = minutes_per_start_,
                                       .importance = now.importance,
                                       .slot_intensity = likely_intensity(worker, worker.state, now)
                                   },
                                   gap, propagation_);

    auto managed = [&](const WorkerState& state, const Event& event, double gss, int days) {
        Participation p = gss > 0.0
            ? Participation{
                  .minutes = shadow_.assumed_future_minutes,
                  .importance = event.importance,
                  .slot_intensity = likely_intensity(worker, state, event)
              }
            : Participation::rested(event.importance);
        return propagate(state, worker.profile, p, days, propagation_);
    };

    double loss = 0.0;
    double discount = 1.0;
    for (size_t j = k + 1; j <= last; ++j) {
        const auto& event = events[j];
        discount *= shadow_.discount;

        double gss_rest = scoring_.best_score(worker, rested, event.formation, event.importance);
        double gss_play = scoring_.best_score(worker, played, event.formation, event.importance);
        loss += shadow_.importance_weights[event.importance] * discount * (gss_rest - gss_play);

        if (j < last) {
            int days = days_between(event, events[j + 1]);
            rested = managed(rested, event, gss_rest, days);
            played = managed(played, event, gss_play, days);
        }
    }
    return loss;
}

std::vector<double> ShadowPricer::scarcity(const Roster& roster,
                                           const Event& event,
                                           const ConstraintSet& constraints) const {
    const auto& slots = event.formation.slots;
    const size_t n = roster.size();
    const size_t s = slots.size();

    // A lock takes its worker out of every other slot and its slot from every other worker
    auto lock_excludes = [&](const WorkerId& worker, const SlotId& slot) {
        return std::any_of(constraints.locks.begin(), constraints.locks.end(), [&](const SlotLock& lock) {
            return (lock.worker == worker) != (lock.slot == slot);
        });
    };

    // GSS of every eligible (worker, slot) pair; -1 marks ineligible
    std::vector<double> gss(n * s, -1.0);
    for (size_t i = 0; i < n; ++i) {
        const auto& worker = roster[i];
        if (constraints.is_forced_rest(worker.id)) continue;
        for (size_t j = 0; j < s; ++j) {
            if (!scoring_.is_eligible(worker, worker.state, slots[j], event.formation)) continue;
            if (constraints.is_rejected(worker.id, slots[j].id)) continue;
            if (lock_excludes(worker.id, slots[j].id)) continue;
            if (auto b = scoring_.score(worker, worker.state, slots[j], event.importance)) {
                gss[i * s + j] = b->gss;
            }
        }
    }

    std::vector<double> result(n, 0.0);
    for (size_t j = 0; j < s; ++j) {
        size_t best = n;
        double best_gss = -1.0;
        double runner_up = 0.0;
        for (size_t i = 0; i < n; ++i) {
            double g = gss[i * s + j];
            if (g > best_gss) {
                runner_up = std::max(runner_up, best_gss);
                best_gss = g;
                best = i;
            } else {
                runner_up = std::max(runner_up, g);
            }
        }
        if (best == n || best_gss <= 0.0) continue;

        double gap = (best_gss - runner_up) / best_gss;
        result[best] = std::max(result[best], std::min(gap, shadow_.scarcity_cap));
    }
    return result;
}

ShadowPrices ShadowPricer::compute(const Roster& roster,
                                   std::span<const Event> events,
                                   size_t k,
                                   const ConstraintSet& constraints) const {
    ShadowPrices prices(roster.size());
    if (k + 1 >= events.size()) return prices;

    const auto& now = events[k];
    auto scarcities = scarcity(roster, now, constraints);
    double scaling = shadow_.current_scaling[now.importance];

    for (size_t i = 0; i < roster.size(); ++i) {
        const auto& worker = roster[i];
        if (!worker.available()) continue;

        auto& entry = prices[i];
        entry.raw = future_loss(worker, events, k);
        entry.scarcity = scarcities[i];
        entry.price = std::max(0.0, entry.raw)
                    * (1.0 + shadow_.scarcity_lambda * entry.scarcity)
                    * scaling;
    }
    return prices;
}

std::vector<std::pair<WorkerId, double>> most_preserved(const Roster& roster,
                                                        const ShadowPrices& prices,
                                                        size_t n) {
    std::vector<std::pair<WorkerId, double>> ranked;
    for (size_t i = 0; i < roster.size() && i < prices.size(); ++i) {
        if (prices[i].price > 0.0) {
            ranked.emplace_back(roster[i].id, prices[i].price);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > n) ranked.resize(n);
    return ranked;
}

}  // namespace squad_rotation
