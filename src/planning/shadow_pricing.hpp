/**
 * @file shadow_pricing.hpp
 * @brief Look-ahead opportunity cost of using a worker now.
 *
 * For worker w at event k the module projects two branches with the same
 * propagate() the planner uses, "rested at k" and "played at k", and
 * compares the worker's best eligible GSS at each future event within the
 * horizon. Both branches manage the worker normally afterwards: the worker
 * starts every later event it is eligible for.
 *
 *   raw   = Σ_j weight(imp_j) · γ^(j−k) · (GSS_rest_j − GSS_play_j)
 *   price = max(0, raw) · (1 + λ·scarcity) · scaling(imp_k)
 *
 * Scarcity is the largest relative gap to the next-best option over the
 * slots of event k where the worker is the best available choice. Workers
 * the event's constraints keep out of a slot are not options for it.
 */

#pragma once

#include "core/config.hpp"
#include "roster/event.hpp"
#include "roster/worker.hpp"
#include "scoring/scoring_model.hpp"

#include <span>
#include <utility>
#include <vector>

namespace squad_rotation {

struct ShadowPrice {
    double price = 0.0;         ///< Final, non-negative, GSS units
    double raw = 0.0;           ///< Discounted future loss before clamping
    double scarcity = 0.0;      ///< In [0, scarcity_cap]
};

/// One entry per roster worker, in roster order.
using ShadowPrices = std::vector<ShadowPrice>;

class ShadowPricer {
public:
    ShadowPricer(const ScoringModel& scoring,
                 const ShadowConfig& shadow,
                 const PropagationConfig& propagation,
                 uint32_t minutes_per_start);

    /**
     * @brief Shadow prices of every roster worker for event k.
     *
     * Returns all zeros when k is the last event.
     *
     * @param constraints The constraint set of event k, used for scarcity.
     */
    [[nodiscard]] ShadowPrices compute(const Roster& roster,
                                       std::span<const Event> events,
                                       size_t k,
                                       const ConstraintSet& constraints = {}) const;

    /// Discounted future GSS loss from playing w at event k (unclamped).
    [[nodiscard]] double future_loss(const Worker& worker,
                                     std::span<const Event> events,
                                     size_t k) const;

    /// Per-worker scarcity at event k, in roster order.
    [[nodiscard]] std::vector<double> scarcity(const Roster& roster,
                                               const Event& event,
                                               const ConstraintSet& constraints = {}) const;

private:
    /// Intensity of the slot the worker would most likely fill.
    [[nodiscard]] double likely_intensity(const Worker& worker,
                                          const WorkerState& state,
                                          const Event& event) const;

    const ScoringModel& scoring_;
    ShadowConfig shadow_;
    PropagationConfig propagation_;
    uint32_t minutes_per_start_;
};

/**
 * @brief The n workers with the highest shadow price, highest first.
 *
 * Ties keep roster order. Workers with a zero price are omitted.
 */
[[nodiscard]] std::vector<std::pair<WorkerId, double>> most_preserved(const Roster& roster,
                                                                      const ShadowPrices& prices,
                                                                      size_t n);

/// Whole days between two event dates (never negative).
[[nodiscard]] int days_between(const Event& from, const Event& to) noexcept;

}  // namespace squad_rotation
