/**
 * @file propagation.hpp
 * @brief Forward simulation of worker state across events.
 *
 * propagate() is the only function that moves a WorkerState forward in
 * time. The horizon planner calls it for real transitions and shadow
 * pricing calls it for hypothetical branches, so projected and actual
 * dynamics cannot drift apart.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "roster/worker.hpp"

#include <optional>
#include <unordered_map>

namespace squad_rotation {

/**
 * @brief What a worker did at an event.
 */
struct Participation {
    uint32_t minutes = 0;                       ///< 0 = rested
    Importance importance = Importance::Medium;
    double slot_intensity = 1.0;

    [[nodiscard]] bool played() const noexcept { return minutes > 0; }

    static Participation rested(Importance importance = Importance::Medium) {
        return Participation{.minutes = 0, .importance = importance, .slot_intensity = 1.0};
    }
};

/**
 * @brief Advance one worker's state over an event and the days after it.
 *
 * Played: readiness drops with minutes, stamina, slot and event intensity;
 * sharpness rises; the appearance enters the window and the streak grows.
 * Rested: the streak resets. Then elapsed_days of recovery, sharpness decay
 * and window ageing apply in both cases. A rest with zero elapsed days
 * returns the state unchanged.
 *
 * Pure and deterministic. Negative elapsed_days are treated as zero.
 */
[[nodiscard]] WorkerState propagate(const WorkerState& state,
                                    const PhysicalProfile& profile,
                                    const Participation& participation,
                                    int elapsed_days,
                                    const PropagationConfig& config);

/// Readiness regained per day of rest.
[[nodiscard]] double recovery_per_day(const PhysicalProfile& profile, const PropagationConfig& config);

/**
 * @brief Days of pure rest until readiness reaches target.
 *
 * @return nullopt when the target is unreachable (above 1 or zero recovery).
 */
[[nodiscard]] std::optional<int> days_to_recover(const WorkerState& state,
                                                 const PhysicalProfile& profile,
                                                 double target,
                                                 const PropagationConfig& config);

/**
 * @brief Propagate every worker of a roster.
 *
 * Workers missing from participations are treated as rested at an event of
 * the given importance.
 */
[[nodiscard]] Roster advance_roster(const Roster& roster,
                                    const std::unordered_map<WorkerId, Participation>& participations,
                                    Importance importance,
                                    int elapsed_days,
                                    const PropagationConfig& config);

}  // namespace squad_rotation
