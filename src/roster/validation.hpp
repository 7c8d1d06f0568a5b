/**
 * @file validation.hpp
 * @brief Structural checks on rosters, formations, events and constraints.
 *
 * Every check returns ErrorCode::Validation naming the offending ids in
 * Error::subjects. Nothing here touches scores; contradictions between
 * constraints are the solver's concern.
 */

#pragma once

#include "core/result.hpp"
#include "roster/event.hpp"
#include "roster/worker.hpp"

#include <span>

namespace squad_rotation {

Result<void> validate_state(const WorkerId& id, const WorkerState& state);
Result<void> validate_worker(const Worker& worker);
Result<void> validate_roster(const Roster& roster);
Result<void> validate_formation(const Formation& formation);

/// Formations valid and dates non-decreasing.
Result<void> validate_events(std::span<const Event> events);

/// Every id a constraint mentions must exist in the roster / formation.
Result<void> validate_constraints(const ConstraintSet& constraints,
                                  const Roster& roster,
                                  const Formation& formation);

}  // namespace squad_rotation
