/**
 * @file validation.cpp
 * @brief Roster, formation, event and constraint validation.
 */

#include "roster/validation.hpp"

#include <cmath>
#include <format>
#include <unordered_set>

namespace squad_rotation {

namespace {

bool in_unit_range(double v) noexcept {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

}  // namespace

Result<void> validate_state(const WorkerId& id, const WorkerState& state) {
    if (!in_unit_range(state.readiness)) {
        return validation_error(
            std::format("worker '{}': readiness {} outside [0,1]", id, state.readiness), {id});
    }
    if (!in_unit_range(state.sharpness)) {
        return validation_error(
            std::format("worker '{}': sharpness {} outside [0,1]", id, state.sharpness), {id});
    }
    for (const auto& appearance : state.window) {
        if (appearance.days_ago < 0) {
            return validation_error(
                std::format("worker '{}': appearance dated in the future", id), {id});
        }
    }
    return {};
}

Result<void> validate_worker(const Worker& worker) {
    if (worker.id.empty()) {
        return validation_error("worker with empty id");
    }
    for (const auto& [kind, rating] : worker.ratings) {
        if (!std::isfinite(rating.in_possession) || !std::isfinite(rating.out_of_possession) ||
            rating.in_possession < 0.0 || rating.out_of_possession < 0.0) {
            return validation_error(
                std::format("worker '{}': negative rating at '{}'", worker.id, kind), {worker.id});
        }
    }
    for (const auto& [kind, fam] : worker.familiarity) {
        if (!in_unit_range(fam.in_possession) || !in_unit_range(fam.out_of_possession)) {
            return validation_error(
                std::format("worker '{}': familiarity at '{}' outside [0,1]", worker.id, kind),
                {worker.id});
        }
    }
    return validate_state(worker.id, worker.state);
}

Result<void> validate_roster(const Roster& roster) {
    std::unordered_set<WorkerId> seen;
    for (const auto& worker : roster) {
        if (auto r = validate_worker(worker); !r) return r;
        if (!seen.insert(worker.id).second) {
            return validation_error(std::format("duplicate worker id '{}'", worker.id), {worker.id});
        }
    }
    return {};
}

Result<void> validate_formation(const Formation& formation) {
    if (formation.slots.size() != kFormationSize) {
        return validation_error(std::format("formation '{}' has {} slots, expected {}",
                                            formation.name, formation.slots.size(), kFormationSize));
    }

    std::unordered_set<SlotId> seen;
    size_t keepers = 0;
    for (const auto& s : formation.slots) {
        if (!seen.insert(s.id).second) {
            return validation_error(
                std::format("formation '{}': duplicate slot id '{}'", formation.name, s.id), {s.id});
        }
        if (s.goalkeeper) ++keepers;
        if (s.intensity <= 0.0) {
            return validation_error(
                std::format("formation '{}': slot '{}' has non-positive intensity", formation.name, s.id),
                {s.id});
        }
    }
    if (keepers != 1) {
        return validation_error(std::format("formation '{}' has {} goalkeeper slots, expected 1",
                                            formation.name, keepers));
    }
    return {};
}

Result<void> validate_events(std::span<const Event> events) {
    for (size_t i = 0; i < events.size(); ++i) {
        if (auto r = validate_formation(events[i].formation); !r) {
            auto err = r.error();
            err.message = std::format("event '{}': {}", events[i].id, err.message);
            return err;
        }
        if (i > 0 && events[i].date < events[i - 1].date) {
            return validation_error(
                std::format("event '{}' is dated before event '{}'", events[i].id, events[i - 1].id),
                {events[i].id, events[i - 1].id});
        }
    }
    return {};
}

Result<void> validate_constraints(const ConstraintSet& constraints,
                                  const Roster& roster,
                                  const Formation& formation) {
    auto known_worker = [&](const WorkerId& id) -> Result<void> {
        if (find_worker(roster, id) == nullptr) {
            return validation_error(std::format("constraint names unknown worker '{}'", id), {id});
        }
        return {};
    };
    auto known_slot = [&](const SlotId& id) -> Result<void> {
        if (formation.find_slot(id) == nullptr) {
            return validation_error(std::format("constraint names unknown slot '{}'", id), {id});
        }
        return {};
    };

    for (const auto& id : constraints.forced_rest) {
        if (auto r = known_worker(id); !r) return r;
    }
    for (const auto& id : constraints.readiness_floor_overrides) {
        if (auto r = known_worker(id); !r) return r;
    }
    for (const auto& lock : constraints.locks) {
        if (auto r = known_worker(lock.worker); !r) return r;
        if (auto r = known_slot(lock.slot); !r) return r;
    }
    for (const auto& rejection : constraints.rejections) {
        if (auto r = known_worker(rejection.worker); !r) return r;
        if (auto r = known_slot(rejection.slot); !r) return r;
    }
    return {};
}

}  // namespace squad_rotation
