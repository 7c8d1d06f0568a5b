/**
 * @file stability.cpp
 * @brief Inertia and anchoring costs.
 */

#include "solver/stability.hpp"

namespace squad_rotation {

void AssignmentHistory::record(const Assignment& assignment) {
    std::unordered_map<WorkerId, SlotId> slots;
    for (const auto& entry : assignment.lineup) {
        slots.emplace(entry.worker, entry.slot);
    }
    events_.push_front(std::move(slots));
    while (events_.size() > max_events_) {
        events_.pop_back();
    }
}

std::optional<SlotId> AssignmentHistory::previous_slot(const WorkerId& worker) const {
    if (events_.empty()) return std::nullopt;
    auto it = events_.front().find(worker);
    if (it == events_.front().end()) return std::nullopt;
    return it->second;
}

uint32_t AssignmentHistory::consecutive_in(const WorkerId& worker, const SlotId& slot) const {
    uint32_t count = 0;
    for (const auto& event : events_) {
        auto it = event.find(worker);
        if (it == event.end() || it->second != slot) break;
        ++count;
    }
    return count;
}

double stability_cost(const AssignmentHistory& history,
                      const WorkerId& worker,
                      const SlotId& slot,
                      const StabilityConfig& config) {
    auto previous = history.previous_slot(worker);
    if (!previous) return 0.0;

    if (*previous == slot) {
        return -config.inertia_weight * config.continuity_bonus;
    }

    double cost = config.inertia_weight * config.switch_cost;
    if (config.anchor_threshold > 0 &&
        history.consecutive_in(worker, *previous) >= config.anchor_threshold) {
        cost += config.anchor_multiplier * config.switch_cost;
    }
    return cost;
}

}  // namespace squad_rotation
