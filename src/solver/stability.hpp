/**
 * @file stability.hpp
 * @brief Assignment inertia and soft-lock anchoring.
 *
 * Keeping a worker in the slot it filled at the previous event earns a
 * continuity bonus; moving it costs a switch penalty. A worker that has
 * filled the same slot for anchor_threshold consecutive events is anchored
 * and pays an extra anchor_multiplier × switch_cost to move.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "solver/assignment.hpp"

#include <deque>
#include <optional>
#include <unordered_map>

namespace squad_rotation {

/**
 * @brief Slots filled at recent events, most recent first.
 */
class AssignmentHistory {
public:
    explicit AssignmentHistory(size_t max_events = 10) : max_events_(max_events) {}

    void record(const Assignment& assignment);

    /// Slot at the immediately preceding event, if the worker started it.
    [[nodiscard]] std::optional<SlotId> previous_slot(const WorkerId& worker) const;

    /// Leading run of recorded events in which the worker filled slot.
    [[nodiscard]] uint32_t consecutive_in(const WorkerId& worker, const SlotId& slot) const;

    [[nodiscard]] size_t size() const noexcept { return events_.size(); }
    [[nodiscard]] bool empty() const noexcept { return events_.empty(); }

private:
    size_t max_events_;
    std::deque<std::unordered_map<WorkerId, SlotId>> events_;
};

/**
 * @brief Stability term for placing worker at slot.
 *
 * Negative for continuity, positive for a move, zero when the worker did
 * not start the previous event.
 */
[[nodiscard]] double stability_cost(const AssignmentHistory& history,
                                    const WorkerId& worker,
                                    const SlotId& slot,
                                    const StabilityConfig& config);

}  // namespace squad_rotation
