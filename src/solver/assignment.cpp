/**
 * @file assignment.cpp
 * @brief Assignment lookups.
 */

#include "solver/assignment.hpp"

#include <algorithm>

namespace squad_rotation {

bool Assignment::starts(const WorkerId& worker) const {
    return slot_of(worker).has_value();
}

std::optional<SlotId> Assignment::slot_of(const WorkerId& worker) const {
    auto it = std::find_if(lineup.begin(), lineup.end(),
                           [&](const SlotAssignment& a) { return a.worker == worker; });
    if (it == lineup.end()) return std::nullopt;
    return it->slot;
}

const SlotAssignment* Assignment::find_slot(const SlotId& slot) const {
    auto it = std::find_if(lineup.begin(), lineup.end(),
                           [&](const SlotAssignment& a) { return a.slot == slot; });
    return it == lineup.end() ? nullptr : &*it;
}

}  // namespace squad_rotation
