/**
 * @file event.cpp
 * @brief Formation shapes and constraint lookups.
 */

#include "roster/event.hpp"

#include <algorithm>

namespace squad_rotation {

namespace {

TaskSlot slot(SlotId id, TaskKind kind) {
    bool keeper = kind == "GK";
    double intensity = slot_intensity(kind);
    return TaskSlot{
        .id = std::move(id),
        .kind = std::move(kind),
        .goalkeeper = keeper,
        .intensity = intensity
    };
}

}  // namespace

double slot_intensity(const TaskKind& kind) noexcept {
    if (kind == "FB" || kind == "WB" || kind == "DM") return 1.2;
    if (kind == "CB" || kind == "GK") return 0.8;
    return 1.0;
}

const TaskSlot* Formation::goalkeeper_slot() const noexcept {
    auto it = std::find_if(slots.begin(), slots.end(),
                           [](const TaskSlot& s) { return s.goalkeeper; });
    return it == slots.end() ? nullptr : &*it;
}

const TaskSlot* Formation::find_slot(const SlotId& id) const noexcept {
    auto it = std::find_if(slots.begin(), slots.end(),
                           [&](const TaskSlot& s) { return s.id == id; });
    return it == slots.end() ? nullptr : &*it;
}

Formation Formation::four_four_two() {
    return Formation{
        .name = "4-4-2",
        .slots = {
            slot("GK", "GK"),
            slot("RB", "FB"), slot("RCB", "CB"), slot("LCB", "CB"), slot("LB", "FB"),
            slot("RM", "WM"), slot("RCM", "CM"), slot("LCM", "CM"), slot("LM", "WM"),
            slot("RST", "ST"), slot("LST", "ST"),
        }
    };
}

Formation Formation::four_three_three() {
    return Formation{
        .name = "4-3-3",
        .slots = {
            slot("GK", "GK"),
            slot("RB", "FB"), slot("RCB", "CB"), slot("LCB", "CB"), slot("LB", "FB"),
            slot("DM", "DM"), slot("RCM", "CM"), slot("LCM", "CM"),
            slot("RW", "W"), slot("ST", "ST"), slot("LW", "W"),
        }
    };
}

Formation Formation::three_five_two() {
    return Formation{
        .name = "3-5-2",
        .slots = {
            slot("GK", "GK"),
            slot("RCB", "CB"), slot("CB", "CB"), slot("LCB", "CB"),
            slot("RWB", "WB"), slot("DM", "DM"), slot("RCM", "CM"), slot("LCM", "CM"),
            slot("LWB", "WB"),
            slot("RST", "ST"), slot("LST", "ST"),
        }
    };
}

// ─────────────────────────────────────────────
// ConstraintSet
// ─────────────────────────────────────────────

bool ConstraintSet::is_forced_rest(const WorkerId& worker) const {
    return std::find(forced_rest.begin(), forced_rest.end(), worker) != forced_rest.end();
}

bool ConstraintSet::has_floor_override(const WorkerId& worker) const {
    return std::find(readiness_floor_overrides.begin(), readiness_floor_overrides.end(), worker)
        != readiness_floor_overrides.end();
}

bool ConstraintSet::is_rejected(const WorkerId& worker, const SlotId& slot) const {
    return std::any_of(rejections.begin(), rejections.end(), [&](const SlotRejection& r) {
        return r.worker == worker && r.slot == slot;
    });
}

const SlotLock* ConstraintSet::lock_for(const WorkerId& worker) const {
    auto it = std::find_if(locks.begin(), locks.end(),
                           [&](const SlotLock& l) { return l.worker == worker; });
    return it == locks.end() ? nullptr : &*it;
}

bool ConstraintSet::empty() const noexcept {
    return forced_rest.empty() && locks.empty() && rejections.empty()
        && readiness_floor_overrides.empty();
}

}  // namespace squad_rotation
