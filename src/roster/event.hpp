/**
 * @file event.hpp
 * @brief Task slots, formations, scheduled events and per-event constraints.
 */

#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace squad_rotation {

/**
 * @brief One position to fill in a formation.
 */
struct TaskSlot {
    SlotId id;
    TaskKind kind;
    bool goalkeeper = false;
    double intensity = 1.0;     ///< Physical demand relative to an average slot

    auto operator<=>(const TaskSlot&) const = default;
};

inline constexpr size_t kFormationSize = 11;

/**
 * @brief Eleven slots, exactly one of them the goalkeeper slot.
 */
struct Formation {
    std::string name;
    std::vector<TaskSlot> slots;

    [[nodiscard]] size_t size() const noexcept { return slots.size(); }
    [[nodiscard]] const TaskSlot* goalkeeper_slot() const noexcept;
    [[nodiscard]] const TaskSlot* find_slot(const SlotId& id) const noexcept;

    // ── Stock shapes ──────────────────────────
    static Formation four_four_two();
    static Formation four_three_three();
    static Formation three_five_two();
};

/**
 * @brief Physical demand multiplier for a task kind.
 *
 * Wide defenders and holding midfielders cover the most ground; centre-backs
 * and goalkeepers the least.
 */
[[nodiscard]] double slot_intensity(const TaskKind& kind) noexcept;

/**
 * @brief A scheduled event. Never mutated by the optimizer.
 */
struct Event {
    EventId id;
    Date date;
    Importance importance = Importance::Medium;
    Formation formation;
};

// ─────────────────────────────────────────────
// Constraints
// ─────────────────────────────────────────────

struct SlotLock {
    WorkerId worker;
    SlotId slot;

    auto operator<=>(const SlotLock&) const = default;
};

struct SlotRejection {
    WorkerId worker;
    SlotId slot;

    auto operator<=>(const SlotRejection&) const = default;
};

/**
 * @brief Caller-supplied constraints for one event.
 */
struct ConstraintSet {
    std::vector<WorkerId> forced_rest;
    std::vector<SlotLock> locks;
    std::vector<SlotRejection> rejections;
    /// Workers allowed to start below the readiness hard floor.
    std::vector<WorkerId> readiness_floor_overrides;

    [[nodiscard]] bool is_forced_rest(const WorkerId& worker) const;
    [[nodiscard]] bool has_floor_override(const WorkerId& worker) const;
    [[nodiscard]] bool is_rejected(const WorkerId& worker, const SlotId& slot) const;
    [[nodiscard]] const SlotLock* lock_for(const WorkerId& worker) const;
    [[nodiscard]] bool empty() const noexcept;
};

}  // namespace squad_rotation
