/**
 * @file assignment.hpp
 * @brief Per-event solver output.
 */

#pragma once

#include "core/types.hpp"
#include "scoring/scoring_model.hpp"

#include <optional>
#include <string>
#include <vector>

namespace squad_rotation {

/**
 * @brief One filled slot with the numbers that put the worker there.
 */
struct SlotAssignment {
    SlotId slot;
    WorkerId worker;
    GssBreakdown breakdown;
    double shadow_price = 0.0;
    double stability_cost = 0.0;
    double cost = 0.0;          ///< −GSS + shadow + stability
    bool locked = false;
    bool fallback = false;      ///< Familiarity below the competent tier
};

/**
 * @brief Lineup chosen for one event. Immutable once produced.
 */
struct Assignment {
    size_t event_index = 0;
    EventId event_id;
    Importance importance = Importance::Medium;
    std::vector<SlotAssignment> lineup;     ///< Formation slot order
    std::vector<WorkerId> bench;            ///< Best rested options, best first
    std::vector<WorkerId> rested;           ///< Every non-starter, roster order
    double total_cost = 0.0;
    double total_gss = 0.0;
    bool goalkeeper_relaxed = false;

    [[nodiscard]] bool starts(const WorkerId& worker) const;
    [[nodiscard]] std::optional<SlotId> slot_of(const WorkerId& worker) const;
    [[nodiscard]] const SlotAssignment* find_slot(const SlotId& slot) const;
};

}  // namespace squad_rotation
