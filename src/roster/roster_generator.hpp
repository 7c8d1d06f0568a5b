/**
 * @file roster_generator.hpp
 * @brief Synthetic squads and fixture lists for testing and benchmarking.
 */

#pragma once

#include "roster/event.hpp"
#include "roster/worker.hpp"

#include <random>
#include <vector>

namespace squad_rotation {

/**
 * @brief Factory for synthetic rosters and event sequences.
 */
class RosterGenerator {
public:
    /// One worker rated and fully familiar at a single kind.
    static Worker specialist(const WorkerId& id, const TaskKind& kind, double rating,
                             double familiarity = 1.0);

    /// Depth-ordered squad: for each formation slot, `depth` specialists named
    /// "<slot>_<d>" rated base_rating − d × step.
    static Roster layered_squad(const Formation& formation, size_t depth,
                                double base_rating, double step);

    /// Random squad: size workers cycling through the formation's kinds, each
    /// with a secondary kind at partial familiarity.
    static Roster random_squad(size_t size, const Formation& formation, std::mt19937& rng);

    /// Events on the given day offsets from start.
    static std::vector<Event> fixtures(Date start,
                                       const std::vector<int>& day_offsets,
                                       const std::vector<Importance>& importances,
                                       const Formation& formation);

    /// count events every interval_days, all of one importance.
    static std::vector<Event> fixture_run(Date start, size_t count, int interval_days,
                                          Importance importance, const Formation& formation);
};

}  // namespace squad_rotation
