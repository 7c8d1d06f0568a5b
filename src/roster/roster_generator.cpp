/**
 * @file roster_generator.cpp
 * @brief Synthetic roster and fixture generation.
 *
 * Generates squads that model common selection situations:
 * - Layered depth charts (clear first, second and third choices per slot)
 * - Random squads with versatile workers (for stress testing and benchmarking)
 * - Fixture lists with arbitrary spacing and importance
 */

#include "roster/roster_generator.hpp"

#include <algorithm>
#include <format>

namespace squad_rotation {

Worker RosterGenerator::specialist(const WorkerId& id, const TaskKind& kind, double rating,
                                   double familiarity) {
    Worker w;
    w.id = id;
    w.name = id;
    w.ratings[kind] = RoleRating{.in_possession = rating, .out_of_possession = rating};
    w.familiarity[kind] = Familiarity{.in_possession = familiarity, .out_of_possession = familiarity};
    return w;
}

// ─────────────────────────────────────────────
// Layered squad: slot_0 > slot_1 > ... per slot
// ─────────────────────────────────────────────

Roster RosterGenerator::layered_squad(const Formation& formation, size_t depth,
                                      double base_rating, double step) {
    Roster roster;
    roster.reserve(formation.slots.size() * depth);
    for (size_t d = 0; d < depth; ++d) {
        for (const auto& slot : formation.slots) {
            roster.push_back(specialist(std::format("{}_{}", slot.id, d), slot.kind,
                                        base_rating - static_cast<double>(d) * step));
        }
    }
    return roster;
}

// ─────────────────────────────────────────────
// Random squad: cycles through kinds so every slot has cover
// ─────────────────────────────────────────────

Roster RosterGenerator::random_squad(size_t size, const Formation& formation, std::mt19937& rng) {
    std::vector<TaskKind> kinds;
    for (const auto& slot : formation.slots) {
        if (std::find(kinds.begin(), kinds.end(), slot.kind) == kinds.end()) {
            kinds.push_back(slot.kind);
        }
    }
    const TaskKind keeper = formation.goalkeeper_slot() != nullptr
        ? formation.goalkeeper_slot()->kind : TaskKind{"GK"};

    std::uniform_real_distribution<double> rating(90.0, 170.0);
    std::uniform_real_distribution<double> phase_skew(0.9, 1.1);
    std::uniform_real_distribution<double> secondary_fam(0.3, 0.8);
    std::uniform_real_distribution<double> readiness(0.85, 1.0);
    std::uniform_real_distribution<double> sharpness(0.6, 1.0);
    std::uniform_int_distribution<int> age(18, 34);
    std::uniform_int_distribution<int> attribute(5, 18);
    std::uniform_int_distribution<size_t> kind_pick(0, kinds.size() - 1);

    Roster roster;
    roster.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        const auto& primary = kinds[i % kinds.size()];
        double r = rating(rng);

        Worker w = specialist(std::format("w{:03}", i), primary, r);
        w.ratings[primary].out_of_possession = r * phase_skew(rng);

        // Outfield workers pick up a second outfield kind
        if (primary != keeper) {
            TaskKind secondary = kinds[kind_pick(rng)];
            if (secondary != primary && secondary != keeper) {
                double fam = secondary_fam(rng);
                w.ratings[secondary] = RoleRating{.in_possession = r * 0.9, .out_of_possession = r * 0.9};
                w.familiarity[secondary] = Familiarity{.in_possession = fam, .out_of_possession = fam};
            }
        }

        w.profile = PhysicalProfile{.age = age(rng), .natural_fitness = attribute(rng), .stamina = attribute(rng)};
        w.state.readiness = readiness(rng);
        w.state.sharpness = sharpness(rng);
        roster.push_back(std::move(w));
    }
    return roster;
}

// ─────────────────────────────────────────────
// Fixtures
// ─────────────────────────────────────────────

std::vector<Event> RosterGenerator::fixtures(Date start,
                                             const std::vector<int>& day_offsets,
                                             const std::vector<Importance>& importances,
                                             const Formation& formation) {
    std::vector<Event> events;
    events.reserve(day_offsets.size());
    for (size_t i = 0; i < day_offsets.size(); ++i) {
        events.push_back(Event{
            .id = std::format("event_{}", i),
            .date = start + std::chrono::days{day_offsets[i]},
            .importance = i < importances.size() ? importances[i] : Importance::Medium,
            .formation = formation
        });
    }
    return events;
}

std::vector<Event> RosterGenerator::fixture_run(Date start, size_t count, int interval_days,
                                                Importance importance, const Formation& formation) {
    std::vector<int> offsets;
    for (size_t i = 0; i < count; ++i) {
        offsets.push_back(static_cast<int>(i) * interval_days);
    }
    return fixtures(start, offsets, std::vector<Importance>(count, importance), formation);
}

}  // namespace squad_rotation
