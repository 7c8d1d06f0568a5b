/**
 * @file worker.cpp
 * @brief Worker lookups and load classification.
 */

#include "roster/worker.hpp"

#include <algorithm>
#include <numeric>

namespace squad_rotation {

uint32_t WorkerState::window_minutes() const noexcept {
    return std::accumulate(window.begin(), window.end(), uint32_t{0},
        [](uint32_t sum, const Appearance& a) { return sum + a.minutes; });
}

std::optional<RoleRating> Worker::rating_at(const TaskKind& kind) const {
    auto it = ratings.find(kind);
    if (it == ratings.end()) return std::nullopt;
    return it->second;
}

Familiarity Worker::familiarity_at(const TaskKind& kind) const {
    auto it = familiarity.find(kind);
    if (it == familiarity.end()) return Familiarity{};
    return it->second;
}

double load_threshold(const PhysicalProfile& profile, const PropagationConfig& config) {
    double threshold = config.base_load_threshold;

    // Veterans and teenagers tolerate less accumulated load
    if (profile.age >= 32) {
        threshold -= 100.0;
    } else if (profile.age >= 30 || profile.age < 19) {
        threshold -= 50.0;
    }

    if (profile.natural_fitness < 10) {
        threshold -= 50.0;
    } else if (profile.natural_fitness >= 15) {
        threshold += 50.0;
    }

    if (profile.stamina < 10) {
        threshold -= 50.0;
    } else if (profile.stamina >= 15) {
        threshold += 30.0;
    }

    return std::clamp(threshold, config.min_load_threshold, config.max_load_threshold);
}

LoadCategory load_category(const WorkerState& state,
                           const PhysicalProfile& profile,
                           const PropagationConfig& config) {
    if (state.jaded) return LoadCategory::Jaded;

    double ratio = static_cast<double>(state.window_minutes()) / load_threshold(profile, config);
    if (ratio < config.fresh_ratio) return LoadCategory::Fresh;
    if (ratio < config.fit_ratio) return LoadCategory::Fit;
    return LoadCategory::Tired;
}

const Worker* find_worker(const Roster& roster, const WorkerId& id) {
    auto it = std::find_if(roster.begin(), roster.end(),
                           [&](const Worker& w) { return w.id == id; });
    return it == roster.end() ? nullptr : &*it;
}

Worker* find_worker(Roster& roster, const WorkerId& id) {
    auto it = std::find_if(roster.begin(), roster.end(),
                           [&](const Worker& w) { return w.id == id; });
    return it == roster.end() ? nullptr : &*it;
}

}  // namespace squad_rotation
