/**
 * @file propagation.cpp
 * @brief State propagation: match load, recovery, decay and jadedness.
 */

#include "simulation/propagation.hpp"

#include <algorithm>
#include <cmath>

namespace squad_rotation {

namespace {

double stamina_modifier(const PhysicalProfile& profile) noexcept {
    return 1.0 + (10 - profile.stamina) * 0.05;
}

double natural_fitness_modifier(const PhysicalProfile& profile) noexcept {
    return 0.8 + (profile.natural_fitness / 20.0) * 0.4;
}

double age_modifier(const PhysicalProfile& profile) noexcept {
    if (profile.age >= 32) return 0.9;
    if (profile.age >= 30) return 0.95;
    return 1.0;
}

double training_modifier(TrainingIntensity intensity) noexcept {
    switch (intensity) {
        case TrainingIntensity::Low:    return 1.2;
        case TrainingIntensity::Medium: return 1.0;
        case TrainingIntensity::High:   return 0.8;
    }
    return 1.0;
}

void apply_match(WorkerState& s,
                 const PhysicalProfile& profile,
                 const Participation& p,
                 const PropagationConfig& config) {
    double ratio = p.minutes / 90.0;

    double loss = config.readiness_loss_per_90 * ratio * stamina_modifier(profile)
                * p.slot_intensity * config.event_intensity[p.importance];
    s.readiness = std::clamp(s.readiness - loss, 0.0, 1.0);

    double gain = config.sharpness_gain_per_90 * ratio * config.competitiveness[p.importance];
    s.sharpness = std::clamp(s.sharpness + gain, 0.0, 1.0);

    s.window.push_back(Appearance{.days_ago = 0, .minutes = p.minutes});
    s.consecutive_appearances += 1;
    s.days_since_appearance = 0;

    if (s.window_minutes() >= load_threshold(profile, config) &&
        s.consecutive_appearances >= static_cast<uint32_t>(config.jaded_streak)) {
        s.jaded = true;
    }
}

void apply_days(WorkerState& s,
                const PhysicalProfile& profile,
                int days,
                const PropagationConfig& config) {
    if (days <= 0) return;

    s.readiness = std::clamp(s.readiness + recovery_per_day(profile, config) * days, 0.0, 1.0);
    s.sharpness = std::clamp(s.sharpness - config.sharpness_decay_per_day * days, 0.0, 1.0);

    for (auto& appearance : s.window) {
        appearance.days_ago += days;
    }
    std::erase_if(s.window, [&](const Appearance& a) { return a.days_ago >= config.window_days; });

    s.days_since_appearance += static_cast<uint32_t>(days);
    if (s.jaded && s.days_since_appearance >= static_cast<uint32_t>(config.jaded_recovery_days)) {
        s.jaded = false;
    }
}

}  // namespace

WorkerState propagate(const WorkerState& state,
                      const PhysicalProfile& profile,
                      const Participation& participation,
                      int elapsed_days,
                      const PropagationConfig& config) {
    elapsed_days = std::max(elapsed_days, 0);
    if (!participation.played() && elapsed_days == 0) {
        return state;
    }

    WorkerState next = state;
    if (participation.played()) {
        apply_match(next, profile, participation, config);
    } else {
        next.consecutive_appearances = 0;
    }
    apply_days(next, profile, elapsed_days, config);
    return next;
}

double recovery_per_day(const PhysicalProfile& profile, const PropagationConfig& config) {
    return config.recovery_per_day * natural_fitness_modifier(profile)
         * age_modifier(profile) * training_modifier(config.training);
}

std::optional<int> days_to_recover(const WorkerState& state,
                                   const PhysicalProfile& profile,
                                   double target,
                                   const PropagationConfig& config) {
    if (state.readiness >= target) return 0;
    if (target > 1.0) return std::nullopt;

    double rate = recovery_per_day(profile, config);
    if (rate <= 0.0) return std::nullopt;

    return static_cast<int>(std::ceil((target - state.readiness) / rate - 1e-9));
}

Roster advance_roster(const Roster& roster,
                      const std::unordered_map<WorkerId, Participation>& participations,
                      Importance importance,
                      int elapsed_days,
                      const PropagationConfig& config) {
    Roster next = roster;
    for (auto& worker : next) {
        auto it = participations.find(worker.id);
        Participation p = it != participations.end() ? it->second : Participation::rested(importance);
        worker.state = propagate(worker.state, worker.profile, p, elapsed_days, config);
    }
    return next;
}

}  // namespace squad_rotation
