/**
 * @file worker.hpp
 * @brief Worker (squad member) model and perishable state.
 *
 * A Worker carries static capability data (ratings and familiarity per task
 * kind, physical profile) plus a WorkerState that only the propagation
 * engine mutates. Load categories are derived from the rolling appearance
 * window, never stored.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace squad_rotation {

/**
 * @brief Capability at a task kind, split by phase of play.
 */
struct RoleRating {
    double in_possession = 0.0;
    double out_of_possession = 0.0;

    auto operator<=>(const RoleRating&) const = default;
};

/**
 * @brief Familiarity with a task kind, each phase in [0,1].
 */
struct Familiarity {
    double in_possession = 0.0;
    double out_of_possession = 0.0;

    auto operator<=>(const Familiarity&) const = default;
};

struct PhysicalProfile {
    int age = 25;
    int natural_fitness = 10;   ///< 1-20
    int stamina = 10;           ///< 1-20

    auto operator<=>(const PhysicalProfile&) const = default;
};

struct Availability {
    bool injured = false;
    bool suspended = false;

    [[nodiscard]] bool available() const noexcept { return !injured && !suspended; }

    auto operator<=>(const Availability&) const = default;
};

/**
 * @brief One appearance inside the rolling load window.
 */
struct Appearance {
    int days_ago = 0;
    uint32_t minutes = 0;

    auto operator<=>(const Appearance&) const = default;
};

/**
 * @brief Perishable per-worker state.
 *
 * readiness and sharpness are in [0,1]; the window holds appearances no
 * older than the configured window length.
 */
struct WorkerState {
    double readiness = 1.0;
    double sharpness = 1.0;
    std::vector<Appearance> window;
    uint32_t consecutive_appearances = 0;
    uint32_t days_since_appearance = 0;
    bool jaded = false;

    [[nodiscard]] uint32_t window_minutes() const noexcept;

    bool operator==(const WorkerState&) const = default;
};

/**
 * @brief A squad member.
 */
struct Worker {
    WorkerId id;
    std::string name;
    std::map<TaskKind, RoleRating> ratings;
    std::map<TaskKind, Familiarity> familiarity;
    PhysicalProfile profile;
    Availability availability;
    WorkerState state;

    [[nodiscard]] bool available() const noexcept { return availability.available(); }
    [[nodiscard]] std::optional<RoleRating> rating_at(const TaskKind& kind) const;
    [[nodiscard]] Familiarity familiarity_at(const TaskKind& kind) const;
};

using Roster = std::vector<Worker>;

// ─────────────────────────────────────────────
// Load
// ─────────────────────────────────────────────

/**
 * @brief Personal window-minute threshold before jadedness sets in.
 *
 * Base threshold adjusted for age, natural fitness and stamina, clamped to
 * the configured bounds.
 */
[[nodiscard]] double load_threshold(const PhysicalProfile& profile, const PropagationConfig& config);

/**
 * @brief Derive the load category from a state.
 */
[[nodiscard]] LoadCategory load_category(const WorkerState& state,
                                         const PhysicalProfile& profile,
                                         const PropagationConfig& config);

/// Look up a worker by id, or nullptr.
[[nodiscard]] const Worker* find_worker(const Roster& roster, const WorkerId& id);
[[nodiscard]] Worker* find_worker(Roster& roster, const WorkerId& id);

}  // namespace squad_rotation
