/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout SquadRotation.
 *
 * Defines WorkerId, SlotId, importance levels, load categories and
 * familiarity tiers. All types are designed for value semantics.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace squad_rotation {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using WorkerId = std::string;
using SlotId = std::string;
using TaskKind = std::string;
using EventId = std::string;
using Date = std::chrono::sys_days;

// ─────────────────────────────────────────────
// Event Importance
// ─────────────────────────────────────────────

/**
 * @brief Importance of an event, supplied by the caller.
 *
 * Drives the per-importance curve parameters, shadow weights and rest
 * attractiveness. Used as an array index, so keep the values dense.
 */
enum class Importance : uint8_t {
    High,
    Medium,
    Low,
    SharpnessBuilding
};

inline constexpr size_t kImportanceLevels = 4;

[[nodiscard]] constexpr size_t index_of(Importance importance) noexcept {
    return static_cast<size_t>(importance);
}

[[nodiscard]] constexpr std::string_view to_string(Importance importance) noexcept {
    switch (importance) {
        case Importance::High:              return "high";
        case Importance::Medium:            return "medium";
        case Importance::Low:               return "low";
        case Importance::SharpnessBuilding: return "sharpness";
    }
    return "unknown";
}

inline constexpr std::array<Importance, kImportanceLevels> kAllImportances{
    Importance::High, Importance::Medium, Importance::Low, Importance::SharpnessBuilding
};

/**
 * @brief Per-importance lookup table.
 */
template <typename T>
struct ByImportance {
    std::array<T, kImportanceLevels> values{};

    [[nodiscard]] constexpr T& operator[](Importance importance) noexcept {
        return values[index_of(importance)];
    }
    [[nodiscard]] constexpr const T& operator[](Importance importance) const noexcept {
        return values[index_of(importance)];
    }
};

// ─────────────────────────────────────────────
// Load Category
// ─────────────────────────────────────────────

enum class LoadCategory : uint8_t {
    Fresh,
    Fit,
    Tired,
    Jaded       ///< Sticky; needs an extended break to clear
};

inline constexpr size_t kLoadCategories = 4;

[[nodiscard]] constexpr std::string_view to_string(LoadCategory load) noexcept {
    switch (load) {
        case LoadCategory::Fresh: return "fresh";
        case LoadCategory::Fit:   return "fit";
        case LoadCategory::Tired: return "tired";
        case LoadCategory::Jaded: return "jaded";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Familiarity Tier
// ─────────────────────────────────────────────

enum class FamiliarityTier : uint8_t {
    Natural,
    Accomplished,
    Competent,
    Unconvincing,
    Awkward
};

/**
 * @brief Map a [0,1] familiarity score onto its tier.
 */
[[nodiscard]] constexpr FamiliarityTier familiarity_tier(double familiarity) noexcept {
    if (familiarity >= 0.90) return FamiliarityTier::Natural;
    if (familiarity >= 0.65) return FamiliarityTier::Accomplished;
    if (familiarity >= 0.45) return FamiliarityTier::Competent;
    if (familiarity >= 0.25) return FamiliarityTier::Unconvincing;
    return FamiliarityTier::Awkward;
}

[[nodiscard]] constexpr std::string_view to_string(FamiliarityTier tier) noexcept {
    switch (tier) {
        case FamiliarityTier::Natural:      return "natural";
        case FamiliarityTier::Accomplished: return "accomplished";
        case FamiliarityTier::Competent:    return "competent";
        case FamiliarityTier::Unconvincing: return "unconvincing";
        case FamiliarityTier::Awkward:      return "awkward";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Training Intensity
// ─────────────────────────────────────────────

enum class TrainingIntensity : uint8_t {
    Low,
    Medium,
    High
};

[[nodiscard]] constexpr std::string_view to_string(TrainingIntensity intensity) noexcept {
    switch (intensity) {
        case TrainingIntensity::Low:    return "low";
        case TrainingIntensity::Medium: return "medium";
        case TrainingIntensity::High:   return "high";
    }
    return "unknown";
}

}  // namespace squad_rotation
