/**
 * @file curves.hpp
 * @brief Parameterized multiplier curves used by the scoring model.
 *
 * Each GSS multiplier is a small function object (curve kind + parameters)
 * so that every shape is configuration rather than code. All curves map
 * [0,1] into [floor, 1].
 */

#pragma once

#include "core/concepts.hpp"
#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace squad_rotation {

enum class CurveKind : uint8_t {
    Logistic,           ///< Increasing, normalized so f(1) = 1
    InverseLogistic,    ///< Decreasing, normalized so f(0) = 1
    Linear              ///< floor + (1 - floor) * x
};

[[nodiscard]] constexpr std::string_view to_string(CurveKind kind) noexcept {
    switch (kind) {
        case CurveKind::Logistic:        return "logistic";
        case CurveKind::InverseLogistic: return "inverse_logistic";
        case CurveKind::Linear:          return "linear";
    }
    return "unknown";
}

/**
 * @brief A bounded multiplier curve on [0,1].
 *
 * Inputs outside [0,1] are clamped. The output never drops below floor and
 * never exceeds 1.
 */
struct MultiplierCurve {
    CurveKind kind = CurveKind::Linear;
    double steepness = 1.0;
    double midpoint = 0.5;
    double floor = 0.0;

    [[nodiscard]] double operator()(double x) const noexcept;

    static MultiplierCurve logistic(double steepness, double midpoint, double floor);
    static MultiplierCurve inverse_logistic(double steepness, double midpoint, double floor);
    static MultiplierCurve linear(double floor);
};

/**
 * @brief Step multiplier indexed by LoadCategory.
 */
class LoadMultiplier {
public:
    explicit LoadMultiplier(std::array<double, kLoadCategories> values) : values_(values) {}

    [[nodiscard]] double operator()(LoadCategory load) const noexcept {
        return values_[static_cast<size_t>(load)];
    }

private:
    std::array<double, kLoadCategories> values_;
};

static_assert(MultiplierCurveLike<MultiplierCurve>);

}  // namespace squad_rotation
