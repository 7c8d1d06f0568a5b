/**
 * @file curves.cpp
 * @brief Curve evaluation.
 */

#include "scoring/curves.hpp"

#include <algorithm>
#include <cmath>

namespace squad_rotation {

namespace {

double sigmoid(double z) noexcept {
    // Clamp to keep exp() well away from overflow
    z = std::clamp(z, -40.0, 40.0);
    return 1.0 / (1.0 + std::exp(-z));
}

}  // namespace

double MultiplierCurve::operator()(double x) const noexcept {
    x = std::clamp(x, 0.0, 1.0);

    double shape = 0.0;
    switch (kind) {
        case CurveKind::Logistic:
            shape = sigmoid(steepness * (x - midpoint)) / sigmoid(steepness * (1.0 - midpoint));
            break;
        case CurveKind::InverseLogistic:
            shape = sigmoid(-steepness * (x - midpoint)) / sigmoid(steepness * midpoint);
            break;
        case CurveKind::Linear:
            shape = x;
            break;
    }

    return std::clamp(floor + (1.0 - floor) * shape, floor, 1.0);
}

MultiplierCurve MultiplierCurve::logistic(double steepness, double midpoint, double floor) {
    return MultiplierCurve{
        .kind = CurveKind::Logistic,
        .steepness = steepness,
        .midpoint = midpoint,
        .floor = floor
    };
}

MultiplierCurve MultiplierCurve::inverse_logistic(double steepness, double midpoint, double floor) {
    return MultiplierCurve{
        .kind = CurveKind::InverseLogistic,
        .steepness = steepness,
        .midpoint = midpoint,
        .floor = floor
    };
}

MultiplierCurve MultiplierCurve::linear(double floor) {
    return MultiplierCurve{
        .kind = CurveKind::Linear,
        .steepness = 1.0,
        .midpoint = 0.5,
        .floor = floor
    };
}

}  // namespace squad_rotation
