#pragma once

/// @file numeric.h
/// @brief Rounding helpers shared by the analytics modules

#include <cmath>

namespace invsense {

/// @brief Round to a number of decimals, ties to even on the scaled value
///
/// Scales by 10^decimals and rounds with the default floating point mode
/// (round-half-even), so 0.125 -> 0.12 and 0.135 -> 0.14 as in numpy.round.
inline double RoundDecimals(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::nearbyint(value * scale) / scale;
}

}  // namespace invsense
