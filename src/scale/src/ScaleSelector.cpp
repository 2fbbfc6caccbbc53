/**
 * @file ScaleSelector.cpp
 * @brief Implementation of ladder-based unit selection.
 */

#include "src/scale/inc/ScaleSelector.hpp"
#include "src/helpers/inc/Format.hpp"

#include <cmath>

namespace legible {

namespace scale {

namespace {

/// Express magnitude in ladder[index].
ScaledMagnitude scaledAt(double magnitude, std::span<const ScaleUnit> ladder,
                         std::size_t index) noexcept {
  ScaledMagnitude out;
  out.raw = magnitude;
  out.unitIndex = index;
  out.scaled = magnitude / ladder[index].divisor;
  out.rounded = out.scaled;
  return out;
}

} // namespace

/* ----------------------------- API ----------------------------- */

ScaledMagnitude selectScale(double magnitude, std::span<const ScaleUnit> ladder) noexcept {
  if (ladder.empty()) {
    return ScaledMagnitude{magnitude, 0, magnitude, magnitude};
  }

  const double ABS = std::fabs(magnitude);
  std::size_t index = 0;
  for (std::size_t i = 1; i < ladder.size(); ++i) {
    if (ladder[i].threshold <= ABS) {
      index = i;
    } else {
      break;
    }
  }

  return scaledAt(magnitude, ladder, index);
}

ScaledMagnitude scaleAndRound(double magnitude, std::span<const ScaleUnit> ladder,
                              unsigned digits) noexcept {
  using legible::helpers::format::roundHalfAway;

  ScaledMagnitude out = selectScale(magnitude, ladder);
  out.rounded = roundHalfAway(out.scaled, digits);

  // Rounding may carry into the next unit (999.96 K -> 1000.0 K -> 1 M)
  while (out.unitIndex + 1 < ladder.size()) {
    const ScaleUnit& CUR = ladder[out.unitIndex];
    const ScaleUnit& NEXT = ladder[out.unitIndex + 1];
    if (std::fabs(out.rounded) * CUR.divisor < NEXT.threshold) {
      break;
    }
    out = scaledAt(magnitude, ladder, out.unitIndex + 1);
    out.rounded = roundHalfAway(out.scaled, digits);
  }

  return out;
}

} // namespace scale

} // namespace legible
