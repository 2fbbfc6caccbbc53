/**
 * @file HumanNumber.cpp
 * @brief Implementation of short-scale count rendering.
 */

#include "src/number/inc/HumanNumber.hpp"
#include "src/helpers/inc/Format.hpp"

#include <cmath>

#include <fmt/core.h>

namespace legible {

namespace number {

namespace {

using legible::helpers::format::formatScaled;
using legible::helpers::format::groupThousands;
using legible::helpers::format::isIntegral;
using legible::helpers::format::Style;

/// Scaled values keep one digit; base-unit values round to a whole count.
scale::ScaledMagnitude scaleCount(double value) noexcept {
  const scale::ScaledMagnitude SM =
      scale::scaleAndRound(value, NUMBER_LADDER, NUMBER_DECIMAL_DIGITS);
  if (SM.unitIndex != 0) {
    return SM;
  }
  // 999.5 rounds to 1000 here and is promoted to "1K"
  return scale::scaleAndRound(value, NUMBER_LADDER, 0);
}

std::string render(double value, Style style) {
  if (!std::isfinite(value)) {
    return fmt::format("{}", value);
  }

  const scale::ScaledMagnitude SM = scaleCount(value);
  const std::string NUM = formatScaled(SM.rounded);
  if (SM.unitIndex == 0) {
    return NUM;
  }

  const scale::ScaleUnit& UNIT = NUMBER_LADDER[SM.unitIndex];
  if (style == Style::CONCISE) {
    return NUM + UNIT.symbol;
  }
  return fmt::format("{} {}", NUM, UNIT.singular);
}

} // namespace

/* ----------------------------- HumanNumber ----------------------------- */

HumanNumber HumanNumber::from(double value) noexcept { return HumanNumber(value); }

scale::ScaledMagnitude HumanNumber::magnitude() const noexcept { return scaleCount(value_); }

std::string HumanNumber::concise() const { return render(value_, Style::CONCISE); }

std::string HumanNumber::full() const { return render(value_, Style::FULL); }

std::string HumanNumber::grouped() const {
  if (value_ == 0.0) {
    return "0";
  }
  // Shortest round-trip digits; integral values are forced to fixed notation
  if (isIntegral(value_) && std::fabs(value_) < GROUPED_FIXED_LIMIT) {
    return groupThousands(fmt::format("{:.0f}", value_));
  }
  return groupThousands(fmt::format("{}", value_));
}

} // namespace number

} // namespace legible
