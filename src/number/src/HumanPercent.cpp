/**
 * @file HumanPercent.cpp
 * @brief Implementation of percentage rendering.
 */

#include "src/number/inc/HumanPercent.hpp"
#include "src/helpers/inc/Format.hpp"

#include <cmath>

namespace legible {

namespace number {

using legible::helpers::format::formatTrimmed;
using legible::helpers::format::MAX_DECIMAL_DIGITS;
using legible::helpers::format::roundHalfAway;

/* ----------------------------- HumanPercent ----------------------------- */

HumanPercent HumanPercent::from(double value, unsigned precision) noexcept {
  return HumanPercent(value, (precision > MAX_DECIMAL_DIGITS) ? MAX_DECIMAL_DIGITS : precision);
}

double HumanPercent::rounded() const noexcept { return roundHalfAway(value_, precision_); }

std::string HumanPercent::concise() const {
  const double ROUNDED = rounded();
  if (!std::isfinite(ROUNDED)) {
    return PERCENT_NON_FINITE_TEXT;
  }
  return formatTrimmed(ROUNDED, precision_) + "%";
}

std::string HumanPercent::full() const {
  const double ROUNDED = rounded();
  if (!std::isfinite(ROUNDED)) {
    return PERCENT_NON_FINITE_TEXT;
  }
  return formatTrimmed(ROUNDED, precision_) + " percent";
}

} // namespace number

} // namespace legible
