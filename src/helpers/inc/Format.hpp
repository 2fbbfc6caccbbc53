#ifndef LEGIBLE_HELPERS_FORMAT_HPP
#define LEGIBLE_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Rounding and decimal rendering shared by all legible formatters.
 *
 * Every formatter rounds half-away-from-zero and renders through fmt, so the
 * same scaled value prints identically whichever quantity it came from.
 *
 * @note NOT RT-SAFE: String-returning functions allocate.
 *       Rounding helpers are noexcept and allocation-free.
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace legible {
namespace helpers {
namespace format {

/* ----------------------------- Constants ----------------------------- */

/// Largest number of decimal digits any formatter rounds to.
inline constexpr unsigned MAX_DECIMAL_DIGITS = 15;

/// Doubles at or above this magnitude have no fractional part.
inline constexpr double INTEGRAL_LIMIT = 4503599627370496.0; // 2^52

/* ----------------------------- Style ----------------------------- */

/**
 * @brief Output style shared by all formatters.
 */
enum class Style : std::uint8_t {
  CONCISE = 0, ///< Symbol-based ("1.2K", "5 MiB")
  FULL = 1,    ///< Word-based ("1.2 thousand", "5 mebibytes")
};

/* ----------------------------- Rounding ----------------------------- */

/**
 * @brief Round to a fixed number of decimal digits, half away from zero.
 * @param value Value to round.
 * @param digits Decimal digits to keep (clamped to MAX_DECIMAL_DIGITS).
 * @return Rounded value; non-finite input is returned unchanged.
 * @note RT-SAFE: No allocation.
 */
[[nodiscard]] inline double roundHalfAway(double value, unsigned digits) noexcept {
  if (!std::isfinite(value)) {
    return value;
  }
  if (digits > MAX_DECIMAL_DIGITS) {
    digits = MAX_DECIMAL_DIGITS;
  }

  double scale = 1.0;
  for (unsigned i = 0; i < digits; ++i) {
    scale *= 10.0;
  }

  const double SCALED = value * scale;
  if (std::fabs(SCALED) >= INTEGRAL_LIMIT) {
    return value;
  }
  return std::round(SCALED) / scale;
}

/**
 * @brief Check whether a value has no fractional part.
 * @note RT-SAFE: No allocation.
 */
[[nodiscard]] inline bool isIntegral(double value) noexcept {
  return std::isfinite(value) && std::trunc(value) == value;
}

/* ----------------------------- Rendering ----------------------------- */

/**
 * @brief Render a value already rounded to one decimal digit.
 * @param rounded Value produced by roundHalfAway(x, 1).
 * @return "5" for integral values, "1.2" otherwise.
 * @note NOT RT-SAFE: Returns std::string.
 *
 * Negative zero renders as "0".
 */
[[nodiscard]] inline std::string formatScaled(double rounded) {
  if (rounded == 0.0) {
    return "0";
  }
  if (isIntegral(rounded)) {
    return fmt::format("{:.0f}", rounded);
  }
  return fmt::format("{:.1f}", rounded);
}

/**
 * @brief Render with at most @p digits digits after the decimal point.
 * @param value Value to render (normally pre-rounded).
 * @param digits Digits after the point; trailing zeros and a bare point are dropped.
 * @return "12.35", "12.3", "50" for 50.0.
 * @note NOT RT-SAFE: Returns std::string.
 *
 * Negative zero renders as "0".
 */
[[nodiscard]] inline std::string formatTrimmed(double value, unsigned digits) {
  if (digits > MAX_DECIMAL_DIGITS) {
    digits = MAX_DECIMAL_DIGITS;
  }
  if (value == 0.0) {
    return "0";
  }
  if (isIntegral(value) || !std::isfinite(value)) {
    return fmt::format("{:.0f}", value);
  }

  std::string out = fmt::format("{:.{}f}", value, digits);
  if (out.find('.') != std::string::npos) {
    const std::size_t LAST = out.find_last_not_of('0');
    out.erase((out[LAST] == '.') ? LAST : LAST + 1);
  }
  if (out == "-0") {
    return "0";
  }
  return out;
}

/**
 * @brief Group the integer digits of a plain decimal string by thousands.
 * @param number Output of fmt such as "-1234567.5"; exponent forms pass through.
 * @return "-1,234,567.5".
 * @note NOT RT-SAFE: Returns std::string.
 */
[[nodiscard]] inline std::string groupThousands(const std::string& number) {
  const std::size_t BEGIN = (!number.empty() && number[0] == '-') ? 1 : 0;
  std::size_t end = number.find('.');
  if (end == std::string::npos) {
    end = number.size();
  }
  for (std::size_t i = BEGIN; i < end; ++i) {
    if (number[i] < '0' || number[i] > '9') {
      return number;
    }
  }

  std::string out = number.substr(0, BEGIN);
  for (std::size_t i = BEGIN; i < end; ++i) {
    if (i != BEGIN && (end - i) % 3 == 0) {
      out.push_back(',');
    }
    out.push_back(number[i]);
  }
  out.append(number, end, std::string::npos);
  return out;
}

/**
 * @brief Pick the singular or plural form of a unit word.
 * @param singular Word used when @p count is exactly one.
 * @param plural Word used otherwise.
 * @note RT-SAFE: Returns one of the static arguments.
 */
[[nodiscard]] inline const char* unitWord(std::uint64_t count, const char* singular,
                                          const char* plural) noexcept {
  return (count == 1) ? singular : plural;
}

} // namespace format
} // namespace helpers
} // namespace legible

#endif // LEGIBLE_HELPERS_FORMAT_HPP
