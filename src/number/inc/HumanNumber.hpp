#ifndef LEGIBLE_NUMBER_HUMAN_NUMBER_HPP
#define LEGIBLE_NUMBER_HUMAN_NUMBER_HPP
/**
 * @file HumanNumber.hpp
 * @brief Short-scale rendering of large counts (1.2K, 2.5 billion).
 * @note Thread-safe: Immutable value type.
 *
 * Values are scaled by powers of 1000 and rounded to one decimal digit
 * (half away from zero). Exact results drop the decimal ("1K"), inexact ones
 * keep it ("1.2K"). Values below 1000 carry no unit and round to a whole
 * count ("12" for 12.34). grouped() prints the unscaled value with thousands
 * separators instead ("1,234,567.5").
 */

#include "src/scale/inc/ScaleSelector.hpp"

#include <array>       // std::array
#include <string>      // std::string
#include <string_view> // std::string_view

#include <fmt/format.h>

namespace legible {

namespace number {

/* ----------------------------- Constants ----------------------------- */

/// Short-scale ladder. Count words have no plural form.
inline constexpr std::array<scale::ScaleUnit, 7> NUMBER_LADDER{{
    {1.0, 1.0, "", "", ""},
    {1e3, 1e3, "K", "thousand", "thousand"},
    {1e6, 1e6, "M", "million", "million"},
    {1e9, 1e9, "B", "billion", "billion"},
    {1e12, 1e12, "T", "trillion", "trillion"},
    {1e15, 1e15, "Q", "quadrillion", "quadrillion"},
    {1e18, 1e18, "Qi", "quintillion", "quintillion"},
}};

/// Decimal digits kept after scaling.
inline constexpr unsigned NUMBER_DECIMAL_DIGITS = 1;

/// grouped() prints integral values below this in full; larger ones use fmt's shortest form.
inline constexpr double GROUPED_FIXED_LIMIT = 1e21;

/* ----------------------------- HumanNumber ----------------------------- */

/**
 * @brief Immutable count wrapper with concise and full renderings.
 */
class HumanNumber {
public:
  HumanNumber() noexcept = default;

  /// @brief Wrap a count. Any real value is accepted; sign is preserved.
  [[nodiscard]] static HumanNumber from(double value) noexcept;

  /// @brief Wrapped raw value.
  [[nodiscard]] double value() const noexcept { return value_; }

  /// @brief Unit chosen for this value after rounding.
  [[nodiscard]] scale::ScaledMagnitude magnitude() const noexcept;

  /// @brief Symbol form, e.g. "1.2K", "-3M", "999".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string concise() const;

  /// @brief Word form, e.g. "1.2 thousand", "1 million", "999".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string full() const;

  /// @brief Unscaled value with comma thousands separators, e.g. "1,234,567.5".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string grouped() const;

  /// @brief Same as full().
  [[nodiscard]] std::string toString() const { return full(); }

  bool operator==(const HumanNumber&) const noexcept = default;

private:
  explicit HumanNumber(double value) noexcept : value_(value) {}

  double value_{0.0};
};

} // namespace number

} // namespace legible

/// Formats as the full form.
template <>
struct fmt::formatter<legible::number::HumanNumber> : fmt::formatter<std::string_view> {
  auto format(const legible::number::HumanNumber& number, fmt::format_context& ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(number.full(), ctx);
  }
};

#endif // LEGIBLE_NUMBER_HUMAN_NUMBER_HPP
