#ifndef LEGIBLE_NUMBER_HUMAN_PERCENT_HPP
#define LEGIBLE_NUMBER_HUMAN_PERCENT_HPP
/**
 * @file HumanPercent.hpp
 * @brief Percentage rendering ("12.3%", "12.3 percent").
 * @note Thread-safe: Immutable value type.
 *
 * The value is taken as already expressed in percent (12.3 means 12.3%) and
 * rounded to the requested precision; trailing zeros are not printed
 * (50.00 renders "50%"). No bounds check: values above 100 or below 0 render
 * as given. NaN and infinities render "-".
 */

#include <string>      // std::string
#include <string_view> // std::string_view

#include <fmt/format.h>

namespace legible {

namespace number {

/// Rendered in both styles when the rounded value is NaN or infinite.
inline constexpr const char* PERCENT_NON_FINITE_TEXT = "-";

/* ----------------------------- HumanPercent ----------------------------- */

/**
 * @brief Immutable percentage wrapper rounded to a maximum number of decimals.
 */
class HumanPercent {
public:
  HumanPercent() noexcept = default;

  /**
   * @brief Wrap a percentage.
   * @param value Percentage value (not a ratio).
   * @param precision Decimal digits to keep; clamped to MAX_DECIMAL_DIGITS.
   */
  [[nodiscard]] static HumanPercent from(double value, unsigned precision) noexcept;

  [[nodiscard]] double value() const noexcept { return value_; }
  [[nodiscard]] unsigned precision() const noexcept { return precision_; }

  /// @brief Value rounded half away from zero to precision() digits.
  [[nodiscard]] double rounded() const noexcept;

  /// @brief "12.3%".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string concise() const;

  /// @brief "12.3 percent".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string full() const;

  /// @brief Same as full().
  [[nodiscard]] std::string toString() const { return full(); }

  bool operator==(const HumanPercent&) const noexcept = default;

private:
  HumanPercent(double value, unsigned precision) noexcept
      : value_(value), precision_(precision) {}

  double value_{0.0};
  unsigned precision_{0};
};

} // namespace number

} // namespace legible

/// Formats as the full form.
template <>
struct fmt::formatter<legible::number::HumanPercent> : fmt::formatter<std::string_view> {
  auto format(const legible::number::HumanPercent& percent, fmt::format_context& ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(percent.full(), ctx);
  }
};

#endif // LEGIBLE_NUMBER_HUMAN_PERCENT_HPP
