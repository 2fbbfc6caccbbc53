#ifndef LEGIBLE_SCALE_SCALE_SELECTOR_HPP
#define LEGIBLE_SCALE_SCALE_SELECTOR_HPP
/**
 * @file ScaleSelector.hpp
 * @brief Unit selection over a fixed magnitude ladder.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * A ladder is an ascending list of units, each with the threshold at which it
 * becomes the preferred unit and the divisor that scales a raw value into it:
 *  - Counts:        1, 1e3 (K), 1e6 (M), ...
 *  - Binary sizes:  1, 1024 (KiB), 1024^2 (MiB), ...
 *  - Decimal sizes: 1, 1000 (KB), 1000^2 (MB), ...
 */

#include <cstddef> // std::size_t
#include <span>    // std::span

namespace legible {

namespace scale {

/* ----------------------------- ScaleUnit ----------------------------- */

/**
 * @brief One rung of a unit ladder.
 */
struct ScaleUnit {
  double threshold;     ///< Smallest |magnitude| rendered in this unit
  double divisor;       ///< raw / divisor = scaled value
  const char* symbol;   ///< Concise suffix (e.g. "K", "MiB")
  const char* singular; ///< Full word for exactly one (e.g. "kibibyte")
  const char* plural;   ///< Full word otherwise (e.g. "kibibytes")
};

/* ----------------------------- ScaledMagnitude ----------------------------- */

/**
 * @brief A raw value expressed in a chosen ladder unit.
 *
 * Invariant: scaled == raw / ladder[unitIndex].divisor.
 */
struct ScaledMagnitude {
  double raw{0.0};         ///< Input value, sign preserved
  std::size_t unitIndex{0}; ///< Index of the chosen ladder entry
  double scaled{0.0};      ///< raw divided by the unit divisor
  double rounded{0.0};     ///< scaled rounded for display (scaleAndRound only)

  bool operator==(const ScaledMagnitude&) const noexcept = default;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Pick the largest unit whose threshold does not exceed |magnitude|.
 * @param magnitude Raw value (any sign; NaN selects the base unit).
 * @param ladder Units in ascending threshold order.
 * @return Chosen unit and scaled value; rounded == scaled.
 * @note RT-safe: No allocation.
 *
 * Values below every threshold (including zero and small negatives) use the
 * first entry. An empty ladder leaves the value unscaled at index 0.
 */
[[nodiscard]] ScaledMagnitude selectScale(double magnitude,
                                          std::span<const ScaleUnit> ladder) noexcept;

/**
 * @brief Select a unit, round for display, and promote across unit boundaries.
 * @param magnitude Raw value.
 * @param ladder Units in ascending threshold order.
 * @param digits Decimal digits kept by rounding (half away from zero).
 * @return Scaled magnitude whose rounded value never reaches the next unit.
 * @note RT-safe: No allocation.
 *
 * 999'999 with one digit rounds to 1000.0 K, which is promoted to 1.0 M.
 */
[[nodiscard]] ScaledMagnitude scaleAndRound(double magnitude, std::span<const ScaleUnit> ladder,
                                            unsigned digits) noexcept;

} // namespace scale

} // namespace legible

#endif // LEGIBLE_SCALE_SCALE_SELECTOR_HPP
