#ifndef LEGIBLE_TIMING_HUMAN_TIME_HPP
#define LEGIBLE_TIMING_HUMAN_TIME_HPP
/**
 * @file HumanTime.hpp
 * @brief Elapsed span rendering as hours/minutes/seconds ("1h 1m 1s").
 * @note Thread-safe: Immutable value type.
 *
 * Leading zero components are dropped, the rest are kept:
 *  - 3661 s -> "1h 1m 1s" / "1 hour 1 minute 1 second"
 *  - 3605 s -> "1h 0m 5s" / "1 hour 0 minutes 5 seconds"
 *  -   90 s -> "1m 30s"   / "1 minute 30 seconds"
 *  -    0 s -> "0s"       / "0 seconds"
 */

#include "src/helpers/inc/Status.hpp"

#include <chrono>      // std::chrono::duration
#include <cstdint>     // std::uint64_t, std::uint32_t
#include <string>      // std::string
#include <string_view> // std::string_view

#include <fmt/format.h>

namespace legible {

namespace timing {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::uint64_t SECONDS_PER_MINUTE = 60;
inline constexpr std::uint64_t SECONDS_PER_HOUR = 3600;

/// Exclusive upper bound for fromDuration(): 2^63 seconds.
inline constexpr double MAX_SPAN_SECONDS = 9223372036854775808.0;

/* ----------------------------- CompoundSpan ----------------------------- */

/**
 * @brief Whole-second span split into hours, minutes and seconds.
 *
 * Invariant: hours * 3600 + minutes * 60 + seconds == totalSeconds(),
 * with minutes and seconds in [0, 60).
 */
struct CompoundSpan {
  std::uint64_t hours{0};
  std::uint32_t minutes{0};
  std::uint32_t seconds{0};

  /// @brief Split a total. Exact integer division, no rounding.
  [[nodiscard]] static CompoundSpan decompose(std::uint64_t totalSeconds) noexcept;

  /// @brief Re-sum the components.
  [[nodiscard]] std::uint64_t totalSeconds() const noexcept;

  bool operator==(const CompoundSpan&) const noexcept = default;
};

/* ----------------------------- HumanTime ----------------------------- */

/**
 * @brief Immutable elapsed-span wrapper.
 */
class HumanTime {
public:
  HumanTime() noexcept = default;

  /// @brief Wrap a whole number of seconds.
  [[nodiscard]] static HumanTime from(std::uint64_t seconds) noexcept;

  /**
   * @brief Wrap a chrono duration, rejecting negative spans.
   * @param span Elapsed time; sub-second precision is truncated.
   * @param out Receives the wrapper on success; untouched on failure.
   * @return Status::OK, or Status::INVALID_INPUT if span is negative, NaN,
   *         or at least MAX_SPAN_SECONDS long.
   * @note RT-safe: No allocation.
   */
  template <class Rep, class Period>
  [[nodiscard]] static Status fromDuration(std::chrono::duration<Rep, Period> span,
                                           HumanTime& out) noexcept {
    // Range-check in floating point; NaN fails the first comparison
    const double SECS = std::chrono::duration<double>(span).count();
    if (!(SECS >= 0.0) || SECS >= MAX_SPAN_SECONDS) {
      return Status::INVALID_INPUT;
    }
    const auto WHOLE = std::chrono::duration_cast<std::chrono::seconds>(span);
    out = HumanTime(static_cast<std::uint64_t>(WHOLE.count()));
    return Status::OK;
  }

  [[nodiscard]] std::uint64_t seconds() const noexcept { return seconds_; }

  /// @brief Hours/minutes/seconds decomposition.
  [[nodiscard]] CompoundSpan span() const noexcept { return CompoundSpan::decompose(seconds_); }

  /// @brief "1h 1m 1s", "5m 3s", "0s".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string concise() const;

  /// @brief "1 hour 1 minute 1 second".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string full() const;

  /// @brief Same as full().
  [[nodiscard]] std::string toString() const { return full(); }

  bool operator==(const HumanTime&) const noexcept = default;

private:
  explicit HumanTime(std::uint64_t seconds) noexcept : seconds_(seconds) {}

  std::uint64_t seconds_{0};
};

} // namespace timing

} // namespace legible

/// Formats as the full form.
template <>
struct fmt::formatter<legible::timing::HumanTime> : fmt::formatter<std::string_view> {
  auto format(const legible::timing::HumanTime& time, fmt::format_context& ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(time.full(), ctx);
  }
};

#endif // LEGIBLE_TIMING_HUMAN_TIME_HPP
