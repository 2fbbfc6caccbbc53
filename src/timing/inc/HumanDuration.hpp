#ifndef LEGIBLE_TIMING_HUMAN_DURATION_HPP
#define LEGIBLE_TIMING_HUMAN_DURATION_HPP
/**
 * @file HumanDuration.hpp
 * @brief Relative time rendering ("2m ago", "3h from now", "yesterday").
 * @note Thread-safe: Immutable value type.
 *
 * The reference instant is compared against "now", captured once when the
 * wrapper is built, so rendering the same wrapper twice gives the same text.
 * The elapsed time is bucketed into the coarsest whole unit (floor):
 *
 *   |delta| < 10 s            just now
 *   |delta| < 60 s            seconds
 *   |delta| < 1 h             minutes
 *   |delta| < 1 day           hours
 *   1 day <= |delta| < 2 days yesterday / tomorrow
 *   |delta| < 7 days          days
 *   |delta| < 1 month         weeks   (month = 30.436875 days)
 *   |delta| < 1 year          months  (year = 365.2425 days)
 *   otherwise                 years
 *
 * A missing reference renders the sentinel "-".
 */

#include <chrono>      // std::chrono::system_clock
#include <cstdint>     // std::int64_t, std::uint64_t
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

#include <fmt/format.h>

namespace legible {

namespace timing {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::uint64_t JUST_NOW_SECONDS = 10;
inline constexpr std::uint64_t MINUTE_SECONDS = 60;
inline constexpr std::uint64_t HOUR_SECONDS = 3'600;
inline constexpr std::uint64_t DAY_SECONDS = 86'400;
inline constexpr std::uint64_t WEEK_SECONDS = 604'800;
inline constexpr std::uint64_t MONTH_SECONDS = 2'629'746; ///< Mean Gregorian month
inline constexpr std::uint64_t YEAR_SECONDS = 31'556'952; ///< Mean Gregorian year

/// Text rendered when there is no reference instant.
inline constexpr const char* NEVER_TEXT = "-";

/* ----------------------------- DurationBucket ----------------------------- */

/**
 * @brief Classification of a time delta.
 */
enum class DurationBucket : std::uint8_t {
  NEVER = 0, ///< No reference instant
  JUST_NOW,
  SECONDS,
  MINUTES,
  HOURS,
  YESTERDAY, ///< One whole day in the past
  TOMORROW,  ///< One whole day in the future
  DAYS,
  WEEKS,
  MONTHS,
  YEARS,
};

/**
 * @brief Bucket name (e.g. "MINUTES").
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(DurationBucket bucket) noexcept;

/* ----------------------------- RelativeDelta ----------------------------- */

/**
 * @brief A bucketed delta: which unit, how many, and which direction.
 */
struct RelativeDelta {
  DurationBucket bucket{DurationBucket::NEVER};
  std::uint64_t count{0}; ///< Whole units (floor); 1 for YESTERDAY/TOMORROW
  bool future{false};     ///< Reference lies after "now"

  bool operator==(const RelativeDelta&) const noexcept = default;
};

/**
 * @brief Bucket a signed delta.
 * @param deltaSeconds now - reference; positive means the reference is past.
 * @note RT-safe: No allocation.
 */
[[nodiscard]] RelativeDelta classifyDelta(std::int64_t deltaSeconds) noexcept;

/* ----------------------------- HumanDuration ----------------------------- */

/**
 * @brief Immutable "time since / until" wrapper.
 */
class HumanDuration {
public:
  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;

  HumanDuration() noexcept = default;

  /// @brief Compare @p reference against the current wall clock.
  [[nodiscard]] static HumanDuration from(std::optional<TimePoint> reference) noexcept;

  /// @brief Compare @p reference against an explicit "now".
  [[nodiscard]] static HumanDuration between(std::optional<TimePoint> reference,
                                             TimePoint now) noexcept;

  [[nodiscard]] const std::optional<TimePoint>& reference() const noexcept { return reference_; }
  [[nodiscard]] TimePoint now() const noexcept { return now_; }

  /// @brief Signed whole seconds (now - reference); 0 without a reference.
  [[nodiscard]] std::int64_t deltaSeconds() const noexcept;

  /// @brief Bucketed delta.
  [[nodiscard]] RelativeDelta classify() const noexcept;

  /// @brief "1m ago", "3h from now", "yesterday", "just now", "-".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string concise() const;

  /// @brief "1 minute ago", "3 hours from now", "yesterday".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string full() const;

  /// @brief Same as full().
  [[nodiscard]] std::string toString() const { return full(); }

  bool operator==(const HumanDuration&) const noexcept = default;

private:
  HumanDuration(std::optional<TimePoint> reference, TimePoint now) noexcept
      : reference_(reference), now_(now) {}

  std::optional<TimePoint> reference_{};
  TimePoint now_{};
};

} // namespace timing

} // namespace legible

/// Formats as the full form.
template <>
struct fmt::formatter<legible::timing::HumanDuration> : fmt::formatter<std::string_view> {
  auto format(const legible::timing::HumanDuration& duration, fmt::format_context& ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(duration.full(), ctx);
  }
};

#endif // LEGIBLE_TIMING_HUMAN_DURATION_HPP
