/**
 * @file HumanDuration.cpp
 * @brief Implementation of relative time bucketing and rendering.
 */

#include "src/timing/inc/HumanDuration.hpp"
#include "src/helpers/inc/Format.hpp"

#include <array>

#include <fmt/core.h>

namespace legible {

namespace timing {

using legible::helpers::format::Style;
using legible::helpers::format::unitWord;

namespace {

/// Countable bucket with its unit length and spellings.
struct RelativeUnit {
  DurationBucket bucket;
  std::uint64_t seconds; ///< Unit length
  std::uint64_t limit;   ///< |delta| below this stays in the unit
  const char* abbr;
  const char* singular;
  const char* plural;
};

/// Buckets in ascending order. DAYS is reached only past the YESTERDAY/TOMORROW band.
constexpr std::array<RelativeUnit, 7> RELATIVE_UNITS{{
    {DurationBucket::SECONDS, 1, MINUTE_SECONDS, "s", "second", "seconds"},
    {DurationBucket::MINUTES, MINUTE_SECONDS, HOUR_SECONDS, "m", "minute", "minutes"},
    {DurationBucket::HOURS, HOUR_SECONDS, DAY_SECONDS, "h", "hour", "hours"},
    {DurationBucket::DAYS, DAY_SECONDS, WEEK_SECONDS, "d", "day", "days"},
    {DurationBucket::WEEKS, WEEK_SECONDS, MONTH_SECONDS, "w", "week", "weeks"},
    {DurationBucket::MONTHS, MONTH_SECONDS, YEAR_SECONDS, "mo", "month", "months"},
    {DurationBucket::YEARS, YEAR_SECONDS, 0, "y", "year", "years"},
}};

const RelativeUnit* findUnit(DurationBucket bucket) noexcept {
  for (const RelativeUnit& UNIT : RELATIVE_UNITS) {
    if (UNIT.bucket == bucket) {
      return &UNIT;
    }
  }
  return nullptr;
}

/// Gaps below this are measured in clock ticks without overflow on any common clock.
constexpr std::uint64_t EXACT_GAP_LIMIT_SECONDS = 200 * YEAR_SECONDS;

std::uint64_t absSeconds(std::int64_t delta) noexcept {
  // Negate in unsigned arithmetic so INT64_MIN does not overflow
  const auto BITS = static_cast<std::uint64_t>(delta);
  return (delta < 0) ? (0 - BITS) : BITS;
}

std::string render(const RelativeDelta& delta, Style style) {
  switch (delta.bucket) {
  case DurationBucket::NEVER:
    return NEVER_TEXT;
  case DurationBucket::JUST_NOW:
    return "just now";
  case DurationBucket::YESTERDAY:
    return "yesterday";
  case DurationBucket::TOMORROW:
    return "tomorrow";
  default:
    break;
  }

  const RelativeUnit* unit = findUnit(delta.bucket);
  if (unit == nullptr) {
    return NEVER_TEXT;
  }

  const char* DIRECTION = delta.future ? "from now" : "ago";
  if (style == Style::CONCISE) {
    return fmt::format("{}{} {}", delta.count, unit->abbr, DIRECTION);
  }

  return fmt::format("{} {} {}", delta.count, unitWord(delta.count, unit->singular, unit->plural),
                     DIRECTION);
}

} // namespace

/* ----------------------------- DurationBucket ----------------------------- */

const char* toString(DurationBucket bucket) noexcept {
  switch (bucket) {
  case DurationBucket::NEVER:
    return "NEVER";
  case DurationBucket::JUST_NOW:
    return "JUST_NOW";
  case DurationBucket::SECONDS:
    return "SECONDS";
  case DurationBucket::MINUTES:
    return "MINUTES";
  case DurationBucket::HOURS:
    return "HOURS";
  case DurationBucket::YESTERDAY:
    return "YESTERDAY";
  case DurationBucket::TOMORROW:
    return "TOMORROW";
  case DurationBucket::DAYS:
    return "DAYS";
  case DurationBucket::WEEKS:
    return "WEEKS";
  case DurationBucket::MONTHS:
    return "MONTHS";
  case DurationBucket::YEARS:
    return "YEARS";
  }
  return "UNKNOWN";
}

/* ----------------------------- Classification ----------------------------- */

RelativeDelta classifyDelta(std::int64_t deltaSeconds) noexcept {
  RelativeDelta out;
  out.future = deltaSeconds < 0;

  const std::uint64_t ABS = absSeconds(deltaSeconds);
  if (ABS < JUST_NOW_SECONDS) {
    out.bucket = DurationBucket::JUST_NOW;
    out.future = false;
    return out;
  }

  if (ABS >= DAY_SECONDS && ABS < 2 * DAY_SECONDS) {
    out.bucket = out.future ? DurationBucket::TOMORROW : DurationBucket::YESTERDAY;
    out.count = 1;
    return out;
  }

  for (const RelativeUnit& UNIT : RELATIVE_UNITS) {
    if (UNIT.limit == 0 || ABS < UNIT.limit) {
      out.bucket = UNIT.bucket;
      out.count = ABS / UNIT.seconds;
      return out;
    }
  }

  return out;
}

/* ----------------------------- HumanDuration ----------------------------- */

HumanDuration HumanDuration::from(std::optional<TimePoint> reference) noexcept {
  return HumanDuration(reference, Clock::now());
}

HumanDuration HumanDuration::between(std::optional<TimePoint> reference, TimePoint now) noexcept {
  return HumanDuration(reference, now);
}

std::int64_t HumanDuration::deltaSeconds() const noexcept {
  if (!reference_) {
    return 0;
  }
  // Coarse gap in whole seconds cannot overflow; the tick gap can for far-apart instants
  const auto NOW_S = std::chrono::floor<std::chrono::seconds>(now_);
  const auto REF_S = std::chrono::floor<std::chrono::seconds>(*reference_);
  const std::int64_t COARSE = static_cast<std::int64_t>(NOW_S.time_since_epoch().count()) -
                              static_cast<std::int64_t>(REF_S.time_since_epoch().count());
  if (absSeconds(COARSE) >= EXACT_GAP_LIMIT_SECONDS) {
    return COARSE;
  }

  // Truncate the real gap toward zero: 119.5 s is 119 s either way
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(now_ - *reference_).count());
}

RelativeDelta HumanDuration::classify() const noexcept {
  if (!reference_) {
    return RelativeDelta{};
  }
  return classifyDelta(deltaSeconds());
}

std::string HumanDuration::concise() const { return render(classify(), Style::CONCISE); }

std::string HumanDuration::full() const { return render(classify(), Style::FULL); }

} // namespace timing

} // namespace legible
