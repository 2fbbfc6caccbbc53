/**
 * @file HumanTime.cpp
 * @brief Implementation of hours/minutes/seconds span rendering.
 */

#include "src/timing/inc/HumanTime.hpp"
#include "src/helpers/inc/Format.hpp"

#include <fmt/core.h>

namespace legible {

namespace timing {

using legible::helpers::format::unitWord;

/* ----------------------------- CompoundSpan ----------------------------- */

CompoundSpan CompoundSpan::decompose(std::uint64_t totalSeconds) noexcept {
  CompoundSpan span;
  span.hours = totalSeconds / SECONDS_PER_HOUR;
  span.minutes =
      static_cast<std::uint32_t>((totalSeconds % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE);
  span.seconds = static_cast<std::uint32_t>(totalSeconds % SECONDS_PER_MINUTE);
  return span;
}

std::uint64_t CompoundSpan::totalSeconds() const noexcept {
  return hours * SECONDS_PER_HOUR + static_cast<std::uint64_t>(minutes) * SECONDS_PER_MINUTE +
         seconds;
}

/* ----------------------------- HumanTime ----------------------------- */

HumanTime HumanTime::from(std::uint64_t seconds) noexcept { return HumanTime(seconds); }

std::string HumanTime::concise() const {
  const CompoundSpan S = span();
  if (S.hours > 0) {
    return fmt::format("{}h {}m {}s", S.hours, S.minutes, S.seconds);
  }
  if (S.minutes > 0) {
    return fmt::format("{}m {}s", S.minutes, S.seconds);
  }
  return fmt::format("{}s", S.seconds);
}

std::string HumanTime::full() const {
  const CompoundSpan S = span();
  const std::string SECS =
      fmt::format("{} {}", S.seconds, unitWord(S.seconds, "second", "seconds"));
  const std::string MINS =
      fmt::format("{} {}", S.minutes, unitWord(S.minutes, "minute", "minutes"));

  if (S.hours > 0) {
    return fmt::format("{} {} {} {}", S.hours, unitWord(S.hours, "hour", "hours"), MINS, SECS);
  }
  if (S.minutes > 0) {
    return fmt::format("{} {}", MINS, SECS);
  }
  return SECS;
}

} // namespace timing

} // namespace legible
