/**
 * @file HumanSize.cpp
 * @brief Implementation of byte count rendering.
 */

#include "src/storage/inc/HumanSize.hpp"
#include "src/helpers/inc/Format.hpp"

#include <fmt/core.h>

namespace legible {

namespace storage {

using legible::helpers::format::formatScaled;
using legible::helpers::format::Style;

namespace {

std::string render(std::uint64_t bytes, SizeUnitSystem system, Style style) {
  const std::span<const scale::ScaleUnit> LADDER = sizeLadder(system);
  const scale::ScaledMagnitude SM =
      scale::scaleAndRound(static_cast<double>(bytes), LADDER, SIZE_DECIMAL_DIGITS);

  // Base unit is exact; avoid a round trip through double for large counts
  const std::string NUM =
      (SM.unitIndex == 0) ? fmt::format("{}", bytes) : formatScaled(SM.rounded);
  const scale::ScaleUnit& UNIT = LADDER[SM.unitIndex];

  if (style == Style::CONCISE) {
    return fmt::format("{} {}", NUM, UNIT.symbol);
  }
  return fmt::format("{} {}", NUM, (NUM == "1") ? UNIT.singular : UNIT.plural);
}

} // namespace

/* ----------------------------- SizeUnitSystem ----------------------------- */

const char* toString(SizeUnitSystem system) noexcept {
  switch (system) {
  case SizeUnitSystem::BINARY:
    return "binary";
  case SizeUnitSystem::DECIMAL:
    return "decimal";
  }
  return "unknown";
}

std::span<const scale::ScaleUnit> sizeLadder(SizeUnitSystem system) noexcept {
  if (system == SizeUnitSystem::DECIMAL) {
    return DECIMAL_SIZE_LADDER;
  }
  return BINARY_SIZE_LADDER;
}

/* ----------------------------- HumanSize ----------------------------- */

HumanSize HumanSize::from(std::uint64_t bytes, SizeUnitSystem system) noexcept {
  return HumanSize(bytes, system);
}

Status HumanSize::fromSigned(std::int64_t bytes, HumanSize& out, SizeUnitSystem system) noexcept {
  if (bytes < 0) {
    return Status::INVALID_INPUT;
  }
  out = HumanSize(static_cast<std::uint64_t>(bytes), system);
  return Status::OK;
}

scale::ScaledMagnitude HumanSize::magnitude() const noexcept {
  return scale::scaleAndRound(static_cast<double>(bytes_), sizeLadder(system_),
                              SIZE_DECIMAL_DIGITS);
}

std::string HumanSize::concise() const { return render(bytes_, system_, Style::CONCISE); }

std::string HumanSize::full() const { return render(bytes_, system_, Style::FULL); }

} // namespace storage

} // namespace legible
