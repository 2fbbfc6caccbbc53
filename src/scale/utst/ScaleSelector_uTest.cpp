/**
 * @file ScaleSelector_uTest.cpp
 * @brief Unit tests for legible::scale ladder selection.
 *
 * Notes:
 *  - Uses a small local ladder so thresholds and divisors can differ.
 *  - Production ladders are exercised through HumanNumber and HumanSize.
 */

#include "src/scale/inc/ScaleSelector.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <limits>
#include <span>

using legible::scale::ScaledMagnitude;
using legible::scale::scaleAndRound;
using legible::scale::ScaleUnit;
using legible::scale::selectScale;

namespace {

constexpr std::array<ScaleUnit, 4> TEST_LADDER{{
    {1.0, 1.0, "", "", ""},
    {1e3, 1e3, "K", "thousand", "thousand"},
    {1e6, 1e6, "M", "million", "million"},
    {1e9, 1e9, "B", "billion", "billion"},
}};

} // namespace

/* ----------------------------- selectScale Tests ----------------------------- */

/** @test Values below every threshold use the base unit. */
TEST(ScaleSelectorTest, BelowFirstThresholdUsesBase) {
  const ScaledMagnitude SM = selectScale(999.0, TEST_LADDER);
  EXPECT_EQ(SM.unitIndex, 0U);
  EXPECT_DOUBLE_EQ(SM.scaled, 999.0);
}

/** @test An exact threshold selects that unit. */
TEST(ScaleSelectorTest, ExactThresholdSelectsUnit) {
  EXPECT_EQ(selectScale(1e3, TEST_LADDER).unitIndex, 1U);
  EXPECT_EQ(selectScale(1e6, TEST_LADDER).unitIndex, 2U);
  EXPECT_EQ(selectScale(1e9, TEST_LADDER).unitIndex, 3U);
}

/** @test Values past the last threshold stay in the last unit. */
TEST(ScaleSelectorTest, AboveLastThresholdUsesLast) {
  const ScaledMagnitude SM = selectScale(5e12, TEST_LADDER);
  EXPECT_EQ(SM.unitIndex, 3U);
  EXPECT_DOUBLE_EQ(SM.scaled, 5000.0);
}

/** @test Zero uses the base unit. */
TEST(ScaleSelectorTest, ZeroUsesBase) {
  const ScaledMagnitude SM = selectScale(0.0, TEST_LADDER);
  EXPECT_EQ(SM.unitIndex, 0U);
  EXPECT_DOUBLE_EQ(SM.scaled, 0.0);
}

/** @test Negative values select by magnitude and keep their sign. */
TEST(ScaleSelectorTest, NegativeKeepsSign) {
  const ScaledMagnitude SM = selectScale(-2'500'000.0, TEST_LADDER);
  EXPECT_EQ(SM.unitIndex, 2U);
  EXPECT_DOUBLE_EQ(SM.scaled, -2.5);
  EXPECT_DOUBLE_EQ(SM.raw, -2'500'000.0);
}

/** @test scaled * divisor reproduces the raw value. */
TEST(ScaleSelectorTest, ScaledTimesDivisorIsRaw) {
  for (const double RAW : {0.0, 7.0, 1'234.0, 56'789'012.0, -3'000'000'000.0}) {
    const ScaledMagnitude SM = selectScale(RAW, TEST_LADDER);
    EXPECT_DOUBLE_EQ(SM.scaled * TEST_LADDER[SM.unitIndex].divisor, RAW) << "raw=" << RAW;
  }
}

/** @test NaN falls back to the base unit. */
TEST(ScaleSelectorTest, NanUsesBase) {
  const ScaledMagnitude SM = selectScale(std::numeric_limits<double>::quiet_NaN(), TEST_LADDER);
  EXPECT_EQ(SM.unitIndex, 0U);
  EXPECT_TRUE(std::isnan(SM.scaled));
}

/** @test An empty ladder leaves the value unscaled. */
TEST(ScaleSelectorTest, EmptyLadder) {
  const ScaledMagnitude SM = selectScale(42.0, std::span<const ScaleUnit>{});
  EXPECT_EQ(SM.unitIndex, 0U);
  EXPECT_DOUBLE_EQ(SM.scaled, 42.0);
}

/* ----------------------------- scaleAndRound Tests ----------------------------- */

/** @test Rounded value is half-away-from-zero at the requested digits. */
TEST(ScaleSelectorTest, RoundsScaledValue) {
  const ScaledMagnitude SM = scaleAndRound(1'250.0, TEST_LADDER, 1);
  EXPECT_EQ(SM.unitIndex, 1U);
  EXPECT_DOUBLE_EQ(SM.scaled, 1.25);
  EXPECT_DOUBLE_EQ(SM.rounded, 1.3);
}

/** @test Rounding up to the next threshold promotes the unit. */
TEST(ScaleSelectorTest, PromotesAcrossBoundary) {
  const ScaledMagnitude SM = scaleAndRound(999'999.0, TEST_LADDER, 1);
  EXPECT_EQ(SM.unitIndex, 2U);
  EXPECT_DOUBLE_EQ(SM.rounded, 1.0);
}

/** @test Promotion also applies from the base unit. */
TEST(ScaleSelectorTest, PromotesFromBase) {
  const ScaledMagnitude SM = scaleAndRound(999.96, TEST_LADDER, 1);
  EXPECT_EQ(SM.unitIndex, 1U);
  EXPECT_DOUBLE_EQ(SM.rounded, 1.0);
}

/** @test Promotion applies to negative values too. */
TEST(ScaleSelectorTest, PromotesNegative) {
  const ScaledMagnitude SM = scaleAndRound(-999'999.0, TEST_LADDER, 1);
  EXPECT_EQ(SM.unitIndex, 2U);
  EXPECT_DOUBLE_EQ(SM.rounded, -1.0);
}

/** @test Values just under a boundary that do not round up stay put. */
TEST(ScaleSelectorTest, NoPromotionBelowBoundary) {
  const ScaledMagnitude SM = scaleAndRound(999'940.0, TEST_LADDER, 1);
  EXPECT_EQ(SM.unitIndex, 1U);
  EXPECT_DOUBLE_EQ(SM.rounded, 999.9);
}

/** @test The last unit never promotes. */
TEST(ScaleSelectorTest, LastUnitDoesNotPromote) {
  const ScaledMagnitude SM = scaleAndRound(1e15, TEST_LADDER, 1);
  EXPECT_EQ(SM.unitIndex, 3U);
  EXPECT_DOUBLE_EQ(SM.rounded, 1e6);
}

/** @test Same input always yields the same result. */
TEST(ScaleSelectorTest, Deterministic) {
  EXPECT_EQ(scaleAndRound(123'456.0, TEST_LADDER, 1), scaleAndRound(123'456.0, TEST_LADDER, 1));
}
