/**
 * @file HumanPermissions_uTest.cpp
 * @brief Unit tests for legible::system::HumanPermissions.
 *
 * Notes:
 *  - Renderer tests use a fake classifier so they do not depend on any
 *    mode encoding.
 *  - toString() follows LEGIBLE_PERMISSIONS_DESCRIPTIVE; the test checks
 *    whichever style the build selected.
 */

#include "src/system/inc/HumanPermissions.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include <fmt/format.h>

using legible::system::AccessTriplet;
using legible::system::DEFAULT_PERMISSION_STYLE;
using legible::system::FileType;
using legible::system::HumanPermissions;
using legible::system::MODE_DIRECTORY;
using legible::system::MODE_REGULAR;
using legible::system::ModeClassifier;
using legible::system::PermissionBits;
using legible::system::PermissionStyle;
using legible::system::renderDescriptive;
using legible::system::renderSymbolic;
using legible::system::SYMBOLIC_LENGTH;

namespace {

/// Returns fixed bits regardless of the mode and counts calls.
class FakeClassifier final : public ModeClassifier {
public:
  explicit FakeClassifier(const PermissionBits& bits) : bits_(bits) {}

  PermissionBits classify(std::uint32_t mode) const noexcept override {
    lastMode = mode;
    ++calls;
    return bits_;
  }

  mutable std::uint32_t lastMode{0};
  mutable int calls{0};

private:
  PermissionBits bits_;
};

PermissionBits makeBits(FileType type, AccessTriplet owner, AccessTriplet group,
                        AccessTriplet other) {
  PermissionBits b;
  b.fileType = type;
  b.owner = owner;
  b.group = group;
  b.other = other;
  return b;
}

constexpr AccessTriplet RWX{true, true, true};
constexpr AccessTriplet RW{true, true, false};
constexpr AccessTriplet RX{true, false, true};
constexpr AccessTriplet RO{true, false, false};
constexpr AccessTriplet NO{false, false, false};

} // namespace

/* ----------------------------- Symbolic Tests ----------------------------- */

/** @test Directory 0755. */
TEST(HumanPermissionsTest, SymbolicDirectory) {
  EXPECT_EQ(renderSymbolic(makeBits(FileType::DIRECTORY, RWX, RX, RX)), "drwxr-xr-x");
}

/** @test Regular file 0644 and symlink 0777. */
TEST(HumanPermissionsTest, SymbolicRegularAndLink) {
  EXPECT_EQ(renderSymbolic(makeBits(FileType::REGULAR, RW, RO, RO)), "-rw-r--r--");
  EXPECT_EQ(renderSymbolic(makeBits(FileType::SYMLINK, RWX, RWX, RWX)), "lrwxrwxrwx");
}

/** @test No bits at all. */
TEST(HumanPermissionsTest, SymbolicEmpty) {
  const std::string OUT = renderSymbolic(makeBits(FileType::UNKNOWN, NO, NO, NO));
  EXPECT_EQ(OUT, "?---------");
  EXPECT_EQ(OUT.size(), SYMBOLIC_LENGTH);
}

/** @test setuid/setgid show s or S, sticky shows t or T. */
TEST(HumanPermissionsTest, SymbolicSpecialBits) {
  PermissionBits b = makeBits(FileType::REGULAR, RWX, RX, RX);
  b.setuid = true;
  b.setgid = true;
  EXPECT_EQ(renderSymbolic(b), "-rwsr-sr-x");

  PermissionBits noExec = makeBits(FileType::REGULAR, RW, RO, RO);
  noExec.setuid = true;
  noExec.setgid = true;
  EXPECT_EQ(renderSymbolic(noExec), "-rwSr-Sr--");

  PermissionBits tmp = makeBits(FileType::DIRECTORY, RWX, RWX, RWX);
  tmp.sticky = true;
  EXPECT_EQ(renderSymbolic(tmp), "drwxrwxrwt");

  tmp.other = RW;
  EXPECT_EQ(renderSymbolic(tmp), "drwxrwxrwT");
}

/* ----------------------------- Descriptive Tests ----------------------------- */

/** @test Each principal lists its set bits. */
TEST(HumanPermissionsTest, DescriptiveListing) {
  EXPECT_EQ(renderDescriptive(makeBits(FileType::DIRECTORY, RWX, RX, RX)),
            "User: Read, Write, Execute; Group: Read, Execute; Other: Read, Execute");
}

/** @test A principal with no bits lists None. */
TEST(HumanPermissionsTest, DescriptiveNone) {
  EXPECT_EQ(renderDescriptive(makeBits(FileType::REGULAR, RW, RO, NO)),
            "User: Read, Write; Group: Read; Other: None");
  EXPECT_EQ(renderDescriptive(makeBits(FileType::REGULAR, NO, NO, NO)),
            "User: None; Group: None; Other: None");
}

/** @test Single write bit has no stray separators. */
TEST(HumanPermissionsTest, DescriptiveSingleBit) {
  const AccessTriplet W{false, true, false};
  EXPECT_EQ(renderDescriptive(makeBits(FileType::REGULAR, W, NO, W)),
            "User: Write; Group: None; Other: Write");
}

/* ----------------------------- HumanPermissions Tests ----------------------------- */

/** @test from() delegates classification to the injected classifier. */
TEST(HumanPermissionsTest, UsesInjectedClassifier) {
  const FakeClassifier FAKE(makeBits(FileType::DIRECTORY, RWX, RX, NO));
  const HumanPermissions P = HumanPermissions::from(0123, FAKE);

  EXPECT_EQ(FAKE.calls, 1);
  EXPECT_EQ(FAKE.lastMode, 0123U);
  EXPECT_EQ(P.mode(), 0123U);
  EXPECT_EQ(P.symbolic(), "drwxr-x---");
  EXPECT_EQ(P.descriptive(), "User: Read, Write, Execute; Group: Read, Execute; Other: None");
}

/** @test Default POSIX classifier end to end. */
TEST(HumanPermissionsTest, DefaultClassifierEndToEnd) {
  const HumanPermissions P = HumanPermissions::from(MODE_DIRECTORY | 0755U);
  EXPECT_EQ(P.symbolic(), "drwxr-xr-x");
  EXPECT_EQ(P.bits().fileType, FileType::DIRECTORY);

  EXPECT_EQ(HumanPermissions::from(MODE_REGULAR | 0644U).symbolic(),
            "-rw-r--r--");
}

/** @test toString() uses the build-selected style. */
TEST(HumanPermissionsTest, ToStringFollowsBuildStyle) {
  const HumanPermissions P = HumanPermissions::from(MODE_DIRECTORY | 0755U);
  if (DEFAULT_PERMISSION_STYLE == PermissionStyle::DESCRIPTIVE) {
    EXPECT_EQ(P.toString(), P.descriptive());
  } else {
    EXPECT_EQ(P.toString(), "drwxr-xr-x");
  }
  EXPECT_EQ(fmt::format("{}", P), P.toString());
}

/** @test Explicit style selection. */
TEST(HumanPermissionsTest, RenderByStyle) {
  const PermissionBits B = makeBits(FileType::REGULAR, RW, RO, RO);
  EXPECT_EQ(legible::system::render(B, PermissionStyle::SYMBOLIC), "-rw-r--r--");
  EXPECT_EQ(legible::system::render(B, PermissionStyle::DESCRIPTIVE),
            "User: Read, Write; Group: Read; Other: Read");
  EXPECT_STREQ(legible::system::toString(PermissionStyle::SYMBOLIC), "SYMBOLIC");
}

/** @test Rendering the same value twice gives identical text. */
TEST(HumanPermissionsTest, Idempotent) {
  const HumanPermissions P = HumanPermissions::from(MODE_REGULAR | 0600U);
  EXPECT_EQ(P.symbolic(), P.symbolic());
  EXPECT_EQ(P.descriptive(), P.descriptive());
}
