/**
 * @file HumanPermissions.cpp
 * @brief Symbolic and descriptive file mode rendering.
 */

#include "src/system/inc/HumanPermissions.hpp"

#include <array>

namespace legible {

namespace system {

namespace {

/// One principal's bits plus the special bit sharing its execute slot.
struct Principal {
  const char* label;
  AccessTriplet access;
  bool special;
  char specialTag; ///< 's' for setuid/setgid, 't' for sticky
};

std::array<Principal, 3> principals(const PermissionBits& bits) noexcept {
  return {{
      {"User", bits.owner, bits.setuid, 's'},
      {"Group", bits.group, bits.setgid, 's'},
      {"Other", bits.other, bits.sticky, 't'},
  }};
}

char executeSlot(const Principal& p) noexcept {
  if (p.special) {
    // Uppercase marks a special bit without the underlying execute bit
    return p.access.execute ? p.specialTag : static_cast<char>(p.specialTag - ('a' - 'A'));
  }
  return p.access.execute ? 'x' : '-';
}

} // namespace

/* ----------------------------- PermissionStyle ----------------------------- */

const char* toString(PermissionStyle style) noexcept {
  switch (style) {
  case PermissionStyle::SYMBOLIC:
    return "SYMBOLIC";
  case PermissionStyle::DESCRIPTIVE:
    return "DESCRIPTIVE";
  }
  return "UNKNOWN";
}

/* ----------------------------- Renderers ----------------------------- */

std::string renderSymbolic(const PermissionBits& bits) {
  std::string out;
  out.reserve(SYMBOLIC_LENGTH);
  out.push_back(typeTag(bits.fileType));

  for (const Principal& P : principals(bits)) {
    out.push_back(P.access.read ? 'r' : '-');
    out.push_back(P.access.write ? 'w' : '-');
    out.push_back(executeSlot(P));
  }
  return out;
}

std::string renderDescriptive(const PermissionBits& bits) {
  std::string out;
  out.reserve(96);

  bool firstPrincipal = true;
  for (const Principal& P : principals(bits)) {
    if (!firstPrincipal) {
      out += "; ";
    }
    firstPrincipal = false;

    out += P.label;
    out += ": ";
    if (P.access.none()) {
      out += "None";
      continue;
    }

    bool first = true;
    const auto APPEND = [&out, &first](const char* name) {
      if (!first) {
        out += ", ";
      }
      out += name;
      first = false;
    };
    if (P.access.read) {
      APPEND("Read");
    }
    if (P.access.write) {
      APPEND("Write");
    }
    if (P.access.execute) {
      APPEND("Execute");
    }
  }
  return out;
}

std::string render(const PermissionBits& bits, PermissionStyle style) {
  if (style == PermissionStyle::DESCRIPTIVE) {
    return renderDescriptive(bits);
  }
  return renderSymbolic(bits);
}

/* ----------------------------- HumanPermissions ----------------------------- */

HumanPermissions HumanPermissions::from(std::uint32_t mode) noexcept {
  return from(mode, defaultModeClassifier());
}

HumanPermissions HumanPermissions::from(std::uint32_t mode,
                                        const ModeClassifier& classifier) noexcept {
  return HumanPermissions(mode, classifier.classify(mode));
}

} // namespace system

} // namespace legible
