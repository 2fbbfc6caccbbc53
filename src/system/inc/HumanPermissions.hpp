#ifndef LEGIBLE_SYSTEM_HUMAN_PERMISSIONS_HPP
#define LEGIBLE_SYSTEM_HUMAN_PERMISSIONS_HPP
/**
 * @file HumanPermissions.hpp
 * @brief File mode rendering ("drwxr-xr-x" or "User: Read, Write; ...").
 * @note Thread-safe: Immutable value type.
 *
 * Two renderings of the same classified bits:
 *  - Symbolic (ls -l):  "drwxr-xr-x", setuid/setgid as s/S, sticky as t/T
 *  - Descriptive:       "User: Read, Write, Execute; Group: Read; Other: None"
 *
 * toString() picks the style fixed at build time by
 * LEGIBLE_PERMISSIONS_DESCRIPTIVE (defaults to 1 on Windows, 0 elsewhere).
 */

#include "src/system/inc/ModeClassifier.hpp"

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint32_t, std::uint8_t
#include <string>      // std::string
#include <string_view> // std::string_view

#include <fmt/format.h>

#ifndef LEGIBLE_PERMISSIONS_DESCRIPTIVE
#if defined(_WIN32)
#define LEGIBLE_PERMISSIONS_DESCRIPTIVE 1
#else
#define LEGIBLE_PERMISSIONS_DESCRIPTIVE 0
#endif
#endif

namespace legible {

namespace system {

/* ----------------------------- PermissionStyle ----------------------------- */

/**
 * @brief Rendering template for PermissionBits.
 */
enum class PermissionStyle : std::uint8_t {
  SYMBOLIC = 0,    ///< 10-character ls -l string
  DESCRIPTIVE = 1, ///< Sentence per principal
};

/// Style used by HumanPermissions::toString().
inline constexpr PermissionStyle DEFAULT_PERMISSION_STYLE =
    (LEGIBLE_PERMISSIONS_DESCRIPTIVE != 0) ? PermissionStyle::DESCRIPTIVE
                                           : PermissionStyle::SYMBOLIC;

/// Length of a symbolic permission string.
inline constexpr std::size_t SYMBOLIC_LENGTH = 10;

/**
 * @brief Style name (e.g. "SYMBOLIC").
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(PermissionStyle style) noexcept;

/* ----------------------------- Renderers ----------------------------- */

/**
 * @brief Render "drwxr-xr-x".
 * @note NOT RT-safe: Returns std::string.
 */
[[nodiscard]] std::string renderSymbolic(const PermissionBits& bits);

/**
 * @brief Render "User: Read, Write, Execute; Group: Read, Execute; Other: None".
 * @note NOT RT-safe: Returns std::string.
 *
 * Principals are separated by "; ", permissions by ", ". A principal with no
 * bits set lists "None". File type and special bits are not described.
 */
[[nodiscard]] std::string renderDescriptive(const PermissionBits& bits);

/**
 * @brief Render in the requested style.
 * @note NOT RT-safe: Returns std::string.
 */
[[nodiscard]] std::string render(const PermissionBits& bits, PermissionStyle style);

/* ----------------------------- HumanPermissions ----------------------------- */

/**
 * @brief Immutable file mode wrapper.
 */
class HumanPermissions {
public:
  HumanPermissions() noexcept = default;

  /// @brief Classify with the default POSIX classifier.
  [[nodiscard]] static HumanPermissions from(std::uint32_t mode) noexcept;

  /// @brief Classify with a caller-provided classifier.
  [[nodiscard]] static HumanPermissions from(std::uint32_t mode,
                                             const ModeClassifier& classifier) noexcept;

  [[nodiscard]] std::uint32_t mode() const noexcept { return mode_; }
  [[nodiscard]] const PermissionBits& bits() const noexcept { return bits_; }

  /// @brief "drwxr-xr-x".
  [[nodiscard]] std::string symbolic() const { return renderSymbolic(bits_); }

  /// @brief "User: Read, Write, Execute; Group: Read, Execute; Other: Read, Execute".
  [[nodiscard]] std::string descriptive() const { return renderDescriptive(bits_); }

  /// @brief Rendering in DEFAULT_PERMISSION_STYLE.
  [[nodiscard]] std::string toString() const { return render(bits_, DEFAULT_PERMISSION_STYLE); }

  bool operator==(const HumanPermissions&) const noexcept = default;

private:
  HumanPermissions(std::uint32_t mode, const PermissionBits& bits) noexcept
      : mode_(mode), bits_(bits) {}

  std::uint32_t mode_{0};
  PermissionBits bits_{};
};

} // namespace system

} // namespace legible

/// Formats in DEFAULT_PERMISSION_STYLE.
template <>
struct fmt::formatter<legible::system::HumanPermissions> : fmt::formatter<std::string_view> {
  auto format(const legible::system::HumanPermissions& perms, fmt::format_context& ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(perms.toString(), ctx);
  }
};

#endif // LEGIBLE_SYSTEM_HUMAN_PERMISSIONS_HPP
