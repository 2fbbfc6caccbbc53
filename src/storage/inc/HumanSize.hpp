#ifndef LEGIBLE_STORAGE_HUMAN_SIZE_HPP
#define LEGIBLE_STORAGE_HUMAN_SIZE_HPP
/**
 * @file HumanSize.hpp
 * @brief Byte count rendering in binary (KiB, MiB) or decimal (KB, MB) units.
 * @note Thread-safe: Immutable value type.
 *
 * Binary (IEC, 1024-based) is the default. Exact results render without a
 * decimal ("5 MiB"); inexact results keep one digit ("1.4 MiB").
 */

#include "src/helpers/inc/Status.hpp"
#include "src/scale/inc/ScaleSelector.hpp"

#include <array>       // std::array
#include <cstdint>     // std::uint64_t, std::int64_t
#include <span>        // std::span
#include <string>      // std::string
#include <string_view> // std::string_view

#include <fmt/format.h>

namespace legible {

namespace storage {

/* ----------------------------- SizeUnitSystem ----------------------------- */

/**
 * @brief Base used to scale byte counts.
 */
enum class SizeUnitSystem : std::uint8_t {
  BINARY = 0,  ///< IEC, powers of 1024 (KiB, MiB, ...)
  DECIMAL = 1, ///< SI, powers of 1000 (KB, MB, ...)
};

/**
 * @brief Human-readable unit system name.
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(SizeUnitSystem system) noexcept;

/* ----------------------------- Constants ----------------------------- */

inline constexpr double KIB = 1024.0;
inline constexpr double MIB = KIB * 1024.0;
inline constexpr double GIB = MIB * 1024.0;
inline constexpr double TIB = GIB * 1024.0;
inline constexpr double PIB = TIB * 1024.0;
inline constexpr double EIB = PIB * 1024.0;

/// IEC ladder. A 64-bit byte count never exceeds 16 EiB.
inline constexpr std::array<scale::ScaleUnit, 7> BINARY_SIZE_LADDER{{
    {1.0, 1.0, "B", "byte", "bytes"},
    {KIB, KIB, "KiB", "kibibyte", "kibibytes"},
    {MIB, MIB, "MiB", "mebibyte", "mebibytes"},
    {GIB, GIB, "GiB", "gibibyte", "gibibytes"},
    {TIB, TIB, "TiB", "tebibyte", "tebibytes"},
    {PIB, PIB, "PiB", "pebibyte", "pebibytes"},
    {EIB, EIB, "EiB", "exbibyte", "exbibytes"},
}};

/// SI ladder.
inline constexpr std::array<scale::ScaleUnit, 7> DECIMAL_SIZE_LADDER{{
    {1.0, 1.0, "B", "byte", "bytes"},
    {1e3, 1e3, "KB", "kilobyte", "kilobytes"},
    {1e6, 1e6, "MB", "megabyte", "megabytes"},
    {1e9, 1e9, "GB", "gigabyte", "gigabytes"},
    {1e12, 1e12, "TB", "terabyte", "terabytes"},
    {1e15, 1e15, "PB", "petabyte", "petabytes"},
    {1e18, 1e18, "EB", "exabyte", "exabytes"},
}};

/// Decimal digits kept after scaling.
inline constexpr unsigned SIZE_DECIMAL_DIGITS = 1;

/**
 * @brief Ladder for a unit system.
 * @note RT-safe: Returns a view of a static table.
 */
[[nodiscard]] std::span<const scale::ScaleUnit> sizeLadder(SizeUnitSystem system) noexcept;

/* ----------------------------- HumanSize ----------------------------- */

/**
 * @brief Immutable byte count wrapper.
 *
 * The unit system is fixed at construction; decimal() and binary() return
 * a copy in the other system.
 */
class HumanSize {
public:
  /// Zero bytes, binary.
  HumanSize() noexcept = default;

  /**
   * @brief Wrap an unsigned byte count.
   * @param bytes Byte count.
   * @param system Unit system (binary by default).
   */
  [[nodiscard]] static HumanSize from(std::uint64_t bytes,
                                      SizeUnitSystem system = SizeUnitSystem::BINARY) noexcept;

  /**
   * @brief Wrap a signed byte count, rejecting negative values.
   * @param bytes Byte count (must be >= 0).
   * @param out Receives the wrapper on success; untouched on failure.
   * @param system Unit system (binary by default).
   * @return Status::OK, or Status::INVALID_INPUT for negative input.
   * @note RT-safe: No allocation.
   */
  [[nodiscard]] static Status fromSigned(std::int64_t bytes, HumanSize& out,
                                         SizeUnitSystem system = SizeUnitSystem::BINARY) noexcept;

  /// @brief Copy rendered in SI units.
  [[nodiscard]] HumanSize decimal() const noexcept {
    return HumanSize(bytes_, SizeUnitSystem::DECIMAL);
  }

  /// @brief Copy rendered in IEC units.
  [[nodiscard]] HumanSize binary() const noexcept {
    return HumanSize(bytes_, SizeUnitSystem::BINARY);
  }

  [[nodiscard]] std::uint64_t bytes() const noexcept { return bytes_; }
  [[nodiscard]] SizeUnitSystem system() const noexcept { return system_; }

  /// @brief Unit chosen for this size after rounding.
  [[nodiscard]] scale::ScaledMagnitude magnitude() const noexcept;

  /// @brief "5 MiB", "1.4 MiB", "500 B".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string concise() const;

  /// @brief "5 mebibytes", "1 kibibyte", "0 bytes".
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string full() const;

  /// @brief Same as full().
  [[nodiscard]] std::string toString() const { return full(); }

  bool operator==(const HumanSize&) const noexcept = default;

private:
  HumanSize(std::uint64_t bytes, SizeUnitSystem system) noexcept
      : bytes_(bytes), system_(system) {}

  std::uint64_t bytes_{0};
  SizeUnitSystem system_{SizeUnitSystem::BINARY};
};

} // namespace storage

} // namespace legible

/// Formats as the full form.
template <>
struct fmt::formatter<legible::storage::HumanSize> : fmt::formatter<std::string_view> {
  auto format(const legible::storage::HumanSize& size, fmt::format_context& ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(size.full(), ctx);
  }
};

#endif // LEGIBLE_STORAGE_HUMAN_SIZE_HPP
