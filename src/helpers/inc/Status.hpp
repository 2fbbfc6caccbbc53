#ifndef LEGIBLE_HELPERS_STATUS_HPP
#define LEGIBLE_HELPERS_STATUS_HPP
/**
 * @file Status.hpp
 * @brief Status codes returned by factories that can reject their input.
 * @note Thread-safe: Stateless.
 */

#include <cstdint>

namespace legible {

/* ----------------------------- Status ----------------------------- */

/**
 * @brief Result of a checked factory (e.g. HumanSize::fromSigned).
 */
enum class Status : std::uint8_t {
  OK = 0,
  INVALID_INPUT, ///< Value outside the formatter's domain (e.g. a negative size)
};

/**
 * @brief Human-readable status string.
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] inline const char* toString(Status status) noexcept {
  switch (status) {
  case Status::OK:
    return "OK";
  case Status::INVALID_INPUT:
    return "INVALID_INPUT";
  }
  return "UNKNOWN";
}

} // namespace legible

#endif // LEGIBLE_HELPERS_STATUS_HPP
