#ifndef LEGIBLE_SYSTEM_MODE_CLASSIFIER_HPP
#define LEGIBLE_SYSTEM_MODE_CLASSIFIER_HPP
/**
 * @file ModeClassifier.hpp
 * @brief Classification of a raw st_mode value into file type and access bits.
 * @note Thread-safe: Classifiers are stateless.
 *
 * HumanPermissions never reads mode bits itself; it asks a ModeClassifier.
 * PosixModeClassifier decodes the traditional octal st_mode layout from the
 * MODE_* constants below, so it builds where <sys/stat.h> lacks S_IFLNK or
 * S_ISVTX (MSVC). On POSIX hosts the constants are checked against the
 * system macros at compile time. Callers with their own mode encoding supply
 * another implementation.
 */

#include <cstdint> // std::uint32_t, std::uint8_t

namespace legible {

namespace system {

/* ----------------------------- Mode Layout ----------------------------- */

inline constexpr std::uint32_t MODE_TYPE_MASK = 0170000;
inline constexpr std::uint32_t MODE_SOCKET = 0140000;
inline constexpr std::uint32_t MODE_SYMLINK = 0120000;
inline constexpr std::uint32_t MODE_REGULAR = 0100000;
inline constexpr std::uint32_t MODE_BLOCK_DEVICE = 0060000;
inline constexpr std::uint32_t MODE_DIRECTORY = 0040000;
inline constexpr std::uint32_t MODE_CHAR_DEVICE = 0020000;
inline constexpr std::uint32_t MODE_FIFO = 0010000;

inline constexpr std::uint32_t MODE_SETUID = 04000;
inline constexpr std::uint32_t MODE_SETGID = 02000;
inline constexpr std::uint32_t MODE_STICKY = 01000;

inline constexpr std::uint32_t MODE_OWNER_READ = 0400;
inline constexpr std::uint32_t MODE_OWNER_WRITE = 0200;
inline constexpr std::uint32_t MODE_OWNER_EXECUTE = 0100;
inline constexpr std::uint32_t MODE_GROUP_READ = 040;
inline constexpr std::uint32_t MODE_GROUP_WRITE = 020;
inline constexpr std::uint32_t MODE_GROUP_EXECUTE = 010;
inline constexpr std::uint32_t MODE_OTHER_READ = 04;
inline constexpr std::uint32_t MODE_OTHER_WRITE = 02;
inline constexpr std::uint32_t MODE_OTHER_EXECUTE = 01;

/* ----------------------------- FileType ----------------------------- */

/**
 * @brief File type encoded in the S_IFMT bits.
 */
enum class FileType : std::uint8_t {
  UNKNOWN = 0,
  REGULAR,
  DIRECTORY,
  SYMLINK,
  CHAR_DEVICE,
  BLOCK_DEVICE,
  FIFO,
  SOCKET,
};

/**
 * @brief File type name (e.g. "DIRECTORY").
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(FileType type) noexcept;

/**
 * @brief One-character tag used by ls -l ('d', '-', 'l', 'c', 'b', 'p', 's', '?').
 * @note RT-safe: No allocation.
 */
[[nodiscard]] char typeTag(FileType type) noexcept;

/* ----------------------------- AccessTriplet ----------------------------- */

/**
 * @brief Read/write/execute bits for one principal.
 */
struct AccessTriplet {
  bool read{false};
  bool write{false};
  bool execute{false};

  /// @brief True when no bit is set.
  [[nodiscard]] bool none() const noexcept { return !read && !write && !execute; }

  bool operator==(const AccessTriplet&) const noexcept = default;
};

/* ----------------------------- PermissionBits ----------------------------- */

/**
 * @brief Classified mode: file type, three principals, special bits.
 */
struct PermissionBits {
  FileType fileType{FileType::UNKNOWN};
  AccessTriplet owner{};
  AccessTriplet group{};
  AccessTriplet other{};
  bool setuid{false}; ///< S_ISUID
  bool setgid{false}; ///< S_ISGID
  bool sticky{false}; ///< S_ISVTX

  bool operator==(const PermissionBits&) const noexcept = default;
};

/* ----------------------------- ModeClassifier ----------------------------- */

/**
 * @brief Maps a raw mode integer to PermissionBits.
 */
class ModeClassifier {
public:
  virtual ~ModeClassifier() = default;

  /// @brief Classify a raw mode. Must be total and side-effect free.
  [[nodiscard]] virtual PermissionBits classify(std::uint32_t mode) const noexcept = 0;
};

/**
 * @brief Decodes the octal st_mode layout (MODE_TYPE_MASK, MODE_OWNER_READ, ...).
 */
class PosixModeClassifier final : public ModeClassifier {
public:
  [[nodiscard]] PermissionBits classify(std::uint32_t mode) const noexcept override;
};

/**
 * @brief Process-wide PosixModeClassifier instance.
 * @note RT-safe: Returns a reference to a static object.
 */
[[nodiscard]] const ModeClassifier& defaultModeClassifier() noexcept;

} // namespace system

} // namespace legible

#endif // LEGIBLE_SYSTEM_MODE_CLASSIFIER_HPP
