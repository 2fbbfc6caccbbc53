/**
 * @file ModeClassifier.cpp
 * @brief Octal st_mode decoding.
 */

#include "src/system/inc/ModeClassifier.hpp"

#if !defined(_WIN32)
#include <sys/stat.h> // S_IFMT, S_IRUSR, S_ISUID, ...
#endif

namespace legible {

namespace system {

#if !defined(_WIN32)
static_assert(MODE_TYPE_MASK == S_IFMT, "st_mode type mask differs from octal layout");
static_assert(MODE_SOCKET == S_IFSOCK && MODE_SYMLINK == S_IFLNK && MODE_REGULAR == S_IFREG);
static_assert(MODE_BLOCK_DEVICE == S_IFBLK && MODE_DIRECTORY == S_IFDIR);
static_assert(MODE_CHAR_DEVICE == S_IFCHR && MODE_FIFO == S_IFIFO);
static_assert(MODE_SETUID == S_ISUID && MODE_SETGID == S_ISGID && MODE_STICKY == S_ISVTX);
static_assert(MODE_OWNER_READ == S_IRUSR && MODE_OWNER_WRITE == S_IWUSR &&
              MODE_OWNER_EXECUTE == S_IXUSR);
static_assert(MODE_GROUP_READ == S_IRGRP && MODE_GROUP_WRITE == S_IWGRP &&
              MODE_GROUP_EXECUTE == S_IXGRP);
static_assert(MODE_OTHER_READ == S_IROTH && MODE_OTHER_WRITE == S_IWOTH &&
              MODE_OTHER_EXECUTE == S_IXOTH);
#endif

namespace {

bool hasBit(std::uint32_t mode, std::uint32_t bit) noexcept { return (mode & bit) != 0; }

FileType decodeType(std::uint32_t mode) noexcept {
  switch (mode & MODE_TYPE_MASK) {
  case MODE_REGULAR:
    return FileType::REGULAR;
  case MODE_DIRECTORY:
    return FileType::DIRECTORY;
  case MODE_SYMLINK:
    return FileType::SYMLINK;
  case MODE_CHAR_DEVICE:
    return FileType::CHAR_DEVICE;
  case MODE_BLOCK_DEVICE:
    return FileType::BLOCK_DEVICE;
  case MODE_FIFO:
    return FileType::FIFO;
  case MODE_SOCKET:
    return FileType::SOCKET;
  default:
    return FileType::UNKNOWN;
  }
}

} // namespace

/* ----------------------------- FileType ----------------------------- */

const char* toString(FileType type) noexcept {
  switch (type) {
  case FileType::UNKNOWN:
    return "UNKNOWN";
  case FileType::REGULAR:
    return "REGULAR";
  case FileType::DIRECTORY:
    return "DIRECTORY";
  case FileType::SYMLINK:
    return "SYMLINK";
  case FileType::CHAR_DEVICE:
    return "CHAR_DEVICE";
  case FileType::BLOCK_DEVICE:
    return "BLOCK_DEVICE";
  case FileType::FIFO:
    return "FIFO";
  case FileType::SOCKET:
    return "SOCKET";
  }
  return "UNKNOWN";
}

char typeTag(FileType type) noexcept {
  switch (type) {
  case FileType::REGULAR:
    return '-';
  case FileType::DIRECTORY:
    return 'd';
  case FileType::SYMLINK:
    return 'l';
  case FileType::CHAR_DEVICE:
    return 'c';
  case FileType::BLOCK_DEVICE:
    return 'b';
  case FileType::FIFO:
    return 'p';
  case FileType::SOCKET:
    return 's';
  case FileType::UNKNOWN:
    break;
  }
  return '?';
}

/* ----------------------------- PosixModeClassifier ----------------------------- */

PermissionBits PosixModeClassifier::classify(std::uint32_t mode) const noexcept {
  PermissionBits bits;
  bits.fileType = decodeType(mode);

  bits.owner.read = hasBit(mode, MODE_OWNER_READ);
  bits.owner.write = hasBit(mode, MODE_OWNER_WRITE);
  bits.owner.execute = hasBit(mode, MODE_OWNER_EXECUTE);

  bits.group.read = hasBit(mode, MODE_GROUP_READ);
  bits.group.write = hasBit(mode, MODE_GROUP_WRITE);
  bits.group.execute = hasBit(mode, MODE_GROUP_EXECUTE);

  bits.other.read = hasBit(mode, MODE_OTHER_READ);
  bits.other.write = hasBit(mode, MODE_OTHER_WRITE);
  bits.other.execute = hasBit(mode, MODE_OTHER_EXECUTE);

  bits.setuid = hasBit(mode, MODE_SETUID);
  bits.setgid = hasBit(mode, MODE_SETGID);
  bits.sticky = hasBit(mode, MODE_STICKY);

  return bits;
}

const ModeClassifier& defaultModeClassifier() noexcept {
  static const PosixModeClassifier INSTANCE{};
  return INSTANCE;
}

} // namespace system

} // namespace legible
