// pkgindex/fs/file_stat.hpp - Structural file metadata
//
// FileStat is the unit of change detection: two stats taken at different
// times describe the same, unchanged file iff same_file() holds.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct stat;

namespace pkgindex::fs
{

/**
 * Metadata captured from lstat(2) or stat(2).
 *
 * dev and ino identify the underlying inode for loop detection only; they do
 * not participate in same_file().
 */
struct FileStat
{
  std::string name;  ///< Base name of the file
  uint64_t size = 0;
  uint32_t mode = 0;      ///< st_mode, type and permission bits
  int64_t mtime_ns = 0;   ///< Modification time in nanoseconds since the epoch
  bool is_dir = false;
  uint64_t dev = 0;
  uint64_t ino = 0;

  [[nodiscard]] bool is_regular() const noexcept;
  [[nodiscard]] bool is_symlink() const noexcept;

  /// Structural equality over name, size, mode, mtime and is_dir.
  [[nodiscard]] bool same_as(const FileStat & other) const noexcept
  {
    return name == other.name && size == other.size && mode == other.mode &&
           mtime_ns == other.mtime_ns && is_dir == other.is_dir;
  }

  /// Build from a stat buffer; name is the base name to record.
  [[nodiscard]] static FileStat from_stat(std::string name, const struct stat & st);
};

/**
 * Report whether a and b describe the same unchanged file.
 *
 * True when both are absent, or both are present and structurally equal.
 */
[[nodiscard]] inline bool same_file(
  const std::optional<FileStat> & a, const std::optional<FileStat> & b) noexcept
{
  if (!a) {
    return !b;
  }
  return b && a->same_as(*b);
}

}  // namespace pkgindex::fs
