// pkgindex/index/directory.hpp - Directory tree snapshot
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pkgindex/fs/file_stat.hpp"

namespace pkgindex
{

/**
 * One directory of a source root as seen by the last update.
 *
 * The tree only points downward; packages are found through the registry
 * by path. Every readable, non-ignored subdirectory is kept, with or
 * without a package, so files added to it later are seen by the next
 * update. Symlinked directories appear under the link's path.
 */
struct Directory
{
  std::string path;      ///< Absolute path
  std::string basename;
  std::string pkg_name;  ///< Declared name of the package here, if any
  bool has_pkg = false;
  bool is_internal = false;  ///< This or an ancestor is named "internal"
  std::optional<fs::FileStat> stat;
  int depth = 0;                    ///< 0 for a source root
  std::vector<Directory> children;  ///< Sorted by basename

  [[nodiscard]] const Directory * child(std::string_view name) const;

  /// Find the descendant (or this) at an absolute path.
  [[nodiscard]] const Directory * lookup(std::string_view dir) const;

  /**
   * Package directories importable from reference, sorted.
   *
   * A directory below "internal" is visible only when reference lies in
   * the tree rooted at the parent of the last "internal" element.
   */
  [[nodiscard]] std::vector<std::string> import_list(std::string_view reference) const;

  /// Every directory holding a package, in path order.
  [[nodiscard]] std::vector<const Directory *> list_packages() const;

  bool operator==(const Directory & other) const;
};

}  // namespace pkgindex
