// pkgindex/index/package.hpp - Package and file model
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pkgindex/fs/file_stat.hpp"
#include "pkgindex/index/package_error.hpp"

namespace pkgindex
{

// ============================================================================
// File classes
// ============================================================================

/**
 * How a .go file of a package directory takes part in a build. The values
 * are bits so that queries may ask for several classes at once.
 */
enum class FileKind : uint8_t {
  IgnoredGoFile = 1,  ///< Excluded by build constraints for this build
  TestGoFile = 2,     ///< _test.go files; build constraints are not checked
  GoFile = 4,         ///< Buildable source files
  Any = 7,
};

[[nodiscard]] constexpr FileKind operator|(FileKind a, FileKind b) noexcept
{
  return static_cast<FileKind>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr bool has_kind(FileKind mask, FileKind kind) noexcept
{
  return (static_cast<uint8_t>(mask) & static_cast<uint8_t>(kind)) != 0;
}

[[nodiscard]] std::string_view to_string(FileKind kind) noexcept;

// ============================================================================
// File
// ============================================================================

/// State of the package clause cached on a File.
enum class ClauseState : uint8_t {
  Unknown,  ///< Not read since the stat last changed
  Parsed,
  Failed,
};

struct File
{
  std::string name;  ///< Base name
  std::string path;  ///< Absolute path
  fs::FileStat stat;

  /// Package clause name, valid while stat is unchanged.
  std::string clause_name;
  ClauseState clause = ClauseState::Unknown;

  /// Drop the cached clause after the file changed on disk.
  void forget_clause()
  {
    clause_name.clear();
    clause = ClauseState::Unknown;
  }

  bool operator==(const File & other) const noexcept
  {
    return name == other.name && path == other.path && stat.same_as(other.stat);
  }
};

// ============================================================================
// Package
// ============================================================================

/**
 * A directory that contains .go files, as seen by the last update.
 *
 * Every tracked file lives in exactly one class. Packages published in the
 * registry are immutable; the indexer copies, modifies and republishes.
 */
class Package
{
public:
  std::string dir;          ///< Absolute directory
  std::string name;         ///< Declared package name, "" if unknown
  std::string import_path;  ///< dir relative to src_root
  std::string root;         ///< Workspace root, the parent of src_root
  std::string src_root;     ///< Source root containing dir
  bool is_in_standard_tree = false;
  bool installed = false;
  std::optional<fs::FileStat> stat;  ///< Stat of dir when last listed
  PackageError error;

  /// Environment revision the file classes were computed under.
  uint64_t classified_revision = 0;

  /// Place file in kind, removing it from the other classes.
  void add_file(FileKind kind, File file);

  /// Remove the named file from whichever class holds it.
  bool remove_file(std::string_view file_name);

  [[nodiscard]] const File * lookup_file(std::string_view file_name) const;
  [[nodiscard]] File * lookup_file(std::string_view file_name);

  /// Class of the named file, if tracked.
  [[nodiscard]] std::optional<FileKind> kind_of(std::string_view file_name) const;

  /// Files of the requested classes, sorted by name.
  [[nodiscard]] std::vector<const File *> files(FileKind mask = FileKind::Any) const;
  [[nodiscard]] std::vector<std::string> file_names(FileKind mask = FileKind::Any) const;
  [[nodiscard]] std::vector<std::string> file_paths(FileKind mask = FileKind::Any) const;

  [[nodiscard]] size_t file_count(FileKind mask = FileKind::Any) const noexcept;

  /// Invoke fn on every file of every class; fn may modify the file.
  void for_each_file(const std::function<void(FileKind, File &)> & fn);

  [[nodiscard]] bool is_command() const noexcept { return name == "main"; }
  [[nodiscard]] bool is_valid() const noexcept { return !name.empty() && file_count() > 0; }

  /// Structural equality, ignoring cached clause names.
  bool operator==(const Package & other) const;

private:
  [[nodiscard]] static size_t slot(FileKind kind) noexcept;

  static constexpr std::array<FileKind, 3> k_kinds = {
    FileKind::IgnoredGoFile, FileKind::TestGoFile, FileKind::GoFile};

  std::array<std::map<std::string, File, std::less<>>, 3> files_;
};

}  // namespace pkgindex
