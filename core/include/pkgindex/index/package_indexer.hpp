// pkgindex/index/package_indexer.hpp - Per-directory package indexing
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "pkgindex/basic/string_interner.hpp"
#include "pkgindex/build/environment.hpp"
#include "pkgindex/fs/file_stat.hpp"
#include "pkgindex/fs/gated_fs.hpp"
#include "pkgindex/index/event.hpp"
#include "pkgindex/index/ident_index.hpp"
#include "pkgindex/index/package.hpp"
#include "pkgindex/index/package_error.hpp"
#include "pkgindex/index/package_registry.hpp"

namespace pkgindex
{

/**
 * Shared state an update works against. Everything referenced is owned by
 * the Corpus and outlives the update.
 */
struct IndexContext
{
  const build::Environment & env;
  fs::GatedFs & fs;
  PackageRegistry & registry;
  IdentIndex & idents;
  StringInterner & strings;
  EventSink & events;
  std::shared_ptr<spdlog::logger> logger;
  bool index_identifiers = false;
};

/// Outcome of indexing one directory.
struct IndexResult
{
  PackagePtr package;  ///< Published package, null when there is none
  PackageError error;  ///< NoGoFiles when package is null, else package->error
};

/**
 * Brings the registry entry of a single directory up to date.
 *
 * One indexer serves a whole update pass; it snapshots the source roots and
 * environment revision at construction so every directory of the pass sees
 * the same environment. index() may be called concurrently for distinct
 * directories.
 */
class PackageIndexer
{
public:
  PackageIndexer(IndexContext & ctx, std::vector<std::string> roots, std::string standard_root,
                 uint64_t revision);

  /**
   * Index dir.
   *
   * @param dir_stat current stat of dir
   * @param listing  lstat of every entry of dir when the caller already
   *                 read it; null lets the indexer skip the listing if
   *                 dir_stat is unchanged
   */
  IndexResult index(const std::string & dir, const fs::FileStat & dir_stat,
                    const std::vector<fs::FileStat> * listing = nullptr);

  /// Delete the package in dir, its identifiers, and emit Delete.
  void remove(const std::string & dir);

  /// Longest source root containing dir.
  [[nodiscard]] std::optional<std::string> src_root_for(std::string_view dir) const;

  [[nodiscard]] uint64_t revision() const noexcept { return revision_; }
  [[nodiscard]] const std::vector<std::string> & roots() const noexcept { return roots_; }

private:
  [[nodiscard]] Package new_package(const std::string & dir, const std::string & src_root) const;

  /// Re-stat known files; returns names whose stat changed.
  std::vector<std::string> refresh_files(Package & pkg, bool & files_changed);

  /// Merge a fresh listing; returns names that are new or changed.
  std::vector<std::string> merge_listing(
    Package & pkg, const std::vector<fs::FileStat> & listing, bool & files_changed);

  [[nodiscard]] FileKind classify(const std::string & dir, const std::string & name) const;

  void resolve_name(Package & pkg);
  void ensure_clause(File & file);
  [[nodiscard]] std::optional<std::string> read_package_clause(const std::string & path);

  [[nodiscard]] bool is_installed(const Package & pkg) const;

  void index_identifiers(const Package & pkg);

  IndexContext & ctx_;
  std::vector<std::string> roots_;
  std::string standard_root_;
  uint64_t revision_;
};

}  // namespace pkgindex
