// pkgindex/index/package_registry.hpp - Packages by source root and name
//
// The registry is the single source of truth for readers. It holds
// immutable Package snapshots in two maps behind one reader/writer lock:
//
//   by_path: src_root -> import_path -> Package
//   by_name: package name -> dir   (commands excluded)
//
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "pkgindex/index/package.hpp"

namespace pkgindex
{

using PackagePtr = std::shared_ptr<const Package>;

class PackageRegistry
{
public:
  PackageRegistry() = default;

  PackageRegistry(const PackageRegistry &) = delete;
  PackageRegistry & operator=(const PackageRegistry &) = delete;

  /**
   * Publish pkg, replacing any package with the same src_root and
   * import_path, and update the name index in the same critical section.
   */
  void insert(PackagePtr pkg);

  /// Remove and return the package at (src_root, import_path).
  PackagePtr remove(std::string_view src_root, std::string_view import_path);

  /// Remove and return the package whose directory is dir.
  PackagePtr remove_by_dir(std::string_view dir);

  /// Remove every package under src_root.
  std::vector<PackagePtr> remove_root(std::string_view src_root);

  [[nodiscard]] PackagePtr lookup(std::string_view src_root, std::string_view import_path) const;

  /// Find the package for an absolute directory via its source root.
  [[nodiscard]] PackagePtr lookup_by_path(std::string_view dir) const;

  [[nodiscard]] PackagePtr lookup_by_name(std::string_view name) const;

  /// Snapshot of all packages sorted by directory.
  [[nodiscard]] std::vector<PackagePtr> packages() const;

  /// Source roots that hold at least one package.
  [[nodiscard]] std::vector<std::string> roots() const;

  /// Copy of the name index.
  [[nodiscard]] std::map<std::string, std::string> name_index() const;

  [[nodiscard]] size_t size() const;

  /**
   * Mark every package as classified under no environment revision, so the
   * next update reclassifies all files even where nothing changed on disk.
   */
  void invalidate_environment();

private:
  using PathMap = std::map<std::string, PackagePtr, std::less<>>;

  [[nodiscard]] const PathMap * root_for_locked(std::string_view dir, std::string_view * root) const;
  PackagePtr remove_locked(std::string_view src_root, std::string_view import_path);

  mutable std::shared_mutex mu_;
  std::map<std::string, PathMap, std::less<>> by_path_;
  std::map<std::string, std::string, std::less<>> by_name_;
};

}  // namespace pkgindex
