// pkgindex/index/tree_builder.hpp - Parallel directory walks
//
// A TreeBuilder performs one pass over one source root: either a fresh
// build or an incremental update of the previous tree. Each directory is
// handed to the PackageIndexer before its children are visited; children
// are walked concurrently and awaited by their parent.
//
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "pkgindex/index/directory.hpp"
#include "pkgindex/index/package_indexer.hpp"

namespace pkgindex
{

/// Upper bound on walker threads alive at once within one pass.
inline constexpr int k_max_walker_threads = 32;

class TreeBuilder
{
public:
  /// max_depth <= 0 means no limit.
  TreeBuilder(IndexContext & ctx, PackageIndexer & indexer, int max_depth);

  TreeBuilder(const TreeBuilder &) = delete;
  TreeBuilder & operator=(const TreeBuilder &) = delete;

  /**
   * Walk root from scratch.
   *
   * @return the root Directory (kept even when empty), or std::nullopt when
   *         root is not a readable directory
   */
  std::optional<Directory> build_root(const std::string & root);

  /**
   * Bring a previously built tree up to date. Packages of subtrees that
   * vanished are deleted from the registry.
   */
  std::optional<Directory> update_root(const Directory & prev);

  /// Delete every package in the tree rooted at dir.
  void delete_subtree(const Directory & dir);

  [[nodiscard]] int max_depth() const noexcept { return max_depth_; }

private:
  std::optional<Directory> build(
    const std::string & path, const fs::FileStat & st, int depth, bool internal);
  std::optional<Directory> update(const Directory & prev, const fs::FileStat & st);

  /// Record the inode of st; false if this pass has seen it already.
  bool visit(const fs::FileStat & st);

  [[nodiscard]] std::vector<fs::FileStat> list(const std::string & path);

  /// Entries of listing to descend into, with symlinks resolved to their target's stat.
  [[nodiscard]] std::vector<fs::FileStat> subdirectories(
    const std::string & path, const std::vector<fs::FileStat> & listing);

  using Task = std::function<std::optional<Directory>()>;

  /// Run tasks, on walker threads while the thread budget allows.
  std::vector<std::optional<Directory>> run_all(std::vector<Task> tasks);

  IndexContext & ctx_;
  PackageIndexer & indexer_;
  int max_depth_;

  std::mutex seen_mu_;
  std::set<std::pair<uint64_t, uint64_t>> seen_;
  std::atomic<int> threads_{0};
};

}  // namespace pkgindex
