// pkgindex/index/tree_builder.cpp - Parallel directory walks
#include "pkgindex/index/tree_builder.hpp"

#include <climits>
#include <future>
#include <set>
#include <string_view>
#include <system_error>

#include "pkgindex/basic/path_util.hpp"

namespace pkgindex
{

namespace
{

void set_package(Directory & dir, const IndexResult & res)
{
  dir.has_pkg = res.package != nullptr;
  dir.pkg_name = res.package ? res.package->name : std::string();
}

Directory shallow_copy(const Directory & prev, const fs::FileStat & st)
{
  Directory dir;
  dir.path = prev.path;
  dir.basename = prev.basename;
  dir.is_internal = prev.is_internal;
  dir.depth = prev.depth;
  dir.stat = st;
  return dir;
}

}  // namespace

TreeBuilder::TreeBuilder(IndexContext & ctx, PackageIndexer & indexer, int max_depth)
: ctx_(ctx), indexer_(indexer), max_depth_(max_depth <= 0 ? INT_MAX : max_depth)
{
}

bool TreeBuilder::visit(const fs::FileStat & st)
{
  if (st.dev == 0 && st.ino == 0) {
    return true;
  }
  std::lock_guard lock(seen_mu_);
  return seen_.emplace(st.dev, st.ino).second;
}

std::vector<fs::FileStat> TreeBuilder::list(const std::string & path)
{
  auto listing = ctx_.fs.readdir(path);
  if (!listing) {
    ctx_.logger->debug("walk: {}", listing.error().message());
    return {};
  }
  return std::move(listing).value();
}

std::vector<fs::FileStat> TreeBuilder::subdirectories(
  const std::string & path, const std::vector<fs::FileStat> & listing)
{
  std::vector<fs::FileStat> out;
  for (const auto & entry : listing) {
    if (is_ignored_dir_name(entry.name)) {
      continue;
    }
    if (entry.is_dir) {
      out.push_back(entry);
      continue;
    }
    if (!entry.is_symlink()) {
      continue;
    }
    // Symlinks are followed; visit() stops cycles.
    auto target = ctx_.fs.stat(path_join(path, entry.name));
    if (!target) {
      ctx_.logger->debug("walk: {}", target.error().message());
      continue;
    }
    if (target->is_dir) {
      target->name = entry.name;
      out.push_back(std::move(*target));
    }
  }
  return out;
}

std::vector<std::optional<Directory>> TreeBuilder::run_all(std::vector<Task> tasks)
{
  std::vector<std::optional<Directory>> results(tasks.size());
  std::vector<std::future<std::optional<Directory>>> futures(tasks.size());

  for (size_t i = 0; i < tasks.size(); ++i) {
    if (threads_.fetch_add(1) < k_max_walker_threads) {
      try {
        futures[i] = std::async(std::launch::async, [this, &task = tasks[i]]() {
          struct Release
          {
            std::atomic<int> & n;
            ~Release() { n.fetch_sub(1); }
          } release{threads_};
          return task();
        });
        continue;
      } catch (const std::system_error & e) {
        ctx_.logger->debug("walk: cannot start thread: {}", e.what());
      }
    }
    threads_.fetch_sub(1);
    results[i] = tasks[i]();
  }

  for (size_t i = 0; i < futures.size(); ++i) {
    if (futures[i].valid()) {
      results[i] = futures[i].get();
    }
  }
  return results;
}

// ============================================================================
// Build
// ============================================================================

std::optional<Directory> TreeBuilder::build_root(const std::string & root)
{
  auto st = ctx_.fs.stat(root);
  if (!st) {
    ctx_.logger->debug("walk: {}", st.error().message());
    return std::nullopt;
  }
  if (!st->is_dir) {
    ctx_.logger->debug("walk: {} is not a directory", root);
    return std::nullopt;
  }
  return build(root, *st, 0, path_base(root) == "internal");
}

std::optional<Directory> TreeBuilder::build(
  const std::string & path, const fs::FileStat & st, int depth, bool internal)
{
  if (!visit(st)) {
    ctx_.logger->debug("walk: {} already visited", path);
    return std::nullopt;
  }

  Directory dir;
  dir.path = path;
  dir.basename = std::string(path_base(path));
  dir.is_internal = internal;
  dir.stat = st;
  dir.depth = depth;
  if (depth >= max_depth_) {
    return dir;
  }

  const auto listing = list(path);
  set_package(dir, indexer_.index(path, st, &listing));

  const auto subdirs = subdirectories(path, listing);
  std::vector<Task> tasks;
  for (const auto & sub : subdirs) {
    tasks.push_back([this, &sub, child = path_join(path, sub.name), depth, internal]() {
      return build(child, sub, depth + 1, internal || sub.name == "internal");
    });
  }

  for (auto & c : run_all(std::move(tasks))) {
    if (c) {
      dir.children.push_back(std::move(*c));
    }
  }
  return dir;
}

// ============================================================================
// Update
// ============================================================================

std::optional<Directory> TreeBuilder::update_root(const Directory & prev)
{
  auto st = ctx_.fs.stat(prev.path);
  if (!st || !st->is_dir) {
    ctx_.logger->info("source root {} is gone", prev.path);
    delete_subtree(prev);
    return std::nullopt;
  }
  return update(prev, *st);
}

std::optional<Directory> TreeBuilder::update(const Directory & prev, const fs::FileStat & st)
{
  if (!visit(st)) {
    ctx_.logger->debug("walk: {} already visited", prev.path);
    delete_subtree(prev);
    return std::nullopt;
  }

  Directory dir = shallow_copy(prev, st);
  if (dir.depth >= max_depth_) {
    return dir;
  }

  std::vector<Task> tasks;
  std::vector<fs::FileStat> listing;
  std::vector<fs::FileStat> subdirs;

  if (fs::same_file(prev.stat, st)) {
    set_package(dir, indexer_.index(prev.path, st, nullptr));
    for (const auto & c : prev.children) {
      tasks.push_back([this, &c]() -> std::optional<Directory> {
        auto cst = ctx_.fs.stat(c.path);
        if (!cst || !cst->is_dir) {
          delete_subtree(c);
          return std::nullopt;
        }
        return update(c, *cst);
      });
    }
  } else {
    listing = list(prev.path);
    set_package(dir, indexer_.index(prev.path, st, &listing));

    subdirs = subdirectories(prev.path, listing);
    std::set<std::string_view> present;
    for (const auto & sub : subdirs) {
      present.insert(sub.name);
      if (const Directory * old = prev.child(sub.name)) {
        tasks.push_back([this, old, &sub]() { return update(*old, sub); });
      } else {
        tasks.push_back(
          [this, &sub, child = path_join(prev.path, sub.name), depth = dir.depth,
           internal = dir.is_internal]() {
            return build(child, sub, depth + 1, internal || sub.name == "internal");
          });
      }
    }

    for (const auto & c : prev.children) {
      if (present.find(c.basename) == present.end()) {
        delete_subtree(c);
      }
    }
  }

  for (auto & c : run_all(std::move(tasks))) {
    if (c) {
      dir.children.push_back(std::move(*c));
    }
  }
  return dir;
}

void TreeBuilder::delete_subtree(const Directory & dir)
{
  indexer_.remove(dir.path);
  for (const auto & c : dir.children) {
    delete_subtree(c);
  }
}

}  // namespace pkgindex
