// pkgindex/index/package_registry.cpp - Packages by source root and name
#include "pkgindex/index/package_registry.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include "pkgindex/basic/path_util.hpp"

namespace pkgindex
{

namespace
{

bool is_indexed_name(std::string_view name)
{
  return !name.empty() && name != "main";
}

}  // namespace

void PackageRegistry::insert(PackagePtr pkg)
{
  if (!pkg) {
    return;
  }

  std::unique_lock lock(mu_);
  auto & paths = by_path_[pkg->src_root];

  auto prev = paths.find(pkg->import_path);
  if (prev != paths.end() && prev->second->name != pkg->name) {
    auto it = by_name_.find(prev->second->name);
    if (it != by_name_.end() && it->second == prev->second->dir) {
      by_name_.erase(it);
    }
  }

  if (is_indexed_name(pkg->name)) {
    by_name_.insert_or_assign(pkg->name, pkg->dir);
  }
  paths.insert_or_assign(pkg->import_path, std::move(pkg));
}

PackagePtr PackageRegistry::remove_locked(std::string_view src_root, std::string_view import_path)
{
  auto root_it = by_path_.find(src_root);
  if (root_it == by_path_.end()) {
    return nullptr;
  }
  auto it = root_it->second.find(import_path);
  if (it == root_it->second.end()) {
    return nullptr;
  }

  PackagePtr pkg = std::move(it->second);
  root_it->second.erase(it);
  if (root_it->second.empty()) {
    by_path_.erase(root_it);
  }

  auto name_it = by_name_.find(pkg->name);
  if (name_it != by_name_.end() && name_it->second == pkg->dir) {
    by_name_.erase(name_it);
  }
  return pkg;
}

PackagePtr PackageRegistry::remove(std::string_view src_root, std::string_view import_path)
{
  std::unique_lock lock(mu_);
  return remove_locked(src_root, import_path);
}

PackagePtr PackageRegistry::remove_by_dir(std::string_view dir)
{
  std::unique_lock lock(mu_);
  std::string_view root;
  if (root_for_locked(dir, &root) == nullptr) {
    return nullptr;
  }
  // root views a key that remove_locked may erase.
  const std::string src_root(root);
  return remove_locked(src_root, trim_path_prefix(dir, src_root));
}

std::vector<PackagePtr> PackageRegistry::remove_root(std::string_view src_root)
{
  std::unique_lock lock(mu_);
  std::vector<PackagePtr> removed;
  auto root_it = by_path_.find(src_root);
  if (root_it == by_path_.end()) {
    return removed;
  }

  for (auto & [path, pkg] : root_it->second) {
    auto name_it = by_name_.find(pkg->name);
    if (name_it != by_name_.end() && name_it->second == pkg->dir) {
      by_name_.erase(name_it);
    }
    removed.push_back(std::move(pkg));
  }
  by_path_.erase(root_it);
  return removed;
}

const PackageRegistry::PathMap * PackageRegistry::root_for_locked(
  std::string_view dir, std::string_view * root) const
{
  const PathMap * best = nullptr;
  size_t best_len = 0;
  for (const auto & [src_root, paths] : by_path_) {
    if (src_root.size() >= best_len && has_root(dir, src_root)) {
      best = &paths;
      best_len = src_root.size();
      if (root != nullptr) {
        *root = src_root;
      }
    }
  }
  return best;
}

PackagePtr PackageRegistry::lookup(std::string_view src_root, std::string_view import_path) const
{
  std::shared_lock lock(mu_);
  auto root_it = by_path_.find(src_root);
  if (root_it == by_path_.end()) {
    return nullptr;
  }
  auto it = root_it->second.find(import_path);
  return it != root_it->second.end() ? it->second : nullptr;
}

PackagePtr PackageRegistry::lookup_by_path(std::string_view dir) const
{
  std::shared_lock lock(mu_);
  std::string_view root;
  const PathMap * paths = root_for_locked(dir, &root);
  if (paths == nullptr) {
    return nullptr;
  }
  auto it = paths->find(trim_path_prefix(dir, root));
  return it != paths->end() ? it->second : nullptr;
}

PackagePtr PackageRegistry::lookup_by_name(std::string_view name) const
{
  std::shared_lock lock(mu_);
  auto name_it = by_name_.find(name);
  if (name_it == by_name_.end()) {
    return nullptr;
  }
  std::string_view root;
  const PathMap * paths = root_for_locked(name_it->second, &root);
  if (paths == nullptr) {
    return nullptr;
  }
  auto it = paths->find(trim_path_prefix(name_it->second, root));
  return it != paths->end() ? it->second : nullptr;
}

std::vector<PackagePtr> PackageRegistry::packages() const
{
  std::vector<PackagePtr> out;
  {
    std::shared_lock lock(mu_);
    for (const auto & [root, paths] : by_path_) {
      for (const auto & [path, pkg] : paths) {
        out.push_back(pkg);
      }
    }
  }
  std::sort(out.begin(), out.end(), [](const PackagePtr & a, const PackagePtr & b) {
    return a->dir < b->dir;
  });
  return out;
}

std::vector<std::string> PackageRegistry::roots() const
{
  std::shared_lock lock(mu_);
  std::vector<std::string> out;
  out.reserve(by_path_.size());
  for (const auto & [root, paths] : by_path_) {
    out.push_back(root);
  }
  return out;
}

std::map<std::string, std::string> PackageRegistry::name_index() const
{
  std::shared_lock lock(mu_);
  return {by_name_.begin(), by_name_.end()};
}

size_t PackageRegistry::size() const
{
  std::shared_lock lock(mu_);
  size_t n = 0;
  for (const auto & [root, paths] : by_path_) {
    n += paths.size();
  }
  return n;
}

void PackageRegistry::invalidate_environment()
{
  std::unique_lock lock(mu_);
  for (auto & [root, paths] : by_path_) {
    for (auto & [path, pkg] : paths) {
      auto copy = std::make_shared<Package>(*pkg);
      copy->classified_revision = 0;
      pkg = std::move(copy);
    }
  }
}

}  // namespace pkgindex
