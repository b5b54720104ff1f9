// pkgindex/index/directory.cpp - Directory tree snapshot
#include "pkgindex/index/directory.hpp"

#include <algorithm>

#include "pkgindex/basic/path_util.hpp"

namespace pkgindex
{

namespace
{

void collect_packages(const Directory & dir, std::vector<const Directory *> & out)
{
  if (dir.has_pkg) {
    out.push_back(&dir);
  }
  for (const auto & c : dir.children) {
    collect_packages(c, out);
  }
}

bool visible_from(const Directory & dir, std::string_view reference)
{
  if (!dir.is_internal) {
    return true;
  }
  return !reference.empty() && has_root(reference, internal_root(dir.path));
}

}  // namespace

const Directory * Directory::child(std::string_view name) const
{
  auto it = std::lower_bound(
    children.begin(), children.end(), name,
    [](const Directory & d, std::string_view n) { return d.basename < n; });
  if (it == children.end() || it->basename != name) {
    return nullptr;
  }
  return &*it;
}

const Directory * Directory::lookup(std::string_view dir) const
{
  if (!has_root(dir, path)) {
    return nullptr;
  }

  const Directory * cur = this;
  std::string_view rest = trim_path_prefix(dir, path);
  while (!rest.empty() && cur != nullptr) {
    const size_t slash = rest.find('/');
    const std::string_view elem = rest.substr(0, slash);
    cur = cur->child(elem);
    rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);
  }
  return cur;
}

std::vector<std::string> Directory::import_list(std::string_view reference) const
{
  std::vector<std::string> out;
  for (const Directory * d : list_packages()) {
    if (visible_from(*d, reference)) {
      out.push_back(d->path);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<const Directory *> Directory::list_packages() const
{
  std::vector<const Directory *> out;
  collect_packages(*this, out);
  return out;
}

bool Directory::operator==(const Directory & other) const
{
  return path == other.path && basename == other.basename && pkg_name == other.pkg_name &&
         has_pkg == other.has_pkg && is_internal == other.is_internal &&
         fs::same_file(stat, other.stat) && depth == other.depth && children == other.children;
}

}  // namespace pkgindex
