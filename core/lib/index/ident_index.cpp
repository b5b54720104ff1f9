// pkgindex/index/ident_index.cpp - Identifier tables
#include "pkgindex/index/ident_index.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include "pkgindex/basic/path_util.hpp"

namespace pkgindex
{

namespace
{

bool ident_less(const Ident & a, const Ident & b)
{
  if (a.file != b.file) {
    return a.file < b.file;
  }
  return a.info.offset() < b.info.offset();
}

}  // namespace

void IdentIndex::erase_locked(std::string_view dir)
{
  auto it = by_package_.find(dir);
  if (it == by_package_.end()) {
    return;
  }

  for (const auto & ident : it->second.idents) {
    auto & table = by_kind_[static_cast<size_t>(ident.info.kind())];
    auto entry = table.find(ident.name);
    if (entry == table.end()) {
      continue;
    }
    auto & list = entry->second;
    list.erase(
      std::remove_if(
        list.begin(), list.end(), [&](const Ident & x) { return path_dir(x.file) == dir; }),
      list.end());
    if (list.empty()) {
      table.erase(entry);
    }
  }
  by_package_.erase(it);
}

void IdentIndex::replace(std::string_view dir, std::vector<Ident> idents)
{
  std::sort(idents.begin(), idents.end(), ident_less);

  std::unique_lock lock(mu_);
  erase_locked(dir);

  auto & entry = by_package_[dir];
  for (auto & ident : idents) {
    if (!is_valid(ident.info.kind())) {
      continue;
    }
    auto & list = by_kind_[static_cast<size_t>(ident.info.kind())][ident.name];
    list.insert(std::upper_bound(list.begin(), list.end(), ident, ident_less), ident);
    entry.exports.emplace(ident.qualified_name(), ident);
    entry.idents.push_back(ident);
  }
}

bool IdentIndex::remove(std::string_view dir)
{
  std::unique_lock lock(mu_);
  const bool found = by_package_.find(dir) != by_package_.end();
  erase_locked(dir);
  return found;
}

std::vector<Ident> IdentIndex::lookup(TypKind kind, std::string_view name) const
{
  if (!is_valid(kind)) {
    return {};
  }
  std::shared_lock lock(mu_);
  const auto & table = by_kind_[static_cast<size_t>(kind)];
  auto it = table.find(name);
  if (it == table.end()) {
    return {};
  }
  return it->second;
}

std::vector<Ident> IdentIndex::exports(std::string_view dir) const
{
  std::shared_lock lock(mu_);
  std::vector<Ident> out;
  auto it = by_package_.find(dir);
  if (it == by_package_.end()) {
    return out;
  }
  out.reserve(it->second.exports.size());
  for (const auto & [qualified, ident] : it->second.exports) {
    out.push_back(ident);
  }
  return out;
}

std::vector<Ident> IdentIndex::all() const
{
  std::shared_lock lock(mu_);
  std::vector<Ident> out;
  for (const auto & [dir, entry] : by_package_) {
    out.insert(out.end(), entry.idents.begin(), entry.idents.end());
  }
  std::sort(out.begin(), out.end(), ident_less);
  return out;
}

size_t IdentIndex::package_count() const
{
  std::shared_lock lock(mu_);
  return by_package_.size();
}

bool IdentIndex::contains(std::string_view dir) const
{
  std::shared_lock lock(mu_);
  return by_package_.find(dir) != by_package_.end();
}

}  // namespace pkgindex
