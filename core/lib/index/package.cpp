// pkgindex/index/package.cpp - Package and file model
#include "pkgindex/index/package.hpp"

#include <algorithm>
#include <utility>

namespace pkgindex
{

std::string_view to_string(FileKind kind) noexcept
{
  switch (kind) {
    case FileKind::IgnoredGoFile:
      return "IgnoredGoFile";
    case FileKind::TestGoFile:
      return "TestGoFile";
    case FileKind::GoFile:
      return "GoFile";
    case FileKind::Any:
      return "Any";
  }
  return "Invalid";
}

size_t Package::slot(FileKind kind) noexcept
{
  switch (kind) {
    case FileKind::IgnoredGoFile:
      return 0;
    case FileKind::TestGoFile:
      return 1;
    default:
      return 2;
  }
}

void Package::add_file(FileKind kind, File file)
{
  const size_t target = slot(kind);
  for (size_t i = 0; i < files_.size(); ++i) {
    if (i != target) {
      auto it = files_[i].find(file.name);
      if (it != files_[i].end()) {
        files_[i].erase(it);
      }
    }
  }
  std::string key = file.name;
  files_[target].insert_or_assign(std::move(key), std::move(file));
}

bool Package::remove_file(std::string_view file_name)
{
  for (auto & m : files_) {
    auto it = m.find(file_name);
    if (it != m.end()) {
      m.erase(it);
      return true;
    }
  }
  return false;
}

const File * Package::lookup_file(std::string_view file_name) const
{
  for (const auto & m : files_) {
    auto it = m.find(file_name);
    if (it != m.end()) {
      return &it->second;
    }
  }
  return nullptr;
}

File * Package::lookup_file(std::string_view file_name)
{
  for (auto & m : files_) {
    auto it = m.find(file_name);
    if (it != m.end()) {
      return &it->second;
    }
  }
  return nullptr;
}

std::optional<FileKind> Package::kind_of(std::string_view file_name) const
{
  for (size_t i = 0; i < files_.size(); ++i) {
    if (files_[i].find(file_name) != files_[i].end()) {
      return k_kinds[i];
    }
  }
  return std::nullopt;
}

std::vector<const File *> Package::files(FileKind mask) const
{
  std::vector<const File *> out;
  for (size_t i = 0; i < files_.size(); ++i) {
    if (!has_kind(mask, k_kinds[i])) {
      continue;
    }
    for (const auto & [name, file] : files_[i]) {
      out.push_back(&file);
    }
  }
  std::sort(out.begin(), out.end(), [](const File * a, const File * b) { return a->name < b->name; });
  return out;
}

std::vector<std::string> Package::file_names(FileKind mask) const
{
  std::vector<std::string> out;
  for (const File * f : files(mask)) {
    out.push_back(f->name);
  }
  return out;
}

std::vector<std::string> Package::file_paths(FileKind mask) const
{
  std::vector<std::string> out;
  for (const File * f : files(mask)) {
    out.push_back(f->path);
  }
  std::sort(out.begin(), out.end());
  return out;
}

size_t Package::file_count(FileKind mask) const noexcept
{
  size_t n = 0;
  for (size_t i = 0; i < files_.size(); ++i) {
    if (has_kind(mask, k_kinds[i])) {
      n += files_[i].size();
    }
  }
  return n;
}

void Package::for_each_file(const std::function<void(FileKind, File &)> & fn)
{
  for (size_t i = 0; i < files_.size(); ++i) {
    for (auto & [name, file] : files_[i]) {
      fn(k_kinds[i], file);
    }
  }
}

bool Package::operator==(const Package & other) const
{
  return dir == other.dir && name == other.name && import_path == other.import_path &&
         root == other.root && src_root == other.src_root &&
         is_in_standard_tree == other.is_in_standard_tree && installed == other.installed &&
         fs::same_file(stat, other.stat) && error == other.error && files_ == other.files_;
}

}  // namespace pkgindex
