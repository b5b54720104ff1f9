// pkgindex/basic/path_util.cpp - Slash-separated path helpers
#include "pkgindex/basic/path_util.hpp"

#include <vector>

namespace pkgindex
{

bool has_root(std::string_view path, std::string_view root) noexcept
{
  if (root.empty() || path.size() < root.size()) {
    return false;
  }
  if (path.substr(0, root.size()) != root) {
    return false;
  }
  if (path.size() == root.size() || root.back() == '/') {
    return true;
  }
  return path[root.size()] == '/';
}

std::string_view trim_path_prefix(std::string_view path, std::string_view root) noexcept
{
  if (!has_root(path, root)) {
    return path;
  }
  path.remove_prefix(root.size());
  while (!path.empty() && path.front() == '/') {
    path.remove_prefix(1);
  }
  return path;
}

std::string_view path_base(std::string_view path) noexcept
{
  if (path.empty()) {
    return path;
  }
  while (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  if (path == "/") {
    return path;
  }
  const auto slash = path.rfind('/');
  if (slash == std::string_view::npos) {
    return path;
  }
  return path.substr(slash + 1);
}

std::string_view path_dir(std::string_view path) noexcept
{
  const auto slash = path.rfind('/');
  if (slash == std::string_view::npos) {
    return ".";
  }
  if (slash == 0) {
    return path.substr(0, 1);
  }
  return path.substr(0, slash);
}

std::string path_join(std::string_view a, std::string_view b)
{
  if (a.empty()) {
    return std::string(b);
  }
  if (b.empty()) {
    return std::string(a);
  }
  std::string out(a);
  if (out.back() != '/') {
    out.push_back('/');
  }
  while (!b.empty() && b.front() == '/') {
    b.remove_prefix(1);
  }
  out.append(b);
  return out;
}

std::string clean_path(std::string_view path)
{
  if (path.empty()) {
    return ".";
  }
  const bool rooted = path.front() == '/';

  std::vector<std::string_view> elems;
  size_t pos = 0;
  while (pos <= path.size()) {
    auto next = path.find('/', pos);
    if (next == std::string_view::npos) {
      next = path.size();
    }
    const auto elem = path.substr(pos, next - pos);
    pos = next + 1;

    if (elem.empty() || elem == ".") {
      continue;
    }
    if (elem == "..") {
      if (!elems.empty() && elems.back() != "..") {
        elems.pop_back();
      } else if (!rooted) {
        elems.push_back(elem);
      }
      continue;
    }
    elems.push_back(elem);
  }

  std::string out;
  if (rooted) {
    out.push_back('/');
  }
  for (size_t i = 0; i < elems.size(); ++i) {
    if (i > 0) {
      out.push_back('/');
    }
    out.append(elems[i]);
  }
  if (out.empty()) {
    return ".";
  }
  return out;
}

std::string_view path_ext(std::string_view path) noexcept
{
  for (size_t i = path.size(); i > 0; --i) {
    const char c = path[i - 1];
    if (c == '/') {
      break;
    }
    if (c == '.') {
      return path.substr(i - 1);
    }
  }
  return {};
}

std::string_view internal_root(std::string_view path) noexcept
{
  constexpr std::string_view k_internal = "internal";

  // Scan elements right to left for the last one named "internal".
  size_t end = path.size();
  while (end > 0) {
    auto slash = path.rfind('/', end - 1);
    const size_t begin = (slash == std::string_view::npos) ? 0 : slash + 1;
    if (path.substr(begin, end - begin) == k_internal) {
      if (slash == std::string_view::npos) {
        return ".";
      }
      return slash == 0 ? path.substr(0, 1) : path.substr(0, slash);
    }
    if (slash == std::string_view::npos) {
      break;
    }
    end = slash;
  }
  return path;
}

bool has_internal_element(std::string_view path) noexcept
{
  size_t pos = 0;
  while (pos <= path.size()) {
    auto next = path.find('/', pos);
    if (next == std::string_view::npos) {
      next = path.size();
    }
    if (path.substr(pos, next - pos) == "internal") {
      return true;
    }
    pos = next + 1;
  }
  return false;
}

bool is_valid_name(std::string_view name) noexcept
{
  return !name.empty() && name.front() != '.' && name.front() != '_';
}

bool is_ignored_dir_name(std::string_view name) noexcept
{
  return name == "testdata" || !is_valid_name(name);
}

bool is_go_file_name(std::string_view name) noexcept
{
  constexpr std::string_view k_suffix = ".go";
  return is_valid_name(name) && name.size() > k_suffix.size() &&
         name.substr(name.size() - k_suffix.size()) == k_suffix;
}

bool is_go_test_file_name(std::string_view name) noexcept
{
  constexpr std::string_view k_suffix = "_test.go";
  return is_go_file_name(name) && name.size() >= k_suffix.size() &&
         name.substr(name.size() - k_suffix.size()) == k_suffix;
}

}  // namespace pkgindex
