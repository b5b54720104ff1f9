// pkgindex/basic/string_interner.cpp - String intern pool implementation
#include "pkgindex/basic/string_interner.hpp"

#include <mutex>

namespace pkgindex
{

std::string_view StringInterner::intern(std::string_view s)
{
  {
    std::shared_lock lock(mu_);
    if (auto it = strings_.find(s); it != strings_.end()) {
      return *it;
    }
  }

  // Another writer may have inserted s between the two locks; emplace
  // returns the existing node in that case.
  std::unique_lock lock(mu_);
  const auto [it, inserted] = strings_.emplace(s);
  (void)inserted;
  return *it;
}

size_t StringInterner::size() const
{
  std::shared_lock lock(mu_);
  return strings_.size();
}

}  // namespace pkgindex
