// pkgindex/basic/string_interner.hpp - Concurrent string intern pool
//
// Import paths, directory names and identifier names repeat across the whole
// index. Interning them lets every Package, File and Ident share one copy.
//
#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace pkgindex
{

/**
 * A thread-safe string intern pool.
 *
 * intern() returns a view of the canonical copy of its argument. Equal inputs
 * always yield views of the same storage. Views stay valid for the lifetime
 * of the interner; entries are never removed.
 */
class StringInterner
{
public:
  StringInterner() = default;

  StringInterner(const StringInterner &) = delete;
  StringInterner & operator=(const StringInterner &) = delete;

  /// Return the canonical copy of s, inserting it on first use.
  [[nodiscard]] std::string_view intern(std::string_view s);

  /// Number of distinct strings held.
  [[nodiscard]] size_t size() const;

private:
  struct Hash
  {
    using is_transparent = void;
    size_t operator()(std::string_view s) const noexcept
    {
      return std::hash<std::string_view>{}(s);
    }
  };

  mutable std::shared_mutex mu_;
  std::unordered_set<std::string, Hash, std::equal_to<>> strings_;
};

}  // namespace pkgindex
