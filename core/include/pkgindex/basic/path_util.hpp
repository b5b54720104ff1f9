// pkgindex/basic/path_util.hpp - Slash-separated path helpers
//
// Paths handled by the index are absolute, clean and slash-separated. These
// helpers operate on strings directly rather than std::filesystem::path so
// interned views can be compared without allocation.
//
#pragma once

#include <string>
#include <string_view>

namespace pkgindex
{

/**
 * Report whether path lies inside the tree rooted at root.
 *
 * Matching is component-aware: "/a/bc" is not inside "/a/b".
 */
[[nodiscard]] bool has_root(std::string_view path, std::string_view root) noexcept;

/**
 * Strip root and any following separators from path.
 *
 * Returns path unchanged when it is not inside root, and "" when path equals
 * root.
 */
[[nodiscard]] std::string_view trim_path_prefix(
  std::string_view path, std::string_view root) noexcept;

/// Last element of path ("" for an empty path, "/" for the root).
[[nodiscard]] std::string_view path_base(std::string_view path) noexcept;

/// Everything but the last element of path, without a trailing separator.
[[nodiscard]] std::string_view path_dir(std::string_view path) noexcept;

/// Join two slash-separated fragments, collapsing a duplicate separator.
[[nodiscard]] std::string path_join(std::string_view a, std::string_view b);

/// Lexically clean a path: collapse "//", drop "." and resolve "..".
[[nodiscard]] std::string clean_path(std::string_view path);

/// Extension of the last element including its dot, or "".
[[nodiscard]] std::string_view path_ext(std::string_view path) noexcept;

/**
 * Return the directory that may import packages below the last "internal"
 * element of path: the parent of that element. Returns path when it has no
 * "internal" element.
 */
[[nodiscard]] std::string_view internal_root(std::string_view path) noexcept;

/// Whether any element of path is exactly "internal".
[[nodiscard]] bool has_internal_element(std::string_view path) noexcept;

/**
 * Whether name may be a package directory or tracked source file: it is
 * non-empty and does not start with '.' or '_'.
 */
[[nodiscard]] bool is_valid_name(std::string_view name) noexcept;

/// Whether a directory with this basename is skipped during a walk.
[[nodiscard]] bool is_ignored_dir_name(std::string_view name) noexcept;

/// Whether name is a tracked Go source file (valid name, ".go" suffix).
[[nodiscard]] bool is_go_file_name(std::string_view name) noexcept;

/// Whether name is a Go test file ("_test.go" suffix).
[[nodiscard]] bool is_go_test_file_name(std::string_view name) noexcept;

}  // namespace pkgindex
