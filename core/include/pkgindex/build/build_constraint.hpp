// pkgindex/build/build_constraint.hpp - Go build constraints
//
// Evaluates the file-name and in-file rules that decide whether a source
// file takes part in a build for a given platform and tag set.
//
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pkgindex::build
{

/// Reports whether a single build tag is satisfied.
using TagPredicate = std::function<bool(std::string_view)>;

/**
 * Build constraint comments found in a file header.
 */
struct HeaderConstraints
{
  /// Expression of the //go:build line, without the prefix.
  std::optional<std::string> go_build;

  /// Argument text of each "// +build" line that precedes the last blank
  /// line of the header.
  std::vector<std::string> plus_build;

  /// More than one //go:build line was present.
  bool duplicate_go_build = false;
};

/**
 * Scan the comment block at the top of a file for build constraints.
 *
 * Scanning stops at the first line that is neither blank nor a comment.
 */
[[nodiscard]] HeaderConstraints scan_header_constraints(std::string_view src);

/**
 * Evaluate a //go:build expression ("linux && (amd64 || arm64) && !cgo").
 *
 * @return the result, or std::nullopt when the expression is malformed
 */
[[nodiscard]] std::optional<bool> eval_go_build_expr(
  std::string_view expr, const TagPredicate & has_tag);

/**
 * Evaluate the arguments of a "// +build" line: space-separated options are
 * OR-ed, comma-separated terms are AND-ed, and "!" negates a term.
 */
[[nodiscard]] bool eval_plus_build_line(std::string_view args, const TagPredicate & has_tag);

/**
 * Decide whether the header of src admits the file. A //go:build line takes
 * precedence over "// +build" lines.
 */
[[nodiscard]] bool should_build(std::string_view src, const TagPredicate & has_tag);

/**
 * Apply the _GOOS, _GOARCH and _GOOS_GOARCH file-name rules. Only the part of
 * the name after its first '_' is considered, and a trailing "_test" is
 * ignored.
 */
[[nodiscard]] bool good_os_arch_file(
  std::string_view name, std::string_view goos, std::string_view goarch);

/// Whether name has an extension that a build may consume.
[[nodiscard]] bool is_buildable_extension(std::string_view ext) noexcept;

}  // namespace pkgindex::build
