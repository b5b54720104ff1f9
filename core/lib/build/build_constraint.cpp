#include "pkgindex/build/build_constraint.hpp"

#include <array>
#include <cctype>

#include "pkgindex/build/known_platforms.hpp"

namespace pkgindex::build
{
namespace
{

std::string_view trim_space(std::string_view s) noexcept
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

bool starts_with(std::string_view s, std::string_view prefix) noexcept
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool is_tag_char(char c) noexcept
{
  const auto u = static_cast<unsigned char>(c);
  return (std::isalnum(u) != 0) || c == '_' || c == '.';
}

/// "//go:build" followed by a space or end of line.
bool is_go_build_comment(std::string_view line) noexcept
{
  constexpr std::string_view k_prefix = "//go:build";
  if (!starts_with(line, k_prefix)) {
    return false;
  }
  return line.size() == k_prefix.size() ||
         std::isspace(static_cast<unsigned char>(line[k_prefix.size()])) != 0;
}

/// Argument text of a "// +build" line, or nullopt for any other line.
std::optional<std::string_view> plus_build_args(std::string_view line) noexcept
{
  if (!starts_with(line, "//")) {
    return std::nullopt;
  }
  line = trim_space(line.substr(2));
  constexpr std::string_view k_plus_build = "+build";
  if (!starts_with(line, k_plus_build)) {
    return std::nullopt;
  }
  const auto rest = line.substr(k_plus_build.size());
  if (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front())) == 0) {
    return std::nullopt;
  }
  return trim_space(rest);
}

// ============================================================================
// //go:build expression evaluation
// ============================================================================

class ExprParser
{
public:
  ExprParser(std::string_view src, const TagPredicate & has_tag) : src_(src), has_tag_(has_tag) {}

  std::optional<bool> parse()
  {
    auto v = parse_or();
    skip_space();
    if (!v || pos_ != src_.size()) {
      return std::nullopt;
    }
    return v;
  }

private:
  void skip_space()
  {
    while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool consume(std::string_view op)
  {
    skip_space();
    if (starts_with(src_.substr(pos_), op)) {
      pos_ += op.size();
      return true;
    }
    return false;
  }

  std::optional<bool> parse_or()
  {
    auto lhs = parse_and();
    while (lhs && consume("||")) {
      auto rhs = parse_and();
      if (!rhs) {
        return std::nullopt;
      }
      lhs = *lhs || *rhs;
    }
    return lhs;
  }

  std::optional<bool> parse_and()
  {
    auto lhs = parse_not();
    while (lhs && consume("&&")) {
      auto rhs = parse_not();
      if (!rhs) {
        return std::nullopt;
      }
      lhs = *lhs && *rhs;
    }
    return lhs;
  }

  std::optional<bool> parse_not()
  {
    if (consume("!")) {
      auto v = parse_not();
      if (!v) {
        return std::nullopt;
      }
      return !*v;
    }
    if (consume("(")) {
      auto v = parse_or();
      if (!v || !consume(")")) {
        return std::nullopt;
      }
      return v;
    }
    return parse_tag();
  }

  std::optional<bool> parse_tag()
  {
    skip_space();
    const size_t start = pos_;
    while (pos_ < src_.size() && is_tag_char(src_[pos_])) {
      ++pos_;
    }
    if (pos_ == start) {
      return std::nullopt;
    }
    return has_tag_(src_.substr(start, pos_ - start));
  }

  std::string_view src_;
  const TagPredicate & has_tag_;
  size_t pos_ = 0;
};

/// One comma-separated term of a +build option: "tag" or "!tag".
bool eval_plus_build_term(std::string_view term, const TagPredicate & has_tag)
{
  bool negate = false;
  if (starts_with(term, "!")) {
    negate = true;
    term.remove_prefix(1);
  }
  if (term.empty() || starts_with(term, "!")) {
    return false;
  }
  for (const char c : term) {
    if (!is_tag_char(c)) {
      return false;
    }
  }
  return has_tag(term) != negate;
}

bool os_matches(std::string_view file_os, std::string_view goos) noexcept
{
  if (file_os == goos) {
    return true;
  }
  return (goos == "android" && file_os == "linux") ||
         (goos == "illumos" && file_os == "solaris") || (goos == "ios" && file_os == "darwin");
}

}  // namespace

// ============================================================================
// Header scanning
// ============================================================================

HeaderConstraints scan_header_constraints(std::string_view src)
{
  HeaderConstraints out;

  // Lines before the most recent blank line may carry +build constraints.
  std::vector<std::string_view> pending;
  bool in_block_comment = false;

  size_t pos = 0;
  while (pos < src.size()) {
    auto nl = src.find('\n', pos);
    if (nl == std::string_view::npos) {
      nl = src.size();
    }
    const auto line = trim_space(src.substr(pos, nl - pos));
    pos = nl + 1;

    if (in_block_comment) {
      if (line.find("*/") != std::string_view::npos) {
        in_block_comment = false;
        // Text after the comment end must itself be blank.
        if (!trim_space(line.substr(line.find("*/") + 2)).empty()) {
          break;
        }
      }
      continue;
    }

    if (line.empty()) {
      for (const auto l : pending) {
        if (auto args = plus_build_args(l)) {
          out.plus_build.emplace_back(*args);
        }
      }
      pending.clear();
      continue;
    }

    if (starts_with(line, "//")) {
      if (is_go_build_comment(line)) {
        if (out.go_build) {
          out.duplicate_go_build = true;
        } else {
          out.go_build = std::string(trim_space(line.substr(std::string_view("//go:build").size())));
        }
      }
      pending.push_back(line);
      continue;
    }

    if (starts_with(line, "/*")) {
      const auto close = line.find("*/", 2);
      if (close == std::string_view::npos) {
        in_block_comment = true;
        continue;
      }
      if (trim_space(line.substr(close + 2)).empty()) {
        continue;
      }
    }

    // Package clause or other code: the header ends here.
    break;
  }

  return out;
}

std::optional<bool> eval_go_build_expr(std::string_view expr, const TagPredicate & has_tag)
{
  ExprParser parser(expr, has_tag);
  return parser.parse();
}

bool eval_plus_build_line(std::string_view args, const TagPredicate & has_tag)
{
  size_t pos = 0;
  bool any_option = false;
  while (pos < args.size()) {
    while (pos < args.size() && std::isspace(static_cast<unsigned char>(args[pos])) != 0) {
      ++pos;
    }
    const size_t start = pos;
    while (pos < args.size() && std::isspace(static_cast<unsigned char>(args[pos])) == 0) {
      ++pos;
    }
    if (pos == start) {
      break;
    }
    any_option = true;

    const auto option = args.substr(start, pos - start);
    bool all = true;
    size_t tpos = 0;
    while (tpos <= option.size()) {
      auto comma = option.find(',', tpos);
      if (comma == std::string_view::npos) {
        comma = option.size();
      }
      if (!eval_plus_build_term(option.substr(tpos, comma - tpos), has_tag)) {
        all = false;
        break;
      }
      tpos = comma + 1;
    }
    if (all) {
      return true;
    }
  }
  // "// +build" with no options constrains nothing.
  return !any_option;
}

bool should_build(std::string_view src, const TagPredicate & has_tag)
{
  const auto header = scan_header_constraints(src);
  if (header.duplicate_go_build) {
    return false;
  }
  if (header.go_build) {
    return eval_go_build_expr(*header.go_build, has_tag).value_or(false);
  }
  for (const auto & line : header.plus_build) {
    if (!eval_plus_build_line(line, has_tag)) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// File names
// ============================================================================

bool good_os_arch_file(std::string_view name, std::string_view goos, std::string_view goarch)
{
  if (const auto dot = name.find('.'); dot != std::string_view::npos) {
    name = name.substr(0, dot);
  }

  // "linux.go" is not constrained; "x_linux.go" is.
  const auto underscore = name.find('_');
  if (underscore == std::string_view::npos) {
    return true;
  }
  name = name.substr(underscore);

  std::vector<std::string_view> parts;
  size_t pos = 0;
  while (pos <= name.size()) {
    auto next = name.find('_', pos);
    if (next == std::string_view::npos) {
      next = name.size();
    }
    parts.push_back(name.substr(pos, next - pos));
    pos = next + 1;
  }
  if (!parts.empty() && parts.back() == "test") {
    parts.pop_back();
  }

  const size_t n = parts.size();
  if (n >= 2 && is_known_os(parts[n - 2]) && is_known_arch(parts[n - 1])) {
    return parts[n - 1] == goarch && os_matches(parts[n - 2], goos);
  }
  if (n >= 1 && is_known_os(parts[n - 1])) {
    return os_matches(parts[n - 1], goos);
  }
  if (n >= 1 && is_known_arch(parts[n - 1])) {
    return parts[n - 1] == goarch;
  }
  return true;
}

bool is_buildable_extension(std::string_view ext) noexcept
{
  static constexpr std::array<std::string_view, 15> k_exts = {
    ".go", ".c",   ".cc",  ".cxx", ".cpp",  ".m",       ".s",    ".h",
    ".hh", ".hpp", ".hxx", ".S",   ".swig", ".swigcxx", ".syso",
  };
  for (const auto e : k_exts) {
    if (e == ext) {
      return true;
    }
  }
  return false;
}

}  // namespace pkgindex::build
