#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace pkgindex::syntax
{

inline constexpr std::array<std::string_view, 25> k_go_keywords = {
  "break",   "case",   "chan",   "const",       "continue", "default", "defer",
  "else",    "fallthrough",      "for",         "func",     "go",      "goto",
  "if",      "import", "interface", "map",      "package",  "range",   "return",
  "select",  "struct", "switch", "type",        "var",
};

[[nodiscard]] inline bool is_go_keyword(std::string_view s) noexcept
{
  return std::find(k_go_keywords.begin(), k_go_keywords.end(), s) != k_go_keywords.end();
}

}  // namespace pkgindex::syntax
