// pkgindex/basic/source_file.cpp - Source text and line table implementation
#include "pkgindex/basic/source_file.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace pkgindex
{

SourceFile::SourceFile(std::string path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  line_starts_.push_back(0);
  for (uint32_t pos = 0;; ++pos) {
    const auto nl = content_.find('\n', pos);
    if (nl == std::string::npos) {
      break;
    }
    pos = static_cast<uint32_t>(nl);
    line_starts_.push_back(pos + 1);
  }
}

LineColumn SourceFile::line_column(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));

  // line_starts_[0] == 0, so the bound is never the first element.
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto index = static_cast<uint32_t>(std::distance(line_starts_.begin(), next)) - 1;
  return {index + 1, offset - line_starts_[index] + 1};
}

std::string_view SourceFile::slice(SourceRange range) const noexcept
{
  if (!range.is_valid() || range.begin > content_.size() || range.end < range.begin) {
    return {};
  }
  const std::string_view text(content_);
  return text.substr(range.begin, range.end - range.begin);
}

}  // namespace pkgindex
