// pkgindex/basic/source_file.hpp - Source text, byte ranges and line tables
//
// Go source files are addressed by byte offset. Line numbers are computed on
// demand from a line table built once per file.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pkgindex
{

// ============================================================================
// SourceRange - Half-open byte range
// ============================================================================

/**
 * A byte range [begin, end) within one source file.
 */
struct SourceRange
{
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  uint32_t begin = k_invalid_offset;
  uint32_t end = k_invalid_offset;

  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(uint32_t b, uint32_t e) noexcept : begin(b), end(e) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin != k_invalid_offset && end != k_invalid_offset;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() && end >= begin ? end - begin : 0;
  }

  [[nodiscard]] constexpr bool operator==(const SourceRange & other) const noexcept
  {
    return begin == other.begin && end == other.end;
  }
};

/// 1-based line and column.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;
};

// ============================================================================
// SourceFile - Content and line table
// ============================================================================

/**
 * Owns the text of one source file together with its line table.
 */
class SourceFile
{
public:
  SourceFile() : line_starts_{0} {}
  SourceFile(std::string path, std::string content);

  [[nodiscard]] const std::string & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  /**
   * Convert a byte offset to a 1-based line and column.
   *
   * Offsets past the end of the content are clamped to the end.
   */
  [[nodiscard]] LineColumn line_column(uint32_t offset) const noexcept;

  /// Text covered by range, clamped to the content.
  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;

private:
  std::string path_;
  std::string content_;
  std::vector<uint32_t> line_starts_;  ///< Offset of the first byte of each line
};

}  // namespace pkgindex
