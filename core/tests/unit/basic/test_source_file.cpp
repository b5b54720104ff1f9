#include <gtest/gtest.h>

#include "pkgindex/basic/diagnostic.hpp"
#include "pkgindex/basic/source_file.hpp"

using pkgindex::DiagnosticBag;
using pkgindex::Severity;
using pkgindex::SourceFile;
using pkgindex::SourceRange;

TEST(BasicSourceFile, LineColumnIsOneBased)
{
  SourceFile file("/x/a.go", "package a\n\nfunc F() {}\n");
  EXPECT_EQ(file.line_count(), 4U);

  auto lc = file.line_column(0);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 1U);

  lc = file.line_column(11);  // 'f' of func
  EXPECT_EQ(lc.line, 3U);
  EXPECT_EQ(lc.column, 1U);

  lc = file.line_column(16);  // 'F'
  EXPECT_EQ(lc.line, 3U);
  EXPECT_EQ(lc.column, 6U);
}

TEST(BasicSourceFile, OffsetsPastEndAreClamped)
{
  SourceFile file("/x/a.go", "ab\ncd");
  const auto lc = file.line_column(1000);
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 3U);
  EXPECT_EQ(file.slice(SourceRange(3, 1000)), "cd");
  EXPECT_EQ(file.slice(SourceRange(1, 1)), "");
  EXPECT_EQ(file.slice(SourceRange()), "");
}

TEST(BasicDiagnostic, BagTracksErrors)
{
  DiagnosticBag diags;
  EXPECT_FALSE(diags.has_errors());
  diags.report_warning(SourceRange(0, 1), "odd");
  EXPECT_FALSE(diags.has_errors());
  diags.report_error(SourceRange(3, 4), "expected 'package'");
  ASSERT_TRUE(diags.has_errors());
  EXPECT_EQ(diags.size(), 2U);
  EXPECT_EQ(diags.first_error()->severity, Severity::Error);

  SourceFile file("/x/a.go", "ab\ncd");
  EXPECT_EQ(
    pkgindex::format_diagnostic(*diags.first_error(), file),
    "/x/a.go:2:1: error: expected 'package'");
}
