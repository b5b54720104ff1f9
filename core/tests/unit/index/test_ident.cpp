#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pkgindex/basic/diagnostic.hpp"
#include "pkgindex/basic/source_file.hpp"
#include "pkgindex/basic/string_interner.hpp"
#include "pkgindex/index/ident.hpp"
#include "pkgindex/index/ident_collector.hpp"
#include "pkgindex/index/ident_index.hpp"
#include "pkgindex/syntax/parser.hpp"

using pkgindex::Ident;
using pkgindex::IdentIndex;
using pkgindex::IdentScope;
using pkgindex::StringInterner;
using pkgindex::TypInfo;
using pkgindex::TypKind;

namespace
{

Ident make_ident(
  std::string_view file, std::string_view name, TypKind kind, int64_t offset,
  std::string_view recv = {})
{
  Ident ident;
  ident.name = name;
  ident.recv = recv;
  ident.package_name = "p";
  ident.file = file;
  ident.info = TypInfo::make(kind, offset, 1);
  return ident;
}

std::vector<std::string> qualified_names(const std::vector<Ident> & idents)
{
  std::vector<std::string> out;
  for (const auto & i : idents) {
    out.push_back(i.qualified_name());
  }
  return out;
}

}  // namespace

// ============================================================================
// TypInfo
// ============================================================================

TEST(IndexTypInfo, PacksKindLineAndOffset)
{
  const auto info = TypInfo::make(TypKind::Func, 140, 12);
  EXPECT_EQ(info.kind(), TypKind::Func);
  EXPECT_EQ(info.line(), 12U);
  EXPECT_EQ(info.offset(), 140U);
  EXPECT_EQ(info.raw(), (uint64_t{140} << 32) | (uint64_t{12} << 4) | 4U);
  EXPECT_EQ(TypInfo::from_raw(info.raw()), info);
}

TEST(IndexTypInfo, LimitsOfEachField)
{
  const auto max = TypInfo::make(TypKind::Interface, UINT32_MAX, TypInfo::k_line_mask);
  EXPECT_EQ(max.kind(), TypKind::Interface);
  EXPECT_EQ(max.line(), TypInfo::k_line_mask);
  EXPECT_EQ(max.offset(), UINT32_MAX);
}

TEST(IndexTypInfo, OutOfRangeFieldsEncodeAsZero)
{
  const auto big_offset = TypInfo::make(TypKind::Var, int64_t{1} << 33, 7);
  EXPECT_EQ(big_offset.offset(), 0U);
  EXPECT_EQ(big_offset.line(), 7U);
  EXPECT_EQ(big_offset.kind(), TypKind::Var);

  const auto negative = TypInfo::make(TypKind::Const, -1, -1);
  EXPECT_EQ(negative.offset(), 0U);
  EXPECT_EQ(negative.line(), 0U);
  EXPECT_EQ(negative.kind(), TypKind::Const);

  const auto big_line = TypInfo::make(TypKind::Type, 99, int64_t{1} << 28);
  EXPECT_EQ(big_line.offset(), 99U);
  EXPECT_EQ(big_line.line(), 0U);
}

TEST(IndexTypInfo, KindNames)
{
  EXPECT_EQ(pkgindex::to_string(TypKind::Const), "ConstDecl");
  EXPECT_EQ(pkgindex::to_string(TypKind::Method), "MethodDecl");
  EXPECT_EQ(pkgindex::to_string(static_cast<TypKind>(7)), "InvalidDecl");
  EXPECT_EQ(pkgindex::typ_kind_from_string("InterfaceDecl"), TypKind::Interface);
  EXPECT_FALSE(pkgindex::typ_kind_from_string("Interface").has_value());
  EXPECT_TRUE(pkgindex::is_valid(TypKind::Interface));
  EXPECT_FALSE(pkgindex::is_valid(static_cast<TypKind>(7)));
}

TEST(IndexTypInfo, JsonProjection)
{
  const auto info = TypInfo::make(TypKind::Func, 140, 12);
  const nlohmann::json j = info;
  EXPECT_EQ(j, nlohmann::json::parse(R"({"Kind": "FuncDecl", "Line": 12, "Offset": 140})"));

  const auto back = j.get<TypInfo>();
  EXPECT_EQ(back, info);
}

TEST(IndexTypInfo, JsonRejectsUnknownKind)
{
  const auto j = nlohmann::json::parse(R"({"Kind": "Bogus", "Line": 1, "Offset": 2})");
  EXPECT_THROW((void)j.get<TypInfo>(), std::invalid_argument);
}

// ============================================================================
// Ident
// ============================================================================

TEST(IndexIdent, QualifiedNameAndExport)
{
  const auto fn = make_ident("/src/p/a.go", "New", TypKind::Func, 0);
  EXPECT_EQ(fn.qualified_name(), "New");
  EXPECT_TRUE(fn.is_exported());

  const auto method = make_ident("/src/p/a.go", "close", TypKind::Method, 0, "File");
  EXPECT_EQ(method.qualified_name(), "File.close");
  EXPECT_FALSE(method.is_exported());
}

TEST(IndexIdent, JsonProjection)
{
  auto ident = make_ident("/src/p/a.go", "Close", TypKind::Method, 30, "File");
  ident.import_path = "example.com/p";

  const nlohmann::json j = ident;
  EXPECT_EQ(j.at("Name"), "Close");
  EXPECT_EQ(j.at("Recv"), "File");
  EXPECT_EQ(j.at("Package"), "p");
  EXPECT_EQ(j.at("Path"), "example.com/p");
  EXPECT_EQ(j.at("File"), "/src/p/a.go");
  EXPECT_EQ(j.at("Info").at("Kind"), "MethodDecl");
  EXPECT_EQ(j.at("Info").at("Offset"), 30);
}

// ============================================================================
// IdentIndex
// ============================================================================

TEST(IndexIdentIndex, LookupByKindAcrossPackages)
{
  IdentIndex index;
  index.replace(
    "/src/p", {
                make_ident("/src/p/a.go", "File", TypKind::Type, 5),
                make_ident("/src/p/a.go", "New", TypKind::Func, 40),
                make_ident("/src/p/a.go", "Close", TypKind::Method, 80, "File"),
              });
  index.replace("/src/q", {make_ident("/src/q/b.go", "New", TypKind::Func, 3)});

  EXPECT_EQ(index.package_count(), 2U);

  const auto news = index.lookup(TypKind::Func, "New");
  ASSERT_EQ(news.size(), 2U);
  EXPECT_EQ(news[0].file, "/src/p/a.go");
  EXPECT_EQ(news[1].file, "/src/q/b.go");

  // Methods are found under their bare name.
  const auto closes = index.lookup(TypKind::Method, "Close");
  ASSERT_EQ(closes.size(), 1U);
  EXPECT_EQ(closes[0].recv, "File");

  EXPECT_TRUE(index.lookup(TypKind::Type, "New").empty());
  EXPECT_TRUE(index.lookup(static_cast<TypKind>(7), "New").empty());
}

TEST(IndexIdentIndex, ExportsOrderedByQualifiedName)
{
  IdentIndex index;
  index.replace(
    "/src/p", {
                make_ident("/src/p/a.go", "New", TypKind::Func, 40),
                make_ident("/src/p/a.go", "Close", TypKind::Method, 80, "File"),
                make_ident("/src/p/a.go", "File", TypKind::Type, 5),
              });

  const std::vector<std::string> expected = {"File", "File.Close", "New"};
  EXPECT_EQ(qualified_names(index.exports("/src/p")), expected);
  EXPECT_TRUE(index.exports("/src/none").empty());
}

TEST(IndexIdentIndex, ReplaceDropsStaleEntries)
{
  IdentIndex index;
  index.replace(
    "/src/p", {
                make_ident("/src/p/a.go", "New", TypKind::Func, 40),
                make_ident("/src/p/a.go", "Close", TypKind::Method, 80, "File"),
              });
  index.replace("/src/q", {make_ident("/src/q/b.go", "New", TypKind::Func, 3)});

  index.replace("/src/p", {make_ident("/src/p/a.go", "New", TypKind::Func, 44)});

  EXPECT_TRUE(index.lookup(TypKind::Method, "Close").empty());
  const auto news = index.lookup(TypKind::Func, "New");
  ASSERT_EQ(news.size(), 2U);
  EXPECT_EQ(news[0].info.offset(), 44U);
}

TEST(IndexIdentIndex, DuplicateDeclarationsAreAllRemoved)
{
  IdentIndex index;
  index.replace(
    "/src/p", {
                make_ident("/src/p/b.go", "init", TypKind::Func, 10),
                make_ident("/src/p/a.go", "init", TypKind::Func, 20),
              });

  const auto inits = index.lookup(TypKind::Func, "init");
  ASSERT_EQ(inits.size(), 2U);
  EXPECT_EQ(inits[0].file, "/src/p/a.go");

  // Repeated init functions each keep their own entry.
  const auto exported = index.exports("/src/p");
  ASSERT_EQ(exported.size(), 2U);
  EXPECT_EQ(exported[0].file, "/src/p/a.go");
  EXPECT_EQ(exported[1].file, "/src/p/b.go");

  EXPECT_TRUE(index.remove("/src/p"));
  EXPECT_FALSE(index.remove("/src/p"));
  EXPECT_FALSE(index.contains("/src/p"));
  EXPECT_TRUE(index.lookup(TypKind::Func, "init").empty());
  EXPECT_TRUE(index.all().empty());
}

TEST(IndexIdentIndex, AllSortedByFileAndOffset)
{
  IdentIndex index;
  index.replace(
    "/src/q", {
                make_ident("/src/q/a.go", "Z", TypKind::Var, 9),
                make_ident("/src/q/a.go", "Y", TypKind::Const, 2),
              });
  index.replace("/src/p", {make_ident("/src/p/z.go", "X", TypKind::Func, 100)});

  const auto all = index.all();
  ASSERT_EQ(all.size(), 3U);
  EXPECT_EQ(all[0].name, "X");
  EXPECT_EQ(all[1].name, "Y");
  EXPECT_EQ(all[2].name, "Z");
}

TEST(IndexIdentIndex, InvalidKindsAreSkipped)
{
  IdentIndex index;
  auto bad = make_ident("/src/p/a.go", "Bad", TypKind::Func, 1);
  bad.info = TypInfo::from_raw(7);
  index.replace("/src/p", {bad});

  EXPECT_TRUE(index.contains("/src/p"));
  EXPECT_TRUE(index.exports("/src/p").empty());
}

// ============================================================================
// Collector
// ============================================================================

TEST(IndexIdentCollector, CollectsTopLevelDeclarations)
{
  const std::string src =
    "package foo\n"
    "\n"
    "const Max = 10\n"
    "var _ = 1\n"
    "type File struct{}\n"
    "func (f *File) Close() error { return nil }\n"
    "func New() *File { return nil }\n"
    "func (x pkg.T) Skip() {}\n";
  const pkgindex::SourceFile file("/src/foo/a.go", src);
  pkgindex::DiagnosticBag diags;
  const auto ast = pkgindex::syntax::parse_declarations(file, diags);
  ASSERT_TRUE(ast.has_value());

  StringInterner strings;
  const IdentScope scope{"foo", "example.com/foo", "/src/foo/a.go"};
  const auto idents = pkgindex::collect_file_idents(*ast, file, scope, strings);

  ASSERT_EQ(idents.size(), 4U);
  EXPECT_EQ(idents[0].name, "Max");
  EXPECT_EQ(idents[0].info.kind(), TypKind::Const);
  EXPECT_EQ(idents[0].info.line(), 3U);
  EXPECT_EQ(idents[0].info.offset(), src.find("Max"));

  EXPECT_EQ(idents[1].name, "File");
  EXPECT_EQ(idents[1].info.kind(), TypKind::Type);
  EXPECT_EQ(idents[1].info.line(), 5U);

  EXPECT_EQ(idents[2].name, "Close");
  EXPECT_EQ(idents[2].recv, "File");
  EXPECT_EQ(idents[2].info.kind(), TypKind::Method);
  EXPECT_EQ(idents[2].info.offset(), src.find("Close"));

  EXPECT_EQ(idents[3].name, "New");
  EXPECT_EQ(idents[3].info.kind(), TypKind::Func);
  EXPECT_EQ(idents[3].info.line(), 7U);

  for (const auto & ident : idents) {
    EXPECT_EQ(ident.package_name, "foo");
    EXPECT_EQ(ident.import_path, "example.com/foo");
    EXPECT_EQ(ident.file, "/src/foo/a.go");
  }

  // Names are views into the pool, not into the source.
  EXPECT_EQ(idents[0].name.data(), strings.intern("Max").data());
  EXPECT_EQ(idents[0].file.data(), strings.intern("/src/foo/a.go").data());
}
