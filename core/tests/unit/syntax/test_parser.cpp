#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "pkgindex/basic/diagnostic.hpp"
#include "pkgindex/basic/source_file.hpp"
#include "pkgindex/syntax/ast.hpp"
#include "pkgindex/syntax/parser.hpp"

using pkgindex::DiagnosticBag;
using pkgindex::SourceFile;
using pkgindex::syntax::FileAst;
using pkgindex::syntax::FuncDecl;
using pkgindex::syntax::GenDecl;
using pkgindex::syntax::GenDeclKind;
using pkgindex::syntax::imports_cgo;
using pkgindex::syntax::parse_declarations;
using pkgindex::syntax::parse_package_name;

namespace
{

// Keeps the source alive for the string views held by the AST.
struct Parsed
{
  explicit Parsed(std::string src) : file("/src/p/a.go", std::move(src))
  {
    ast = parse_declarations(file, diags);
  }

  [[nodiscard]] std::vector<const FuncDecl *> funcs() const
  {
    std::vector<const FuncDecl *> out;
    for (const auto & d : ast->decls) {
      if (const auto * fn = std::get_if<FuncDecl>(&d)) {
        out.push_back(fn);
      }
    }
    return out;
  }

  [[nodiscard]] std::vector<const GenDecl *> gen_decls() const
  {
    std::vector<const GenDecl *> out;
    for (const auto & d : ast->decls) {
      if (const auto * g = std::get_if<GenDecl>(&d)) {
        out.push_back(g);
      }
    }
    return out;
  }

  SourceFile file;
  DiagnosticBag diags;
  std::optional<FileAst> ast;
};

}  // namespace

TEST(SyntaxParser, PackageClauseAndImports)
{
  Parsed p(
    "// Package foo does things.\n"
    "package foo\n"
    "\n"
    "import \"fmt\"\n"
    "import (\n"
    "\t\"os\"\n"
    "\tfp \"path/filepath\"\n"
    "\t. \"strings\"\n"
    "\t_ \"embed\"\n"
    ")\n");

  ASSERT_TRUE(p.ast.has_value());
  EXPECT_TRUE(p.diags.empty());
  EXPECT_EQ(p.ast->package.name.text, "foo");
  EXPECT_EQ(p.file.slice(p.ast->package.range), "package foo");

  const auto & imports = p.ast->imports;
  ASSERT_EQ(imports.size(), 5U);
  EXPECT_EQ(imports[0].path, "fmt");
  EXPECT_FALSE(imports[0].alias.has_value());
  EXPECT_EQ(imports[1].path, "os");
  EXPECT_EQ(imports[2].path, "path/filepath");
  ASSERT_TRUE(imports[2].alias.has_value());
  EXPECT_EQ(imports[2].alias->text, "fp");
  ASSERT_TRUE(imports[3].alias.has_value());
  EXPECT_EQ(imports[3].alias->text, ".");
  ASSERT_TRUE(imports[4].alias.has_value());
  EXPECT_EQ(imports[4].alias->text, "_");

  ASSERT_EQ(p.ast->comments.size(), 1U);
  EXPECT_EQ(p.file.slice(p.ast->comments[0]), "// Package foo does things.");
}

TEST(SyntaxParser, FunctionsAndMethodReceivers)
{
  Parsed p(
    "package foo\n"
    "func Top() {}\n"
    "func (s *Stack[T]) Push(v T) { s.items = append(s.items, v) }\n"
    "func (Server) Serve() error { return nil }\n"
    "func (r (*Reader)) Read(p []byte) (int, error) { return 0, nil }\n"
    "func (x pkg.Remote) Bad() {}\n"
    "func Map[K comparable, V any](m map[K]V) []K { return nil }\n"
    "func external() int\n");

  ASSERT_TRUE(p.ast.has_value());
  EXPECT_TRUE(p.diags.empty());

  const auto fns = p.funcs();
  ASSERT_EQ(fns.size(), 7U);

  EXPECT_EQ(fns[0]->name.text, "Top");
  EXPECT_FALSE(fns[0]->has_receiver);
  EXPECT_TRUE(fns[0]->has_body);
  EXPECT_EQ(p.file.slice(fns[0]->range), "func Top() {}");

  EXPECT_EQ(fns[1]->name.text, "Push");
  EXPECT_TRUE(fns[1]->has_receiver);
  ASSERT_TRUE(fns[1]->receiver_type.has_value());
  EXPECT_EQ(fns[1]->receiver_type->text, "Stack");

  ASSERT_TRUE(fns[2]->receiver_type.has_value());
  EXPECT_EQ(fns[2]->receiver_type->text, "Server");

  EXPECT_EQ(fns[3]->name.text, "Read");
  ASSERT_TRUE(fns[3]->receiver_type.has_value());
  EXPECT_EQ(fns[3]->receiver_type->text, "Reader");

  // A qualified receiver type has no local base type.
  EXPECT_EQ(fns[4]->name.text, "Bad");
  EXPECT_TRUE(fns[4]->has_receiver);
  EXPECT_FALSE(fns[4]->receiver_type.has_value());

  EXPECT_EQ(fns[5]->name.text, "Map");
  EXPECT_TRUE(fns[5]->has_type_params);

  EXPECT_EQ(fns[6]->name.text, "external");
  EXPECT_FALSE(fns[6]->has_body);
}

TEST(SyntaxParser, GroupedAndSingleGeneralDeclarations)
{
  Parsed p(
    "package foo\n"
    "const Pi = 3.14\n"
    "const (\n"
    "\tA = iota\n"
    "\tB\n"
    "\t_\n"
    ")\n"
    "var x, y int = 1, 2\n"
    "var (\n"
    "\thandler = func() { println(\"x\") }\n"
    "\tm map[string][]int\n"
    ")\n"
    "type Point struct { X, Y int }\n"
    "type (\n"
    "\tID = string\n"
    "\tList[T any] []T\n"
    "\tMatrix [4][4]float64\n"
    ")\n");

  ASSERT_TRUE(p.ast.has_value());
  EXPECT_TRUE(p.diags.empty());

  const auto decls = p.gen_decls();
  ASSERT_EQ(decls.size(), 6U);

  EXPECT_EQ(decls[0]->kind, GenDeclKind::Const);
  EXPECT_FALSE(decls[0]->grouped);
  ASSERT_EQ(decls[0]->value_specs.size(), 1U);
  EXPECT_EQ(decls[0]->value_specs[0].names[0].text, "Pi");

  EXPECT_TRUE(decls[1]->grouped);
  ASSERT_EQ(decls[1]->value_specs.size(), 3U);
  EXPECT_EQ(decls[1]->value_specs[0].names[0].text, "A");
  EXPECT_EQ(decls[1]->value_specs[1].names[0].text, "B");
  EXPECT_EQ(decls[1]->value_specs[2].names[0].text, "_");

  EXPECT_EQ(decls[2]->kind, GenDeclKind::Var);
  ASSERT_EQ(decls[2]->value_specs.size(), 1U);
  ASSERT_EQ(decls[2]->value_specs[0].names.size(), 2U);
  EXPECT_EQ(decls[2]->value_specs[0].names[1].text, "y");

  ASSERT_EQ(decls[3]->value_specs.size(), 2U);
  EXPECT_EQ(decls[3]->value_specs[0].names[0].text, "handler");
  EXPECT_EQ(decls[3]->value_specs[1].names[0].text, "m");

  EXPECT_EQ(decls[4]->kind, GenDeclKind::Type);
  ASSERT_EQ(decls[4]->type_specs.size(), 1U);
  EXPECT_EQ(decls[4]->type_specs[0].name.text, "Point");
  EXPECT_FALSE(decls[4]->type_specs[0].is_alias);

  ASSERT_EQ(decls[5]->type_specs.size(), 3U);
  EXPECT_EQ(decls[5]->type_specs[0].name.text, "ID");
  EXPECT_TRUE(decls[5]->type_specs[0].is_alias);
  EXPECT_EQ(decls[5]->type_specs[1].name.text, "List");
  EXPECT_TRUE(decls[5]->type_specs[1].has_type_params);
  EXPECT_EQ(decls[5]->type_specs[2].name.text, "Matrix");
  EXPECT_FALSE(decls[5]->type_specs[2].has_type_params);
}

TEST(SyntaxParser, RecoversAtNextTopLevelKeyword)
{
  Parsed p(
    "package foo\n"
    "func () {}\n"
    "var = 3\n"
    "func Good() {}\n"
    "type T int\n");

  ASSERT_TRUE(p.ast.has_value());
  ASSERT_EQ(p.diags.size(), 2U);
  EXPECT_EQ(p.diags.all()[0].message, "expected function name, found {");
  EXPECT_EQ(p.diags.all()[1].message, "expected identifier, found =");

  const auto fns = p.funcs();
  ASSERT_EQ(fns.size(), 1U);
  EXPECT_EQ(fns[0]->name.text, "Good");

  const auto decls = p.gen_decls();
  ASSERT_EQ(decls.size(), 1U);
  EXPECT_EQ(decls[0]->type_specs[0].name.text, "T");
}

TEST(SyntaxParser, MissingSemicolonAfterPackageClause)
{
  Parsed p("package foo func F() {}\n");

  ASSERT_TRUE(p.ast.has_value());
  ASSERT_EQ(p.diags.size(), 1U);
  EXPECT_EQ(p.diags.all()[0].message, "expected ';' after package clause, found keyword 'func'");
  ASSERT_EQ(p.funcs().size(), 1U);
}

TEST(SyntaxParser, LateImportIsReportedButKept)
{
  Parsed p(
    "package foo\n"
    "func F() {}\n"
    "import \"os\"\n");

  ASSERT_TRUE(p.ast.has_value());
  ASSERT_EQ(p.diags.size(), 1U);
  EXPECT_EQ(
    p.diags.all()[0].message,
    "imports must appear before other declarations, found keyword 'import'");
  ASSERT_EQ(p.ast->imports.size(), 1U);
  EXPECT_EQ(p.ast->imports[0].path, "os");
}

TEST(SyntaxParser, MissingPackageClauseYieldsNoFile)
{
  Parsed p("foo bar\n");

  EXPECT_FALSE(p.ast.has_value());
  ASSERT_EQ(p.diags.size(), 1U);
  EXPECT_EQ(p.diags.all()[0].message, "expected 'package', found identifier 'foo'");
}

TEST(SyntaxParser, PackageNameSkipsLeadingComments)
{
  const std::string_view src =
    "// Copyright 2024\n"
    "\n"
    "/* Package doc\n   spans lines. */\n"
    "package main // trailing\n"
    "\n"
    "func main() {\n";

  const auto name = parse_package_name(src);
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(*name, "main");
  // The result is a view into the input.
  EXPECT_GE(name->data(), src.data());
  EXPECT_LE(name->data() + name->size(), src.data() + src.size());
}

TEST(SyntaxParser, PackageNameRejectsMalformedClauses)
{
  EXPECT_FALSE(parse_package_name("").has_value());
  EXPECT_FALSE(parse_package_name("package").has_value());
  EXPECT_FALSE(parse_package_name("package 123").has_value());
  EXPECT_FALSE(parse_package_name("func main() {}").has_value());
  // Only the clause is inspected; a broken body does not matter.
  EXPECT_EQ(parse_package_name("package p\nfunc {{{").value_or(""), "p");
}

TEST(SyntaxParser, ImportsCgo)
{
  EXPECT_TRUE(imports_cgo(
    "package p\n"
    "/*\n"
    "#include <stdio.h>\n"
    "*/\n"
    "import \"C\"\n"));
  EXPECT_TRUE(imports_cgo("package p\nimport (\"fmt\"; \"C\")\n"));
  EXPECT_FALSE(imports_cgo("package p\nimport \"fmt\"\n"));
  // Imports after the first declaration are not part of the import block.
  EXPECT_FALSE(imports_cgo("package p\nfunc f() {}\nimport \"C\"\n"));
  EXPECT_FALSE(imports_cgo("not go at all"));
}
