// pkgindex/syntax/parser.hpp - Declaration-level Go parser
#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "pkgindex/basic/diagnostic.hpp"
#include "pkgindex/syntax/ast.hpp"
#include "pkgindex/syntax/lexer.hpp"
#include "pkgindex/syntax/token.hpp"

namespace pkgindex::syntax
{

enum class ParseMode : uint8_t {
  PackageClauseOnly,  ///< Stop after "package <name>"
  ImportsOnly,        ///< Stop after the import declarations
  Declarations,       ///< Imports and every top-level declaration
};

/**
 * Parses Go source down to top-level declarations.
 *
 * Tokens are pulled from the lexer on demand, so PackageClauseOnly reads no
 * further than the clause. Function bodies, initializers and type literals
 * are skipped by bracket matching. Syntax errors are reported to the
 * DiagnosticBag and parsing resumes at the next top-level keyword.
 */
class Parser
{
public:
  Parser(std::string_view src, DiagnosticBag & diags, ParseMode mode = ParseMode::Declarations)
  : lexer_(src), diags_(diags), mode_(mode)
  {
  }

  /**
   * Parse the file.
   *
   * @return the file, or std::nullopt when the package clause is missing or
   *         malformed. Later errors leave a partial FileAst and diagnostics.
   */
  [[nodiscard]] std::optional<FileAst> parse_file();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0);
  [[nodiscard]] bool at(TokenKind k, size_t lookahead = 0) { return cur(lookahead).kind == k; }
  [[nodiscard]] bool at_keyword(std::string_view kw) { return cur().is_keyword(kw); }
  [[nodiscard]] bool at_eof() { return at(TokenKind::Eof); }

  Token advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);
  void expect_semicolon(std::string_view after);

  void error_at(const Token & t, std::string_view msg);

  /// Skip to the next top-level keyword at brace depth 0.
  void synchronize_top_level();

  /// Skip a balanced open/close group starting at the current token.
  bool skip_balanced(TokenKind open, TokenKind close);

  /// Skip tokens until a Semicolon or unmatched ')' at depth 0.
  void skip_expression_list();

  /// Skip one type expression.
  void skip_type();
  [[nodiscard]] bool at_type_start();

  /// After "[" following a type name: is this a type parameter list?
  [[nodiscard]] bool at_type_params();

  // Top-level
  [[nodiscard]] std::optional<PackageClause> parse_package_clause();
  void parse_import_decl(FileAst & file);
  [[nodiscard]] std::optional<ImportSpec> parse_import_spec();
  [[nodiscard]] std::optional<FuncDecl> parse_func_decl();
  [[nodiscard]] std::optional<Name> parse_receiver();
  [[nodiscard]] std::optional<GenDecl> parse_gen_decl(GenDeclKind kind);
  [[nodiscard]] std::optional<TypeSpec> parse_type_spec();
  [[nodiscard]] std::optional<ValueSpec> parse_value_spec();

  Lexer lexer_;
  DiagnosticBag & diags_;
  ParseMode mode_;
  std::vector<Token> tokens_;
  std::vector<SourceRange> comments_;
  size_t idx_ = 0;
};

/**
 * Parse just the package clause of src.
 *
 * @return the declared package name as a view into src, or std::nullopt.
 */
[[nodiscard]] std::optional<std::string_view> parse_package_name(std::string_view src);

/// Whether src imports the pseudo-package "C".
[[nodiscard]] bool imports_cgo(std::string_view src);

/// Parse every top-level declaration of file.
[[nodiscard]] std::optional<FileAst> parse_declarations(
  const SourceFile & file, DiagnosticBag & diags);

}  // namespace pkgindex::syntax
