#include "pkgindex/syntax/parser.hpp"

#include <string>

#include <fmt/format.h>

namespace pkgindex::syntax
{

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead)
{
  const size_t want = idx_ + lookahead;
  while (tokens_.size() <= want) {
    if (!tokens_.empty() && tokens_.back().kind == TokenKind::Eof) {
      return tokens_.back();
    }
    Token t = lexer_.next_token();
    if (t.is_comment()) {
      comments_.push_back(t.range);
      continue;
    }
    tokens_.push_back(t);
  }
  return tokens_[want];
}

Token Parser::advance()
{
  Token t = cur();
  if (t.kind != TokenKind::Eof) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), fmt::format("expected {}", what));
  return false;
}

void Parser::expect_semicolon(std::string_view after)
{
  if (match(TokenKind::Semicolon) || at(TokenKind::RParen) || at(TokenKind::RBrace) || at_eof()) {
    return;
  }
  error_at(cur(), fmt::format("expected ';' after {}", after));
  synchronize_top_level();
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  std::string found = t.kind == TokenKind::Semicolon && t.implicit
                        ? std::string("newline")
                        : std::string(to_string(t.kind));
  if (t.kind == TokenKind::Identifier || t.kind == TokenKind::Keyword) {
    found = fmt::format("{} '{}'", found, t.text);
  }
  diags_.report_error(t.range, fmt::format("{}, found {}", msg, found));
}

void Parser::synchronize_top_level()
{
  int depth = 0;
  while (!at_eof()) {
    const Token & t = cur();
    if (depth == 0 && t.kind == TokenKind::Keyword &&
        (t.text == "func" || t.text == "const" || t.text == "var" || t.text == "type" ||
         t.text == "import")) {
      return;
    }
    if (t.kind == TokenKind::LBrace || t.kind == TokenKind::LParen ||
        t.kind == TokenKind::LBracket) {
      ++depth;
    } else if (
      (t.kind == TokenKind::RBrace || t.kind == TokenKind::RParen ||
       t.kind == TokenKind::RBracket) &&
      depth > 0) {
      --depth;
    }
    advance();
  }
}

bool Parser::skip_balanced(TokenKind open, TokenKind close)
{
  const Token start = cur();
  if (!match(open)) {
    error_at(start, fmt::format("expected '{}'", to_string(open)));
    return false;
  }
  int depth = 1;
  while (depth > 0) {
    if (at_eof()) {
      error_at(cur(), fmt::format("expected '{}' to match '{}'", to_string(close), to_string(open)));
      return false;
    }
    const TokenKind k = advance().kind;
    if (k == open) {
      ++depth;
    } else if (k == close) {
      --depth;
    }
  }
  return true;
}

void Parser::skip_expression_list()
{
  int depth = 0;
  while (!at_eof()) {
    const TokenKind k = cur().kind;
    if (depth == 0 && (k == TokenKind::Semicolon || k == TokenKind::RParen)) {
      return;
    }
    if (k == TokenKind::LBrace || k == TokenKind::LParen || k == TokenKind::LBracket) {
      ++depth;
    } else if (k == TokenKind::RBrace || k == TokenKind::RParen || k == TokenKind::RBracket) {
      --depth;
      if (depth < 0) {
        return;
      }
    }
    advance();
  }
}

bool Parser::at_type_start()
{
  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::Identifier:
    case TokenKind::Star:
    case TokenKind::LParen:
    case TokenKind::LBracket:
    case TokenKind::Arrow:
    case TokenKind::Ellipsis:
      return true;
    case TokenKind::Keyword:
      return t.text == "map" || t.text == "chan" || t.text == "func" || t.text == "struct" ||
             t.text == "interface";
    default:
      return false;
  }
}

void Parser::skip_type()
{
  const Token t = cur();
  switch (t.kind) {
    case TokenKind::Identifier:
      advance();
      if (at(TokenKind::Dot) && at(TokenKind::Identifier, 1)) {
        advance();
        advance();
      }
      if (at(TokenKind::LBracket)) {
        // Instantiation: T[int]
        skip_balanced(TokenKind::LBracket, TokenKind::RBracket);
      }
      return;
    case TokenKind::Star:
    case TokenKind::Ellipsis:
      advance();
      skip_type();
      return;
    case TokenKind::LParen:
      skip_balanced(TokenKind::LParen, TokenKind::RParen);
      return;
    case TokenKind::LBracket:
      skip_balanced(TokenKind::LBracket, TokenKind::RBracket);
      skip_type();
      return;
    case TokenKind::Arrow:
      advance();
      if (at_keyword("chan")) {
        advance();
      }
      skip_type();
      return;
    case TokenKind::Keyword:
      if (t.text == "map") {
        advance();
        skip_balanced(TokenKind::LBracket, TokenKind::RBracket);
        skip_type();
      } else if (t.text == "chan") {
        advance();
        match(TokenKind::Arrow);
        skip_type();
      } else if (t.text == "func") {
        advance();
        skip_balanced(TokenKind::LParen, TokenKind::RParen);
        if (at(TokenKind::LParen)) {
          skip_balanced(TokenKind::LParen, TokenKind::RParen);
        } else if (at_type_start()) {
          skip_type();
        }
      } else if (t.text == "struct" || t.text == "interface") {
        advance();
        skip_balanced(TokenKind::LBrace, TokenKind::RBrace);
      } else {
        error_at(t, "expected type");
      }
      return;
    default:
      error_at(t, "expected type");
      return;
  }
}

bool Parser::at_type_params()
{
  // [P any], [P, Q any], [P ~int], [P *C], [P C[int]]; but not [N]T or [pkg.N]T.
  if (!at(TokenKind::LBracket) || !at(TokenKind::Identifier, 1)) {
    return false;
  }
  switch (cur(2).kind) {
    case TokenKind::Identifier:
    case TokenKind::Keyword:
    case TokenKind::Tilde:
    case TokenKind::Comma:
    case TokenKind::LBracket:
    case TokenKind::LParen:
      return true;
    case TokenKind::Star:
      return at(TokenKind::Identifier, 3);
    default:
      return false;
  }
}

// ============================================================================
// Top-level
// ============================================================================

std::optional<PackageClause> Parser::parse_package_clause()
{
  const Token kw = cur();
  if (!kw.is_keyword("package")) {
    error_at(kw, "expected 'package'");
    return std::nullopt;
  }
  advance();

  const Token name = cur();
  if (name.kind != TokenKind::Identifier) {
    error_at(name, "expected package name");
    return std::nullopt;
  }
  advance();

  PackageClause clause;
  clause.name = Name{name.text, name.range};
  clause.range = SourceRange(kw.begin(), name.end());
  return clause;
}

std::optional<ImportSpec> Parser::parse_import_spec()
{
  ImportSpec spec;
  const uint32_t start = cur().begin();

  if (at(TokenKind::Identifier) || at(TokenKind::Dot)) {
    const Token alias = advance();
    spec.alias = Name{alias.text, alias.range};
  }

  const Token path = cur();
  if (path.kind != TokenKind::StringLiteral && path.kind != TokenKind::RawStringLiteral) {
    error_at(path, "expected import path");
    return std::nullopt;
  }
  advance();

  spec.path = path.text;
  spec.range = SourceRange(start, path.end());
  return spec;
}

void Parser::parse_import_decl(FileAst & file)
{
  advance();  // import

  if (!match(TokenKind::LParen)) {
    if (auto spec = parse_import_spec()) {
      file.imports.push_back(*spec);
    }
    expect_semicolon("import declaration");
    return;
  }

  while (!at(TokenKind::RParen) && !at_eof()) {
    const size_t before = idx_;
    if (match(TokenKind::Semicolon)) {
      continue;
    }
    if (auto spec = parse_import_spec()) {
      file.imports.push_back(*spec);
      if (!at(TokenKind::RParen)) {
        expect(TokenKind::Semicolon, "';' or ')' in import list");
      }
    } else {
      skip_expression_list();
      match(TokenKind::Semicolon);
    }
    if (idx_ == before) {
      advance();
    }
  }
  expect(TokenKind::RParen, "')'");
  expect_semicolon("import declaration");
}

std::optional<Name> Parser::parse_receiver()
{
  // Collect the tokens between the receiver parentheses.
  std::vector<Token> recv;
  advance();  // (
  int depth = 1;
  while (!at_eof()) {
    const Token t = advance();
    if (t.kind == TokenKind::LParen) {
      ++depth;
    } else if (t.kind == TokenKind::RParen) {
      if (--depth == 0) {
        break;
      }
    }
    recv.push_back(t);
  }
  if (depth != 0) {
    error_at(cur(), "expected ')' after receiver");
    return std::nullopt;
  }

  size_t lo = 0;
  size_t hi = recv.size();
  if (hi > lo && recv[hi - 1].kind == TokenKind::Comma) {
    --hi;
  }

  // Drop the receiver name: "r T", "r *T", "r (T)".
  if (
    hi - lo > 1 && recv[lo].kind == TokenKind::Identifier &&
    (recv[lo + 1].kind == TokenKind::Identifier || recv[lo + 1].kind == TokenKind::Star ||
     recv[lo + 1].kind == TokenKind::LParen)) {
    ++lo;
  }

  // Unwrap parentheses and pointers.
  while (hi > lo) {
    if (recv[lo].kind == TokenKind::Star) {
      ++lo;
    } else if (recv[lo].kind == TokenKind::LParen && recv[hi - 1].kind == TokenKind::RParen) {
      ++lo;
      --hi;
    } else {
      break;
    }
  }

  if (hi == lo || recv[lo].kind != TokenKind::Identifier) {
    return std::nullopt;
  }
  // T or T[K, V]; a qualified name is not a local receiver.
  if (hi - lo == 1 || recv[lo + 1].kind == TokenKind::LBracket) {
    return Name{recv[lo].text, recv[lo].range};
  }
  return std::nullopt;
}

std::optional<FuncDecl> Parser::parse_func_decl()
{
  FuncDecl fn;
  const uint32_t start = advance().begin();  // func

  if (at(TokenKind::LParen)) {
    fn.has_receiver = true;
    fn.receiver_type = parse_receiver();
  }

  const Token name = cur();
  if (name.kind != TokenKind::Identifier) {
    error_at(name, "expected function name");
    synchronize_top_level();
    return std::nullopt;
  }
  advance();
  fn.name = Name{name.text, name.range};

  if (at(TokenKind::LBracket)) {
    fn.has_type_params = true;
    if (!skip_balanced(TokenKind::LBracket, TokenKind::RBracket)) {
      return std::nullopt;
    }
  }

  if (!skip_balanced(TokenKind::LParen, TokenKind::RParen)) {
    synchronize_top_level();
    return std::nullopt;
  }

  // Result
  if (at(TokenKind::LParen)) {
    skip_balanced(TokenKind::LParen, TokenKind::RParen);
  } else if (at_type_start()) {
    skip_type();
  }

  uint32_t end = tokens_.empty() ? start : cur().begin();
  if (at(TokenKind::LBrace)) {
    fn.has_body = true;
    if (!skip_balanced(TokenKind::LBrace, TokenKind::RBrace)) {
      return std::nullopt;
    }
    end = tokens_[idx_ - 1].end();
  }
  fn.range = SourceRange(start, end);

  expect_semicolon("function declaration");
  return fn;
}

std::optional<TypeSpec> Parser::parse_type_spec()
{
  const Token name = cur();
  if (name.kind != TokenKind::Identifier) {
    error_at(name, "expected type name");
    return std::nullopt;
  }
  advance();

  TypeSpec spec;
  spec.name = Name{name.text, name.range};

  if (at_type_params()) {
    spec.has_type_params = true;
    skip_balanced(TokenKind::LBracket, TokenKind::RBracket);
  }
  if (match(TokenKind::Assign)) {
    spec.is_alias = true;
  }
  skip_type();

  spec.range = SourceRange(name.begin(), idx_ > 0 ? tokens_[idx_ - 1].end() : name.end());
  return spec;
}

std::optional<ValueSpec> Parser::parse_value_spec()
{
  ValueSpec spec;
  const uint32_t start = cur().begin();

  while (true) {
    const Token name = cur();
    if (name.kind != TokenKind::Identifier) {
      error_at(name, "expected identifier");
      return std::nullopt;
    }
    advance();
    spec.names.push_back(Name{name.text, name.range});
    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  if (!at(TokenKind::Assign) && !at(TokenKind::Semicolon) && !at(TokenKind::RParen)) {
    skip_type();
  }
  if (match(TokenKind::Assign)) {
    skip_expression_list();
  }

  spec.range = SourceRange(start, tokens_[idx_ - 1].end());
  return spec;
}

std::optional<GenDecl> Parser::parse_gen_decl(GenDeclKind kind)
{
  GenDecl decl;
  decl.kind = kind;
  const uint32_t start = advance().begin();

  auto parse_one = [&]() -> bool {
    if (kind == GenDeclKind::Type) {
      auto spec = parse_type_spec();
      if (spec) {
        decl.type_specs.push_back(*spec);
      }
      return spec.has_value();
    }
    auto spec = parse_value_spec();
    if (spec) {
      decl.value_specs.push_back(std::move(*spec));
    }
    return spec.has_value();
  };

  if (match(TokenKind::LParen)) {
    decl.grouped = true;
    while (!at(TokenKind::RParen) && !at_eof()) {
      const size_t before = idx_;
      if (match(TokenKind::Semicolon)) {
        continue;
      }
      if (!parse_one()) {
        skip_expression_list();
        match(TokenKind::Semicolon);
      } else if (!at(TokenKind::RParen) && !match(TokenKind::Semicolon)) {
        error_at(cur(), "expected ';' or ')' in declaration list");
        skip_expression_list();
      }
      if (idx_ == before) {
        advance();
      }
    }
    if (!expect(TokenKind::RParen, "')'")) {
      decl.range = SourceRange(start, cur().begin());
      return decl;
    }
  } else if (!parse_one()) {
    synchronize_top_level();
    return std::nullopt;
  }

  decl.range = SourceRange(start, tokens_[idx_ - 1].end());
  expect_semicolon("declaration");
  return decl;
}

std::optional<FileAst> Parser::parse_file()
{
  auto clause = parse_package_clause();
  if (!clause) {
    return std::nullopt;
  }

  FileAst file;
  file.package = *clause;

  if (mode_ == ParseMode::PackageClauseOnly) {
    file.comments = comments_;
    return file;
  }

  expect_semicolon("package clause");

  while (at_keyword("import")) {
    parse_import_decl(file);
  }
  if (mode_ == ParseMode::ImportsOnly) {
    file.comments = comments_;
    return file;
  }

  while (!at_eof()) {
    const Token t = cur();
    if (t.kind == TokenKind::Semicolon) {
      advance();
      continue;
    }
    if (t.is_keyword("func")) {
      if (auto fn = parse_func_decl()) {
        file.decls.emplace_back(*fn);
      }
    } else if (t.is_keyword("const") || t.is_keyword("var") || t.is_keyword("type")) {
      const GenDeclKind kind = t.text == "const"  ? GenDeclKind::Const
                               : t.text == "var"  ? GenDeclKind::Var
                                                  : GenDeclKind::Type;
      if (auto decl = parse_gen_decl(kind)) {
        file.decls.emplace_back(std::move(*decl));
      }
    } else if (t.is_keyword("import")) {
      error_at(t, "imports must appear before other declarations");
      parse_import_decl(file);
    } else {
      error_at(t, "expected declaration");
      advance();
      synchronize_top_level();
    }
  }

  file.comments = comments_;
  return file;
}

// ============================================================================
// Entry points
// ============================================================================

std::optional<std::string_view> parse_package_name(std::string_view src)
{
  DiagnosticBag diags;
  Parser parser(src, diags, ParseMode::PackageClauseOnly);
  auto file = parser.parse_file();
  if (!file) {
    return std::nullopt;
  }
  return file->package.name.text;
}

bool imports_cgo(std::string_view src)
{
  DiagnosticBag diags;
  Parser parser(src, diags, ParseMode::ImportsOnly);
  auto file = parser.parse_file();
  if (!file) {
    return false;
  }
  for (const auto & spec : file->imports) {
    if (spec.path == "C") {
      return true;
    }
  }
  return false;
}

std::optional<FileAst> parse_declarations(const SourceFile & file, DiagnosticBag & diags)
{
  Parser parser(file.content(), diags, ParseMode::Declarations);
  return parser.parse_file();
}

}  // namespace pkgindex::syntax
