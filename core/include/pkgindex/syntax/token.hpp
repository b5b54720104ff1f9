// pkgindex/syntax/token.hpp - Go tokens
#pragma once

#include <cstdint>
#include <string_view>

#include "pkgindex/basic/source_file.hpp"

namespace pkgindex::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  LineComment,   // // ...
  BlockComment,  // /* ... */

  Identifier,
  Keyword,

  IntLiteral,
  FloatLiteral,
  ImagLiteral,
  RuneLiteral,
  StringLiteral,     // token.text is the string *contents* (without quotes)
  RawStringLiteral,  // token.text is the string *contents* (without backquotes)

  // Punctuation the parser inspects
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Semicolon,  // explicit ';' or inserted at a newline / EOF
  Dot,
  Ellipsis,
  Colon,

  Assign,  // =
  Define,  // :=
  Star,
  Tilde,
  Pipe,
  Arrow,  // <-
  Inc,    // ++
  Dec,    // --

  // Every other operator
  Operator,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes for strings)
  std::string_view text;  // slice view (for string literals: interior)

  /// True for a Semicolon inserted by the lexer rather than written.
  bool implicit = false;

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }
  [[nodiscard]] bool is_keyword(std::string_view kw) const noexcept
  {
    return kind == TokenKind::Keyword && text == kw;
  }
  [[nodiscard]] bool is_comment() const noexcept
  {
    return kind == TokenKind::LineComment || kind == TokenKind::BlockComment;
  }

  [[nodiscard]] uint32_t begin() const noexcept { return range.begin; }
  [[nodiscard]] uint32_t end() const noexcept { return range.end; }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Keyword:
      return "keyword";
    case TokenKind::IntLiteral:
      return "int";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::ImagLiteral:
      return "imaginary";
    case TokenKind::RuneLiteral:
      return "rune";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::RawStringLiteral:
      return "raw string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::Ellipsis:
      return "...";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Assign:
      return "=";
    case TokenKind::Define:
      return ":=";
    case TokenKind::Star:
      return "*";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Arrow:
      return "<-";
    case TokenKind::Inc:
      return "++";
    case TokenKind::Dec:
      return "--";
    case TokenKind::Operator:
      return "operator";
  }
  return "";
}

}  // namespace pkgindex::syntax
