// pkgindex/syntax/lexer.hpp - Go lexer with automatic semicolon insertion
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "pkgindex/syntax/token.hpp"

namespace pkgindex::syntax
{

/**
 * Tokenizes Go source.
 *
 * The lexer never fails: malformed input becomes Unknown tokens. Comments are
 * emitted as tokens. A Semicolon with implicit == true is inserted at a
 * newline or at EOF after a token that may end a statement.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

  /// Next token; Eof repeats once reached.
  [[nodiscard]] Token next_token();

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skip blanks; stops at a newline when a semicolon is pending.
  void skip_whitespace();

  [[nodiscard]] Token lex_line_comment();
  [[nodiscard]] Token lex_block_comment();
  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_quoted(char quote, TokenKind kind);
  [[nodiscard]] Token lex_raw_string();
  [[nodiscard]] Token lex_operator();

  /// Whether the block comment at pos_ spans a newline or is unterminated.
  [[nodiscard]] bool block_comment_breaks_line() const noexcept;

  [[nodiscard]] Token make_semicolon(uint32_t at) const noexcept;

  [[nodiscard]] SourceRange make_range(uint32_t start, uint32_t end) const noexcept
  {
    return {start, end};
  }
  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
  bool insert_semi_ = false;
};

}  // namespace pkgindex::syntax
