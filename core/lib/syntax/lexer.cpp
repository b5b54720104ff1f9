#include "pkgindex/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

#include "pkgindex/syntax/keywords.hpp"

namespace pkgindex::syntax
{
namespace
{

// Non-ASCII bytes are accepted as identifier characters; Go permits Unicode
// letters and the indexer only needs token boundaries.
bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_' || c >= 0x80; }
bool is_ident_continue(unsigned char c) { return is_ident_start(c) || (std::isdigit(c) != 0); }

bool is_hex_digit(unsigned char c)
{
  return (std::isdigit(c) != 0) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_digit_or_sep(unsigned char c) { return (std::isdigit(c) != 0) || c == '_'; }

/// Keywords after which a newline terminates the statement.
bool keyword_ends_statement(std::string_view kw)
{
  return kw == "break" || kw == "continue" || kw == "fallthrough" || kw == "return";
}

struct OperatorSpelling
{
  std::string_view text;
  TokenKind kind;
};

// Longest spellings first.
constexpr std::array<OperatorSpelling, 25> k_multi_char_operators = {{
  {"<<=", TokenKind::Operator}, {">>=", TokenKind::Operator}, {"&^=", TokenKind::Operator},
  {"...", TokenKind::Ellipsis}, {"&&", TokenKind::Operator},  {"||", TokenKind::Operator},
  {"<-", TokenKind::Arrow},     {"++", TokenKind::Inc},       {"--", TokenKind::Dec},
  {"==", TokenKind::Operator},  {"!=", TokenKind::Operator},  {"<=", TokenKind::Operator},
  {">=", TokenKind::Operator},  {":=", TokenKind::Define},    {"+=", TokenKind::Operator},
  {"-=", TokenKind::Operator},  {"*=", TokenKind::Operator},  {"/=", TokenKind::Operator},
  {"%=", TokenKind::Operator},  {"&=", TokenKind::Operator},  {"|=", TokenKind::Operator},
  {"^=", TokenKind::Operator},  {"<<", TokenKind::Operator},  {">>", TokenKind::Operator},
  {"&^", TokenKind::Operator},
}};

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || (c == '\n' && !insert_semi_)) {
      advance(1);
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = make_range(start, static_cast<uint32_t>(pos_));
  t.text = src_.substr(start, pos_ - start);
  return t;
}

Token Lexer::make_semicolon(uint32_t at) const noexcept
{
  Token t;
  t.kind = TokenKind::Semicolon;
  t.range = make_range(at, at);
  t.text = "\n";
  t.implicit = true;
  return t;
}

bool Lexer::block_comment_breaks_line() const noexcept
{
  const auto close = src_.find("*/", pos_ + 2);
  if (close == std::string_view::npos) {
    return true;
  }
  return src_.substr(pos_, close - pos_).find('\n') != std::string_view::npos;
}

Token Lexer::lex_line_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  auto end = static_cast<uint32_t>(pos_);
  if (end > start && src_[end - 1] == '\r') {
    end -= 1;
  }

  Token t;
  t.kind = TokenKind::LineComment;
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);
  return t;
}

Token Lexer::lex_block_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);
  while (!eof() && !starts_with("*/")) {
    advance(1);
  }
  if (eof()) {
    // Unterminated comment swallows the rest of the file.
    return make_token(TokenKind::Unknown, start);
  }
  advance(2);
  return make_token(TokenKind::BlockComment, start);
}

Token Lexer::lex_identifier_or_keyword()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }

  Token t = make_token(TokenKind::Identifier, start);
  if (is_go_keyword(t.text)) {
    t.kind = TokenKind::Keyword;
    insert_semi_ = keyword_ends_statement(t.text);
  } else {
    insert_semi_ = true;
  }
  return t;
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  TokenKind kind = TokenKind::IntLiteral;

  const char p1 = peek(1);
  if (peek() == '0' && (p1 == 'x' || p1 == 'X')) {
    advance(2);
    while (!eof() && (is_hex_digit(static_cast<unsigned char>(peek())) || peek() == '_')) {
      advance(1);
    }
    if (peek() == '.') {
      kind = TokenKind::FloatLiteral;
      advance(1);
      while (!eof() && (is_hex_digit(static_cast<unsigned char>(peek())) || peek() == '_')) {
        advance(1);
      }
    }
    if (peek() == 'p' || peek() == 'P') {
      kind = TokenKind::FloatLiteral;
      advance(1);
      if (peek() == '+' || peek() == '-') {
        advance(1);
      }
      while (!eof() && is_digit_or_sep(static_cast<unsigned char>(peek()))) {
        advance(1);
      }
    }
  } else if (peek() == '0' && (p1 == 'b' || p1 == 'B' || p1 == 'o' || p1 == 'O')) {
    advance(2);
    while (!eof() && is_digit_or_sep(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
  } else {
    while (!eof() && is_digit_or_sep(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    if (peek() == '.' && peek(1) != '.') {
      kind = TokenKind::FloatLiteral;
      advance(1);
      while (!eof() && is_digit_or_sep(static_cast<unsigned char>(peek()))) {
        advance(1);
      }
    }
    if (peek() == 'e' || peek() == 'E') {
      kind = TokenKind::FloatLiteral;
      advance(1);
      if (peek() == '+' || peek() == '-') {
        advance(1);
      }
      while (!eof() && is_digit_or_sep(static_cast<unsigned char>(peek()))) {
        advance(1);
      }
    }
  }

  if (peek() == 'i') {
    kind = TokenKind::ImagLiteral;
    advance(1);
  }

  insert_semi_ = true;
  return make_token(kind, start);
}

Token Lexer::lex_quoted(char quote, TokenKind kind)
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof()) {
    const char c = peek();
    if (c == quote) {
      break;
    }
    if (c == '\n') {
      // Unterminated; leave the newline for semicolon insertion.
      insert_semi_ = true;
      return make_token(TokenKind::Unknown, start);
    }
    if (c == '\\') {
      advance(1);
      if (eof()) {
        break;
      }
    }
    advance(1);
  }

  if (eof()) {
    insert_semi_ = true;
    return make_token(TokenKind::Unknown, start);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);

  Token t;
  t.kind = kind;
  t.range = make_range(start, static_cast<uint32_t>(pos_));
  t.text = kind == TokenKind::RuneLiteral
             ? src_.substr(start, pos_ - start)
             : src_.substr(payload_start, payload_end - payload_start);
  insert_semi_ = true;
  return t;
}

Token Lexer::lex_raw_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  const auto payload_start = static_cast<uint32_t>(pos_);
  while (!eof() && peek() != '`') {
    advance(1);
  }

  insert_semi_ = true;
  if (eof()) {
    return make_token(TokenKind::Unknown, start);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);

  Token t;
  t.kind = TokenKind::RawStringLiteral;
  t.range = make_range(start, static_cast<uint32_t>(pos_));
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_operator()
{
  const auto start = static_cast<uint32_t>(pos_);

  for (const auto & op : k_multi_char_operators) {
    if (starts_with(op.text)) {
      advance(op.text.size());
      insert_semi_ = op.kind == TokenKind::Inc || op.kind == TokenKind::Dec;
      return make_token(op.kind, start);
    }
  }

  const char ch = peek();
  advance(1);

  TokenKind kind = TokenKind::Unknown;
  switch (ch) {
    case '(':
      kind = TokenKind::LParen;
      break;
    case ')':
      kind = TokenKind::RParen;
      break;
    case '[':
      kind = TokenKind::LBracket;
      break;
    case ']':
      kind = TokenKind::RBracket;
      break;
    case '{':
      kind = TokenKind::LBrace;
      break;
    case '}':
      kind = TokenKind::RBrace;
      break;
    case ',':
      kind = TokenKind::Comma;
      break;
    case ';':
      kind = TokenKind::Semicolon;
      break;
    case '.':
      kind = TokenKind::Dot;
      break;
    case ':':
      kind = TokenKind::Colon;
      break;
    case '=':
      kind = TokenKind::Assign;
      break;
    case '*':
      kind = TokenKind::Star;
      break;
    case '~':
      kind = TokenKind::Tilde;
      break;
    case '|':
      kind = TokenKind::Pipe;
      break;
    case '+':
    case '-':
    case '/':
    case '%':
    case '&':
    case '^':
    case '<':
    case '>':
    case '!':
      kind = TokenKind::Operator;
      break;
    default:
      kind = TokenKind::Unknown;
      break;
  }

  insert_semi_ =
    kind == TokenKind::RParen || kind == TokenKind::RBracket || kind == TokenKind::RBrace;
  return make_token(kind, start);
}

Token Lexer::next_token()
{
  skip_whitespace();

  if (insert_semi_ && (eof() || peek() == '\n')) {
    const auto at = static_cast<uint32_t>(pos_);
    if (!eof()) {
      advance(1);
    }
    insert_semi_ = false;
    return make_semicolon(at);
  }

  if (eof()) {
    Token t;
    t.kind = TokenKind::Eof;
    const auto at = static_cast<uint32_t>(src_.size());
    t.range = make_range(at, at);
    return t;
  }

  // A comment that ends the line terminates the statement before it.
  if (starts_with("//")) {
    if (insert_semi_) {
      insert_semi_ = false;
      return make_semicolon(static_cast<uint32_t>(pos_));
    }
    return lex_line_comment();
  }
  if (starts_with("/*")) {
    if (insert_semi_ && block_comment_breaks_line()) {
      insert_semi_ = false;
      return make_semicolon(static_cast<uint32_t>(pos_));
    }
    return lex_block_comment();
  }

  const auto c = static_cast<unsigned char>(peek());
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }
  if ((std::isdigit(c) != 0) || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
    return lex_number();
  }
  if (c == '"') {
    return lex_quoted('"', TokenKind::StringLiteral);
  }
  if (c == '\'') {
    return lex_quoted('\'', TokenKind::RuneLiteral);
  }
  if (c == '`') {
    return lex_raw_string();
  }
  return lex_operator();
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace pkgindex::syntax
