#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "pkgindex/syntax/lexer.hpp"
#include "pkgindex/syntax/token.hpp"

using pkgindex::syntax::Lexer;
using pkgindex::syntax::Token;
using pkgindex::syntax::TokenKind;

namespace
{

std::vector<TokenKind> kinds_of(std::string_view src)
{
  Lexer lex(src);
  std::vector<TokenKind> out;
  for (const auto & t : lex.lex_all()) {
    out.push_back(t.kind);
  }
  return out;
}

const Token * first_of(const std::vector<Token> & toks, TokenKind kind)
{
  for (const auto & t : toks) {
    if (t.kind == kind) {
      return &t;
    }
  }
  return nullptr;
}

}  // namespace

TEST(SyntaxLexer, PackageClauseWithImplicitSemicolon)
{
  Lexer lex("package main\n");
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 4U);
  EXPECT_TRUE(toks[0].is_keyword("package"));
  EXPECT_EQ(toks[1].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[1].text, "main");
  EXPECT_EQ(toks[1].begin(), 8U);
  EXPECT_EQ(toks[1].end(), 12U);
  EXPECT_EQ(toks[2].kind, TokenKind::Semicolon);
  EXPECT_TRUE(toks[2].implicit);
  EXPECT_EQ(toks[3].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, SemicolonInsertedAtEofAfterIdentifier)
{
  const auto k = kinds_of("package p");
  const std::vector<TokenKind> expected = {
    TokenKind::Keyword, TokenKind::Identifier, TokenKind::Semicolon, TokenKind::Eof};
  EXPECT_EQ(k, expected);
}

TEST(SyntaxLexer, NoSemicolonAfterOperatorsOrOpeningBrackets)
{
  const auto k = kinds_of("x = a +\nb\nf(\n)\n");
  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::Assign,    TokenKind::Identifier, TokenKind::Operator,
    TokenKind::Identifier, TokenKind::Semicolon, TokenKind::Identifier, TokenKind::LParen,
    TokenKind::RParen,     TokenKind::Semicolon, TokenKind::Eof};
  EXPECT_EQ(k, expected);
}

TEST(SyntaxLexer, SemicolonAfterStatementEndingKeywords)
{
  Lexer lex("return\nbreak\nfunc\n");
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 6U);
  EXPECT_TRUE(toks[0].is_keyword("return"));
  EXPECT_EQ(toks[1].kind, TokenKind::Semicolon);
  EXPECT_TRUE(toks[2].is_keyword("break"));
  EXPECT_EQ(toks[3].kind, TokenKind::Semicolon);
  // "func" does not end a statement.
  EXPECT_TRUE(toks[4].is_keyword("func"));
  EXPECT_EQ(toks[5].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, SemicolonAfterClosingBracketsAndIncDec)
{
  const auto k = kinds_of("}\n]\ni++\nj--\n");
  const std::vector<TokenKind> expected = {
    TokenKind::RBrace,     TokenKind::Semicolon, TokenKind::RBracket,  TokenKind::Semicolon,
    TokenKind::Identifier, TokenKind::Inc,       TokenKind::Semicolon, TokenKind::Identifier,
    TokenKind::Dec,        TokenKind::Semicolon, TokenKind::Eof};
  EXPECT_EQ(k, expected);
}

TEST(SyntaxLexer, TrailingLineCommentTerminatesStatementFirst)
{
  Lexer lex("x // note\ny\n");
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 6U);
  EXPECT_EQ(toks[0].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[1].kind, TokenKind::Semicolon);
  EXPECT_TRUE(toks[1].implicit);
  EXPECT_EQ(toks[2].kind, TokenKind::LineComment);
  EXPECT_EQ(toks[2].text, "// note");
  EXPECT_EQ(toks[3].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[4].kind, TokenKind::Semicolon);
  EXPECT_EQ(toks[5].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, InlineBlockCommentDoesNotBreakStatement)
{
  const auto k = kinds_of("a /* inline */ b\n");
  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::BlockComment, TokenKind::Identifier, TokenKind::Semicolon,
    TokenKind::Eof};
  EXPECT_EQ(k, expected);
}

TEST(SyntaxLexer, MultiLineBlockCommentActsAsNewline)
{
  const auto k = kinds_of("a /* one\ntwo */ b\n");
  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::Semicolon, TokenKind::BlockComment, TokenKind::Identifier,
    TokenKind::Semicolon,  TokenKind::Eof};
  EXPECT_EQ(k, expected);
}

TEST(SyntaxLexer, LineCommentExcludesCarriageReturn)
{
  Lexer lex("// crlf\r\npackage p\r\n");
  const auto toks = lex.lex_all();

  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks[0].kind, TokenKind::LineComment);
  EXPECT_EQ(toks[0].text, "// crlf");
  EXPECT_TRUE(toks[1].is_keyword("package"));
}

TEST(SyntaxLexer, StringLiteralsCarryInteriorText)
{
  Lexer lex(R"(import "fmt"; x := "a\"b"; y := `raw
text`)");
  const auto toks = lex.lex_all();

  std::vector<std::string_view> strings;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::StringLiteral || t.kind == TokenKind::RawStringLiteral) {
      strings.push_back(t.text);
    }
  }
  ASSERT_EQ(strings.size(), 3U);
  EXPECT_EQ(strings[0], "fmt");
  EXPECT_EQ(strings[1], R"(a\"b)");
  EXPECT_EQ(strings[2], "raw\ntext");

  const Token * fmt = first_of(toks, TokenKind::StringLiteral);
  ASSERT_NE(fmt, nullptr);
  // The range covers the quotes.
  EXPECT_EQ(fmt->begin(), 7U);
  EXPECT_EQ(fmt->end(), 12U);
}

TEST(SyntaxLexer, RuneLiteralKeepsQuotes)
{
  Lexer lex("r := '\\n'");
  const auto toks = lex.lex_all();

  const Token * rune = first_of(toks, TokenKind::RuneLiteral);
  ASSERT_NE(rune, nullptr);
  EXPECT_EQ(rune->text, "'\\n'");
}

TEST(SyntaxLexer, UnterminatedLiteralsBecomeUnknown)
{
  {
    const auto k = kinds_of("s := \"open\nt\n");
    const std::vector<TokenKind> expected = {
      TokenKind::Identifier, TokenKind::Define,    TokenKind::Unknown, TokenKind::Semicolon,
      TokenKind::Identifier, TokenKind::Semicolon, TokenKind::Eof};
    EXPECT_EQ(k, expected);
  }
  {
    Lexer lex("s := `never closed");
    const auto toks = lex.lex_all();
    ASSERT_GE(toks.size(), 3U);
    EXPECT_EQ(toks[2].kind, TokenKind::Unknown);
    EXPECT_EQ(toks.back().kind, TokenKind::Eof);
  }
  {
    Lexer lex("x /* never closed");
    const auto toks = lex.lex_all();
    ASSERT_FALSE(toks.empty());
    EXPECT_EQ(toks.back().kind, TokenKind::Eof);
  }
}

TEST(SyntaxLexer, NumericLiteralForms)
{
  struct Case
  {
    std::string_view src;
    TokenKind kind;
  };
  const std::vector<Case> cases = {
    {"42", TokenKind::IntLiteral},       {"1_000", TokenKind::IntLiteral},
    {"0xDEAD_BEEF", TokenKind::IntLiteral}, {"0b1010", TokenKind::IntLiteral},
    {"0o777", TokenKind::IntLiteral},    {"3.14", TokenKind::FloatLiteral},
    {".5", TokenKind::FloatLiteral},     {"1e9", TokenKind::FloatLiteral},
    {"6.02E+23", TokenKind::FloatLiteral}, {"0x1p-2", TokenKind::FloatLiteral},
    {"2i", TokenKind::ImagLiteral},      {"1.5i", TokenKind::ImagLiteral},
  };

  for (const auto & c : cases) {
    Lexer lex(c.src);
    const auto toks = lex.lex_all();
    ASSERT_FALSE(toks.empty()) << c.src;
    EXPECT_EQ(toks[0].kind, c.kind) << c.src;
    EXPECT_EQ(toks[0].text, c.src);
  }
}

TEST(SyntaxLexer, SliceAndEllipsisTokens)
{
  const auto k = kinds_of("a[1:]...");
  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::LBracket, TokenKind::IntLiteral, TokenKind::Colon,
    TokenKind::RBracket,   TokenKind::Ellipsis, TokenKind::Eof};
  EXPECT_EQ(k, expected);
}

TEST(SyntaxLexer, MultiCharacterOperatorsPreferLongestSpelling)
{
  Lexer lex("a <<= b; c := <-ch; d &^ e");
  const auto toks = lex.lex_all();

  std::vector<std::string_view> ops;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Operator || t.kind == TokenKind::Define ||
        t.kind == TokenKind::Arrow) {
      ops.push_back(t.text);
    }
  }
  const std::vector<std::string_view> expected = {"<<=", ":=", "<-", "&^"};
  EXPECT_EQ(ops, expected);
}

TEST(SyntaxLexer, ExplicitSemicolonIsNotImplicit)
{
  Lexer lex("a; b");
  const auto toks = lex.lex_all();

  ASSERT_GE(toks.size(), 4U);
  EXPECT_EQ(toks[1].kind, TokenKind::Semicolon);
  EXPECT_FALSE(toks[1].implicit);
  EXPECT_EQ(toks[3].kind, TokenKind::Semicolon);
  EXPECT_TRUE(toks[3].implicit);
}

TEST(SyntaxLexer, EofRepeats)
{
  Lexer lex("");
  EXPECT_EQ(lex.next_token().kind, TokenKind::Eof);
  EXPECT_EQ(lex.next_token().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, NonAsciiIdentifiers)
{
  Lexer lex("var café = 1");
  const auto toks = lex.lex_all();

  ASSERT_GE(toks.size(), 2U);
  EXPECT_EQ(toks[1].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[1].text, "café");
}
