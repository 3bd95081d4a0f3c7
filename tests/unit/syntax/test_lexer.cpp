#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "matrix_lang/basic/diagnostic.hpp"
#include "matrix_lang/syntax/lexer.hpp"
#include "matrix_lang/syntax/token.hpp"

using matrix_lang::DiagnosticBag;
using matrix_lang::ErrorCode;
using matrix_lang::syntax::Lexer;
using matrix_lang::syntax::Token;
using matrix_lang::syntax::TokenKind;

static std::vector<TokenKind> kinds_of(const std::vector<Token> & toks)
{
  std::vector<TokenKind> out;
  out.reserve(toks.size());
  for (const auto & t : toks) {
    out.push_back(t.kind);
  }
  return out;
}

TEST(SyntaxLexer, KeywordsAndIdentifiers)
{
  DiagnosticBag diags;
  Lexer lex("let mut letter = in_range", diags);
  const auto toks = lex.lex_all();

  const std::vector<TokenKind> expected = {
    TokenKind::KwLet, TokenKind::KwMut, TokenKind::Identifier,
    TokenKind::Assign, TokenKind::Identifier, TokenKind::Eof,
  };
  EXPECT_EQ(kinds_of(toks), expected);
  EXPECT_EQ(toks[2].text, "letter");
  EXPECT_EQ(toks[4].text, "in_range");
  EXPECT_TRUE(diags.empty());
}

TEST(SyntaxLexer, NumberLiterals)
{
  DiagnosticBag diags;
  Lexer lex("42 3.14 1e3 2.5e-2 1..5", diags);
  const auto toks = lex.lex_all();

  const std::vector<TokenKind> expected = {
    TokenKind::IntLiteral,   TokenKind::FloatLiteral, TokenKind::FloatLiteral,
    TokenKind::FloatLiteral, TokenKind::IntLiteral,   TokenKind::DotDot,
    TokenKind::IntLiteral,   TokenKind::Eof,
  };
  EXPECT_EQ(kinds_of(toks), expected);
  EXPECT_EQ(toks[1].text, "3.14");
  EXPECT_EQ(toks[3].text, "2.5e-2");
}

TEST(SyntaxLexer, OperatorsPreferTwoCharacterForms)
{
  DiagnosticBag diags;
  Lexer lex("== != <= >= && || => -> = < > ! ^ %", diags);
  const auto toks = lex.lex_all();

  const std::vector<TokenKind> expected = {
    TokenKind::EqEq,    TokenKind::Ne,       TokenKind::Le,    TokenKind::Ge,
    TokenKind::AndAnd,  TokenKind::OrOr,     TokenKind::FatArrow, TokenKind::Arrow,
    TokenKind::Assign,  TokenKind::Lt,       TokenKind::Gt,    TokenKind::Bang,
    TokenKind::Caret,   TokenKind::Percent,  TokenKind::Eof,
  };
  EXPECT_EQ(kinds_of(toks), expected);
}

TEST(SyntaxLexer, LineCommentsAreSkipped)
{
  DiagnosticBag diags;
  Lexer lex("-- header\nlet x = 1 -- trailing\n-- last", diags);
  const auto toks = lex.lex_all();

  const std::vector<TokenKind> expected = {
    TokenKind::KwLet, TokenKind::Identifier, TokenKind::Assign,
    TokenKind::IntLiteral, TokenKind::Eof,
  };
  EXPECT_EQ(kinds_of(toks), expected);
}

TEST(SyntaxLexer, StringLiteralKeepsEscapedInterior)
{
  DiagnosticBag diags;
  Lexer lex(R"("a\"b\n")", diags);
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 2U);
  EXPECT_EQ(toks[0].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[0].text, R"(a\"b\n)");
  EXPECT_EQ(toks[0].range.get_begin().get_offset(), 0U);
  EXPECT_EQ(toks[0].range.get_end().get_offset(), 8U);
}

TEST(SyntaxLexer, UnterminatedStringStopsLexing)
{
  DiagnosticBag diags;
  Lexer lex("let s = \"abc", diags);
  const auto toks = lex.lex_all();

  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.back().kind, TokenKind::Error);
  EXPECT_TRUE(lex.has_error());
  EXPECT_TRUE(diags.has_error_code(ErrorCode::UnterminatedString));

  // Fail-fast: nothing after the first error.
  EXPECT_EQ(lex.next_token().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, InvalidCharacter)
{
  DiagnosticBag diags;
  Lexer lex("let x = 1 $ 2", diags);
  const auto toks = lex.lex_all();

  EXPECT_EQ(toks.back().kind, TokenKind::Error);
  ASSERT_NE(diags.first_error(), nullptr);
  EXPECT_EQ(diags.first_error()->code, ErrorCode::InvalidCharacter);
  EXPECT_EQ(diags.first_error()->message, "invalid character '$'");
  EXPECT_EQ(diags.first_error()->primary_range().get_begin().get_offset(), 10U);
}

TEST(SyntaxLexer, ResetReplaysTheSameSequence)
{
  DiagnosticBag diags;
  Lexer lex("a + b", diags);
  const auto first = kinds_of(lex.lex_all());
  lex.reset();
  const auto second = kinds_of(lex.lex_all());
  EXPECT_EQ(first, second);
}
