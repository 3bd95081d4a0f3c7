// matrix_lang/syntax/token.hpp - Token kinds and the Token record
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "matrix_lang/basic/source_manager.hpp"

namespace matrix_lang::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Error,  // produced once, at the position where lexing stopped

  Identifier,
  IntLiteral,
  FloatLiteral,
  StringLiteral,  // token.text is the string *contents* (without quotes, still escaped)

  // Keywords
  KwLet,
  KwMut,
  KwIn,
  KwStruct,
  KwIf,
  KwThen,
  KwElse,
  KwMatch,
  KwTypeclass,
  KwInstance,
  KwModule,
  KwImport,
  KwParallel,
  KwSpawn,
  KwWait,
  KwTrue,
  KwFalse,

  // Punctuation
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
  Comma,
  Colon,
  Semicolon,
  Dot,
  DotDot,
  At,
  Pipe,
  FatArrow,  // =>
  Arrow,     // ->
  Assign,    // =

  // Operators
  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Caret,
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
  AndAnd,
  OrOr,
  Bang,
};

struct Token
{
  TokenKind kind = TokenKind::Error;
  SourceRange range;      // byte range in the source (including quotes for strings)
  std::string_view text;  // lexeme (for StringLiteral: interior)

  [[nodiscard]] SourceLocation begin() const noexcept { return range.get_begin(); }
  [[nodiscard]] SourceLocation end() const noexcept { return range.get_end(); }
};

/// Keyword kind for an identifier spelling, if it is reserved.
[[nodiscard]] std::optional<TokenKind> lookup_keyword(std::string_view text) noexcept;

/// Human-readable spelling used in "expected X, found Y" messages.
[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "end of input";
    case TokenKind::Error:
      return "invalid token";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "integer literal";
    case TokenKind::FloatLiteral:
      return "float literal";
    case TokenKind::StringLiteral:
      return "string literal";
    case TokenKind::KwLet:
      return "'let'";
    case TokenKind::KwMut:
      return "'mut'";
    case TokenKind::KwIn:
      return "'in'";
    case TokenKind::KwStruct:
      return "'struct'";
    case TokenKind::KwIf:
      return "'if'";
    case TokenKind::KwThen:
      return "'then'";
    case TokenKind::KwElse:
      return "'else'";
    case TokenKind::KwMatch:
      return "'match'";
    case TokenKind::KwTypeclass:
      return "'typeclass'";
    case TokenKind::KwInstance:
      return "'instance'";
    case TokenKind::KwModule:
      return "'module'";
    case TokenKind::KwImport:
      return "'import'";
    case TokenKind::KwParallel:
      return "'parallel'";
    case TokenKind::KwSpawn:
      return "'spawn'";
    case TokenKind::KwWait:
      return "'wait'";
    case TokenKind::KwTrue:
      return "'true'";
    case TokenKind::KwFalse:
      return "'false'";
    case TokenKind::LParen:
      return "'('";
    case TokenKind::RParen:
      return "')'";
    case TokenKind::LBrace:
      return "'{'";
    case TokenKind::RBrace:
      return "'}'";
    case TokenKind::LBracket:
      return "'['";
    case TokenKind::RBracket:
      return "']'";
    case TokenKind::Comma:
      return "','";
    case TokenKind::Colon:
      return "':'";
    case TokenKind::Semicolon:
      return "';'";
    case TokenKind::Dot:
      return "'.'";
    case TokenKind::DotDot:
      return "'..'";
    case TokenKind::At:
      return "'@'";
    case TokenKind::Pipe:
      return "'|'";
    case TokenKind::FatArrow:
      return "'=>'";
    case TokenKind::Arrow:
      return "'->'";
    case TokenKind::Assign:
      return "'='";
    case TokenKind::Plus:
      return "'+'";
    case TokenKind::Minus:
      return "'-'";
    case TokenKind::Star:
      return "'*'";
    case TokenKind::Slash:
      return "'/'";
    case TokenKind::Percent:
      return "'%'";
    case TokenKind::Caret:
      return "'^'";
    case TokenKind::EqEq:
      return "'=='";
    case TokenKind::Ne:
      return "'!='";
    case TokenKind::Lt:
      return "'<'";
    case TokenKind::Le:
      return "'<='";
    case TokenKind::Gt:
      return "'>'";
    case TokenKind::Ge:
      return "'>='";
    case TokenKind::AndAnd:
      return "'&&'";
    case TokenKind::OrOr:
      return "'||'";
    case TokenKind::Bang:
      return "'!'";
  }
  return "token";
}

}  // namespace matrix_lang::syntax
