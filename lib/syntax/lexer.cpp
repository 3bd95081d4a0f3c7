// matrix_lang/syntax/lexer.cpp - Tokenizer implementation
#include "matrix_lang/syntax/lexer.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace matrix_lang::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

struct KeywordEntry
{
  std::string_view text;
  TokenKind kind;
};

constexpr std::array<KeywordEntry, 17> k_keywords = {{
  {"let", TokenKind::KwLet},
  {"mut", TokenKind::KwMut},
  {"in", TokenKind::KwIn},
  {"struct", TokenKind::KwStruct},
  {"if", TokenKind::KwIf},
  {"then", TokenKind::KwThen},
  {"else", TokenKind::KwElse},
  {"match", TokenKind::KwMatch},
  {"typeclass", TokenKind::KwTypeclass},
  {"instance", TokenKind::KwInstance},
  {"module", TokenKind::KwModule},
  {"import", TokenKind::KwImport},
  {"parallel", TokenKind::KwParallel},
  {"spawn", TokenKind::KwSpawn},
  {"wait", TokenKind::KwWait},
  {"true", TokenKind::KwTrue},
  {"false", TokenKind::KwFalse},
}};

/// Byte length of the UTF-8 sequence introduced by `lead` (1 for invalid leads).
size_t utf8_length(unsigned char lead)
{
  if (lead >= 0xF0) return 4;
  if (lead >= 0xE0) return 3;
  if (lead >= 0xC0) return 2;
  return 1;
}

}  // namespace

std::optional<TokenKind> lookup_keyword(std::string_view text) noexcept
{
  for (const auto & kw : k_keywords) {
    if (kw.text == text) {
      return kw.kind;
    }
  }
  return std::nullopt;
}

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::fail(ErrorCode code, uint32_t start, uint32_t end, std::string message)
{
  failed_ = true;
  diags_->report_error(SourceRange(start, end), std::move(message)).with_code(code);
  return {TokenKind::Error, {start, end}, src_.substr(start, end - start)};
}

void Lexer::skip_whitespace_and_comments()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
      advance(1);
      continue;
    }
    // -- line comment
    if (starts_with("--")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    // /* block comment */ (an unterminated one runs to end of input)
    if (starts_with("/*")) {
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance(1);
      }
      if (!eof()) {
        advance(2);
      }
      continue;
    }
    break;
  }
}

Token Lexer::lex_identifier_or_keyword()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  Token t = make_token(TokenKind::Identifier, start);
  if (auto kw = lookup_keyword(t.text)) {
    t.kind = *kw;
  }
  return t;
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && is_digit(peek())) {
    advance(1);
  }

  bool is_float = false;

  // Fractional part; `1..5` stays an integer followed by a range operator.
  if (peek() == '.' && is_digit(peek(1))) {
    is_float = true;
    advance(1);
    while (!eof() && is_digit(peek())) {
      advance(1);
    }
  }

  // Exponent
  if ((peek() == 'e' || peek() == 'E') &&
      (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
    is_float = true;
    advance(peek(1) == '+' || peek(1) == '-' ? 2 : 1);
    while (!eof() && is_digit(peek())) {
      advance(1);
    }
  }

  return make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // opening quote
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof() && peek() != '"') {
    if (peek() == '\\' && pos_ + 1 < src_.size()) {
      advance(2);
      continue;
    }
    advance(1);
  }

  if (eof()) {
    return fail(
      ErrorCode::UnterminatedString, start, start + 1, "unterminated string literal");
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);  // closing quote

  Token t = make_token(TokenKind::StringLiteral, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_punctuation()
{
  const auto start = static_cast<uint32_t>(pos_);

  struct TwoChar
  {
    std::string_view text;
    TokenKind kind;
  };
  static constexpr std::array<TwoChar, 9> k_two_char = {{
    {"=>", TokenKind::FatArrow},
    {"->", TokenKind::Arrow},
    {"==", TokenKind::EqEq},
    {"!=", TokenKind::Ne},
    {"<=", TokenKind::Le},
    {">=", TokenKind::Ge},
    {"&&", TokenKind::AndAnd},
    {"||", TokenKind::OrOr},
    {"..", TokenKind::DotDot},
  }};

  for (const auto & op : k_two_char) {
    if (starts_with(op.text)) {
      advance(2);
      return make_token(op.kind, start);
    }
  }

  TokenKind kind = TokenKind::Error;
  switch (peek()) {
    case '(':
      kind = TokenKind::LParen;
      break;
    case ')':
      kind = TokenKind::RParen;
      break;
    case '{':
      kind = TokenKind::LBrace;
      break;
    case '}':
      kind = TokenKind::RBrace;
      break;
    case '[':
      kind = TokenKind::LBracket;
      break;
    case ']':
      kind = TokenKind::RBracket;
      break;
    case ',':
      kind = TokenKind::Comma;
      break;
    case ':':
      kind = TokenKind::Colon;
      break;
    case ';':
      kind = TokenKind::Semicolon;
      break;
    case '.':
      kind = TokenKind::Dot;
      break;
    case '@':
      kind = TokenKind::At;
      break;
    case '|':
      kind = TokenKind::Pipe;
      break;
    case '=':
      kind = TokenKind::Assign;
      break;
    case '+':
      kind = TokenKind::Plus;
      break;
    case '-':
      kind = TokenKind::Minus;
      break;
    case '*':
      kind = TokenKind::Star;
      break;
    case '/':
      kind = TokenKind::Slash;
      break;
    case '%':
      kind = TokenKind::Percent;
      break;
    case '^':
      kind = TokenKind::Caret;
      break;
    case '<':
      kind = TokenKind::Lt;
      break;
    case '>':
      kind = TokenKind::Gt;
      break;
    case '!':
      kind = TokenKind::Bang;
      break;
    default:
      break;
  }

  if (kind == TokenKind::Error) {
    const size_t len =
      std::min(utf8_length(static_cast<unsigned char>(peek())), src_.size() - pos_);
    const auto end = static_cast<uint32_t>(pos_ + len);
    return fail(
      ErrorCode::InvalidCharacter, start, end,
      fmt::format("invalid character '{}'", src_.substr(start, len)));
  }

  advance(1);
  return make_token(kind, start);
}

Token Lexer::next_token()
{
  if (failed_) {
    const auto at = static_cast<uint32_t>(src_.size());
    return {TokenKind::Eof, {at, at}, {}};
  }

  skip_whitespace_and_comments();

  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    return {TokenKind::Eof, {at, at}, {}};
  }

  const auto c = static_cast<unsigned char>(peek());
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (c == '"') {
    return lex_string();
  }
  return lex_punctuation();
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> tokens;
  while (true) {
    Token t = next_token();
    const TokenKind kind = t.kind;
    tokens.push_back(t);
    if (kind == TokenKind::Eof || kind == TokenKind::Error) {
      break;
    }
  }
  return tokens;
}

}  // namespace matrix_lang::syntax
