// matrix_lang/syntax/lexer.hpp - Source text to token stream
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "matrix_lang/basic/diagnostic.hpp"
#include "matrix_lang/syntax/token.hpp"

namespace matrix_lang::syntax
{

/**
 * On-demand tokenizer.
 *
 * next_token() produces one token at a time; reset() rewinds to the start so
 * the sequence can be replayed. The first lexical error is reported to the
 * DiagnosticBag, an Error token is returned, and every later call yields Eof.
 */
class Lexer
{
public:
  Lexer(std::string_view src, DiagnosticBag & diags) : src_(src), diags_(&diags) {}

  [[nodiscard]] Token next_token();

  /// Lex the whole input. The last token is Eof, or Error on failure.
  [[nodiscard]] std::vector<Token> lex_all();

  void reset() noexcept
  {
    pos_ = 0;
    failed_ = false;
  }

  [[nodiscard]] bool has_error() const noexcept { return failed_; }

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace_and_comments();

  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_punctuation();

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept
  {
    const auto end = static_cast<uint32_t>(pos_);
    return {kind, {start, end}, src_.substr(start, end - start)};
  }

  [[nodiscard]] Token fail(ErrorCode code, uint32_t start, uint32_t end, std::string message);

  std::string_view src_;
  DiagnosticBag * diags_;
  size_t pos_ = 0;
  bool failed_ = false;
};

}  // namespace matrix_lang::syntax
