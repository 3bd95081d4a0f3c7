// matrix_lang/basic/error_code.hpp - Error taxonomy shared by all passes
#pragma once

#include <cstdint>
#include <string_view>

namespace matrix_lang
{

/**
 * Pass that produced an error. Rendered as the "<ErrorKind>" prefix of a
 * single-line diagnostic.
 */
enum class ErrorKind : uint8_t {
  Lex,
  Parse,
  Type,
  Runtime,
};

enum class ErrorCode : uint8_t {
  None,

  // LexError
  UnterminatedString,
  InvalidCharacter,

  // ParseError
  UnexpectedToken,
  UnterminatedConstruct,

  // TypeError
  Mismatch,
  InfiniteType,
  UnknownIdentifier,
  ArityMismatch,
  ImmutableBinding,
  UnknownField,
  DuplicateDefinition,

  // RuntimeError
  DivisionByZero,
  UndefinedVariable,
  ArgumentMismatch,
  IndexOutOfBounds,
  PatternMatchFailed,
  DomainError,
  StackOverflow,
};

[[nodiscard]] ErrorKind error_kind_of(ErrorCode code) noexcept;

/// "LexError", "ParseError", "TypeError" or "RuntimeError".
[[nodiscard]] std::string_view error_kind_name(ErrorKind kind) noexcept;

/// Variant name, e.g. "UnknownIdentifier".
[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

}  // namespace matrix_lang
