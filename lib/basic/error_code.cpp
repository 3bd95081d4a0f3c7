// matrix_lang/basic/error_code.cpp - Error taxonomy names
#include "matrix_lang/basic/error_code.hpp"

namespace matrix_lang
{

ErrorKind error_kind_of(ErrorCode code) noexcept
{
  switch (code) {
    case ErrorCode::UnterminatedString:
    case ErrorCode::InvalidCharacter:
      return ErrorKind::Lex;
    case ErrorCode::UnexpectedToken:
    case ErrorCode::UnterminatedConstruct:
      return ErrorKind::Parse;
    case ErrorCode::Mismatch:
    case ErrorCode::InfiniteType:
    case ErrorCode::UnknownIdentifier:
    case ErrorCode::ArityMismatch:
    case ErrorCode::ImmutableBinding:
    case ErrorCode::UnknownField:
    case ErrorCode::DuplicateDefinition:
      return ErrorKind::Type;
    case ErrorCode::None:
    case ErrorCode::DivisionByZero:
    case ErrorCode::UndefinedVariable:
    case ErrorCode::ArgumentMismatch:
    case ErrorCode::IndexOutOfBounds:
    case ErrorCode::PatternMatchFailed:
    case ErrorCode::DomainError:
    case ErrorCode::StackOverflow:
      return ErrorKind::Runtime;
  }
  return ErrorKind::Runtime;
}

std::string_view error_kind_name(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::Lex:
      return "LexError";
    case ErrorKind::Parse:
      return "ParseError";
    case ErrorKind::Type:
      return "TypeError";
    case ErrorKind::Runtime:
      return "RuntimeError";
  }
  return "Error";
}

std::string_view error_code_name(ErrorCode code) noexcept
{
  switch (code) {
    case ErrorCode::None:
      return "None";
    case ErrorCode::UnterminatedString:
      return "UnterminatedString";
    case ErrorCode::InvalidCharacter:
      return "InvalidCharacter";
    case ErrorCode::UnexpectedToken:
      return "UnexpectedToken";
    case ErrorCode::UnterminatedConstruct:
      return "UnterminatedConstruct";
    case ErrorCode::Mismatch:
      return "Mismatch";
    case ErrorCode::InfiniteType:
      return "InfiniteType";
    case ErrorCode::UnknownIdentifier:
      return "UnknownIdentifier";
    case ErrorCode::ArityMismatch:
      return "ArityMismatch";
    case ErrorCode::ImmutableBinding:
      return "ImmutableBinding";
    case ErrorCode::UnknownField:
      return "UnknownField";
    case ErrorCode::DuplicateDefinition:
      return "DuplicateDefinition";
    case ErrorCode::DivisionByZero:
      return "DivisionByZero";
    case ErrorCode::UndefinedVariable:
      return "UndefinedVariable";
    case ErrorCode::ArgumentMismatch:
      return "ArgumentMismatch";
    case ErrorCode::IndexOutOfBounds:
      return "IndexOutOfBounds";
    case ErrorCode::PatternMatchFailed:
      return "PatternMatchFailed";
    case ErrorCode::DomainError:
      return "DomainError";
    case ErrorCode::StackOverflow:
      return "StackOverflow";
  }
  return "Unknown";
}

}  // namespace matrix_lang
