// matrix_lang/sema/type_error.hpp - Exception raised by inference
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "matrix_lang/basic/error_code.hpp"
#include "matrix_lang/basic/source_manager.hpp"

namespace matrix_lang
{

/**
 * First type error of a check. Thrown from deep inside inference and
 * converted into a Diagnostic by TypeChecker at the pass boundary.
 */
class TypeCheckError : public std::runtime_error
{
public:
  TypeCheckError(ErrorCode code, std::string message, SourceRange range)
  : std::runtime_error(std::move(message)), code_(code), range_(range)
  {
  }

  /// Point at an earlier site in the same source ("previous definition here").
  TypeCheckError & with_related(SourceRange range, std::string message)
  {
    related_range_ = range;
    related_message_ = std::move(message);
    return *this;
  }

  TypeCheckError & with_help(std::string help)
  {
    help_ = std::move(help);
    return *this;
  }

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }
  [[nodiscard]] SourceRange range() const noexcept { return range_; }
  [[nodiscard]] SourceRange related_range() const noexcept { return related_range_; }
  [[nodiscard]] const std::string & related_message() const noexcept { return related_message_; }
  [[nodiscard]] const std::optional<std::string> & help() const noexcept { return help_; }

private:
  ErrorCode code_;
  SourceRange range_;
  SourceRange related_range_;
  std::string related_message_;
  std::optional<std::string> help_;
};

}  // namespace matrix_lang
