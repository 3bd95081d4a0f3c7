// matrix_lang/runtime/runtime_error.hpp - Evaluation failure
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "matrix_lang/basic/error_code.hpp"
#include "matrix_lang/basic/source_manager.hpp"

namespace matrix_lang
{

/**
 * Thrown by the interpreter and by builtin implementations.
 *
 * Builtins usually throw without a range; the interpreter fills in the
 * range of the call that failed before the error leaves the call.
 */
class RuntimeError : public std::runtime_error
{
public:
  RuntimeError(ErrorCode code, std::string message, SourceRange range = {})
  : std::runtime_error(std::move(message)), code_(code), range_(range)
  {
  }

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }
  [[nodiscard]] SourceRange range() const noexcept { return range_; }
  [[nodiscard]] bool has_range() const noexcept { return range_.is_valid(); }

  void set_range(SourceRange range) noexcept { range_ = range; }

private:
  ErrorCode code_;
  SourceRange range_;
};

}  // namespace matrix_lang
