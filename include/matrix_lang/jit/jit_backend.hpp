// matrix_lang/jit/jit_backend.hpp - Native compilation interface
#pragma once

#include <string_view>

#include "matrix_lang/ast/ast.hpp"
#include "matrix_lang/runtime/value.hpp"

namespace matrix_lang
{

/**
 * Produces a native implementation of a JIT-eligible lambda.
 *
 * compile() may throw any std::exception; the interpreter then keeps the
 * tree-walking implementation.
 */
class JitBackend
{
public:
  virtual ~JitBackend() = default;

  [[nodiscard]] virtual CompiledFunction compile(const LambdaExpr & lambda, std::string_view name) = 0;
};

}  // namespace matrix_lang
