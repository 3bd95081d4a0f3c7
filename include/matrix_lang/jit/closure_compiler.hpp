// matrix_lang/jit/closure_compiler.hpp - Default JIT backend
#pragma once

#include <cstddef>
#include <string_view>

#include "matrix_lang/jit/jit_backend.hpp"

namespace matrix_lang
{

/**
 * Compiles a JIT-eligible lambda into a tree of pre-resolved C++ closures:
 * parameters become slot indices and self-calls call the compiled function
 * directly, so no environment lookups or AST dispatch remain at call time.
 *
 * Throws std::invalid_argument for a lambda outside the eligible set.
 */
class ClosureCompiler : public JitBackend
{
public:
  explicit ClosureCompiler(size_t maxCallDepth) : max_call_depth_(maxCallDepth) {}

  [[nodiscard]] CompiledFunction compile(const LambdaExpr & lambda, std::string_view name) override;

private:
  size_t max_call_depth_;
};

}  // namespace matrix_lang
