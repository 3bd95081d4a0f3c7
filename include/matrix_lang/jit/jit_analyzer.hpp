// matrix_lang/jit/jit_analyzer.hpp - JIT-eligibility analysis for let-bound lambdas
//
// A lambda is eligible when its body only uses the closed operation set
// the native path supports: Int/Float/Bool literals, its own parameters,
// arithmetic and comparison operators, unary minus, if/else, and calls to
// itself. Everything else stays on the tree-walking path.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "matrix_lang/ast/ast.hpp"
#include "matrix_lang/ast/visitor.hpp"

namespace matrix_lang
{

struct JitDecision
{
  bool eligible = false;
  std::string reason;  ///< Why the lambda falls back (empty when eligible)
};

/**
 * Walks a lambda body and stops at the first construct outside the
 * supported set.
 */
class JitAnalyzer : public RecursiveAstVisitor<JitAnalyzer, const AstNode *>
{
  using Base = RecursiveAstVisitor<JitAnalyzer, const AstNode *>;

public:
  /**
   * @param selfName Name the lambda is bound to; calls to it count as
   *                 self-recursion
   */
  [[nodiscard]] static JitDecision analyze(const LambdaExpr & lambda, std::string_view selfName);

  bool visit(const AstNode * node);

private:
  JitAnalyzer(const LambdaExpr & lambda, std::string_view selfName)
  : lambda_(lambda), self_name_(selfName)
  {
  }

  [[nodiscard]] bool is_param(std::string_view name) const;
  bool reject(std::string reason);

  const LambdaExpr & lambda_;
  std::string_view self_name_;
  std::string reason_;
};

/// Counters behind the `jit_stats` builtin.
struct JitStats
{
  size_t analyzed = 0;
  size_t eligible = 0;
  size_t compiled = 0;
  size_t fellBack = 0;

  [[nodiscard]] std::string summary() const;
};

}  // namespace matrix_lang
