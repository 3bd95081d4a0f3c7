// matrix_lang/jit/jit_analyzer.cpp - JIT-eligibility analysis for let-bound lambdas
#include "matrix_lang/jit/jit_analyzer.hpp"

#include <fmt/format.h>

#include <utility>

namespace matrix_lang
{

JitDecision JitAnalyzer::analyze(const LambdaExpr & lambda, std::string_view selfName)
{
  JitAnalyzer analyzer(lambda, selfName);
  if (analyzer.visit(lambda.body)) {
    return JitDecision{true, {}};
  }
  return JitDecision{false, std::move(analyzer.reason_)};
}

bool JitAnalyzer::visit(const AstNode * node)
{
  switch (node->get_kind()) {
    case NodeKind::IntLiteral:
    case NodeKind::FloatLiteral:
    case NodeKind::BoolLiteral:
      return true;

    case NodeKind::Identifier: {
      const auto name = cast<IdentifierExpr>(node)->name;
      if (is_param(name)) return true;
      return reject(fmt::format("captures '{}'", name));
    }

    case NodeKind::Binary: {
      const auto op = cast<BinaryExpr>(node)->op;
      if (op == BinaryOp::And || op == BinaryOp::Or || op == BinaryOp::Range) {
        return reject(fmt::format("unsupported operator '{}'", to_string(op)));
      }
      return Base::visit(node);
    }

    case NodeKind::Unary:
      if (cast<UnaryExpr>(node)->op != UnaryOp::Neg) return reject("unsupported operator '!'");
      return Base::visit(node);

    case NodeKind::If:
      if (!cast<IfExpr>(node)->elseBranch) return reject("'if' without 'else'");
      return Base::visit(node);

    case NodeKind::Call: {
      const auto * call = cast<CallExpr>(node);
      const auto * callee = dyn_cast<IdentifierExpr>(call->callee);
      if (!callee || callee->name != self_name_ || is_param(callee->name)) {
        return reject("calls a function other than itself");
      }
      for (const auto * arg : call->args) {
        if (!visit(arg)) return false;
      }
      return true;
    }

    default:
      break;
  }
  return reject(fmt::format("uses {}", to_string(node->get_kind())));
}

bool JitAnalyzer::is_param(std::string_view name) const
{
  for (const auto * p : lambda_.params) {
    if (p->name == name) return true;
  }
  return false;
}

bool JitAnalyzer::reject(std::string reason)
{
  reason_ = std::move(reason);
  return false;
}

std::string JitStats::summary() const
{
  return fmt::format(
    "analyzed {}, eligible {}, compiled {}, fell back {}", analyzed, eligible, compiled, fellBack);
}

}  // namespace matrix_lang
