// matrix_lang/jit/closure_compiler.cpp - Default JIT backend
#include "matrix_lang/jit/closure_compiler.hpp"

#include <fmt/format.h>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "matrix_lang/runtime/arithmetic.hpp"
#include "matrix_lang/runtime/runtime_error.hpp"

namespace matrix_lang
{

namespace
{

using Args = std::vector<Value>;
using Node = std::function<Value(const Args &)>;

/// Shared by the root function and every self-call inside it.
struct CompiledState
{
  Node body;
  size_t arity = 0;
  size_t depth = 0;
  size_t maxDepth = 0;
  std::string name;

  Value call(const Args & args)
  {
    if (args.size() != arity) {
      throw RuntimeError(
        ErrorCode::ArgumentMismatch,
        fmt::format("'{}' expects {} arguments, got {}", name, arity, args.size()));
    }
    if (depth >= maxDepth) {
      throw RuntimeError(
        ErrorCode::StackOverflow, fmt::format("maximum call depth {} exceeded", maxDepth));
    }
    ++depth;
    struct Restore
    {
      size_t & d;
      ~Restore() { --d; }
    } restore{depth};
    return body(args);
  }
};

class Builder
{
public:
  Builder(const LambdaExpr & lambda, std::string_view self, CompiledState * state)
  : lambda_(lambda), self_(self), state_(state)
  {
  }

  Node build(const Expr * expr)
  {
    switch (expr->get_kind()) {
      case NodeKind::IntLiteral: {
        Value v = Value::make_int(cast<IntLiteralExpr>(expr)->value);
        return [v](const Args &) { return v; };
      }
      case NodeKind::FloatLiteral: {
        Value v = Value::make_float(cast<FloatLiteralExpr>(expr)->value);
        return [v](const Args &) { return v; };
      }
      case NodeKind::BoolLiteral: {
        Value v = Value::make_bool(cast<BoolLiteralExpr>(expr)->value);
        return [v](const Args &) { return v; };
      }
      case NodeKind::Identifier: {
        const size_t slot = param_slot(cast<IdentifierExpr>(expr)->name);
        return [slot](const Args & args) { return args[slot]; };
      }
      case NodeKind::Binary: {
        const auto * bin = cast<BinaryExpr>(expr);
        Node lhs = build(bin->lhs);
        Node rhs = build(bin->rhs);
        const BinaryOp op = bin->op;
        return [op, lhs = std::move(lhs), rhs = std::move(rhs)](const Args & args) {
          return apply_binary(op, lhs(args), rhs(args));
        };
      }
      case NodeKind::Unary: {
        const auto * un = cast<UnaryExpr>(expr);
        Node operand = build(un->operand);
        const UnaryOp op = un->op;
        return [op, operand = std::move(operand)](const Args & args) {
          return apply_unary(op, operand(args));
        };
      }
      case NodeKind::If: {
        const auto * ife = cast<IfExpr>(expr);
        if (!ife->elseBranch) break;
        Node cond = build(ife->condition);
        Node then_branch = build(ife->thenBranch);
        Node else_branch = build(ife->elseBranch);
        return [cond = std::move(cond), then_branch = std::move(then_branch),
                else_branch = std::move(else_branch)](const Args & args) {
          const Value c = cond(args);
          if (!c.is_bool()) {
            throw RuntimeError(ErrorCode::ArgumentMismatch, "condition must be Bool");
          }
          return c.as_bool() ? then_branch(args) : else_branch(args);
        };
      }
      case NodeKind::Call: {
        const auto * call = cast<CallExpr>(expr);
        const auto * callee = dyn_cast<IdentifierExpr>(call->callee);
        if (!callee || callee->name != self_) break;
        std::vector<Node> args;
        for (const auto * a : call->args) args.push_back(build(a));
        CompiledState * state = state_;
        return [state, args = std::move(args)](const Args & outer) {
          Args values;
          values.reserve(args.size());
          for (const auto & a : args) values.push_back(a(outer));
          return state->call(values);
        };
      }
      default:
        break;
    }
    throw std::invalid_argument(
      fmt::format("cannot compile {} in '{}'", to_string(expr->get_kind()), self_));
  }

private:
  size_t param_slot(std::string_view name) const
  {
    for (size_t i = 0; i < lambda_.params.size(); ++i) {
      if (lambda_.params[i]->name == name) return i;
    }
    throw std::invalid_argument(fmt::format("'{}' is not a parameter of '{}'", name, self_));
  }

  const LambdaExpr & lambda_;
  std::string_view self_;
  CompiledState * state_;
};

}  // namespace

CompiledFunction ClosureCompiler::compile(const LambdaExpr & lambda, std::string_view name)
{
  auto state = std::make_shared<CompiledState>();
  state->arity = lambda.params.size();
  state->maxDepth = max_call_depth_;
  state->name = std::string(name);
  state->body = Builder(lambda, name, state.get()).build(lambda.body);

  return [state](const std::vector<Value> & args) { return state->call(args); };
}

}  // namespace matrix_lang
