// matrix_lang/runtime/interpreter.hpp - Tree-walking evaluator
#pragma once

#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "matrix_lang/ast/ast.hpp"
#include "matrix_lang/jit/jit_analyzer.hpp"
#include "matrix_lang/jit/jit_backend.hpp"
#include "matrix_lang/runtime/builtin_registry.hpp"
#include "matrix_lang/runtime/environment.hpp"
#include "matrix_lang/runtime/handle_table.hpp"
#include "matrix_lang/runtime/value.hpp"

namespace matrix_lang
{

struct InterpreterOptions
{
  /// Nested closure calls allowed before StackOverflow.
  size_t maxCallDepth = 1000;
  /// Run the JIT-eligibility analysis on let-bound lambdas.
  bool jitEnabled = true;
  /// Print one line per JIT decision to stderr.
  bool jitDebug = false;
};

/**
 * Evaluates type-checked programs.
 *
 * The global frame persists across run_program() calls, so successive REPL
 * entries see earlier bindings. Each entry runs in a frame of its own that
 * becomes the new global frame only when the entry completes: after a
 * RuntimeError the globals are exactly those before the entry.
 *
 * Closures point into the AST, so every Program passed in must outlive the
 * interpreter.
 */
class Interpreter : public CallContext
{
public:
  Interpreter(const BuiltinRegistry & builtins, InterpreterOptions options, std::ostream & out);
  ~Interpreter() override;

  Interpreter(const Interpreter &) = delete;
  Interpreter & operator=(const Interpreter &) = delete;

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /// Evaluate every item in order; returns the value of the last one.
  Value run_program(const Program & program);

  /// Evaluate one expression in the global frame.
  Value evaluate(const Expr & expr);

  /// Install a native backend for JIT-eligible lambdas (nullptr disables compilation).
  void set_jit_backend(std::unique_ptr<JitBackend> backend) { jit_backend_ = std::move(backend); }

  [[nodiscard]] const JitStats & jit_stats() const noexcept { return jit_stats_; }
  [[nodiscard]] const std::shared_ptr<Environment> & globals() const noexcept { return globals_; }

  // ===========================================================================
  // CallContext
  // ===========================================================================

  Value call(const Value & callee, std::vector<Value> args) override;
  std::ostream & out() override { return out_; }
  HandleTable & handles() override { return handles_; }
  std::string jit_summary() const override { return jit_stats_.summary(); }
  const Type * call_result_type() const override { return call_result_type_; }

private:
  /// Restores the current frame when a scope or call ends.
  class FrameGuard;

  // ===========================================================================
  // Items and Statements
  // ===========================================================================

  Value exec_item(const AstNode * item);
  Value exec_stmt(const Stmt * stmt);
  void exec_struct_decl(const StructDecl * decl);
  void exec_typeclass_decl(const TypeclassDecl * decl);
  void exec_instance_decl(const InstanceDecl * decl);

  /// Evaluate and bind `name`; lambdas bound immutably may recurse.
  Value bind(std::string_view name, bool isMutable, const Expr * value);

  /**
   * Bind in the current scope. Opens a child frame first when the current
   * one already binds `name` (closures keep the binding they captured) or
   * when `value` holds a closure (a frame never holds what points at it).
   */
  void define_in_scope(std::string_view name, Value value);

  // ===========================================================================
  // Expression Evaluation
  // ===========================================================================

  /// Evaluate and attach the expression's range to range-less errors.
  Value eval(const Expr * expr);
  Value eval_node(const Expr * expr);
  Value eval_identifier(const IdentifierExpr * node);
  Value eval_binary(const BinaryExpr * node);
  Value eval_call(const CallExpr * node);
  Value eval_index(const IndexExpr * node);
  Value eval_field_access(const FieldAccessExpr * node);
  Value eval_lambda(const LambdaExpr * node, std::string name, bool recursive);
  Value eval_let(const LetExpr * node);
  Value eval_assign(const AssignExpr * node);
  Value eval_sequence(gsl::span<Stmt * const> statements, const Expr * result);
  Value eval_if(const IfExpr * node);
  Value eval_match(const MatchExpr * node);
  Value eval_struct_literal(const StructLiteralExpr * node);
  Value eval_array_literal(const ArrayLiteralExpr * node);
  Value eval_matrix_literal(const MatrixLiteralExpr * node);
  Value eval_comprehension(const ComprehensionExpr * node);
  Value eval_spawn(const SpawnExpr * node);
  Value eval_wait(const WaitExpr * node);

  void run_generators(
    const ComprehensionExpr * node, size_t index, std::vector<Value> & out);
  bool match_pattern(const Pattern * pattern, const Value & value);

  // ===========================================================================
  // Calls
  // ===========================================================================

  Value call_closure(const std::shared_ptr<const Closure> & closure, std::vector<Value> args);
  Value call_builtin(
    const std::string & name, const std::vector<Value> & args, const Type * resultType);
  Value call_method(const std::string & name, std::vector<Value> args);

  /// Analyze a let-bound lambda and attach a compiled body when possible.
  std::shared_ptr<const CompiledFunction> try_compile(
    const LambdaExpr * lambda, std::string_view name);

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  const BuiltinRegistry & builtins_;
  InterpreterOptions options_;
  std::ostream & out_;

  std::shared_ptr<Environment> globals_;
  std::shared_ptr<Environment> env_;
  size_t depth_ = 0;
  const Type * call_result_type_ = nullptr;

  HandleTable handles_;

  /// Field order per struct, for literals built in any order.
  std::map<std::string, std::vector<std::string>, std::less<>> struct_fields_;
  /// (method, runtime type name) -> implementation.
  std::map<std::pair<std::string, std::string>, Value> methods_;

  /// Frames that had a closure assigned into a mutable binding. Such a
  /// closure may reach the frame holding it; cleared on destruction.
  std::vector<std::weak_ptr<Environment>> assigned_frames_;

  std::unique_ptr<JitBackend> jit_backend_;
  JitStats jit_stats_;
};

}  // namespace matrix_lang
