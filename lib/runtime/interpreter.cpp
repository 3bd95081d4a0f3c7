// matrix_lang/runtime/interpreter.cpp - Tree-walking evaluator
#include "matrix_lang/runtime/interpreter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <cstddef>
#include <ostream>
#include <utility>

#include "matrix_lang/runtime/arithmetic.hpp"
#include "matrix_lang/runtime/runtime_error.hpp"

namespace matrix_lang
{

// ============================================================================
// Scope Guards
// ============================================================================

class Interpreter::FrameGuard
{
public:
  FrameGuard(Interpreter & interp, std::shared_ptr<Environment> frame)
  : interp_(interp), saved_(std::exchange(interp.env_, std::move(frame)))
  {
  }

  FrameGuard(const FrameGuard &) = delete;
  FrameGuard & operator=(const FrameGuard &) = delete;

  ~FrameGuard() { interp_.env_ = std::move(saved_); }

private:
  Interpreter & interp_;
  std::shared_ptr<Environment> saved_;
};

namespace
{

struct DepthGuard
{
  explicit DepthGuard(size_t & d) : depth(d) { ++depth; }
  DepthGuard(const DepthGuard &) = delete;
  DepthGuard & operator=(const DepthGuard &) = delete;
  ~DepthGuard() { --depth; }

  size_t & depth;
};

struct ResultTypeGuard
{
  ResultTypeGuard(const Type *& s, const Type * type) : slot(s), saved(std::exchange(s, type)) {}
  ResultTypeGuard(const ResultTypeGuard &) = delete;
  ResultTypeGuard & operator=(const ResultTypeGuard &) = delete;
  ~ResultTypeGuard() { slot = saved; }

  const Type *& slot;
  const Type * saved;
};

[[noreturn]] void fail(ErrorCode code, std::string message, SourceRange range = {})
{
  throw RuntimeError(code, std::move(message), range);
}

bool expect_bool(const Value & v, std::string_view what)
{
  if (!v.is_bool()) {
    fail(
      ErrorCode::ArgumentMismatch,
      fmt::format("{} must be Bool, got {}", what, runtime_type_name(v)));
  }
  return v.as_bool();
}

/// Dispatch name of an instance head, matching runtime_type_name().
std::string instance_type_name(const TypeNode * type)
{
  switch (type->get_kind()) {
    case NodeKind::NamedType:
      return std::string(cast<NamedTypeNode>(type)->name);
    case NodeKind::GenericType: {
      const auto name = cast<GenericTypeNode>(type)->name;
      return name == "Task" ? "Handle" : std::string(name);
    }
    default:
      return "Function";
  }
}

/// True when `v` may keep a frame alive (a closure, or an aggregate holding one).
bool holds_frame(const Value & v)
{
  switch (v.kind()) {
    case ValueKind::Closure:
      return true;
    case ValueKind::Array: {
      const auto & elements = v.as_array();
      // Elements share one type: a plain first element means a plain array.
      if (elements.empty() || (!elements.front().is_array() && !elements.front().is_struct() &&
                               elements.front().kind() != ValueKind::Closure)) {
        return false;
      }
      return std::any_of(elements.begin(), elements.end(), holds_frame);
    }
    case ValueKind::Struct: {
      const auto & fields = v.as_struct().fields;
      return std::any_of(
        fields.begin(), fields.end(), [](const auto & f) { return holds_frame(f.second); });
    }
    default:
      return false;
  }
}

constexpr size_t k_assigned_frame_prune_threshold = 256;

}  // namespace

// ============================================================================
// Construction
// ============================================================================

Interpreter::Interpreter(
  const BuiltinRegistry & builtins, InterpreterOptions options, std::ostream & out)
: builtins_(builtins),
  options_(options),
  out_(out),
  globals_(std::make_shared<Environment>()),
  env_(globals_)
{
}

Interpreter::~Interpreter()
{
  for (auto & weak : assigned_frames_) {
    if (auto frame = weak.lock()) frame->clear();
  }
}

// ============================================================================
// Entry Points
// ============================================================================

Value Interpreter::run_program(const Program & program)
{
  depth_ = 0;
  env_ = globals_;
  FrameGuard entry(*this, std::make_shared<Environment>(globals_));

  Value last;
  for (const auto * item : program.items) {
    last = exec_item(item);
  }

  // Commit: later entries see this entry's bindings.
  if (!env_->values().empty() || env_->parent() != globals_) {
    globals_ = env_;
  }
  return last;
}

Value Interpreter::evaluate(const Expr & expr)
{
  env_ = globals_;
  depth_ = 0;
  return eval(&expr);
}

// ============================================================================
// Items and Statements
// ============================================================================

Value Interpreter::exec_item(const AstNode * item)
{
  switch (item->get_kind()) {
    case NodeKind::ModuleDecl:
    case NodeKind::ImportDecl:
      return Value::unit();
    case NodeKind::StructDecl:
      exec_struct_decl(cast<StructDecl>(item));
      return Value::unit();
    case NodeKind::TypeclassDecl:
      exec_typeclass_decl(cast<TypeclassDecl>(item));
      return Value::unit();
    case NodeKind::InstanceDecl:
      exec_instance_decl(cast<InstanceDecl>(item));
      return Value::unit();
    default:
      break;
  }
  return exec_stmt(cast<Stmt>(item));
}

Value Interpreter::exec_stmt(const Stmt * stmt)
{
  if (const auto * let = dyn_cast<LetStmt>(stmt)) {
    // Attributes such as @gpu do not change host evaluation.
    return bind(let->name, let->isMutable, let->value);
  }
  return eval(cast<ExprStmt>(stmt)->expr);
}

void Interpreter::exec_struct_decl(const StructDecl * decl)
{
  std::vector<std::string> fields;
  for (const auto * field : decl->fields) {
    fields.emplace_back(field->name);
  }
  struct_fields_.insert_or_assign(std::string(decl->name), std::move(fields));
}

void Interpreter::exec_typeclass_decl(const TypeclassDecl * decl)
{
  for (const auto * method : decl->methods) {
    define_in_scope(method->name, Value::make_method(std::string(method->name)));
  }
}

void Interpreter::exec_instance_decl(const InstanceDecl * decl)
{
  const std::string type_name = instance_type_name(decl->type);
  for (const auto * impl : decl->methods) {
    auto closure = std::make_shared<Closure>();
    closure->params = impl->params;
    closure->body = impl->body;
    closure->env = env_;
    closure->name = std::string(impl->name);
    methods_.insert_or_assign(
      std::make_pair(std::string(impl->name), type_name), Value::make_closure(std::move(closure)));
  }
}

Value Interpreter::bind(std::string_view name, bool isMutable, const Expr * value)
{
  const auto * lambda = dyn_cast<LambdaExpr>(value);
  Value v = (lambda && !isMutable) ? eval_lambda(lambda, std::string(name), true) : eval(value);
  define_in_scope(name, v);
  return v;
}

void Interpreter::define_in_scope(std::string_view name, Value value)
{
  if (env_->defines(name) || holds_frame(value)) {
    env_ = std::make_shared<Environment>(env_);
  }
  env_->define(name, std::move(value));
}

// ============================================================================
// Expression Evaluation
// ============================================================================

Value Interpreter::eval(const Expr * expr)
{
  try {
    return eval_node(expr);
  } catch (RuntimeError & e) {
    if (!e.has_range()) e.set_range(expr->get_range());
    throw;
  }
}

Value Interpreter::eval_node(const Expr * expr)
{
  switch (expr->get_kind()) {
    case NodeKind::IntLiteral:
      return Value::make_int(cast<IntLiteralExpr>(expr)->value);
    case NodeKind::FloatLiteral:
      return Value::make_float(cast<FloatLiteralExpr>(expr)->value);
    case NodeKind::StringLiteral:
      return Value::make_string(std::string(cast<StringLiteralExpr>(expr)->value));
    case NodeKind::BoolLiteral:
      return Value::make_bool(cast<BoolLiteralExpr>(expr)->value);
    case NodeKind::UnitLiteral:
      return Value::unit();
    case NodeKind::Identifier:
      return eval_identifier(cast<IdentifierExpr>(expr));
    case NodeKind::Binary:
      return eval_binary(cast<BinaryExpr>(expr));
    case NodeKind::Unary: {
      const auto * node = cast<UnaryExpr>(expr);
      return apply_unary(node->op, eval(node->operand));
    }
    case NodeKind::Call:
      return eval_call(cast<CallExpr>(expr));
    case NodeKind::Index:
      return eval_index(cast<IndexExpr>(expr));
    case NodeKind::FieldAccess:
      return eval_field_access(cast<FieldAccessExpr>(expr));
    case NodeKind::Lambda:
      return eval_lambda(cast<LambdaExpr>(expr), {}, false);
    case NodeKind::Let:
      return eval_let(cast<LetExpr>(expr));
    case NodeKind::Assign:
      return eval_assign(cast<AssignExpr>(expr));
    case NodeKind::Block: {
      const auto * node = cast<BlockExpr>(expr);
      FrameGuard guard(*this, std::make_shared<Environment>(env_));
      return eval_sequence(node->statements, node->result);
    }
    case NodeKind::If:
      return eval_if(cast<IfExpr>(expr));
    case NodeKind::Match:
      return eval_match(cast<MatchExpr>(expr));
    case NodeKind::StructLiteral:
      return eval_struct_literal(cast<StructLiteralExpr>(expr));
    case NodeKind::ArrayLiteral:
      return eval_array_literal(cast<ArrayLiteralExpr>(expr));
    case NodeKind::MatrixLiteral:
      return eval_matrix_literal(cast<MatrixLiteralExpr>(expr));
    case NodeKind::Comprehension:
      return eval_comprehension(cast<ComprehensionExpr>(expr));
    case NodeKind::Parallel: {
      // Sequential: statements run in order in the enclosing frame.
      const auto * node = cast<ParallelExpr>(expr);
      return eval_sequence(node->statements, node->result);
    }
    case NodeKind::Spawn:
      return eval_spawn(cast<SpawnExpr>(expr));
    case NodeKind::Wait:
      return eval_wait(cast<WaitExpr>(expr));
    default:
      break;
  }
  fail(
    ErrorCode::ArgumentMismatch,
    fmt::format("cannot evaluate {} node", to_string(expr->get_kind())), expr->get_range());
}

Value Interpreter::eval_identifier(const IdentifierExpr * node)
{
  if (const Value * v = env_->lookup(node->name)) {
    return *v;
  }
  if (const auto * impl = builtins_.find_impl(node->name)) {
    if (impl->isConstant) return impl->fn(*this, {});
    return Value::make_builtin(impl->name);
  }
  fail(
    ErrorCode::UndefinedVariable, fmt::format("undefined variable '{}'", node->name),
    node->get_range());
}

Value Interpreter::eval_binary(const BinaryExpr * node)
{
  if (node->op == BinaryOp::And || node->op == BinaryOp::Or) {
    const bool lhs = expect_bool(eval(node->lhs), "left operand");
    if (node->op == BinaryOp::And && !lhs) return Value::make_bool(false);
    if (node->op == BinaryOp::Or && lhs) return Value::make_bool(true);
    return Value::make_bool(expect_bool(eval(node->rhs), "right operand"));
  }
  Value lhs = eval(node->lhs);
  Value rhs = eval(node->rhs);
  return apply_binary(node->op, lhs, rhs);
}

Value Interpreter::eval_call(const CallExpr * node)
{
  Value callee = eval(node->callee);
  std::vector<Value> args;
  args.reserve(node->args.size());
  for (const auto * arg : node->args) {
    args.push_back(eval(arg));
  }
  if (callee.kind() == ValueKind::Builtin) {
    return call_builtin(callee.builtin_name(), args, node->resolvedType);
  }
  return call(callee, std::move(args));
}

Value Interpreter::eval_index(const IndexExpr * node)
{
  Value base = eval(node->base);
  Value index = eval(node->index);
  if (!index.is_int()) {
    fail(
      ErrorCode::ArgumentMismatch,
      fmt::format("index must be Int, got {}", runtime_type_name(index)),
      node->index->get_range());
  }
  const int64_t i = index.as_int();

  auto check_bounds = [&](size_t length) {
    if (i < 0 || static_cast<size_t>(i) >= length) {
      fail(
        ErrorCode::IndexOutOfBounds,
        fmt::format("index {} out of bounds for length {}", i, length), node->get_range());
    }
    return static_cast<size_t>(i);
  };

  if (base.is_array()) {
    const auto & elements = base.as_array();
    return elements[check_bounds(elements.size())];
  }
  if (base.is_matrix()) {
    const auto & m = base.as_matrix();
    const size_t row = check_bounds(m.rows);
    std::vector<Value> cells(
      m.cells.begin() + static_cast<std::ptrdiff_t>(row * m.cols),
      m.cells.begin() + static_cast<std::ptrdiff_t>((row + 1) * m.cols));
    return Value::make_array(std::move(cells));
  }
  fail(
    ErrorCode::ArgumentMismatch, fmt::format("cannot index a {}", runtime_type_name(base)),
    node->base->get_range());
}

Value Interpreter::eval_field_access(const FieldAccessExpr * node)
{
  Value base = eval(node->base);
  if (!base.is_struct()) {
    fail(
      ErrorCode::ArgumentMismatch,
      fmt::format("cannot access field '{}' of {}", node->field, runtime_type_name(base)),
      node->get_range());
  }
  const auto & st = base.as_struct();
  if (const Value * field = st.find_field(node->field)) {
    return *field;
  }
  fail(
    ErrorCode::ArgumentMismatch, fmt::format("struct '{}' has no field '{}'", st.name, node->field),
    node->get_range());
}

Value Interpreter::eval_lambda(const LambdaExpr * node, std::string name, bool recursive)
{
  auto closure = std::make_shared<Closure>();
  closure->params = node->params;
  closure->body = node->body;
  closure->env = env_;
  closure->recursive = recursive;
  if (recursive) {
    closure->compiled = try_compile(node, name);
  }
  closure->name = std::move(name);
  return Value::make_closure(std::move(closure));
}

Value Interpreter::eval_let(const LetExpr * node)
{
  FrameGuard guard(*this, std::make_shared<Environment>(env_));
  bind(node->name, node->isMutable, node->value);
  return eval(node->body);
}

Value Interpreter::eval_assign(const AssignExpr * node)
{
  Value v = eval(node->value);
  Environment * frame = env_->frame_defining(node->target);
  if (!frame) {
    fail(
      ErrorCode::UndefinedVariable, fmt::format("undefined variable '{}'", node->target),
      node->get_range());
  }

  if (holds_frame(v)) {
    if (assigned_frames_.size() >= k_assigned_frame_prune_threshold) {
      assigned_frames_.erase(
        std::remove_if(
          assigned_frames_.begin(), assigned_frames_.end(),
          [](const auto & w) { return w.expired(); }),
        assigned_frames_.end());
    }
    assigned_frames_.push_back(frame->weak_from_this());
  }
  frame->define(node->target, std::move(v));
  return Value::unit();
}

Value Interpreter::eval_sequence(gsl::span<Stmt * const> statements, const Expr * result)
{
  for (const auto * stmt : statements) {
    exec_stmt(stmt);
  }
  return result ? eval(result) : Value::unit();
}

Value Interpreter::eval_if(const IfExpr * node)
{
  if (expect_bool(eval(node->condition), "condition")) {
    return eval(node->thenBranch);
  }
  return node->elseBranch ? eval(node->elseBranch) : Value::unit();
}

Value Interpreter::eval_match(const MatchExpr * node)
{
  Value scrutinee = eval(node->scrutinee);
  for (const auto * arm : node->arms) {
    FrameGuard guard(*this, std::make_shared<Environment>(env_));
    if (!match_pattern(arm->pattern, scrutinee)) continue;
    if (arm->guard && !expect_bool(eval(arm->guard), "match guard")) continue;
    return eval(arm->body);
  }
  fail(
    ErrorCode::PatternMatchFailed,
    fmt::format("no match arm matched value {}", format_value(scrutinee)), node->get_range());
}

bool Interpreter::match_pattern(const Pattern * pattern, const Value & value)
{
  switch (pattern->get_kind()) {
    case NodeKind::WildcardPattern:
      return true;
    case NodeKind::BindingPattern:
      env_->define(cast<BindingPattern>(pattern)->name, value);
      return true;
    case NodeKind::LiteralPattern:
      return values_equal(eval(cast<LiteralPattern>(pattern)->literal), value);
    case NodeKind::StructPattern: {
      const auto * sp = cast<StructPattern>(pattern);
      if (!value.is_struct() || value.as_struct().name != sp->typeName) return false;
      for (const auto * fp : sp->fields) {
        const Value * field = value.as_struct().find_field(fp->name);
        if (!field) return false;
        if (!fp->pattern) {
          env_->define(fp->name, *field);
        } else if (!match_pattern(fp->pattern, *field)) {
          return false;
        }
      }
      return true;
    }
    case NodeKind::ArrayPattern: {
      const auto * ap = cast<ArrayPattern>(pattern);
      if (!value.is_array() || value.as_array().size() != ap->elements.size()) return false;
      for (size_t i = 0; i < ap->elements.size(); ++i) {
        if (!match_pattern(ap->elements[i], value.as_array()[i])) return false;
      }
      return true;
    }
    default:
      break;
  }
  return false;
}

Value Interpreter::eval_struct_literal(const StructLiteralExpr * node)
{
  std::vector<std::pair<std::string, Value>> fields;
  for (const auto * init : node->fields) {
    fields.emplace_back(std::string(init->name), eval(init->value));
  }

  auto decl = struct_fields_.find(node->typeName);
  if (decl != struct_fields_.end()) {
    const auto & order = decl->second;
    auto position = [&](const std::string & name) {
      return std::find(order.begin(), order.end(), name) - order.begin();
    };
    std::stable_sort(fields.begin(), fields.end(), [&](const auto & a, const auto & b) {
      return position(a.first) < position(b.first);
    });
  }
  return Value::make_struct(std::string(node->typeName), std::move(fields));
}

Value Interpreter::eval_array_literal(const ArrayLiteralExpr * node)
{
  std::vector<Value> elements;
  elements.reserve(node->elements.size());
  for (const auto * e : node->elements) {
    elements.push_back(eval(e));
  }
  return Value::make_array(std::move(elements));
}

Value Interpreter::eval_matrix_literal(const MatrixLiteralExpr * node)
{
  if (!node->isMatrix) {
    std::vector<Value> rows;
    rows.reserve(node->rows.size());
    for (const auto * row : node->rows) {
      rows.push_back(eval(row));
    }
    return Value::make_array(std::move(rows));
  }

  std::vector<Value> cells;
  cells.reserve(node->rows.size() * node->columns);
  for (const auto * row : node->rows) {
    for (const auto * e : row->elements) {
      cells.push_back(eval(e));
    }
  }
  return Value::make_matrix(node->rows.size(), node->columns, std::move(cells));
}

Value Interpreter::eval_comprehension(const ComprehensionExpr * node)
{
  std::vector<Value> out;
  run_generators(node, 0, out);
  return Value::make_array(std::move(out));
}

void Interpreter::run_generators(
  const ComprehensionExpr * node, size_t index, std::vector<Value> & out)
{
  const auto * gen = node->generators[index];
  Value source = eval(gen->source);

  std::vector<Value> items;
  if (source.is_array()) {
    items = source.as_array();
  } else if (source.is_matrix()) {
    const auto & m = source.as_matrix();
    for (size_t r = 0; r < m.rows; ++r) {
      items.push_back(Value::make_array(std::vector<Value>(
        m.cells.begin() + static_cast<std::ptrdiff_t>(r * m.cols),
        m.cells.begin() + static_cast<std::ptrdiff_t>((r + 1) * m.cols))));
    }
  } else {
    fail(
      ErrorCode::ArgumentMismatch,
      fmt::format("cannot iterate over {}", runtime_type_name(source)), gen->source->get_range());
  }

  for (auto & item : items) {
    // One frame per element: closures built in the body keep their element.
    FrameGuard iteration(*this, std::make_shared<Environment>(env_));
    env_->define(gen->variable, std::move(item));
    bool keep = true;
    for (const auto * filter : gen->filters) {
      if (!expect_bool(eval(filter), "comprehension filter")) {
        keep = false;
        break;
      }
    }
    if (!keep) continue;

    if (index + 1 == node->generators.size()) {
      out.push_back(eval(node->element));
    } else {
      run_generators(node, index + 1, out);
    }
  }
}

Value Interpreter::eval_spawn(const SpawnExpr * node)
{
  // The task runs to completion before spawn returns.
  Value result = eval(node->body);
  return Value::make_task(handles_.next_id(), std::move(result));
}

Value Interpreter::eval_wait(const WaitExpr * node)
{
  Value target = eval(node->target);

  auto unwrap = [&](const Value & v) {
    const Value * result = v.task_result();
    if (!result) {
      fail(
        ErrorCode::ArgumentMismatch,
        fmt::format("wait expects a task handle, got {}", format_value(v)), node->get_range());
    }
    return *result;
  };

  if (target.is_array()) {
    std::vector<Value> results;
    for (const auto & h : target.as_array()) {
      results.push_back(unwrap(h));
    }
    return Value::make_array(std::move(results));
  }
  return unwrap(target);
}

// ============================================================================
// Calls
// ============================================================================

Value Interpreter::call(const Value & callee, std::vector<Value> args)
{
  switch (callee.kind()) {
    case ValueKind::Closure:
      return call_closure(callee.as_closure(), std::move(args));
    case ValueKind::Builtin:
      return call_builtin(callee.builtin_name(), args, nullptr);
    case ValueKind::Method:
      return call_method(callee.method_name(), std::move(args));
    default:
      break;
  }
  fail(
    ErrorCode::ArgumentMismatch,
    fmt::format("value of type {} is not callable", runtime_type_name(callee)));
}

Value Interpreter::call_closure(
  const std::shared_ptr<const Closure> & callee, std::vector<Value> args)
{
  const Closure & closure = *callee;
  if (args.size() != closure.params.size()) {
    fail(
      ErrorCode::ArgumentMismatch,
      fmt::format(
        "'{}' expects {} arguments, got {}", closure.name.empty() ? "lambda" : closure.name,
        closure.params.size(), args.size()));
  }
  if (depth_ >= options_.maxCallDepth) {
    fail(
      ErrorCode::StackOverflow,
      fmt::format("maximum call depth {} exceeded", options_.maxCallDepth));
  }
  DepthGuard depth(depth_);

  if (closure.compiled) {
    return (*closure.compiled)(args);
  }

  auto frame = std::make_shared<Environment>(closure.env);
  if (closure.recursive) {
    frame->define(closure.name, Value::make_closure(callee));
  }
  for (size_t i = 0; i < args.size(); ++i) {
    frame->define(closure.params[i]->name, std::move(args[i]));
  }
  FrameGuard guard(*this, std::move(frame));
  return eval(closure.body);
}

Value Interpreter::call_builtin(
  const std::string & name, const std::vector<Value> & args, const Type * resultType)
{
  const auto * impl = builtins_.find_impl(name);
  if (!impl) {
    fail(ErrorCode::UndefinedVariable, fmt::format("undefined builtin '{}'", name));
  }
  if (impl->isConstant || args.size() != impl->arity) {
    fail(
      ErrorCode::ArgumentMismatch,
      fmt::format("'{}' expects {} arguments, got {}", name, impl->arity, args.size()));
  }
  ResultTypeGuard result_type(call_result_type_, resultType);
  return impl->fn(*this, args);
}

Value Interpreter::call_method(const std::string & name, std::vector<Value> args)
{
  if (args.empty()) {
    fail(ErrorCode::ArgumentMismatch, fmt::format("method '{}' needs an argument", name));
  }
  const std::string type_name(runtime_type_name(args.front()));
  auto it = methods_.find(std::make_pair(name, type_name));
  if (it == methods_.end()) {
    fail(
      ErrorCode::ArgumentMismatch,
      fmt::format("no instance of method '{}' for type {}", name, type_name));
  }
  return call(it->second, std::move(args));
}

// ============================================================================
// JIT
// ============================================================================

std::shared_ptr<const CompiledFunction> Interpreter::try_compile(
  const LambdaExpr * lambda, std::string_view name)
{
  if (!options_.jitEnabled) return nullptr;

  ++jit_stats_.analyzed;
  const JitDecision decision = JitAnalyzer::analyze(*lambda, name);
  if (!decision.eligible) {
    ++jit_stats_.fellBack;
    if (options_.jitDebug) fmt::print(stderr, "jit: '{}' falls back: {}\n", name, decision.reason);
    return nullptr;
  }

  ++jit_stats_.eligible;
  if (!jit_backend_) {
    ++jit_stats_.fellBack;
    if (options_.jitDebug) fmt::print(stderr, "jit: '{}' eligible, no backend\n", name);
    return nullptr;
  }

  try {
    auto compiled = std::make_shared<const CompiledFunction>(jit_backend_->compile(*lambda, name));
    ++jit_stats_.compiled;
    if (options_.jitDebug) fmt::print(stderr, "jit: '{}' eligible\n", name);
    return compiled;
  } catch (const std::exception & e) {
    ++jit_stats_.fellBack;
    if (options_.jitDebug) fmt::print(stderr, "jit: '{}' falls back: {}\n", name, e.what());
    return nullptr;
  }
}

}  // namespace matrix_lang
