// matrix_lang/sema/type_checker.cpp - Hindley-Milner type inference
//
#include "matrix_lang/sema/type_checker.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "matrix_lang/ast/visitor.hpp"
#include "matrix_lang/sema/type_error.hpp"

namespace matrix_lang
{

namespace
{

bool is_type_var_name(std::string_view name)
{
  return !name.empty() && std::islower(static_cast<unsigned char>(name.front())) != 0;
}

/// Unbound variables of `type` in order of first appearance.
void ordered_vars(
  const Type * type, const Substitution & subst, std::vector<TypeVarId> & out)
{
  type = subst.prune(type);
  switch (type->kind) {
    case TypeKind::Var:
      if (std::find(out.begin(), out.end(), type->var_id) == out.end()) {
        out.push_back(type->var_id);
      }
      return;
    case TypeKind::Array:
    case TypeKind::Matrix:
    case TypeKind::Task:
      ordered_vars(type->element, subst, out);
      return;
    case TypeKind::Function:
      for (const auto * p : type->params) {
        ordered_vars(p, subst, out);
      }
      ordered_vars(type->result, subst, out);
      return;
    default:
      return;
  }
}

/// Rewrites every Expr::resolvedType with the final substitution.
class ResolveTypes : public RecursiveAstVisitor<ResolveTypes>
{
  using Base = RecursiveAstVisitor<ResolveTypes>;

public:
  ResolveTypes(const Substitution & subst, TypeContext & types) : subst_(subst), types_(types) {}

  bool visit(AstNode * node)
  {
    if (auto * expr = dyn_cast<Expr>(node); expr && expr->resolvedType) {
      expr->resolvedType = subst_.apply(expr->resolvedType, types_);
    }
    return Base::visit(node);
  }

private:
  const Substitution & subst_;
  TypeContext & types_;
};

}  // namespace

// ============================================================================
// Scope Guard
// ============================================================================

class TypeChecker::ScopeGuard
{
public:
  explicit ScopeGuard(TypeChecker & checker)
  : checker_(checker), env_(checker.scope_), saved_(checker.scope_)
  {
    checker_.scope_ = &env_;
  }
  ~ScopeGuard() { checker_.scope_ = saved_; }

  ScopeGuard(const ScopeGuard &) = delete;
  ScopeGuard & operator=(const ScopeGuard &) = delete;

private:
  TypeChecker & checker_;
  TypeEnv env_;
  TypeEnv * saved_;
};

// ============================================================================
// Construction and Entry Points
// ============================================================================

TypeChecker::TypeChecker(TypeContext & types, const SignatureTable & builtins)
: types_(types), builtins_(builtins), unifier_(types, subst_)
{
}

TypeChecker::Snapshot TypeChecker::snapshot() const
{
  return Snapshot{subst_, globals_, structs_, classes_, instances_, module_name_};
}

void TypeChecker::restore(Snapshot saved)
{
  subst_ = std::move(saved.subst);
  globals_ = std::move(saved.globals);
  structs_ = std::move(saved.structs);
  classes_ = std::move(saved.classes);
  instances_ = std::move(saved.instances);
  module_name_ = std::move(saved.moduleName);
  scope_ = &globals_;
}

const Type * TypeChecker::check_program(Program & program, DiagnosticBag & diags)
{
  Snapshot saved = snapshot();
  definition_sites_.clear();

  try {
    const Type * last = types_.unit_type();
    for (auto * item : program.items) {
      last = check_item(item);
    }
    finalize(program);
    return resolve(last);
  } catch (const TypeCheckError & e) {
    restore(std::move(saved));
    auto diag = diags.report_error(e.range(), e.what());
    diag.with_code(e.code()).with_secondary_label(e.related_range(), e.related_message());
    if (e.help()) diag.with_help(*e.help());
    return nullptr;
  }
}

std::optional<Scheme> TypeChecker::infer_expression(Expr & expr, DiagnosticBag & diags)
{
  Substitution saved_subst = subst_;
  std::optional<Scheme> scheme;
  try {
    scheme = generalize(infer(&expr));
  } catch (const TypeCheckError & e) {
    scope_ = &globals_;
    diags.report_error(e.range(), e.what()).with_code(e.code());
  }
  subst_ = std::move(saved_subst);
  return scheme;
}

const Type * TypeChecker::resolve(const Type * type) const
{
  return type ? subst_.apply(type, types_) : nullptr;
}

std::optional<Scheme> TypeChecker::global_scheme(std::string_view name) const
{
  if (const auto * binding = globals_.lookup(name)) {
    return Scheme{binding->scheme.vars, resolve(binding->scheme.body)};
  }
  if (const auto * sig = builtins_.find(name)) {
    return sig->scheme;
  }
  return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> TypeChecker::describe_globals() const
{
  std::vector<std::pair<std::string, std::string>> out;
  for (const auto & [name, binding] : globals_.bindings()) {
    const Scheme shown{binding.scheme.vars, resolve(binding.scheme.body)};
    out.emplace_back(name, format_scheme(shown));
  }
  return out;
}

const Type * TypeChecker::find_struct(std::string_view name) const
{
  auto it = structs_.find(name);
  return it == structs_.end() ? nullptr : it->second;
}

void TypeChecker::finalize(Program & program)
{
  ResolveTypes resolver(subst_, types_);
  resolver.visit(&program);
}

// ============================================================================
// Helper Methods
// ============================================================================

void TypeChecker::fail(ErrorCode code, SourceRange range, std::string message) const
{
  throw TypeCheckError(code, std::move(message), range);
}

void TypeChecker::redefinition(SourceRange range, std::string message, std::string_view site_key) const
{
  TypeCheckError error(ErrorCode::DuplicateDefinition, std::move(message), range);
  auto site = definition_sites_.find(site_key);
  if (site != definition_sites_.end()) {
    error.with_related(site->second, "previous definition here");
  }
  throw error;
}

void TypeChecker::unify(const Type * expected, const Type * found, SourceRange where)
{
  unifier_.unify(expected, found, where);
}

const Type * TypeChecker::substitute(
  const Type * type, const Scheme & scheme, std::map<TypeVarId, const Type *> & mapping)
{
  type = subst_.prune(type);
  switch (type->kind) {
    case TypeKind::Var: {
      if (auto it = mapping.find(type->var_id); it != mapping.end()) {
        return it->second;
      }
      const bool quantified =
        std::find(scheme.vars.begin(), scheme.vars.end(), type->var_id) != scheme.vars.end();
      if (!quantified) {
        return type;
      }
      const Type * fresh = types_.fresh_var(type->mask);
      mapping.emplace(type->var_id, fresh);
      return fresh;
    }
    case TypeKind::Array:
      return types_.array_of(substitute(type->element, scheme, mapping));
    case TypeKind::Matrix:
      return types_.matrix_of(substitute(type->element, scheme, mapping));
    case TypeKind::Task:
      return types_.task_of(substitute(type->element, scheme, mapping));
    case TypeKind::Function: {
      std::vector<const Type *> params;
      params.reserve(type->params.size());
      for (const auto * p : type->params) {
        params.push_back(substitute(p, scheme, mapping));
      }
      return types_.function_type(params, substitute(type->result, scheme, mapping));
    }
    default:
      return type;
  }
}

const Type * TypeChecker::instantiate(const Scheme & scheme)
{
  if (!scheme.is_polymorphic()) {
    return scheme.body;
  }
  std::map<TypeVarId, const Type *> mapping;
  return substitute(scheme.body, scheme, mapping);
}

const Type * TypeChecker::instantiate_with(
  const Scheme & scheme, std::map<TypeVarId, const Type *> fixed)
{
  return substitute(scheme.body, scheme, fixed);
}

Scheme TypeChecker::generalize(const Type * type)
{
  const Type * applied = subst_.apply(type, types_);

  std::vector<TypeVarId> vars;
  ordered_vars(applied, subst_, vars);

  std::unordered_set<TypeVarId> env_vars;
  scope_->collect_free_vars(subst_, env_vars);
  vars.erase(
    std::remove_if(
      vars.begin(), vars.end(), [&](TypeVarId v) { return env_vars.count(v) != 0; }),
    vars.end());

  return Scheme{std::move(vars), applied};
}

const Type * TypeChecker::resolve_type(const TypeNode * node, TypeVarNames & names)
{
  switch (node->get_kind()) {
    case NodeKind::NamedType: {
      const auto * named = cast<NamedTypeNode>(node);
      if (const Type * builtin = types_.lookup_builtin(named->name)) {
        return builtin;
      }
      if (const Type * st = find_struct(named->name)) {
        return st;
      }
      if (is_type_var_name(named->name)) {
        auto it = names.find(named->name);
        if (it == names.end()) {
          it = names.emplace(std::string(named->name), types_.fresh_var()).first;
        }
        return it->second;
      }
      fail(
        ErrorCode::UnknownIdentifier, node->get_range(),
        fmt::format("unknown type '{}'", named->name));
    }
    case NodeKind::GenericType: {
      const auto * generic = cast<GenericTypeNode>(node);
      const Type * arg = resolve_type(generic->argument, names);
      if (generic->name == "Array") return types_.array_of(arg);
      if (generic->name == "Matrix") return types_.matrix_of(arg);
      if (generic->name == "Task") return types_.task_of(arg);
      fail(
        ErrorCode::UnknownIdentifier, node->get_range(),
        fmt::format("unknown generic type '{}'", generic->name));
    }
    case NodeKind::FunctionType: {
      const auto * fn = cast<FunctionTypeNode>(node);
      std::vector<const Type *> params;
      for (const auto * p : fn->params) {
        params.push_back(resolve_type(p, names));
      }
      return types_.function_type(params, resolve_type(fn->result, names));
    }
    default:
      break;
  }
  fail(ErrorCode::UnknownIdentifier, node->get_range(), "unsupported type annotation");
}

// ============================================================================
// Items, Statements and Declarations
// ============================================================================

const Type * TypeChecker::check_item(AstNode * item)
{
  switch (item->get_kind()) {
    case NodeKind::ModuleDecl:
      check_module_decl(cast<ModuleDecl>(item));
      return types_.unit_type();
    case NodeKind::ImportDecl:
      check_import_decl(cast<ImportDecl>(item));
      return types_.unit_type();
    case NodeKind::StructDecl:
      check_struct_decl(cast<StructDecl>(item));
      return types_.unit_type();
    case NodeKind::TypeclassDecl:
      check_typeclass_decl(cast<TypeclassDecl>(item));
      return types_.unit_type();
    case NodeKind::InstanceDecl:
      check_instance_decl(cast<InstanceDecl>(item));
      return types_.unit_type();
    default:
      break;
  }
  return check_stmt(cast<Stmt>(item));
}

const Type * TypeChecker::check_stmt(Stmt * stmt)
{
  if (auto * let = dyn_cast<LetStmt>(stmt)) {
    return check_let_stmt(let);
  }
  return infer(cast<ExprStmt>(stmt)->expr);
}

const Type * TypeChecker::check_let_stmt(LetStmt * stmt)
{
  TypeBinding binding =
    infer_binding(stmt->name, stmt->isMutable, stmt->typeAnnotation, stmt->value, stmt->get_range());
  const Type * type = binding.scheme.body;
  scope_->define(stmt->name, std::move(binding));
  return type;
}

TypeBinding TypeChecker::infer_binding(
  std::string_view name, bool isMutable, TypeNode * annotation, Expr * value, SourceRange range)
{
  TypeVarNames names;
  const Type * annotated = annotation ? resolve_type(annotation, names) : nullptr;

  const Type * type = nullptr;
  if (!isMutable && isa<LambdaExpr>(value)) {
    // The function may call itself: bind the name to a monotype first.
    const Type * self = types_.fresh_var();
    {
      ScopeGuard guard(*this);
      scope_->define(name, TypeBinding{Scheme::mono(self), false});
      type = infer(value);
    }
    unify(self, type, range);
  } else {
    type = infer(value);
  }

  if (annotated) {
    unify(annotated, type, value->get_range());
  }

  if (isMutable) {
    return TypeBinding{Scheme::mono(subst_.apply(type, types_)), true};
  }
  return TypeBinding{generalize(type), false};
}

void TypeChecker::check_module_decl(ModuleDecl * decl) { module_name_ = std::string(decl->name); }

void TypeChecker::check_import_decl(ImportDecl * decl)
{
  if (!builtins_.has_module(decl->moduleName)) {
    fail(
      ErrorCode::UnknownIdentifier, decl->get_range(),
      fmt::format("unknown module '{}'", decl->moduleName));
  }
  for (auto item : decl->items) {
    if (!builtins_.exports(decl->moduleName, item)) {
      fail(
        ErrorCode::UnknownIdentifier, decl->get_range(),
        fmt::format("module '{}' has no member '{}'", decl->moduleName, item));
    }
  }
}

void TypeChecker::check_struct_decl(StructDecl * decl)
{
  const std::string site_key = fmt::format("type {}", decl->name);
  if (find_struct(decl->name) || types_.lookup_builtin(decl->name)) {
    redefinition(decl->get_range(), fmt::format("type '{}' is already defined", decl->name), site_key);
  }

  std::vector<StructField> fields;
  for (auto * field : decl->fields) {
    for (const auto * earlier : decl->fields) {
      if (earlier == field) break;
      if (earlier->name == field->name) {
        throw TypeCheckError(
          ErrorCode::DuplicateDefinition,
          fmt::format("duplicate field '{}' in struct '{}'", field->name, decl->name),
          field->get_range())
          .with_related(earlier->get_range(), "first declared here");
      }
    }
    TypeVarNames names;
    const Type * type = resolve_type(field->type, names);
    if (!names.empty()) {
      fail(
        ErrorCode::UnknownIdentifier, field->type->get_range(),
        fmt::format("unknown type '{}'", names.begin()->first));
    }
    fields.push_back(StructField{types_.intern(field->name), type});
  }

  const std::string_view name = types_.intern(decl->name);
  structs_.emplace(std::string(name), types_.struct_type(name, fields));
  definition_sites_.insert_or_assign(site_key, decl->get_range());
}

void TypeChecker::check_typeclass_decl(TypeclassDecl * decl)
{
  const std::string site_key = fmt::format("typeclass {}", decl->name);
  if (classes_.count(decl->name) != 0) {
    redefinition(
      decl->get_range(), fmt::format("typeclass '{}' is already defined", decl->name), site_key);
  }

  ClassInfo info;
  info.name = std::string(decl->name);
  const Type * param = types_.fresh_var();
  info.param = param->var_id;

  for (auto * method : decl->methods) {
    TypeVarNames names;
    names.emplace(std::string(decl->typeParam), param);
    const Type * sig = resolve_type(method->type, names);

    std::vector<TypeVarId> vars;
    ordered_vars(sig, subst_, vars);
    Scheme scheme{std::move(vars), sig};

    globals_.define(method->name, TypeBinding{scheme, false});
    info.methods.emplace_back(std::string(method->name), std::move(scheme));
  }

  classes_.emplace(info.name, std::move(info));
  definition_sites_.insert_or_assign(site_key, decl->get_range());
}

void TypeChecker::check_instance_decl(InstanceDecl * decl)
{
  auto cls = classes_.find(decl->className);
  if (cls == classes_.end()) {
    fail(
      ErrorCode::UnknownIdentifier, decl->get_range(),
      fmt::format("unknown typeclass '{}'", decl->className));
  }
  const ClassInfo & info = cls->second;

  TypeVarNames names;
  const Type * instance_type = resolve_type(decl->type, names);
  const std::string type_name(dispatch_name(instance_type));
  if (type_name.empty()) {
    fail(
      ErrorCode::Mismatch, decl->type->get_range(),
      "type mismatch: instance type must be a concrete type");
  }

  const std::string site_key = fmt::format("instance {} {}", info.name, type_name);
  if (instances_.count({info.name, type_name}) != 0) {
    redefinition(
      decl->get_range(), fmt::format("instance '{} {}' is already defined", info.name, type_name),
      site_key);
  }

  std::set<std::string, std::less<>> implemented;
  for (auto * impl : decl->methods) {
    auto method = std::find_if(
      info.methods.begin(), info.methods.end(),
      [&](const auto & m) { return m.first == impl->name; });
    if (method == info.methods.end()) {
      fail(
        ErrorCode::UnknownIdentifier, impl->get_range(),
        fmt::format("'{}' is not a method of typeclass '{}'", impl->name, info.name));
    }
    if (!implemented.insert(std::string(impl->name)).second) {
      fail(
        ErrorCode::DuplicateDefinition, impl->get_range(),
        fmt::format("method '{}' is implemented twice", impl->name));
    }

    const Type * sig = subst_.prune(instantiate_with(method->second, {{info.param, instance_type}}));

    ScopeGuard guard(*this);
    if (!sig->is_function()) {
      if (!impl->params.empty()) {
        fail(
          ErrorCode::ArityMismatch, impl->get_range(),
          fmt::format("method '{}' takes no parameters", impl->name));
      }
      unify(sig, infer(impl->body), impl->body->get_range());
      continue;
    }

    if (sig->params.size() != impl->params.size()) {
      fail(
        ErrorCode::ArityMismatch, impl->get_range(),
        fmt::format(
          "method '{}' expects {} parameters, got {}", impl->name, sig->params.size(),
          impl->params.size()));
    }
    for (size_t i = 0; i < impl->params.size(); ++i) {
      const Type * param_type = sig->params[i];
      if (impl->params[i]->type) {
        TypeVarNames param_names;
        unify(
          resolve_type(impl->params[i]->type, param_names), param_type,
          impl->params[i]->get_range());
      }
      scope_->define(impl->params[i]->name, TypeBinding{Scheme::mono(param_type), false});
    }
    unify(sig->result, infer(impl->body), impl->body->get_range());
  }

  for (const auto & [method_name, scheme] : info.methods) {
    if (implemented.count(method_name) == 0) {
      fail(
        ErrorCode::ArityMismatch, decl->get_range(),
        fmt::format(
          "instance '{} {}' is missing method '{}'", info.name, type_name, method_name));
    }
  }

  instances_.emplace(info.name, type_name);
  definition_sites_.insert_or_assign(site_key, decl->get_range());
}

// ============================================================================
// Expression Type Inference
// ============================================================================

const Type * TypeChecker::infer(Expr * expr)
{
  const Type * result = nullptr;

  switch (expr->get_kind()) {
    case NodeKind::IntLiteral:
      result = types_.int_type();
      break;
    case NodeKind::FloatLiteral:
      result = types_.float_type();
      break;
    case NodeKind::StringLiteral:
      result = types_.string_type();
      break;
    case NodeKind::BoolLiteral:
      result = types_.bool_type();
      break;
    case NodeKind::UnitLiteral:
      result = types_.unit_type();
      break;
    case NodeKind::Identifier:
      result = infer_identifier(cast<IdentifierExpr>(expr));
      break;
    case NodeKind::Binary:
      result = infer_binary(cast<BinaryExpr>(expr));
      break;
    case NodeKind::Unary:
      result = infer_unary(cast<UnaryExpr>(expr));
      break;
    case NodeKind::Call:
      result = infer_call(cast<CallExpr>(expr));
      break;
    case NodeKind::Index:
      result = infer_index(cast<IndexExpr>(expr));
      break;
    case NodeKind::FieldAccess:
      result = infer_field_access(cast<FieldAccessExpr>(expr));
      break;
    case NodeKind::Lambda:
      result = infer_lambda(cast<LambdaExpr>(expr));
      break;
    case NodeKind::Let:
      result = infer_let(cast<LetExpr>(expr));
      break;
    case NodeKind::Assign:
      result = infer_assign(cast<AssignExpr>(expr));
      break;
    case NodeKind::Block: {
      auto * block = cast<BlockExpr>(expr);
      ScopeGuard guard(*this);
      result = infer_sequence(block->statements, block->result);
      break;
    }
    case NodeKind::If:
      result = infer_if(cast<IfExpr>(expr));
      break;
    case NodeKind::Match:
      result = infer_match(cast<MatchExpr>(expr));
      break;
    case NodeKind::StructLiteral:
      result = infer_struct_literal(cast<StructLiteralExpr>(expr));
      break;
    case NodeKind::ArrayLiteral:
      result = infer_array_literal(cast<ArrayLiteralExpr>(expr));
      break;
    case NodeKind::MatrixLiteral:
      result = infer_matrix_literal(cast<MatrixLiteralExpr>(expr));
      break;
    case NodeKind::Comprehension:
      result = infer_comprehension(cast<ComprehensionExpr>(expr));
      break;
    case NodeKind::Parallel: {
      // Sequential sugar: statements share the enclosing scope.
      auto * par = cast<ParallelExpr>(expr);
      result = infer_sequence(par->statements, par->result);
      break;
    }
    case NodeKind::Spawn:
      result = types_.task_of(infer(cast<SpawnExpr>(expr)->body));
      break;
    case NodeKind::Wait:
      result = infer_wait(cast<WaitExpr>(expr));
      break;
    default:
      fail(ErrorCode::Mismatch, expr->get_range(), "unsupported expression");
  }

  expr->resolvedType = result;
  return result;
}

const Type * TypeChecker::infer_identifier(IdentifierExpr * node)
{
  if (const auto * binding = scope_->lookup(node->name)) {
    return instantiate(binding->scheme);
  }
  if (const auto * sig = builtins_.find(node->name)) {
    return instantiate(sig->scheme);
  }
  fail(
    ErrorCode::UnknownIdentifier, node->get_range(),
    fmt::format("unknown identifier '{}'", node->name));
}

const Type * TypeChecker::infer_binary(BinaryExpr * node)
{
  const Type * lhs = infer(node->lhs);
  const Type * rhs = infer(node->rhs);
  const SourceRange where = node->rhs->get_range();
  const std::string what = fmt::format("operator '{}'", to_string(node->op));

  switch (node->op) {
    case BinaryOp::And:
    case BinaryOp::Or:
      unify(types_.bool_type(), lhs, node->lhs->get_range());
      unify(types_.bool_type(), rhs, where);
      return types_.bool_type();

    case BinaryOp::Eq:
    case BinaryOp::Ne:
      unify(lhs, rhs, where);
      return types_.bool_type();

    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
      unify(lhs, rhs, where);
      unifier_.constrain(lhs, k_mask_numeric | k_mask_string, what, node->get_range());
      return types_.bool_type();

    case BinaryOp::Range:
      unify(types_.int_type(), lhs, node->lhs->get_range());
      unify(types_.int_type(), rhs, where);
      return types_.array_of(types_.int_type());

    case BinaryOp::Add:
      unify(lhs, rhs, where);
      unifier_.constrain(
        lhs, k_mask_numeric | k_mask_string | k_mask_matrix, what, node->get_range());
      return lhs;

    case BinaryOp::Sub:
    case BinaryOp::Mul:
      unify(lhs, rhs, where);
      unifier_.constrain(lhs, k_mask_numeric | k_mask_matrix, what, node->get_range());
      return lhs;

    case BinaryOp::Div:
    case BinaryOp::Mod:
    case BinaryOp::Pow:
      unify(lhs, rhs, where);
      unifier_.constrain(lhs, k_mask_numeric, what, node->get_range());
      return lhs;
  }
  return lhs;
}

const Type * TypeChecker::infer_unary(UnaryExpr * node)
{
  const Type * operand = infer(node->operand);
  if (node->op == UnaryOp::Not) {
    unify(types_.bool_type(), operand, node->operand->get_range());
    return types_.bool_type();
  }
  unifier_.constrain(operand, k_mask_numeric, "unary '-'", node->get_range());
  return operand;
}

const Type * TypeChecker::infer_call(CallExpr * node)
{
  const Type * callee = infer(node->callee);

  std::vector<const Type *> args;
  args.reserve(node->args.size());
  for (auto * arg : node->args) {
    args.push_back(infer(arg));
  }

  const Type * fn = subst_.prune(callee);
  if (fn->is_function()) {
    if (fn->params.size() != args.size()) {
      const auto * ident = dyn_cast<IdentifierExpr>(node->callee);
      fail(
        ErrorCode::ArityMismatch, node->get_range(),
        fmt::format(
          "'{}' expects {} arguments, got {}", ident ? ident->name : "function",
          fn->params.size(), args.size()));
    }
    for (size_t i = 0; i < args.size(); ++i) {
      unify(fn->params[i], args[i], node->args[i]->get_range());
    }
    return fn->result;
  }

  if (fn->is_var()) {
    const Type * result = types_.fresh_var();
    unify(fn, types_.function_type(args, result), node->callee->get_range());
    return result;
  }

  fail(
    ErrorCode::Mismatch, node->callee->get_range(),
    fmt::format("type mismatch: expected a function, found {}", format_type(resolve(fn))));
}

const Type * TypeChecker::infer_index(IndexExpr * node)
{
  const Type * base = subst_.prune(infer(node->base));
  unify(types_.int_type(), infer(node->index), node->index->get_range());

  switch (base->kind) {
    case TypeKind::Array:
      return base->element;
    case TypeKind::Matrix:
      return types_.array_of(base->element);
    case TypeKind::Var: {
      const Type * elem = types_.fresh_var();
      unify(types_.array_of(elem), base, node->base->get_range());
      return elem;
    }
    default:
      break;
  }
  fail(
    ErrorCode::Mismatch, node->base->get_range(),
    fmt::format("type mismatch: cannot index into {}", format_type(resolve(base))));
}

const Type * TypeChecker::infer_field_access(FieldAccessExpr * node)
{
  const Type * base = subst_.prune(infer(node->base));

  if (base->kind == TypeKind::Struct) {
    if (const auto * field = base->find_field(node->field)) {
      return field->type;
    }
    fail(
      ErrorCode::UnknownField, node->get_range(),
      fmt::format("struct '{}' has no field '{}'", base->name, node->field));
  }

  if (base->is_var()) {
    // Infer the struct from the field name when exactly one struct declares it.
    const Type * candidate = nullptr;
    size_t matches = 0;
    for (const auto & [name, st] : structs_) {
      if (st->find_field(node->field)) {
        candidate = st;
        ++matches;
      }
    }
    if (matches == 0) {
      fail(
        ErrorCode::UnknownField, node->get_range(),
        fmt::format("no struct has a field named '{}'", node->field));
    }
    if (matches > 1) {
      fail(
        ErrorCode::Mismatch, node->base->get_range(),
        fmt::format(
          "type mismatch: field '{}' is ambiguous, annotate the struct type", node->field));
    }
    unify(candidate, base, node->base->get_range());
    return candidate->find_field(node->field)->type;
  }

  fail(
    ErrorCode::Mismatch, node->base->get_range(),
    fmt::format("type mismatch: expected a struct, found {}", format_type(resolve(base))));
}

const Type * TypeChecker::infer_lambda(LambdaExpr * node)
{
  TypeVarNames names;
  ScopeGuard guard(*this);

  std::vector<const Type *> params;
  params.reserve(node->params.size());
  for (auto * param : node->params) {
    const Type * type = param->type ? resolve_type(param->type, names) : types_.fresh_var();
    scope_->define(param->name, TypeBinding{Scheme::mono(type), false});
    params.push_back(type);
  }

  const Type * body = infer(node->body);
  if (node->returnType) {
    unify(resolve_type(node->returnType, names), body, node->body->get_range());
  }
  return types_.function_type(params, body);
}

const Type * TypeChecker::infer_let(LetExpr * node)
{
  TypeBinding binding = infer_binding(
    node->name, node->isMutable, node->typeAnnotation, node->value, node->get_range());
  ScopeGuard guard(*this);
  scope_->define(node->name, std::move(binding));
  return infer(node->body);
}

const Type * TypeChecker::infer_assign(AssignExpr * node)
{
  const TypeBinding * binding = scope_->lookup(node->target);
  if (!binding) {
    if (builtins_.contains(node->target)) {
      fail(
        ErrorCode::ImmutableBinding, node->get_range(),
        fmt::format("cannot assign to builtin '{}'", node->target));
    }
    fail(
      ErrorCode::UnknownIdentifier, node->get_range(),
      fmt::format("unknown identifier '{}'", node->target));
  }
  if (!binding->isMutable) {
    throw TypeCheckError(
      ErrorCode::ImmutableBinding,
      fmt::format("cannot assign to immutable binding '{}'", node->target), node->get_range())
      .with_help(fmt::format("declare it with 'let mut {}' to allow assignment", node->target));
  }
  const Type * target = binding->scheme.body;
  unify(target, infer(node->value), node->value->get_range());
  return types_.unit_type();
}

const Type * TypeChecker::infer_sequence(gsl::span<Stmt *> statements, Expr * result)
{
  for (auto * stmt : statements) {
    (void)check_stmt(stmt);
  }
  return result ? infer(result) : types_.unit_type();
}

const Type * TypeChecker::infer_if(IfExpr * node)
{
  unify(types_.bool_type(), infer(node->condition), node->condition->get_range());
  const Type * then_type = infer(node->thenBranch);
  if (node->elseBranch) {
    unify(then_type, infer(node->elseBranch), node->elseBranch->get_range());
    return then_type;
  }
  unify(types_.unit_type(), then_type, node->thenBranch->get_range());
  return types_.unit_type();
}

const Type * TypeChecker::infer_match(MatchExpr * node)
{
  const Type * scrutinee = infer(node->scrutinee);
  const Type * result = types_.fresh_var();

  for (auto * arm : node->arms) {
    ScopeGuard guard(*this);
    check_pattern(arm->pattern, scrutinee);
    if (arm->guard) {
      unify(types_.bool_type(), infer(arm->guard), arm->guard->get_range());
    }
    unify(result, infer(arm->body), arm->body->get_range());
  }
  return result;
}

void TypeChecker::check_pattern(Pattern * pattern, const Type * expected)
{
  switch (pattern->get_kind()) {
    case NodeKind::WildcardPattern:
      return;
    case NodeKind::BindingPattern:
      scope_->define(
        cast<BindingPattern>(pattern)->name, TypeBinding{Scheme::mono(expected), false});
      return;
    case NodeKind::LiteralPattern:
      unify(expected, infer(cast<LiteralPattern>(pattern)->literal), pattern->get_range());
      return;
    case NodeKind::StructPattern: {
      auto * sp = cast<StructPattern>(pattern);
      const Type * st = find_struct(sp->typeName);
      if (!st) {
        fail(
          ErrorCode::UnknownIdentifier, pattern->get_range(),
          fmt::format("unknown struct '{}'", sp->typeName));
      }
      unify(expected, st, pattern->get_range());
      for (auto * fp : sp->fields) {
        const auto * field = st->find_field(fp->name);
        if (!field) {
          fail(
            ErrorCode::UnknownField, fp->get_range(),
            fmt::format("struct '{}' has no field '{}'", sp->typeName, fp->name));
        }
        if (fp->pattern) {
          check_pattern(fp->pattern, field->type);
        } else {
          scope_->define(fp->name, TypeBinding{Scheme::mono(field->type), false});
        }
      }
      return;
    }
    case NodeKind::ArrayPattern: {
      auto * ap = cast<ArrayPattern>(pattern);
      const Type * elem = types_.fresh_var();
      unify(expected, types_.array_of(elem), pattern->get_range());
      for (auto * sub : ap->elements) {
        check_pattern(sub, elem);
      }
      return;
    }
    default:
      break;
  }
  fail(ErrorCode::Mismatch, pattern->get_range(), "unsupported pattern");
}

const Type * TypeChecker::infer_struct_literal(StructLiteralExpr * node)
{
  const Type * st = find_struct(node->typeName);
  if (!st) {
    fail(
      ErrorCode::UnknownIdentifier, node->get_range(),
      fmt::format("unknown struct '{}'", node->typeName));
  }

  std::set<std::string_view> seen;
  for (auto * init : node->fields) {
    const auto * field = st->find_field(init->name);
    if (!field) {
      fail(
        ErrorCode::UnknownIdentifier, init->get_range(),
        fmt::format("struct '{}' has no field '{}'", node->typeName, init->name));
    }
    if (!seen.insert(init->name).second) {
      fail(
        ErrorCode::DuplicateDefinition, init->get_range(),
        fmt::format("field '{}' is initialized twice", init->name));
    }
    unify(field->type, infer(init->value), init->value->get_range());
  }

  if (seen.size() != st->fields.size()) {
    for (const auto & field : st->fields) {
      if (seen.count(field.name) == 0) {
        fail(
          ErrorCode::ArityMismatch, node->get_range(),
          fmt::format(
            "struct '{}' expects {} fields, got {} (missing '{}')", node->typeName,
            st->fields.size(), seen.size(), field.name));
      }
    }
  }
  return st;
}

const Type * TypeChecker::infer_array_literal(ArrayLiteralExpr * node)
{
  const Type * elem = types_.fresh_var();
  for (auto * e : node->elements) {
    unify(elem, infer(e), e->get_range());
  }
  return types_.array_of(elem);
}

const Type * TypeChecker::infer_matrix_literal(MatrixLiteralExpr * node)
{
  const Type * elem = types_.fresh_var();
  for (auto * row : node->rows) {
    for (auto * e : row->elements) {
      unify(elem, infer(e), e->get_range());
    }
    row->resolvedType = types_.array_of(elem);
  }

  // Numeric rows form a Matrix; anything else stays a nested array.
  node->isMatrix = subst_.prune(elem)->is_numeric();
  return node->isMatrix ? types_.matrix_of(elem) : types_.array_of(types_.array_of(elem));
}

const Type * TypeChecker::infer_comprehension(ComprehensionExpr * node)
{
  ScopeGuard guard(*this);

  for (auto * gen : node->generators) {
    const Type * source = subst_.prune(infer(gen->source));
    const Type * item = nullptr;
    if (source->kind == TypeKind::Matrix) {
      item = types_.array_of(source->element);
    } else {
      item = types_.fresh_var();
      unify(types_.array_of(item), source, gen->source->get_range());
    }
    scope_->define(gen->variable, TypeBinding{Scheme::mono(item), false});

    for (auto * filter : gen->filters) {
      unify(types_.bool_type(), infer(filter), filter->get_range());
    }
  }

  return types_.array_of(infer(node->element));
}

const Type * TypeChecker::infer_wait(WaitExpr * node)
{
  const Type * target = subst_.prune(infer(node->target));
  const Type * inner = types_.fresh_var();

  if (target->kind == TypeKind::Array) {
    unify(types_.array_of(types_.task_of(inner)), target, node->target->get_range());
    return types_.array_of(inner);
  }
  unify(types_.task_of(inner), target, node->target->get_range());
  return inner;
}

}  // namespace matrix_lang
