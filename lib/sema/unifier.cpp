// matrix_lang/sema/unifier.cpp - Substitution and unification
//
#include "matrix_lang/sema/unifier.hpp"

#include <fmt/core.h>

#include <vector>

#include "matrix_lang/sema/type_error.hpp"

namespace matrix_lang
{

// ============================================================================
// Substitution
// ============================================================================

const Type * Substitution::prune(const Type * type) const
{
  while (type->is_var()) {
    auto it = bindings_.find(type->var_id);
    if (it == bindings_.end()) break;
    type = it->second;
  }
  return type;
}

const Type * Substitution::apply(const Type * type, TypeContext & types) const
{
  type = prune(type);
  switch (type->kind) {
    case TypeKind::Array: {
      const Type * elem = apply(type->element, types);
      return elem == type->element ? type : types.array_of(elem);
    }
    case TypeKind::Matrix: {
      const Type * elem = apply(type->element, types);
      return elem == type->element ? type : types.matrix_of(elem);
    }
    case TypeKind::Task: {
      const Type * elem = apply(type->element, types);
      return elem == type->element ? type : types.task_of(elem);
    }
    case TypeKind::Function: {
      bool changed = false;
      std::vector<const Type *> params;
      params.reserve(type->params.size());
      for (const auto * p : type->params) {
        params.push_back(apply(p, types));
        changed = changed || params.back() != p;
      }
      const Type * result = apply(type->result, types);
      changed = changed || result != type->result;
      return changed ? types.function_type(params, result) : type;
    }
    default:
      return type;
  }
}

void free_type_vars(
  const Type * type, const Substitution & subst, std::unordered_set<TypeVarId> & out)
{
  type = subst.prune(type);
  switch (type->kind) {
    case TypeKind::Var:
      out.insert(type->var_id);
      return;
    case TypeKind::Array:
    case TypeKind::Matrix:
    case TypeKind::Task:
      free_type_vars(type->element, subst, out);
      return;
    case TypeKind::Function:
      for (const auto * p : type->params) {
        free_type_vars(p, subst, out);
      }
      free_type_vars(type->result, subst, out);
      return;
    default:
      return;
  }
}

// ============================================================================
// Unifier
// ============================================================================

bool Unifier::occurs(TypeVarId var, const Type * type) const
{
  type = subst_.prune(type);
  switch (type->kind) {
    case TypeKind::Var:
      return type->var_id == var;
    case TypeKind::Array:
    case TypeKind::Matrix:
    case TypeKind::Task:
      return occurs(var, type->element);
    case TypeKind::Function:
      for (const auto * p : type->params) {
        if (occurs(var, p)) return true;
      }
      return occurs(var, type->result);
    default:
      return false;
  }
}

void Unifier::mismatch(const Type * expected, const Type * found, SourceRange where) const
{
  throw TypeCheckError(
    ErrorCode::Mismatch,
    fmt::format(
      "type mismatch: expected {}, found {}", format_type(subst_.apply(expected, types_)),
      format_type(subst_.apply(found, types_))),
    where);
}

void Unifier::unify(const Type * expected, const Type * found, SourceRange where)
{
  const Type * a = subst_.prune(expected);
  const Type * b = subst_.prune(found);

  if (a == b) {
    return;
  }
  if (a->is_var()) {
    bind_var(a, b, expected, found, where);
    return;
  }
  if (b->is_var()) {
    bind_var(b, a, expected, found, where);
    return;
  }
  if (a->kind != b->kind) {
    mismatch(expected, found, where);
  }

  switch (a->kind) {
    case TypeKind::Array:
    case TypeKind::Matrix:
    case TypeKind::Task:
      unify(a->element, b->element, where);
      return;
    case TypeKind::Function:
      if (a->params.size() != b->params.size()) {
        mismatch(expected, found, where);
      }
      for (size_t i = 0; i < a->params.size(); ++i) {
        unify(a->params[i], b->params[i], where);
      }
      unify(a->result, b->result, where);
      return;
    case TypeKind::Struct:
      if (a->name != b->name) {
        mismatch(expected, found, where);
      }
      return;
    default:
      // Primitive kinds are equal once their kinds match.
      return;
  }
}

void Unifier::bind_var(
  const Type * var, const Type * type, const Type * expected, const Type * found,
  SourceRange where)
{
  if (type->is_var()) {
    const KindMask merged = var->mask & type->mask;
    if (merged == 0) {
      mismatch(expected, found, where);
    }
    if (merged == type->mask) {
      subst_.bind(var->var_id, type);
    } else if (merged == var->mask) {
      subst_.bind(type->var_id, var);
    } else {
      const Type * narrowed = types_.fresh_var(merged);
      subst_.bind(var->var_id, narrowed);
      subst_.bind(type->var_id, narrowed);
    }
    return;
  }

  if (occurs(var->var_id, type)) {
    throw TypeCheckError(
      ErrorCode::InfiniteType,
      fmt::format(
        "infinite type: t{} occurs in {}", var->var_id,
        format_type(subst_.apply(type, types_))),
      where);
  }
  if ((var->mask & kind_bit(type)) == 0) {
    throw TypeCheckError(
      ErrorCode::Mismatch,
      fmt::format(
        "type mismatch: expected {}, found {}", describe_mask(var->mask),
        format_type(subst_.apply(type, types_))),
      where);
  }
  subst_.bind(var->var_id, type);
}

void Unifier::constrain(const Type * type, KindMask mask, std::string_view what, SourceRange where)
{
  const Type * t = subst_.prune(type);
  if (t->is_var()) {
    const KindMask merged = t->mask & mask;
    if (merged == 0) {
      throw TypeCheckError(
        ErrorCode::Mismatch,
        fmt::format(
          "type mismatch: {} expects {}, found {}", what, describe_mask(mask),
          describe_mask(t->mask)),
        where);
    }
    if (merged != t->mask) {
      subst_.bind(t->var_id, types_.fresh_var(merged));
    }
    return;
  }
  if ((kind_bit(t) & mask) == 0) {
    throw TypeCheckError(
      ErrorCode::Mismatch,
      fmt::format(
        "type mismatch: {} expects {}, found {}", what, describe_mask(mask),
        format_type(subst_.apply(t, types_))),
      where);
  }
}

}  // namespace matrix_lang
