// matrix_lang/sema/unifier.hpp - Substitution and unification
#pragma once

#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "matrix_lang/basic/source_manager.hpp"
#include "matrix_lang/sema/type.hpp"

namespace matrix_lang
{

/**
 * Mapping from type variable ids to types, extended monotonically while a
 * program is checked. Bindings may point at other variables; prune() and
 * apply() follow the chains.
 */
class Substitution
{
public:
  /// Follow variable bindings until reaching an unbound variable or a constructor.
  [[nodiscard]] const Type * prune(const Type * type) const;

  /// Replace every bound variable inside `type`, rebuilding composites.
  [[nodiscard]] const Type * apply(const Type * type, TypeContext & types) const;

  void bind(TypeVarId var, const Type * type) { bindings_[var] = type; }
  [[nodiscard]] bool is_bound(TypeVarId var) const { return bindings_.count(var) != 0; }
  [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }

private:
  std::unordered_map<TypeVarId, const Type *> bindings_;
};

/// Collect the unbound variables of `type` under `subst`.
void free_type_vars(
  const Type * type, const Substitution & subst, std::unordered_set<TypeVarId> & out);

/**
 * Structural unification with occurs check and kind masks.
 *
 * Every failure throws TypeCheckError: TypeError::Mismatch for constructor
 * or mask conflicts, TypeError::InfiniteType when a variable would be bound
 * to a type containing itself.
 */
class Unifier
{
public:
  Unifier(TypeContext & types, Substitution & subst) : types_(types), subst_(subst) {}

  /// Make `expected` and `found` equal; `where` locates the diagnostic.
  void unify(const Type * expected, const Type * found, SourceRange where);

  /**
   * Restrict `type` to the kinds in `mask`.
   *
   * @param what Operation named in the diagnostic ("operator '-'")
   */
  void constrain(const Type * type, KindMask mask, std::string_view what, SourceRange where);

  /// True when variable `var` appears inside `type`.
  [[nodiscard]] bool occurs(TypeVarId var, const Type * type) const;

private:
  void bind_var(const Type * var, const Type * type, const Type * expected,
                const Type * found, SourceRange where);
  [[noreturn]] void mismatch(const Type * expected, const Type * found, SourceRange where) const;

  TypeContext & types_;
  Substitution & subst_;
};

}  // namespace matrix_lang
