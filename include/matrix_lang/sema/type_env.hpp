// matrix_lang/sema/type_env.hpp - Lexical scopes of the type checker
#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "matrix_lang/sema/type.hpp"
#include "matrix_lang/sema/unifier.hpp"

namespace matrix_lang
{

struct TypeBinding
{
  Scheme scheme;
  bool isMutable = false;
};

/**
 * One scope of the type environment.
 *
 * A child scope links to its parent without modifying it; scopes are
 * stack-allocated by the checker and strictly nested, so the parent link
 * is a plain non-owning pointer.
 */
class TypeEnv
{
public:
  explicit TypeEnv(const TypeEnv * parent = nullptr) : parent_(parent) {}

  /// Bind (or shadow) a name in this scope.
  void define(std::string_view name, TypeBinding binding)
  {
    bindings_.insert_or_assign(std::string(name), std::move(binding));
  }

  /// Innermost binding of `name`, walking outwards.
  [[nodiscard]] const TypeBinding * lookup(std::string_view name) const;

  [[nodiscard]] const TypeEnv * parent() const noexcept { return parent_; }

  /// Variables free in the environment (after substitution), excluding quantified ones.
  void collect_free_vars(const Substitution & subst, std::unordered_set<TypeVarId> & out) const;

  /// Bindings of this scope only, ordered by name.
  [[nodiscard]] const std::map<std::string, TypeBinding, std::less<>> & bindings() const noexcept
  {
    return bindings_;
  }

private:
  const TypeEnv * parent_;
  std::map<std::string, TypeBinding, std::less<>> bindings_;
};

}  // namespace matrix_lang
