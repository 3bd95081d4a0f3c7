// matrix_lang/sema/type_env.cpp - Lexical scopes of the type checker
//
#include "matrix_lang/sema/type_env.hpp"

namespace matrix_lang
{

const TypeBinding * TypeEnv::lookup(std::string_view name) const
{
  for (const TypeEnv * env = this; env != nullptr; env = env->parent_) {
    auto it = env->bindings_.find(name);
    if (it != env->bindings_.end()) {
      return &it->second;
    }
  }
  return nullptr;
}

void TypeEnv::collect_free_vars(
  const Substitution & subst, std::unordered_set<TypeVarId> & out) const
{
  for (const TypeEnv * env = this; env != nullptr; env = env->parent_) {
    for (const auto & [name, binding] : env->bindings_) {
      std::unordered_set<TypeVarId> vars;
      free_type_vars(binding.scheme.body, subst, vars);
      for (TypeVarId quantified : binding.scheme.vars) {
        vars.erase(quantified);
      }
      out.insert(vars.begin(), vars.end());
    }
  }
}

}  // namespace matrix_lang
