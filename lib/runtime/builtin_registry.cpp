// matrix_lang/runtime/builtin_registry.cpp - Builtin functions: schemes and implementations
#include "matrix_lang/runtime/builtin_registry.hpp"

#include <utility>

namespace matrix_lang
{

bool BuiltinRegistry::register_builtin(
  std::string_view name, std::string_view module, Scheme scheme, BuiltinFn fn)
{
  if (!fn || scheme.body == nullptr) return false;
  if (signatures_.contains(name) || impls_.find(name) != impls_.end()) return false;

  BuiltinImpl impl;
  impl.name = std::string(name);
  impl.isConstant = !scheme.body->is_function();
  impl.arity = impl.isConstant ? 0 : scheme.body->params.size();
  impl.fn = std::move(fn);

  auto [it, inserted] = signatures_.entries_.emplace(
    std::string(name), BuiltinSignature{std::string(name), std::string(module), std::move(scheme)});
  // Roll the signature back if the implementation cannot be stored.
  try {
    impls_.emplace(impl.name, std::move(impl));
    signatures_.modules_.emplace(module);
  } catch (...) {
    signatures_.entries_.erase(it);
    impls_.erase(std::string(name));
    throw;
  }
  return inserted;
}

const BuiltinImpl * BuiltinRegistry::find_impl(std::string_view name) const
{
  auto it = impls_.find(name);
  return it == impls_.end() ? nullptr : &it->second;
}

}  // namespace matrix_lang
