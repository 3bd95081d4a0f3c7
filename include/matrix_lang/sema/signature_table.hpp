// matrix_lang/sema/signature_table.hpp - Builtin type signatures seen by the checker
#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>

#include "matrix_lang/sema/type.hpp"

namespace matrix_lang
{

class BuiltinRegistry;

struct BuiltinSignature
{
  std::string name;
  std::string module;  ///< Module tag used by `import` ("math", "io", ...)
  Scheme scheme;
};

/**
 * Read-only view of the builtin schemes.
 *
 * Entries are inserted exclusively by BuiltinRegistry::register_builtin(),
 * which adds the implementation in the same call.
 */
class SignatureTable
{
public:
  [[nodiscard]] const BuiltinSignature * find(std::string_view name) const
  {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
  }

  [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

  [[nodiscard]] bool has_module(std::string_view module) const
  {
    return modules_.find(module) != modules_.end();
  }

  /// True when `name` is registered under `module`.
  [[nodiscard]] bool exports(std::string_view module, std::string_view name) const
  {
    const auto * sig = find(name);
    return sig != nullptr && sig->module == module;
  }

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

  [[nodiscard]] auto begin() const { return entries_.begin(); }
  [[nodiscard]] auto end() const { return entries_.end(); }

private:
  friend class BuiltinRegistry;

  std::map<std::string, BuiltinSignature, std::less<>> entries_;
  std::set<std::string, std::less<>> modules_;
};

}  // namespace matrix_lang
