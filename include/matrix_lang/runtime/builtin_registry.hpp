// matrix_lang/runtime/builtin_registry.hpp - Builtin functions: schemes and implementations
//
// The registry is the only way to add a builtin. Each registration inserts
// the type scheme (read by the TypeChecker through signatures()) and the
// implementation (read by the Interpreter through find_impl()) in one step,
// so a name is never checked-but-uncallable or callable-but-unchecked.
//
#pragma once

#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "matrix_lang/runtime/value.hpp"
#include "matrix_lang/sema/signature_table.hpp"
#include "matrix_lang/sema/type.hpp"

namespace matrix_lang
{

class HandleTable;

/**
 * Services the interpreter offers to builtin implementations.
 */
class CallContext
{
public:
  virtual ~CallContext() = default;

  /// Call any callable value (closure, builtin or method) with arguments.
  virtual Value call(const Value & callee, std::vector<Value> args) = 0;

  /// Stream that `print`/`println` write to.
  virtual std::ostream & out() = 0;

  virtual HandleTable & handles() = 0;

  /// One-line summary of JIT-eligibility decisions so far.
  virtual std::string jit_summary() const = 0;

  /**
   * Checked result type of the call site running the current builtin.
   *
   * nullptr when the builtin was reached through a value (passed to `map`,
   * say). Inside polymorphic code the type may still be a variable.
   */
  virtual const Type * call_result_type() const = 0;
};

using BuiltinFn = std::function<Value(CallContext &, const std::vector<Value> &)>;

struct BuiltinImpl
{
  std::string name;
  size_t arity = 0;
  bool isConstant = false;  ///< Non-function scheme: evaluated when the name is read
  BuiltinFn fn;
};

/**
 * Name to (scheme, implementation) table of one session.
 *
 * ## Usage
 * ```cpp
 * TypeContext types;
 * BuiltinRegistry registry(types);
 * install_stdlib(registry);
 * TypeChecker checker(types, registry.signatures());
 * ```
 */
class BuiltinRegistry
{
public:
  explicit BuiltinRegistry(TypeContext & types) : types_(types) {}

  BuiltinRegistry(const BuiltinRegistry &) = delete;
  BuiltinRegistry & operator=(const BuiltinRegistry &) = delete;

  /**
   * Register a builtin under a module tag.
   *
   * @return false, with neither table modified, when `name` is already
   *         registered or `fn` is empty
   */
  [[nodiscard]] bool register_builtin(
    std::string_view name, std::string_view module, Scheme scheme, BuiltinFn fn);

  [[nodiscard]] const SignatureTable & signatures() const noexcept { return signatures_; }

  [[nodiscard]] const BuiltinImpl * find_impl(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return find_impl(name) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return impls_.size(); }

  /// Type context the schemes are built in.
  [[nodiscard]] TypeContext & types() noexcept { return types_; }

private:
  TypeContext & types_;
  SignatureTable signatures_;
  std::map<std::string, BuiltinImpl, std::less<>> impls_;
};

/// Register every standard library module. Throws std::logic_error on a name clash.
void install_stdlib(BuiltinRegistry & registry);

}  // namespace matrix_lang
