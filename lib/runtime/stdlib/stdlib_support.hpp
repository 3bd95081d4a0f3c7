// matrix_lang/runtime/stdlib/stdlib_support.hpp - Helpers shared by the stdlib modules
//
// Internal to lib/runtime/stdlib; not installed.
//
#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "matrix_lang/runtime/builtin_registry.hpp"
#include "matrix_lang/runtime/runtime_error.hpp"
#include "matrix_lang/runtime/value.hpp"
#include "matrix_lang/sema/type.hpp"

namespace matrix_lang::stdlib
{

// ============================================================================
// Scheme Construction
// ============================================================================

/**
 * Builds the scheme of one builtin. Every variable created through var()
 * is quantified by fn() / constant().
 */
class SchemeBuilder
{
public:
  explicit SchemeBuilder(TypeContext & types) : types_(types) {}

  const Type * var(KindMask mask = k_mask_any)
  {
    const Type * v = types_.fresh_var(mask);
    vars_.push_back(v->var_id);
    return v;
  }

  const Type * num() { return var(k_mask_numeric); }

  const Type * Int() const { return types_.int_type(); }
  const Type * Float() const { return types_.float_type(); }
  const Type * Bool() const { return types_.bool_type(); }
  const Type * String() const { return types_.string_type(); }
  const Type * Unit() const { return types_.unit_type(); }
  const Type * Handle() const { return types_.handle_type(); }
  const Type * array(const Type * t) { return types_.array_of(t); }
  const Type * matrix(const Type * t) { return types_.matrix_of(t); }
  const Type * func(const std::vector<const Type *> & params, const Type * result)
  {
    return types_.function_type(params, result);
  }

  Scheme fn(const std::vector<const Type *> & params, const Type * result)
  {
    return Scheme{vars_, types_.function_type(params, result)};
  }

  Scheme constant(const Type * type) { return Scheme{vars_, type}; }

private:
  TypeContext & types_;
  std::vector<TypeVarId> vars_;
};

/// Register or fail loudly: a clash inside the stdlib is a programming error.
inline void define(
  BuiltinRegistry & registry, std::string_view name, std::string_view module, Scheme scheme,
  BuiltinFn fn)
{
  if (!registry.register_builtin(name, module, std::move(scheme), std::move(fn))) {
    throw std::logic_error(fmt::format("builtin '{}' is registered twice", name));
  }
}

// ============================================================================
// Argument Access
// ============================================================================

[[noreturn]] inline void argument_mismatch(
  std::string_view fn, size_t index, std::string_view expected, const Value & got)
{
  throw RuntimeError(
    ErrorCode::ArgumentMismatch,
    fmt::format(
      "'{}' expects {} for argument {}, got {}", fn, expected, index + 1,
      runtime_type_name(got)));
}

inline int64_t int_arg(std::string_view fn, const std::vector<Value> & args, size_t i)
{
  if (!args[i].is_int()) argument_mismatch(fn, i, "Int", args[i]);
  return args[i].as_int();
}

/// Int or Float, widened.
inline double number_arg(std::string_view fn, const std::vector<Value> & args, size_t i)
{
  if (!args[i].is_numeric()) argument_mismatch(fn, i, "Int or Float", args[i]);
  return args[i].to_double();
}

inline const std::string & string_arg(std::string_view fn, const std::vector<Value> & args, size_t i)
{
  if (!args[i].is_string()) argument_mismatch(fn, i, "String", args[i]);
  return args[i].as_string();
}

inline const std::vector<Value> & array_arg(
  std::string_view fn, const std::vector<Value> & args, size_t i)
{
  if (!args[i].is_array()) argument_mismatch(fn, i, "Array", args[i]);
  return args[i].as_array();
}

inline const MatrixValue & matrix_arg(std::string_view fn, const std::vector<Value> & args, size_t i)
{
  if (!args[i].is_matrix()) argument_mismatch(fn, i, "Matrix", args[i]);
  return args[i].as_matrix();
}

inline uint64_t handle_arg(std::string_view fn, const std::vector<Value> & args, size_t i)
{
  if (!args[i].is_handle()) argument_mismatch(fn, i, "Handle", args[i]);
  return args[i].handle_id();
}

/// Array of numbers widened to doubles.
inline std::vector<double> float_vector_arg(
  std::string_view fn, const std::vector<Value> & args, size_t i)
{
  std::vector<double> out;
  for (const auto & e : array_arg(fn, args, i)) {
    if (!e.is_numeric()) argument_mismatch(fn, i, "Array<Float>", args[i]);
    out.push_back(e.to_double());
  }
  return out;
}

inline Value float_array(const std::vector<double> & xs)
{
  std::vector<Value> out;
  out.reserve(xs.size());
  for (double x : xs) out.push_back(Value::make_float(x));
  return Value::make_array(std::move(out));
}

[[noreturn]] inline void domain_error(std::string message)
{
  throw RuntimeError(ErrorCode::DomainError, std::move(message));
}

// ============================================================================
// Module Installers
// ============================================================================

void install_math(BuiltinRegistry & registry);
void install_io(BuiltinRegistry & registry);
void install_array(BuiltinRegistry & registry);
void install_vector(BuiltinRegistry & registry);
void install_matrix(BuiltinRegistry & registry);
void install_random(BuiltinRegistry & registry);
void install_jit(BuiltinRegistry & registry);

}  // namespace matrix_lang::stdlib
