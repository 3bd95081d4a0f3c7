// matrix_lang/runtime/stdlib/math.cpp - `math` module
#include <cmath>

#include "matrix_lang/runtime/arithmetic.hpp"
#include "stdlib_support.hpp"

namespace matrix_lang::stdlib
{

namespace
{

constexpr std::string_view k_module = "math";

using UnaryFloatFn = double (*)(double);

/// (a:num) -> Float wrapper around a <cmath> function.
void define_float_fn(BuiltinRegistry & registry, std::string_view name, UnaryFloatFn f)
{
  SchemeBuilder s(registry.types());
  define(
    registry, name, k_module, s.fn({s.num()}, s.Float()),
    [name, f](CallContext &, const std::vector<Value> & args) {
      return Value::make_float(f(number_arg(name, args, 0)));
    });
}

constexpr double k_pi = 3.14159265358979323846;
constexpr double k_e = 2.71828182845904523536;

bool less_than(const Value & a, const Value & b)
{
  return apply_binary(BinaryOp::Lt, a, b).as_bool();
}

}  // namespace

void install_math(BuiltinRegistry & registry)
{
  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(registry, "abs", k_module, s.fn({a}, a), [](CallContext &, const std::vector<Value> & args) {
      if (args[0].is_int()) {
        const int64_t v = args[0].as_int();
        return Value::make_int(v < 0 ? static_cast<int64_t>(0U - static_cast<uint64_t>(v)) : v);
      }
      return Value::make_float(std::fabs(number_arg("abs", args, 0)));
    });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "sqrt", k_module, s.fn({s.num()}, s.Float()),
      [](CallContext &, const std::vector<Value> & args) {
        const double x = number_arg("sqrt", args, 0);
        if (x < 0.0) domain_error(fmt::format("sqrt of negative number {}", x));
        return Value::make_float(std::sqrt(x));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "ln", k_module, s.fn({s.num()}, s.Float()),
      [](CallContext &, const std::vector<Value> & args) {
        const double x = number_arg("ln", args, 0);
        if (x <= 0.0) domain_error(fmt::format("ln of non-positive number {}", x));
        return Value::make_float(std::log(x));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "log10", k_module, s.fn({s.num()}, s.Float()),
      [](CallContext &, const std::vector<Value> & args) {
        const double x = number_arg("log10", args, 0);
        if (x <= 0.0) domain_error(fmt::format("log10 of non-positive number {}", x));
        return Value::make_float(std::log10(x));
      });
  }

  define_float_fn(registry, "exp", [](double x) { return std::exp(x); });
  define_float_fn(registry, "sin", [](double x) { return std::sin(x); });
  define_float_fn(registry, "cos", [](double x) { return std::cos(x); });
  define_float_fn(registry, "tan", [](double x) { return std::tan(x); });
  define_float_fn(registry, "floor", [](double x) { return std::floor(x); });
  define_float_fn(registry, "ceil", [](double x) { return std::ceil(x); });
  define_float_fn(registry, "round", [](double x) { return std::round(x); });

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(
      registry, "pow", k_module, s.fn({a, a}, a),
      [](CallContext &, const std::vector<Value> & args) {
        return apply_binary(BinaryOp::Pow, args[0], args[1]);
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(registry, "min", k_module, s.fn({a, a}, a), [](CallContext &, const std::vector<Value> & args) {
      return less_than(args[1], args[0]) ? args[1] : args[0];
    });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(registry, "max", k_module, s.fn({a, a}, a), [](CallContext &, const std::vector<Value> & args) {
      return less_than(args[0], args[1]) ? args[1] : args[0];
    });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(
      registry, "clamp", k_module, s.fn({a, a, a}, a),
      [](CallContext &, const std::vector<Value> & args) {
        if (less_than(args[2], args[1])) {
          domain_error("clamp: upper bound is below lower bound");
        }
        if (less_than(args[0], args[1])) return args[1];
        if (less_than(args[2], args[0])) return args[2];
        return args[0];
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(
      registry, "to_float", k_module, s.fn({a}, s.Float()),
      [](CallContext &, const std::vector<Value> & args) {
        return Value::make_float(number_arg("to_float", args, 0));
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(
      registry, "to_int", k_module, s.fn({a}, s.Int()),
      [](CallContext &, const std::vector<Value> & args) {
        if (args[0].is_int()) return args[0];
        const double x = number_arg("to_int", args, 0);
        constexpr double k_limit = 9.2e18;
        if (!std::isfinite(x) || std::fabs(x) > k_limit) {
          domain_error(fmt::format("to_int: {} is out of Int range", x));
        }
        return Value::make_int(static_cast<int64_t>(std::trunc(x)));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(registry, "pi", k_module, s.constant(s.Float()), [](CallContext &, const std::vector<Value> &) {
      return Value::make_float(k_pi);
    });
  }

  {
    SchemeBuilder s(registry.types());
    define(registry, "e", k_module, s.constant(s.Float()), [](CallContext &, const std::vector<Value> &) {
      return Value::make_float(k_e);
    });
  }
}

}  // namespace matrix_lang::stdlib
