// matrix_lang/runtime/stdlib/array.cpp - `array` module
#include <algorithm>

#include "matrix_lang/runtime/arithmetic.hpp"
#include "stdlib_support.hpp"

namespace matrix_lang::stdlib
{

namespace
{

constexpr std::string_view k_module = "array";

/// Fold a numeric array with `op`. An empty array folds to `unit` at the
/// call site's checked result type.
Value reduce_numbers(
  CallContext & ctx, std::string_view fn, const std::vector<Value> & xs, BinaryOp op,
  int64_t unit)
{
  if (xs.empty()) {
    const Type * result = ctx.call_result_type();
    if (result && result->kind == TypeKind::Int) return Value::make_int(unit);
    if (result && result->kind == TypeKind::Float) {
      return Value::make_float(static_cast<double>(unit));
    }
    domain_error(fmt::format("'{}' of an empty array whose element type is not known", fn));
  }
  Value acc = xs.front();
  for (size_t i = 1; i < xs.size(); ++i) {
    acc = apply_binary(op, acc, xs[i]);
  }
  return acc;
}

}  // namespace

void install_array(BuiltinRegistry & registry)
{
  {
    SchemeBuilder s(registry.types());
    define(
      registry, "len", k_module, s.fn({s.array(s.var())}, s.Int()),
      [](CallContext &, const std::vector<Value> & args) {
        return Value::make_int(static_cast<int64_t>(array_arg("len", args, 0).size()));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "range", k_module, s.fn({s.Int(), s.Int()}, s.array(s.Int())),
      [](CallContext &, const std::vector<Value> & args) {
        int_arg("range", args, 0);
        int_arg("range", args, 1);
        return apply_binary(BinaryOp::Range, args[0], args[1]);
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.var();
    define(
      registry, "push", k_module, s.fn({s.array(a), a}, s.array(a)),
      [](CallContext &, const std::vector<Value> & args) {
        std::vector<Value> out = array_arg("push", args, 0);
        out.push_back(args[1]);
        return Value::make_array(std::move(out));
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.var();
    define(
      registry, "concat", k_module, s.fn({s.array(a), s.array(a)}, s.array(a)),
      [](CallContext &, const std::vector<Value> & args) {
        std::vector<Value> out = array_arg("concat", args, 0);
        const auto & rest = array_arg("concat", args, 1);
        out.insert(out.end(), rest.begin(), rest.end());
        return Value::make_array(std::move(out));
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.var();
    define(
      registry, "reverse", k_module, s.fn({s.array(a)}, s.array(a)),
      [](CallContext &, const std::vector<Value> & args) {
        const auto & xs = array_arg("reverse", args, 0);
        return Value::make_array(std::vector<Value>(xs.rbegin(), xs.rend()));
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(
      registry, "sum", k_module, s.fn({s.array(a)}, a),
      [](CallContext & ctx, const std::vector<Value> & args) {
        return reduce_numbers(ctx, "sum", array_arg("sum", args, 0), BinaryOp::Add, 0);
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(
      registry, "product", k_module, s.fn({s.array(a)}, a),
      [](CallContext & ctx, const std::vector<Value> & args) {
        return reduce_numbers(ctx, "product", array_arg("product", args, 0), BinaryOp::Mul, 1);
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.var();
    const Type * b = s.var();
    define(
      registry, "map", k_module, s.fn({s.array(a), s.func({a}, b)}, s.array(b)),
      [](CallContext & ctx, const std::vector<Value> & args) {
        std::vector<Value> out;
        for (const auto & x : array_arg("map", args, 0)) {
          out.push_back(ctx.call(args[1], {x}));
        }
        return Value::make_array(std::move(out));
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.var();
    define(
      registry, "filter", k_module, s.fn({s.array(a), s.func({a}, s.Bool())}, s.array(a)),
      [](CallContext & ctx, const std::vector<Value> & args) {
        std::vector<Value> out;
        for (const auto & x : array_arg("filter", args, 0)) {
          Value keep = ctx.call(args[1], {x});
          if (!keep.is_bool()) argument_mismatch("filter", 1, "a predicate returning Bool", keep);
          if (keep.as_bool()) out.push_back(x);
        }
        return Value::make_array(std::move(out));
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.var();
    const Type * b = s.var();
    define(
      registry, "fold", k_module, s.fn({s.array(a), b, s.func({b, a}, b)}, b),
      [](CallContext & ctx, const std::vector<Value> & args) {
        Value acc = args[1];
        for (const auto & x : array_arg("fold", args, 0)) {
          acc = ctx.call(args[2], {acc, x});
        }
        return acc;
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.var();
    const Type * b = s.var();
    const Type * c = s.var();
    define(
      registry, "zip_with", k_module,
      s.fn({s.array(a), s.array(b), s.func({a, b}, c)}, s.array(c)),
      [](CallContext & ctx, const std::vector<Value> & args) {
        const auto & xs = array_arg("zip_with", args, 0);
        const auto & ys = array_arg("zip_with", args, 1);
        std::vector<Value> out;
        const size_t n = std::min(xs.size(), ys.size());
        for (size_t i = 0; i < n; ++i) {
          out.push_back(ctx.call(args[2], {xs[i], ys[i]}));
        }
        return Value::make_array(std::move(out));
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.var();
    define(
      registry, "head", k_module, s.fn({s.array(a)}, a),
      [](CallContext &, const std::vector<Value> & args) {
        const auto & xs = array_arg("head", args, 0);
        if (xs.empty()) {
          throw RuntimeError(ErrorCode::IndexOutOfBounds, "head of empty array");
        }
        return xs.front();
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.var();
    define(
      registry, "tail", k_module, s.fn({s.array(a)}, s.array(a)),
      [](CallContext &, const std::vector<Value> & args) {
        const auto & xs = array_arg("tail", args, 0);
        if (xs.empty()) return Value::make_array({});
        return Value::make_array(std::vector<Value>(xs.begin() + 1, xs.end()));
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.var();
    define(
      registry, "contains", k_module, s.fn({s.array(a), a}, s.Bool()),
      [](CallContext &, const std::vector<Value> & args) {
        const auto & xs = array_arg("contains", args, 0);
        const bool found = std::any_of(
          xs.begin(), xs.end(), [&](const Value & x) { return values_equal(x, args[1]); });
        return Value::make_bool(found);
      });
  }
}

}  // namespace matrix_lang::stdlib
