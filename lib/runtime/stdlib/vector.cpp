// matrix_lang/runtime/stdlib/vector.cpp - `vector` module (Array<Float> as vectors)
#include <cmath>

#include "stdlib_support.hpp"

namespace matrix_lang::stdlib
{

namespace
{

constexpr std::string_view k_module = "vector";

double dot_product(const std::vector<double> & a, const std::vector<double> & b)
{
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) sum += a[i] * b[i];
  return sum;
}

}  // namespace

void install_vector(BuiltinRegistry & registry)
{
  {
    SchemeBuilder s(registry.types());
    define(
      registry, "vec3", k_module, s.fn({s.Float(), s.Float(), s.Float()}, s.array(s.Float())),
      [](CallContext &, const std::vector<Value> & args) {
        return float_array(
          {number_arg("vec3", args, 0), number_arg("vec3", args, 1), number_arg("vec3", args, 2)});
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "dot", k_module, s.fn({s.array(s.Float()), s.array(s.Float())}, s.Float()),
      [](CallContext &, const std::vector<Value> & args) {
        const auto a = float_vector_arg("dot", args, 0);
        const auto b = float_vector_arg("dot", args, 1);
        if (a.size() != b.size()) {
          throw RuntimeError(
            ErrorCode::ArgumentMismatch,
            fmt::format("'dot' expects vectors of equal length, got {} and {}", a.size(), b.size()));
        }
        return Value::make_float(dot_product(a, b));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "cross", k_module,
      s.fn({s.array(s.Float()), s.array(s.Float())}, s.array(s.Float())),
      [](CallContext &, const std::vector<Value> & args) {
        const auto a = float_vector_arg("cross", args, 0);
        const auto b = float_vector_arg("cross", args, 1);
        if (a.size() != 3 || b.size() != 3) {
          throw RuntimeError(
            ErrorCode::ArgumentMismatch,
            fmt::format("'cross' expects two 3-vectors, got {} and {}", a.size(), b.size()));
        }
        return float_array(
          {a[1] * b[2] - a[2] * b[1], a[2] * b[0] - a[0] * b[2], a[0] * b[1] - a[1] * b[0]});
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "magnitude", k_module, s.fn({s.array(s.Float())}, s.Float()),
      [](CallContext &, const std::vector<Value> & args) {
        const auto a = float_vector_arg("magnitude", args, 0);
        return Value::make_float(std::sqrt(dot_product(a, a)));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "normalize", k_module, s.fn({s.array(s.Float())}, s.array(s.Float())),
      [](CallContext &, const std::vector<Value> & args) {
        auto a = float_vector_arg("normalize", args, 0);
        const double len = std::sqrt(dot_product(a, a));
        if (len == 0.0) domain_error("cannot normalize a zero-length vector");
        for (double & x : a) x /= len;
        return float_array(a);
      });
  }
}

}  // namespace matrix_lang::stdlib
