// matrix_lang/runtime/stdlib/matrix.cpp - `matrix` module
#include "stdlib_support.hpp"

namespace matrix_lang::stdlib
{

namespace
{

constexpr std::string_view k_module = "matrix";

size_t dimension_arg(std::string_view fn, const std::vector<Value> & args, size_t i)
{
  const int64_t n = int_arg(fn, args, i);
  if (n <= 0) domain_error(fmt::format("'{}': dimension must be positive, got {}", fn, n));
  return static_cast<size_t>(n);
}

size_t index_arg(
  std::string_view fn, const std::vector<Value> & args, size_t i, size_t length)
{
  const int64_t n = int_arg(fn, args, i);
  if (n < 0 || static_cast<size_t>(n) >= length) {
    throw RuntimeError(
      ErrorCode::IndexOutOfBounds,
      fmt::format("index {} out of bounds for length {}", n, length));
  }
  return static_cast<size_t>(n);
}

}  // namespace

void install_matrix(BuiltinRegistry & registry)
{
  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(
      registry, "transpose", k_module, s.fn({s.matrix(a)}, s.matrix(a)),
      [](CallContext &, const std::vector<Value> & args) {
        const auto & m = matrix_arg("transpose", args, 0);
        std::vector<Value> cells;
        cells.reserve(m.cells.size());
        for (size_t c = 0; c < m.cols; ++c) {
          for (size_t r = 0; r < m.rows; ++r) cells.push_back(m.at(r, c));
        }
        return Value::make_matrix(m.cols, m.rows, std::move(cells));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "rows", k_module, s.fn({s.matrix(s.num())}, s.Int()),
      [](CallContext &, const std::vector<Value> & args) {
        return Value::make_int(static_cast<int64_t>(matrix_arg("rows", args, 0).rows));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "cols", k_module, s.fn({s.matrix(s.num())}, s.Int()),
      [](CallContext &, const std::vector<Value> & args) {
        return Value::make_int(static_cast<int64_t>(matrix_arg("cols", args, 0).cols));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "identity", k_module, s.fn({s.Int()}, s.matrix(s.Float())),
      [](CallContext &, const std::vector<Value> & args) {
        const size_t n = dimension_arg("identity", args, 0);
        std::vector<Value> cells;
        cells.reserve(n * n);
        for (size_t r = 0; r < n; ++r) {
          for (size_t c = 0; c < n; ++c) cells.push_back(Value::make_float(r == c ? 1.0 : 0.0));
        }
        return Value::make_matrix(n, n, std::move(cells));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "zeros", k_module, s.fn({s.Int(), s.Int()}, s.matrix(s.Float())),
      [](CallContext &, const std::vector<Value> & args) {
        const size_t rows = dimension_arg("zeros", args, 0);
        const size_t cols = dimension_arg("zeros", args, 1);
        return Value::make_matrix(rows, cols, std::vector<Value>(rows * cols, Value::make_float(0.0)));
      });
  }

  {
    SchemeBuilder s(registry.types());
    const Type * a = s.num();
    define(
      registry, "mat_get", k_module, s.fn({s.matrix(a), s.Int(), s.Int()}, a),
      [](CallContext &, const std::vector<Value> & args) {
        const auto & m = matrix_arg("mat_get", args, 0);
        const size_t r = index_arg("mat_get", args, 1, m.rows);
        const size_t c = index_arg("mat_get", args, 2, m.cols);
        return m.at(r, c);
      });
  }
}

}  // namespace matrix_lang::stdlib
