// matrix_lang/runtime/arithmetic.cpp - Operator semantics on runtime values
#include "matrix_lang/runtime/arithmetic.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>
#include <utility>
#include <vector>

#include "matrix_lang/runtime/runtime_error.hpp"

namespace matrix_lang
{

namespace
{

[[noreturn]] void operand_mismatch(BinaryOp op, const Value & lhs, const Value & rhs)
{
  throw RuntimeError(
    ErrorCode::ArgumentMismatch,
    fmt::format(
      "operator '{}' cannot be applied to {} and {}", to_string(op), runtime_type_name(lhs),
      runtime_type_name(rhs)));
}

int64_t wrap(uint64_t v) { return static_cast<int64_t>(v); }

Value int_arith(BinaryOp op, int64_t a, int64_t b)
{
  const auto ua = static_cast<uint64_t>(a);
  const auto ub = static_cast<uint64_t>(b);
  switch (op) {
    case BinaryOp::Add:
      return Value::make_int(wrap(ua + ub));
    case BinaryOp::Sub:
      return Value::make_int(wrap(ua - ub));
    case BinaryOp::Mul:
      return Value::make_int(wrap(ua * ub));
    case BinaryOp::Div:
      if (b == 0) throw RuntimeError(ErrorCode::DivisionByZero, "division by zero");
      if (a == std::numeric_limits<int64_t>::min() && b == -1) return Value::make_int(a);
      return Value::make_int(a / b);
    case BinaryOp::Mod:
      if (b == 0) throw RuntimeError(ErrorCode::DivisionByZero, "modulo by zero");
      if (b == -1) return Value::make_int(0);
      return Value::make_int(a % b);
    case BinaryOp::Pow:
      return Value::make_int(int_pow(a, b));
    default:
      break;
  }
  return Value::unit();
}

Value float_arith(BinaryOp op, double a, double b)
{
  switch (op) {
    case BinaryOp::Add:
      return Value::make_float(a + b);
    case BinaryOp::Sub:
      return Value::make_float(a - b);
    case BinaryOp::Mul:
      return Value::make_float(a * b);
    case BinaryOp::Div:
      if (b == 0.0) throw RuntimeError(ErrorCode::DivisionByZero, "division by zero");
      return Value::make_float(a / b);
    case BinaryOp::Mod:
      if (b == 0.0) throw RuntimeError(ErrorCode::DivisionByZero, "modulo by zero");
      return Value::make_float(std::fmod(a, b));
    case BinaryOp::Pow:
      return Value::make_float(std::pow(a, b));
    default:
      break;
  }
  return Value::unit();
}

Value matrix_elementwise(BinaryOp op, const MatrixValue & a, const MatrixValue & b)
{
  if (a.rows != b.rows || a.cols != b.cols) {
    throw RuntimeError(
      ErrorCode::ArgumentMismatch,
      fmt::format(
        "operator '{}' needs matrices of equal shape, got {}x{} and {}x{}", to_string(op), a.rows,
        a.cols, b.rows, b.cols));
  }
  std::vector<Value> cells;
  cells.reserve(a.cells.size());
  for (size_t i = 0; i < a.cells.size(); ++i) {
    cells.push_back(apply_binary(op, a.cells[i], b.cells[i]));
  }
  return Value::make_matrix(a.rows, a.cols, std::move(cells));
}

Value matrix_product(const MatrixValue & a, const MatrixValue & b)
{
  if (a.cols != b.rows) {
    throw RuntimeError(
      ErrorCode::ArgumentMismatch,
      fmt::format(
        "matrix product needs {}x{} * {}xN, got {}x{}", a.rows, a.cols, a.cols, b.rows, b.cols));
  }
  std::vector<Value> cells;
  cells.reserve(a.rows * b.cols);
  for (size_t r = 0; r < a.rows; ++r) {
    for (size_t c = 0; c < b.cols; ++c) {
      Value acc = apply_binary(BinaryOp::Mul, a.at(r, 0), b.at(0, c));
      for (size_t k = 1; k < a.cols; ++k) {
        acc = apply_binary(BinaryOp::Add, acc, apply_binary(BinaryOp::Mul, a.at(r, k), b.at(k, c)));
      }
      cells.push_back(std::move(acc));
    }
  }
  return Value::make_matrix(a.rows, b.cols, std::move(cells));
}

template <typename T>
bool compare(BinaryOp op, const T & a, const T & b)
{
  switch (op) {
    case BinaryOp::Lt:
      return a < b;
    case BinaryOp::Le:
      return a <= b;
    case BinaryOp::Gt:
      return a > b;
    case BinaryOp::Ge:
      return a >= b;
    default:
      return false;
  }
}

}  // namespace

int64_t int_pow(int64_t base, int64_t exponent)
{
  if (exponent < 0) {
    throw RuntimeError(
      ErrorCode::DomainError, fmt::format("negative exponent {} for Int power", exponent));
  }
  uint64_t result = 1;
  auto b = static_cast<uint64_t>(base);
  while (exponent > 0) {
    if ((exponent & 1) != 0) result *= b;
    b *= b;
    exponent >>= 1;
  }
  return static_cast<int64_t>(result);
}

Value apply_binary(BinaryOp op, const Value & lhs, const Value & rhs)
{
  switch (op) {
    case BinaryOp::Eq:
      return Value::make_bool(values_equal(lhs, rhs));
    case BinaryOp::Ne:
      return Value::make_bool(!values_equal(lhs, rhs));

    case BinaryOp::And:
    case BinaryOp::Or:
      if (!lhs.is_bool() || !rhs.is_bool()) operand_mismatch(op, lhs, rhs);
      return Value::make_bool(
        op == BinaryOp::And ? lhs.as_bool() && rhs.as_bool() : lhs.as_bool() || rhs.as_bool());

    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
      if (lhs.is_int() && rhs.is_int()) return Value::make_bool(compare(op, lhs.as_int(), rhs.as_int()));
      if (lhs.is_float() && rhs.is_float()) {
        return Value::make_bool(compare(op, lhs.as_float(), rhs.as_float()));
      }
      if (lhs.is_string() && rhs.is_string()) {
        return Value::make_bool(compare(op, lhs.as_string(), rhs.as_string()));
      }
      operand_mismatch(op, lhs, rhs);

    case BinaryOp::Range: {
      if (!lhs.is_int() || !rhs.is_int()) operand_mismatch(op, lhs, rhs);
      std::vector<Value> out;
      for (int64_t i = lhs.as_int(); i < rhs.as_int(); ++i) out.push_back(Value::make_int(i));
      return Value::make_array(std::move(out));
    }

    case BinaryOp::Add:
      if (lhs.is_string() && rhs.is_string()) {
        return Value::make_string(lhs.as_string() + rhs.as_string());
      }
      [[fallthrough]];
    case BinaryOp::Sub:
    case BinaryOp::Mul:
      if (lhs.is_matrix() && rhs.is_matrix()) {
        return op == BinaryOp::Mul ? matrix_product(lhs.as_matrix(), rhs.as_matrix())
                                   : matrix_elementwise(op, lhs.as_matrix(), rhs.as_matrix());
      }
      [[fallthrough]];
    case BinaryOp::Div:
    case BinaryOp::Mod:
    case BinaryOp::Pow:
      if (lhs.is_int() && rhs.is_int()) return int_arith(op, lhs.as_int(), rhs.as_int());
      if (lhs.is_float() && rhs.is_float()) return float_arith(op, lhs.as_float(), rhs.as_float());
      operand_mismatch(op, lhs, rhs);
  }
  operand_mismatch(op, lhs, rhs);
}

Value apply_unary(UnaryOp op, const Value & operand)
{
  switch (op) {
    case UnaryOp::Neg:
      if (operand.is_int()) return Value::make_int(wrap(0U - static_cast<uint64_t>(operand.as_int())));
      if (operand.is_float()) return Value::make_float(-operand.as_float());
      break;
    case UnaryOp::Not:
      if (operand.is_bool()) return Value::make_bool(!operand.as_bool());
      break;
  }
  throw RuntimeError(
    ErrorCode::ArgumentMismatch,
    fmt::format(
      "operator '{}' cannot be applied to {}", to_string(op), runtime_type_name(operand)));
}

}  // namespace matrix_lang
