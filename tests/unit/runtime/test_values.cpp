// tests/unit/runtime/test_values.cpp - Values, operators and frames
//

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>

#include "matrix_lang/runtime/arithmetic.hpp"
#include "matrix_lang/runtime/environment.hpp"
#include "matrix_lang/runtime/handle_table.hpp"
#include "matrix_lang/runtime/runtime_error.hpp"
#include "matrix_lang/runtime/value.hpp"

using namespace matrix_lang;

namespace
{

ErrorCode binary_error(BinaryOp op, const Value & lhs, const Value & rhs)
{
  try {
    (void)apply_binary(op, lhs, rhs);
  } catch (const RuntimeError & e) {
    return e.code();
  }
  return ErrorCode::None;
}

Value int_matrix(size_t rows, size_t cols, std::initializer_list<int64_t> cells)
{
  std::vector<Value> values;
  for (auto c : cells) values.push_back(Value::make_int(c));
  return Value::make_matrix(rows, cols, std::move(values));
}

}  // namespace

// ============================================================================
// Formatting and equality
// ============================================================================

TEST(RuntimeValues, Formatting)
{
  EXPECT_EQ(format_value(Value::unit()), "()");
  EXPECT_EQ(format_value(Value::make_float(4.0)), "4.0");
  EXPECT_EQ(format_value(Value::make_float(0.25)), "0.25");
  EXPECT_EQ(format_value(Value::make_string("hi")), "hi");
  EXPECT_EQ(
    format_value(Value::make_array({Value::make_string("a"), Value::make_bool(true)})),
    "[\"a\", true]");
  EXPECT_EQ(
    format_value(Value::make_struct("P", {{"x", Value::make_int(1)}, {"y", Value::make_int(2)}})),
    "P { x: 1, y: 2 }");
  EXPECT_EQ(format_value(Value::make_handle(3)), "<handle 3>");
}

TEST(RuntimeValues, RuntimeTypeNames)
{
  EXPECT_EQ(runtime_type_name(Value::make_int(1)), "Int");
  EXPECT_EQ(runtime_type_name(Value::make_array({})), "Array");
  EXPECT_EQ(runtime_type_name(int_matrix(1, 1, {1})), "Matrix");
  EXPECT_EQ(runtime_type_name(Value::make_struct("Point", {})), "Point");
  EXPECT_EQ(runtime_type_name(Value::make_builtin("sqrt")), "Function");
  EXPECT_EQ(runtime_type_name(Value::make_handle(1)), "Handle");
}

TEST(RuntimeValues, EqualityIsStructuralWithFloatEpsilon)
{
  EXPECT_TRUE(values_equal(Value::make_float(0.1 + 0.2), Value::make_float(0.3)));
  EXPECT_TRUE(values_equal(Value::make_int(2), Value::make_float(2.0)));
  EXPECT_FALSE(values_equal(Value::make_string("1"), Value::make_int(1)));
  EXPECT_TRUE(values_equal(
    Value::make_array({Value::make_int(1), Value::make_array({Value::make_int(2)})}),
    Value::make_array({Value::make_int(1), Value::make_array({Value::make_int(2)})})));
  EXPECT_FALSE(values_equal(int_matrix(1, 2, {1, 2}), int_matrix(2, 1, {1, 2})));
}

// ============================================================================
// Arithmetic
// ============================================================================

TEST(RuntimeArithmetic, IntegerOperations)
{
  EXPECT_EQ(apply_binary(BinaryOp::Add, Value::make_int(5), Value::make_int(3)).as_int(), 8);
  EXPECT_EQ(apply_binary(BinaryOp::Div, Value::make_int(-7), Value::make_int(2)).as_int(), -3);
  EXPECT_EQ(apply_binary(BinaryOp::Mod, Value::make_int(-7), Value::make_int(2)).as_int(), -1);
  EXPECT_EQ(apply_binary(BinaryOp::Pow, Value::make_int(3), Value::make_int(4)).as_int(), 81);
}

TEST(RuntimeArithmetic, IntegerOverflowWraps)
{
  const int64_t max = std::numeric_limits<int64_t>::max();
  const int64_t min = std::numeric_limits<int64_t>::min();
  EXPECT_EQ(apply_binary(BinaryOp::Add, Value::make_int(max), Value::make_int(1)).as_int(), min);
  EXPECT_EQ(apply_binary(BinaryOp::Div, Value::make_int(min), Value::make_int(-1)).as_int(), min);
  EXPECT_EQ(apply_binary(BinaryOp::Mod, Value::make_int(min), Value::make_int(-1)).as_int(), 0);
}

TEST(RuntimeArithmetic, DivisionByZero)
{
  EXPECT_EQ(binary_error(BinaryOp::Div, Value::make_int(1), Value::make_int(0)), ErrorCode::DivisionByZero);
  EXPECT_EQ(binary_error(BinaryOp::Mod, Value::make_int(1), Value::make_int(0)), ErrorCode::DivisionByZero);
  EXPECT_EQ(
    binary_error(BinaryOp::Div, Value::make_float(1.0), Value::make_float(0.0)),
    ErrorCode::DivisionByZero);
}

TEST(RuntimeArithmetic, NegativeIntegerExponent)
{
  EXPECT_EQ(binary_error(BinaryOp::Pow, Value::make_int(2), Value::make_int(-1)), ErrorCode::DomainError);
  EXPECT_THROW((void)int_pow(2, -3), RuntimeError);
  EXPECT_EQ(int_pow(2, 0), 1);
  EXPECT_EQ(int_pow(-2, 3), -8);
}

TEST(RuntimeArithmetic, MismatchedOperands)
{
  EXPECT_EQ(
    binary_error(BinaryOp::Add, Value::make_int(1), Value::make_string("a")),
    ErrorCode::ArgumentMismatch);
}

TEST(RuntimeArithmetic, MatrixProductAndShapes)
{
  const Value a = int_matrix(2, 3, {1, 2, 3, 4, 5, 6});
  const Value b = int_matrix(3, 1, {1, 0, 1});
  const Value p = apply_binary(BinaryOp::Mul, a, b);
  ASSERT_TRUE(p.is_matrix());
  EXPECT_EQ(p.as_matrix().rows, 2U);
  EXPECT_EQ(p.as_matrix().cols, 1U);
  EXPECT_EQ(format_value(p), "[[4], [10]]");

  EXPECT_EQ(binary_error(BinaryOp::Mul, b, b), ErrorCode::ArgumentMismatch);
  EXPECT_EQ(binary_error(BinaryOp::Sub, a, b), ErrorCode::ArgumentMismatch);
}

TEST(RuntimeArithmetic, UnaryOperators)
{
  EXPECT_EQ(apply_unary(UnaryOp::Neg, Value::make_int(4)).as_int(), -4);
  EXPECT_DOUBLE_EQ(apply_unary(UnaryOp::Neg, Value::make_float(1.5)).as_float(), -1.5);
  EXPECT_FALSE(apply_unary(UnaryOp::Not, Value::make_bool(true)).as_bool());
  EXPECT_THROW((void)apply_unary(UnaryOp::Not, Value::make_int(1)), RuntimeError);
}

// ============================================================================
// Environment and handles
// ============================================================================

TEST(RuntimeEnvironment, LookupWalksParents)
{
  auto global = std::make_shared<Environment>();
  global->define("x", Value::make_int(1));
  auto inner = std::make_shared<Environment>(global);
  inner->define("y", Value::make_int(2));

  ASSERT_NE(inner->lookup("x"), nullptr);
  EXPECT_EQ(inner->lookup("x")->as_int(), 1);
  EXPECT_EQ(global->lookup("y"), nullptr);
  EXPECT_TRUE(inner->defines("y"));
  EXPECT_FALSE(inner->defines("x"));
}

TEST(RuntimeEnvironment, AssignUpdatesNearestDefiningFrame)
{
  auto global = std::make_shared<Environment>();
  global->define("n", Value::make_int(1));
  auto inner = std::make_shared<Environment>(global);

  EXPECT_TRUE(inner->assign("n", Value::make_int(5)));
  EXPECT_EQ(global->lookup("n")->as_int(), 5);
  EXPECT_FALSE(inner->defines("n"));
  EXPECT_FALSE(inner->assign("missing", Value::unit()));
}

TEST(RuntimeEnvironment, ShadowingDoesNotTouchParent)
{
  auto global = std::make_shared<Environment>();
  global->define("v", Value::make_int(1));
  auto inner = std::make_shared<Environment>(global);
  inner->define("v", Value::make_string("shadow"));

  EXPECT_TRUE(inner->lookup("v")->is_string());
  EXPECT_TRUE(global->lookup("v")->is_int());
}

TEST(RuntimeHandles, TypedLookup)
{
  struct Counter : HandleObject
  {
    int hits = 0;
  };

  HandleTable table;
  const uint64_t counter = table.add(std::make_unique<Counter>());
  const uint64_t rng = table.add(std::make_unique<RandomSource>(1));
  EXPECT_EQ(counter, 1U);
  EXPECT_EQ(rng, 2U);

  ASSERT_NE(table.get<Counter>(counter), nullptr);
  EXPECT_EQ(table.get<Counter>(counter)->hits, 0);
  EXPECT_EQ(table.get<Counter>(rng), nullptr);
  EXPECT_EQ(table.get<RandomSource>(99), nullptr);
}

TEST(RuntimeHandles, TaskHandlesCarryTheirResult)
{
  HandleTable table;
  Value task = Value::make_task(table.next_id(), Value::make_int(7));

  EXPECT_EQ(task.handle_id(), 1U);
  EXPECT_EQ(table.size(), 0U);
  ASSERT_NE(task.task_result(), nullptr);
  EXPECT_EQ(task.task_result()->as_int(), 7);
  EXPECT_EQ(runtime_type_name(task), "Handle");
  EXPECT_EQ(Value::make_handle(3).task_result(), nullptr);
  EXPECT_EQ(Value::make_int(3).task_result(), nullptr);
}
