// tests/unit/runtime/test_stdlib.cpp - Standard library modules
//

#include <gtest/gtest.h>

#include <string>

#include "matrix_lang/runtime/value.hpp"
#include "matrix_lang/test_support/session_helpers.hpp"

using namespace matrix_lang;
using matrix_lang::test_support::check_source;
using matrix_lang::test_support::run_source;

namespace
{

std::string eval_to_string(const std::string & src)
{
  auto r = run_source(src);
  if (!r->ok()) return "error: " + r->error();
  return format_value(r->value());
}

ErrorCode eval_error(const std::string & src)
{
  auto r = run_source(src);
  if (r->ok()) return ErrorCode::None;
  return r->outcome.diags.first_error()->code;
}

}  // namespace

// ============================================================================
// array
// ============================================================================

TEST(RuntimeStdlib, ArrayBasics)
{
  EXPECT_EQ(eval_to_string("len([1, 2, 3])"), "3");
  EXPECT_EQ(eval_to_string("range(2, 5)"), "[2, 3, 4]");
  EXPECT_EQ(eval_to_string("push([1, 2], 3)"), "[1, 2, 3]");
  EXPECT_EQ(eval_to_string("concat([1], [2, 3])"), "[1, 2, 3]");
  EXPECT_EQ(eval_to_string("reverse([\"a\", \"b\"])"), "[\"b\", \"a\"]");
  EXPECT_EQ(eval_to_string("contains([1, 2, 3], 2)"), "true");
  EXPECT_EQ(eval_to_string("tail([1, 2, 3])"), "[2, 3]");
  EXPECT_EQ(eval_to_string("tail([])"), "[]");
  EXPECT_EQ(eval_to_string("head([7, 8])"), "7");
}

TEST(RuntimeStdlib, HeadOfEmptyArray)
{
  EXPECT_EQ(eval_error("head([])"), ErrorCode::IndexOutOfBounds);
}

TEST(RuntimeStdlib, Reductions)
{
  EXPECT_EQ(eval_to_string("sum([1, 2, 3, 4])"), "10");
  EXPECT_EQ(eval_to_string("sum([1.5, 2.5])"), "4.0");
  EXPECT_EQ(eval_to_string("product([2, 3, 4])"), "24");
}

TEST(RuntimeStdlib, EmptyReductionFollowsElementType)
{
  EXPECT_EQ(eval_to_string("let xs: Array<Float> = []\nsum(xs)"), "0.0");
  EXPECT_EQ(eval_to_string("let ys: Array<Int> = []\nproduct(ys)"), "1");
  EXPECT_EQ(eval_to_string("let xs = filter([1.5], (x) => x > 2.0)\nsum(xs) + 1.5"), "1.5");
  EXPECT_EQ(eval_to_string("let xs = filter([1.5], (x) => x > 2.0)\nproduct(xs)"), "1.0");
}

TEST(RuntimeStdlib, EmptyReductionWithoutKnownElementType)
{
  EXPECT_EQ(eval_error("sum([])"), ErrorCode::DomainError);
  EXPECT_EQ(eval_error("product([])"), ErrorCode::DomainError);
  EXPECT_EQ(eval_error("let rows: Array<Array<Float>> = [[1.0], []]\nmap(rows, sum)"),
            ErrorCode::DomainError);
}

TEST(RuntimeStdlib, HigherOrder)
{
  EXPECT_EQ(eval_to_string("map([1, 2, 3], (x) => x * x)"), "[1, 4, 9]");
  EXPECT_EQ(eval_to_string("filter(range(0, 10), (x) => x % 2 == 0)"), "[0, 2, 4, 6, 8]");
  EXPECT_EQ(eval_to_string("fold([1, 2, 3, 4], 0, (acc, x) => acc + x)"), "10");
  EXPECT_EQ(eval_to_string("fold([\"a\", \"b\"], \"\", (acc, s) => acc + s)"), "ab");
  EXPECT_EQ(eval_to_string("zip_with([1, 2, 3], [10, 20], (a, b) => a + b)"), "[11, 22]");
}

TEST(RuntimeStdlib, CallbackErrorsPropagate)
{
  EXPECT_EQ(eval_error("map([1, 0], (x) => 10 / x)"), ErrorCode::DivisionByZero);
}

// ============================================================================
// vector
// ============================================================================

TEST(RuntimeStdlib, VectorOperations)
{
  EXPECT_EQ(eval_to_string("dot(vec3(1.0, 2.0, 3.0), vec3(4.0, 5.0, 6.0))"), "32.0");
  EXPECT_EQ(eval_to_string("cross(vec3(1.0, 0.0, 0.0), vec3(0.0, 1.0, 0.0))"), "[0.0, 0.0, 1.0]");
  EXPECT_EQ(eval_to_string("magnitude(vec3(3.0, 4.0, 0.0))"), "5.0");
  EXPECT_EQ(eval_to_string("normalize([0.0, 2.0])"), "[0.0, 1.0]");
}

TEST(RuntimeStdlib, VectorErrors)
{
  EXPECT_EQ(eval_error("normalize(vec3(0.0, 0.0, 0.0))"), ErrorCode::DomainError);
  EXPECT_EQ(eval_error("dot([1.0], [1.0, 2.0])"), ErrorCode::ArgumentMismatch);
  EXPECT_EQ(eval_error("cross([1.0, 2.0], [3.0, 4.0])"), ErrorCode::ArgumentMismatch);
}

// ============================================================================
// matrix
// ============================================================================

TEST(RuntimeStdlib, MatrixOperations)
{
  EXPECT_EQ(eval_to_string("transpose([[1, 2, 3], [4, 5, 6]])"), "[[1, 4], [2, 5], [3, 6]]");
  EXPECT_EQ(eval_to_string("rows([[1, 2, 3], [4, 5, 6]])"), "2");
  EXPECT_EQ(eval_to_string("cols([[1, 2, 3], [4, 5, 6]])"), "3");
  EXPECT_EQ(eval_to_string("identity(2)"), "[[1.0, 0.0], [0.0, 1.0]]");
  EXPECT_EQ(eval_to_string("zeros(1, 2)"), "[[0.0, 0.0]]");
  EXPECT_EQ(eval_to_string("mat_get([[1, 2], [3, 4]], 1, 0)"), "3");
  EXPECT_EQ(eval_to_string("identity(2) * [[2.0, 3.0], [4.0, 5.0]]"), "[[2.0, 3.0], [4.0, 5.0]]");
}

TEST(RuntimeStdlib, MatrixErrors)
{
  EXPECT_EQ(eval_error("zeros(0, 2)"), ErrorCode::DomainError);
  EXPECT_EQ(eval_error("identity(-1)"), ErrorCode::DomainError);
  EXPECT_EQ(eval_error("mat_get([[1, 2], [3, 4]], 2, 0)"), ErrorCode::IndexOutOfBounds);
}

TEST(RuntimeStdlib, MatrixBuiltinsRejectNestedArrays)
{
  auto r = run_source("rows([[\"a\"], [\"b\"]])");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::Mismatch)) << r->error();
}

// ============================================================================
// math
// ============================================================================

TEST(RuntimeStdlib, MathFunctions)
{
  EXPECT_EQ(eval_to_string("floor(2.7)"), "2.0");
  EXPECT_EQ(eval_to_string("pow(2, 10)"), "1024");
  EXPECT_EQ(eval_to_string("min(3, 1)"), "1");
  EXPECT_EQ(eval_to_string("max(2.5, 1.0)"), "2.5");
  EXPECT_EQ(eval_to_string("clamp(15, 0, 10)"), "10");
  EXPECT_EQ(eval_to_string("to_int(3.9)"), "3");
  EXPECT_EQ(eval_to_string("to_int(-3.9)"), "-3");
  EXPECT_EQ(eval_to_string("to_float(2)"), "2.0");
  EXPECT_EQ(eval_to_string("to_int(pi * 100.0)"), "314");
}

TEST(RuntimeStdlib, MathFunctionsAcceptInts)
{
  EXPECT_EQ(eval_to_string("sqrt(16)"), "4.0");
  EXPECT_EQ(eval_to_string("floor(3)"), "3.0");
  EXPECT_EQ(eval_to_string("sin(0)"), "0.0");
  EXPECT_EQ(eval_to_string("sqrt(2.25)"), "1.5");
  EXPECT_EQ(eval_error("sqrt(-4)"), ErrorCode::DomainError);

  auto r = check_source("let r: Float = sqrt(16)\nr");
  EXPECT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Float");
}

TEST(RuntimeStdlib, MathDomainErrors)
{
  EXPECT_EQ(eval_error("sqrt(-1.0)"), ErrorCode::DomainError);
  EXPECT_EQ(eval_error("ln(0.0)"), ErrorCode::DomainError);
  EXPECT_EQ(eval_error("clamp(1, 10, 0)"), ErrorCode::DomainError);
  EXPECT_EQ(eval_error("pow(2, -1)"), ErrorCode::DomainError);
}

// ============================================================================
// io
// ============================================================================

TEST(RuntimeStdlib, PrintAndConversion)
{
  auto r = run_source("print(1); print(\"x\"); println([1.0])");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->output(), "1x[1.0]\n");

  EXPECT_EQ(eval_to_string("to_string(3.0) + \"!\""), "3.0!");
  EXPECT_EQ(eval_to_string("type_of([1, 2])"), "Array");
  EXPECT_EQ(eval_to_string("type_of([[1, 2]])"), "Matrix");
}

// ============================================================================
// random
// ============================================================================

TEST(RuntimeStdlib, RandomSourcesAreDeterministicPerSeed)
{
  const std::string src =
    "let r = rng_new(42)\n"
    "[rng_int(r, 1, 100), rng_int(r, 1, 100), rng_int(r, 1, 100)]";
  const std::string first = eval_to_string(src);
  EXPECT_EQ(first.rfind("error", 0), std::string::npos) << first;
  EXPECT_EQ(eval_to_string(src), first);
}

TEST(RuntimeStdlib, RandomValuesStayInRange)
{
  auto r = run_source(
    "let r = rng_new(7)\n"
    "let xs = map(range(0, 50), (i) => rng_next(r))\n"
    "let ds = map(range(0, 50), (i) => rng_int(r, 1, 6))\n"
    "len(filter(xs, (x) => x < 0.0 || x >= 1.0)) + len(filter(ds, (d) => d < 1 || d > 6))");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 0);
}

TEST(RuntimeStdlib, RandomEmptyRange)
{
  EXPECT_EQ(eval_error("let r = rng_new(1)\nrng_int(r, 5, 1)"), ErrorCode::DomainError);
}
