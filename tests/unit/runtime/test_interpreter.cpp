// tests/unit/runtime/test_interpreter.cpp - End-to-end evaluation tests
//

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "matrix_lang/runtime/environment.hpp"
#include "matrix_lang/runtime/value.hpp"
#include "matrix_lang/test_support/session_helpers.hpp"

using namespace matrix_lang;
using matrix_lang::test_support::run_source;
using matrix_lang::test_support::ScriptRun;

namespace
{

SessionOptions without_jit()
{
  SessionOptions options;
  options.interpreter.jitEnabled = false;
  return options;
}

}  // namespace

// ============================================================================
// Scenarios
// ============================================================================

TEST(RuntimeInterpreter, LetBindingValue)
{
  auto r = run_source("let x = 5 + 3");
  ASSERT_TRUE(r->ok()) << r->error();
  ASSERT_TRUE(r->value().is_int());
  EXPECT_EQ(r->value().as_int(), 8);
}

TEST(RuntimeInterpreter, UserFunctionsCombine)
{
  auto r = run_source(
    "let add = (a: Int, b: Int) => a + b\n"
    "let multiply = (a: Int, b: Int) => a * b\n"
    "let power_func = (base: Int, exp: Int) => base ^ exp\n"
    "let first = add(5, 10)\n"
    "first + multiply(3, 4) + power_func(2, 3)");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 35);

  auto single = run_source("let add = (a: Int, b: Int) => a + b; add(5, 10)");
  ASSERT_TRUE(single->ok()) << single->error();
  EXPECT_EQ(single->value().as_int(), 15);
}

TEST(RuntimeInterpreter, MathBuiltins)
{
  auto root = run_source("sqrt(16.0)");
  ASSERT_TRUE(root->ok()) << root->error();
  ASSERT_TRUE(root->value().is_float());
  EXPECT_DOUBLE_EQ(root->value().as_float(), 4.0);
  EXPECT_EQ(format_value(root->value()), "4.0");

  auto absolute = run_source("abs(-15)");
  ASSERT_TRUE(absolute->ok()) << absolute->error();
  ASSERT_TRUE(absolute->value().is_int());
  EXPECT_EQ(absolute->value().as_int(), 15);
}

TEST(RuntimeInterpreter, RecursiveFactorial)
{
  const std::string src =
    "let factorial = (n) => if n <= 1 then 1 else n * factorial(n - 1)\n"
    "factorial(5)";

  auto jit = run_source(src);
  ASSERT_TRUE(jit->ok()) << jit->error();
  EXPECT_EQ(jit->value().as_int(), 120);

  auto tree = run_source(src, without_jit());
  ASSERT_TRUE(tree->ok()) << tree->error();
  EXPECT_EQ(tree->value().as_int(), 120);
}

TEST(RuntimeInterpreter, PolymorphicPrintln)
{
  auto r = run_source(
    "let id = (x) => x\n"
    "println(id(5))\n"
    "println(id(\"a\"))\n"
    "print(2.5)\n"
    "println([1, 2])");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->output(), "5\na\n2.5[1, 2]\n");
  EXPECT_TRUE(r->value().is_unit());
}

// ============================================================================
// Bindings and scopes
// ============================================================================

TEST(RuntimeInterpreter, BlocksYieldTrailingExpression)
{
  auto r = run_source("let y = { let a = 2; let b = 3; a * b }\ny");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 6);

  auto unit = run_source("{ let a = 1 }");
  ASSERT_TRUE(unit->ok()) << unit->error();
  EXPECT_TRUE(unit->value().is_unit());
}

TEST(RuntimeInterpreter, BlockBindingsDoNotLeak)
{
  auto r = run_source("let a = 1\nlet b = { let a = 10; a + 1 }\na + b");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 12);
}

TEST(RuntimeInterpreter, LetInExpression)
{
  auto r = run_source("let x = 2 in let y = x * 10 in x + y");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 22);
}

TEST(RuntimeInterpreter, MutableCounterInLoopFunction)
{
  auto r = run_source(
    "let mut total = 0\n"
    "let add_all = (xs) => fold(xs, 0, (acc, x) => acc + x)\n"
    "total = total + add_all([1, 2, 3])\n"
    "total = total * 2\n"
    "total");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 12);
}

TEST(RuntimeInterpreter, ClosuresCaptureTheirFrame)
{
  auto r = run_source(
    "let make_adder = (n) => (x) => x + n\n"
    "let add3 = make_adder(3)\n"
    "let add10 = make_adder(10)\n"
    "add3(1) + add10(1)");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 15);
}

TEST(RuntimeInterpreter, ShadowingKeepsCapturedBinding)
{
  auto r = run_source(
    "let x = 1\n"
    "let f = () => x + 1\n"
    "let x = \"s\"\n"
    "f()");
  ASSERT_TRUE(r->ok()) << r->error();
  ASSERT_TRUE(r->value().is_int());
  EXPECT_EQ(r->value().as_int(), 2);

  auto same_type = run_source("let x = 1\nlet f = () => x\nlet x = 2\nf() * 10 + x");
  ASSERT_TRUE(same_type->ok()) << same_type->error();
  EXPECT_EQ(same_type->value().as_int(), 12);
}

TEST(RuntimeInterpreter, ShadowingInsideBlockKeepsCapturedBinding)
{
  auto r = run_source(
    "let calc = () => {\n"
    "  let n = 2\n"
    "  let scale = (v) => v * n\n"
    "  let n = 100\n"
    "  scale(3) + n\n"
    "}\n"
    "calc()");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 106);
}

TEST(RuntimeInterpreter, ShadowingAcrossReplEntries)
{
  ScriptRun repl;
  ASSERT_TRUE(repl.run("let x = 1").ok);
  ASSERT_TRUE(repl.run("let f = () => x + 1").ok);
  ASSERT_TRUE(repl.run("let x = \"s\"").ok);
  const auto & out = repl.run("f()");
  ASSERT_TRUE(out.ok) << out.first_error();
  EXPECT_EQ(out.value->as_int(), 2);
  EXPECT_EQ(out.type, "Int");
}

TEST(RuntimeInterpreter, RecursiveClosureSurvivesShadowing)
{
  auto r = run_source(
    "let fact = (n) => if n <= 1 then 1 else n * fact(n - 1)\n"
    "let f = fact\n"
    "let fact = (n) => 0\n"
    "f(5) + fact(5)");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 120);
}

TEST(RuntimeInterpreter, ComprehensionClosuresKeepTheirElement)
{
  auto r = run_source(
    "let fs = [() => i * 10 | i in 0..3]\n"
    "[fs[0](), fs[1](), fs[2]()]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(format_value(r->value()), "[0, 10, 20]");
}

TEST(RuntimeInterpreter, ReturnedClosureReleasesItsFrames)
{
  auto r = run_source(
    "let mk = (n) => {\n"
    "  let g = (k) => k + n\n"
    "  g\n"
    "}\n"
    "mk(1)",
    without_jit());
  ASSERT_TRUE(r->ok()) << r->error();
  ASSERT_EQ(r->value().kind(), ValueKind::Closure);

  const auto & env = r->value().as_closure()->env;
  ASSERT_NE(env, nullptr);
  ASSERT_NE(env->parent(), nullptr);
  std::weak_ptr<Environment> block = env;
  std::weak_ptr<Environment> call = env->parent();

  r->outcome.value.reset();
  EXPECT_TRUE(block.expired());
  EXPECT_TRUE(call.expired());
}

TEST(RuntimeInterpreter, MutualHelpersInsideBlock)
{
  auto r = run_source(
    "let count_down = (n) => {\n"
    "  let step = (k) => if k <= 0 then 0 else 1 + step(k - 1)\n"
    "  step(n)\n"
    "}\n"
    "count_down(25)");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 25);
}

// ============================================================================
// Operators
// ============================================================================

TEST(RuntimeInterpreter, ShortCircuitSkipsRightOperand)
{
  auto r = run_source("false && (1 / 0 == 0) || true");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_TRUE(r->value().as_bool());
}

TEST(RuntimeInterpreter, IntegerDivisionTruncates)
{
  auto r = run_source("[7 / 2, -7 / 2, 7 % 3, 2 ^ 10]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(format_value(r->value()), "[3, -3, 1, 1024]");
}

TEST(RuntimeInterpreter, StringConcatenationAndComparison)
{
  auto r = run_source("let s = \"mat\" + \"rix\"\nif s == \"matrix\" && \"a\" < \"b\" then s else \"\"");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_string(), "matrix");
}

TEST(RuntimeInterpreter, RangeIsEndExclusive)
{
  auto r = run_source("1..4");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(format_value(r->value()), "[1, 2, 3]");
}

// ============================================================================
// Runtime errors
// ============================================================================

TEST(RuntimeInterpreter, DivisionByZero)
{
  auto r = run_source("let d = (a, b) => a / b\nd(1, 0)");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::DivisionByZero));
  EXPECT_EQ(r->error().rfind("RuntimeError: ", 0), 0U);

  auto modulo = run_source("5.0 % 0.0");
  EXPECT_TRUE(modulo->has_error(ErrorCode::DivisionByZero));
}

TEST(RuntimeInterpreter, IndexOutOfBounds)
{
  auto r = run_source("let xs = [1, 2, 3]\nxs[3]");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::IndexOutOfBounds));
  EXPECT_EQ(r->error(), "RuntimeError: index 3 out of bounds for length 3 at line 2, column 1");

  auto negative = run_source("[1, 2][-1]");
  EXPECT_TRUE(negative->has_error(ErrorCode::IndexOutOfBounds));
}

TEST(RuntimeInterpreter, StackOverflowIsReported)
{
  SessionOptions options;
  options.interpreter.maxCallDepth = 64;
  const std::string src = "let forever = (n) => forever(n + 1) + 1\nforever(0)";

  auto jit = run_source(src, options);
  EXPECT_FALSE(jit->ok());
  EXPECT_TRUE(jit->has_error(ErrorCode::StackOverflow));

  options.interpreter.jitEnabled = false;
  auto tree = run_source(src, options);
  EXPECT_FALSE(tree->ok());
  EXPECT_TRUE(tree->has_error(ErrorCode::StackOverflow));
  EXPECT_NE(tree->error().find("maximum call depth 64 exceeded"), std::string::npos);
}

TEST(RuntimeInterpreter, DeepRecursionWithinLimit)
{
  SessionOptions options;
  options.interpreter.maxCallDepth = 300;
  options.interpreter.jitEnabled = false;
  auto r = run_source("let down = (n) => if n == 0 then 0 else down(n - 1)\ndown(250)", options);
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 0);
}

TEST(RuntimeInterpreter, PatternMatchFailed)
{
  auto r = run_source("match 3 { 1 => \"one\", 2 => \"two\" }");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::PatternMatchFailed));
}

TEST(RuntimeInterpreter, DomainErrorFromBuiltin)
{
  auto r = run_source("sqrt(-1.0)");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::DomainError));
}

// ============================================================================
// REPL persistence
// ============================================================================

TEST(RuntimeInterpreter, ReplEntriesShareGlobals)
{
  ScriptRun repl;
  ASSERT_TRUE(repl.run("let x = 10").ok);
  ASSERT_TRUE(repl.run("let double = (n) => n * 2").ok);
  const auto & out = repl.run("double(x)");
  ASSERT_TRUE(out.ok) << out.first_error();
  EXPECT_EQ(out.value->as_int(), 20);
  EXPECT_EQ(out.type, "Int");
}

TEST(RuntimeInterpreter, RuntimeErrorKeepsEarlierBindings)
{
  ScriptRun repl;
  ASSERT_TRUE(repl.run("let a = 3").ok);
  EXPECT_FALSE(repl.run("let b = a / 0").ok);
  EXPECT_TRUE(repl.has_error(ErrorCode::DivisionByZero));

  const auto & after = repl.run("a + 1");
  ASSERT_TRUE(after.ok) << after.first_error();
  EXPECT_EQ(after.value->as_int(), 4);
}

TEST(RuntimeInterpreter, FailedEntryBindsNothing)
{
  ScriptRun repl;
  ASSERT_TRUE(repl.run("let a = 1").ok);
  EXPECT_FALSE(repl.run("let b = 2\nlet c = a / 0\nlet d = 3").ok);
  EXPECT_TRUE(repl.has_error(ErrorCode::DivisionByZero));

  EXPECT_FALSE(repl.run("b").ok);
  EXPECT_TRUE(repl.has_error(ErrorCode::UnknownIdentifier));
  EXPECT_FALSE(repl.run("d").ok);
  EXPECT_TRUE(repl.has_error(ErrorCode::UnknownIdentifier));

  const auto & a = repl.run("a");
  ASSERT_TRUE(a.ok) << a.first_error();
  EXPECT_EQ(a.value->as_int(), 1);
}

TEST(RuntimeInterpreter, FailedEntryKeepsCheckerAndValuesInStep)
{
  ScriptRun repl;
  ASSERT_TRUE(repl.run("let x = 5").ok);
  EXPECT_FALSE(repl.run("let y = 1 / 0\nlet x = \"s\"").ok);

  // x is still an Int for both the checker and the interpreter.
  EXPECT_FALSE(repl.run("x + \"a\"").ok);
  EXPECT_TRUE(repl.has_error(ErrorCode::Mismatch));

  const auto & sum = repl.run("x + 1");
  ASSERT_TRUE(sum.ok) << sum.first_error();
  EXPECT_EQ(sum.value->as_int(), 6);
  EXPECT_EQ(sum.type, "Int");
}

TEST(RuntimeInterpreter, FailedEntryDoesNotRedefineTypes)
{
  ScriptRun repl;
  EXPECT_FALSE(repl.run("struct Pair { a: Int, b: Int }\n1 / 0").ok);
  const auto & again = repl.run("struct Pair { a: Int, b: Int }\nlet p = Pair { a: 1, b: 2 }\np.b");
  ASSERT_TRUE(again.ok) << again.first_error();
  EXPECT_EQ(again.value->as_int(), 2);
}

TEST(RuntimeInterpreter, StaticErrorEvaluatesNothing)
{
  ScriptRun repl;
  EXPECT_FALSE(repl.run("println(\"never\")\nlet bad = 1 + \"x\"").ok);
  EXPECT_EQ(repl.output(), "");
}

// ============================================================================
// Structs, match, typeclasses
// ============================================================================

TEST(RuntimeInterpreter, StructLiteralsFollowDeclarationOrder)
{
  auto r = run_source(
    "struct Point { x: Float, y: Float }\n"
    "let p = Point { y: 2.0, x: 1.0 }\n"
    "p");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(format_value(r->value()), "Point { x: 1.0, y: 2.0 }");
}

TEST(RuntimeInterpreter, MatchDestructuresStructsAndArrays)
{
  auto r = run_source(
    "struct Point { x: Float, y: Float }\n"
    "let quadrant = (p) => match p {\n"
    "  Point { x: 0.0, y: 0.0 } => \"origin\",\n"
    "  Point { x, y } if x > 0.0 && y > 0.0 => \"first\",\n"
    "  _ => \"other\"\n"
    "}\n"
    "let head_or_zero = (xs) => match xs { [a, _] => a, [a] => a, _ => 0 }\n"
    "[quadrant(Point { x: 0.0, y: 0.0 }), quadrant(Point { x: 1.0, y: 2.0 }),\n"
    " quadrant(Point { x: -1.0, y: 2.0 }), to_string(head_or_zero([7, 8])),\n"
    " to_string(head_or_zero([]))]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(format_value(r->value()), R"(["origin", "first", "other", "7", "0"])");
}

TEST(RuntimeInterpreter, TypeclassDispatchOnRuntimeType)
{
  auto r = run_source(
    "struct Point { x: Float, y: Float }\n"
    "typeclass Describe a { describe: (a) -> String }\n"
    "instance Describe Int { describe(n) = \"int \" + to_string(n) }\n"
    "instance Describe Point { describe(p) = \"point \" + to_string(p.x) }\n"
    "describe(4) + \", \" + describe(Point { x: 1.5, y: 0.0 })");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_string(), "int 4, point 1.5");
}

TEST(RuntimeInterpreter, MissingInstanceAtRuntime)
{
  auto r = run_source(
    "typeclass Describe a { describe: (a) -> String }\n"
    "instance Describe Int { describe(n) = \"int\" }\n"
    "describe(\"text\")");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::ArgumentMismatch));
  EXPECT_NE(r->error().find("no instance of method 'describe' for type String"), std::string::npos);
}

// ============================================================================
// Arrays, matrices, comprehensions
// ============================================================================

TEST(RuntimeInterpreter, MatrixLiteralAndProduct)
{
  auto r = run_source(
    "let a = [[1, 2], [3, 4]]\n"
    "let b = [[0, 1], [1, 0]]\n"
    "a * b");
  ASSERT_TRUE(r->ok()) << r->error();
  ASSERT_TRUE(r->value().is_matrix());
  EXPECT_EQ(format_value(r->value()), "[[2, 1], [4, 3]]");
}

TEST(RuntimeInterpreter, MatrixElementwiseAddition)
{
  auto r = run_source("[[1.0, 2.0]] + [[0.5, 0.5]]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(format_value(r->value()), "[[1.5, 2.5]]");

  auto shape = run_source("[[1, 2]] + [[1], [2]]");
  EXPECT_TRUE(shape->has_error(ErrorCode::ArgumentMismatch));
}

TEST(RuntimeInterpreter, NestedStringRowsStayArrays)
{
  auto r = run_source("let names = [[\"a\", \"b\"], [\"c\", \"d\"]]\nnames[1][0]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_string(), "c");
}

TEST(RuntimeInterpreter, MatrixIndexYieldsRow)
{
  auto r = run_source("let m = [[1, 2], [3, 4]]\nm[1][0]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 3);
}

TEST(RuntimeInterpreter, ComprehensionWithFilterAndTwoGenerators)
{
  auto r = run_source("[x * y | x in 1..4 if x != 2 | y in [10, 100]]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(format_value(r->value()), "[10, 100, 30, 300]");
}

TEST(RuntimeInterpreter, ComprehensionOverMatrixRows)
{
  auto r = run_source("[sum(row) | row in [[1, 2], [3, 4], [5, 6]]]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(format_value(r->value()), "[3, 7, 11]");
}

// ============================================================================
// parallel / spawn / wait
// ============================================================================

TEST(RuntimeInterpreter, ParallelRunsInProgramOrder)
{
  auto r = run_source("parallel { println(1); println(2); println(3); 4 }");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->output(), "1\n2\n3\n");
  EXPECT_EQ(r->value().as_int(), 4);
}

TEST(RuntimeInterpreter, SpawnEvaluatesEagerlyAndWaitUnwraps)
{
  auto r = run_source(
    "let a = spawn { println(\"a\"); 1 }\n"
    "println(\"between\")\n"
    "let b = spawn { 2 }\n"
    "wait [a, b]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->output(), "a\nbetween\n");
  EXPECT_EQ(format_value(r->value()), "[1, 2]");

  auto single = run_source("wait spawn { 6 * 7 }");
  ASSERT_TRUE(single->ok()) << single->error();
  EXPECT_EQ(single->value().as_int(), 42);
}

TEST(RuntimeInterpreter, TaskHandlesDoNotAccumulate)
{
  auto r = run_source("sum([wait spawn { i * 2 } | i in 0..3000])");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 8997000);
  EXPECT_EQ(r->session.interpreter().handles().size(), 0U);

  auto twice = run_source("let t = spawn { 21 }\n(wait t) + (wait t)");
  ASSERT_TRUE(twice->ok()) << twice->error();
  EXPECT_EQ(twice->value().as_int(), 42);
}

TEST(RuntimeInterpreter, ParallelBindingsStayInEnclosingFrame)
{
  auto r = run_source("let mut n = 1\nparallel { n = n + 1; n = n * 5 }\nn");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->value().as_int(), 10);

  auto visible = run_source("parallel { let z = 3; 1 }\nz + 1");
  ASSERT_TRUE(visible->ok()) << visible->error();
  EXPECT_EQ(visible->value().as_int(), 4);
}

TEST(RuntimeInterpreter, GpuAttributeDoesNotChangeResult)
{
  auto r = run_source("@gpu let scale = (x: Float) => x * 2.0\nscale(1.25)");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_DOUBLE_EQ(r->value().as_float(), 2.5);
}
