// tests/unit/sema/test_type_checker.cpp - Unit tests for Hindley-Milner inference
//
// Programs are checked through a Session so builtins come from the real
// registry.
//

#include <gtest/gtest.h>

#include <string>

#include "matrix_lang/basic/diagnostic.hpp"
#include "matrix_lang/basic/error_code.hpp"
#include "matrix_lang/test_support/session_helpers.hpp"

using namespace matrix_lang;
using matrix_lang::test_support::check_source;
using matrix_lang::test_support::run_source;
using matrix_lang::test_support::ScriptRun;

// ============================================================================
// Literals and operators
// ============================================================================

TEST(SemaTypeChecker, LetBindingOfArithmetic)
{
  auto r = check_source("let x = 5 + 3");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Int");
}

TEST(SemaTypeChecker, IntAndFloatDoNotMix)
{
  auto r = check_source("1 + 2.0");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::Mismatch));
  EXPECT_EQ(r->error(), "TypeError: type mismatch: expected Int, found Float at line 1, column 5");
}

TEST(SemaTypeChecker, ComparisonYieldsBool)
{
  auto r = check_source("\"a\" < \"b\" && 1.5 >= 0.5");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Bool");
}

TEST(SemaTypeChecker, OperatorKindMaskRejectsString)
{
  auto r = check_source("let neg = (x) => -x\nneg(\"a\")");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::Mismatch));
}

TEST(SemaTypeChecker, StringConcatenation)
{
  auto r = check_source("let greet = (name) => \"hello \" + name\ngreet(\"you\")");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "String");
}

TEST(SemaTypeChecker, RangeIsArrayOfInt)
{
  auto r = check_source("0..4");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Array<Int>");
}

// ============================================================================
// Identifiers and functions
// ============================================================================

TEST(SemaTypeChecker, UnknownIdentifier)
{
  auto r = check_source("foo");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::UnknownIdentifier));
  EXPECT_EQ(r->error(), "TypeError: unknown identifier 'foo' at line 1, column 1");
}

TEST(SemaTypeChecker, UnknownIdentifierPreventsEvaluation)
{
  auto r = run_source("println(\"side effect\")\nfoo");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::UnknownIdentifier));
  EXPECT_EQ(r->output(), "");
  EXPECT_FALSE(r->outcome.value.has_value());
}

TEST(SemaTypeChecker, AnnotatedFunction)
{
  auto r = check_source("let add = (a: Int, b: Int) => a + b\nadd(5, 10)");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Int");
}

TEST(SemaTypeChecker, ArityMismatch)
{
  auto r = check_source("let add = (a: Int, b: Int) => a + b\nadd(1)");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::ArityMismatch));
  EXPECT_NE(r->error().find("'add' expects 2 arguments, got 1"), std::string::npos);
}

TEST(SemaTypeChecker, RecursiveFunction)
{
  auto r = check_source(
    "let factorial = (n) => if n <= 1 then 1 else n * factorial(n - 1)\n"
    "factorial(5)");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Int");
}

TEST(SemaTypeChecker, ReturnAnnotationIsChecked)
{
  auto r = check_source("let f = (x: Int) -> Bool => x + 1");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::Mismatch));
}

TEST(SemaTypeChecker, CallingANonFunction)
{
  auto r = check_source("let x = 3\nx(1)");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::Mismatch));
}

// ============================================================================
// Polymorphism
// ============================================================================

TEST(SemaTypeChecker, GenericBuiltinUsedAtTwoTypes)
{
  auto r = check_source("println(1)\nprintln(\"a\")\nprintln([1.5])");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Unit");
}

TEST(SemaTypeChecker, LetPolymorphism)
{
  auto r = check_source("let id = (x) => x\nlet a = id(5)\nlet b = id(\"a\")\nb");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "String");
}

TEST(SemaTypeChecker, LambdaParametersAreMonomorphic)
{
  auto r = check_source("let f = (g) => { g(1); g(\"a\") }");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::Mismatch));
}

TEST(SemaTypeChecker, SelfApplicationIsInfinite)
{
  auto r = check_source("let w = (x) => x(x)");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::InfiniteType));
}

TEST(SemaTypeChecker, HigherOrderBuiltins)
{
  auto r = check_source("fold(map([1, 2, 3], (x) => x * 2), 0, (acc, x) => acc + x)");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Int");
}

// ============================================================================
// Mutability
// ============================================================================

TEST(SemaTypeChecker, ImmutableBindingCannotBeAssigned)
{
  auto r = check_source("let x = 1\nx = 2");
  EXPECT_FALSE(r->ok());
  EXPECT_TRUE(r->has_error(ErrorCode::ImmutableBinding));

  const Diagnostic * diag = r->outcome.diags.first_error();
  ASSERT_NE(diag, nullptr);
  ASSERT_TRUE(diag->help_message.has_value());
  EXPECT_EQ(*diag->help_message, "declare it with 'let mut x' to allow assignment");
}

TEST(SemaTypeChecker, MutableBindingKeepsItsType)
{
  auto ok = check_source("let mut x = 1\nx = x + 1\nx");
  ASSERT_TRUE(ok->ok()) << ok->error();
  EXPECT_EQ(ok->outcome.type, "Int");

  auto bad = check_source("let mut x = 1\nx = \"two\"");
  EXPECT_TRUE(bad->has_error(ErrorCode::Mismatch));
}

TEST(SemaTypeChecker, BuiltinsCannotBeAssigned)
{
  auto r = check_source("sqrt = 1");
  EXPECT_TRUE(r->has_error(ErrorCode::ImmutableBinding));
}

// ============================================================================
// Control flow
// ============================================================================

TEST(SemaTypeChecker, IfBranchesMustAgree)
{
  EXPECT_TRUE(check_source("if true then 1 else \"a\"")->has_error(ErrorCode::Mismatch));
  EXPECT_TRUE(check_source("if 1 then 2 else 3")->has_error(ErrorCode::Mismatch));
}

TEST(SemaTypeChecker, IfWithoutElseIsUnit)
{
  auto r = check_source("if true then println(1)");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Unit");
}

TEST(SemaTypeChecker, MatchArmsShareAType)
{
  auto ok = check_source("match 3 { 0 => \"zero\", n if n > 0 => \"pos\", _ => \"neg\" }");
  ASSERT_TRUE(ok->ok()) << ok->error();
  EXPECT_EQ(ok->outcome.type, "String");

  auto bad = check_source("match 3 { 0 => \"zero\", _ => 1 }");
  EXPECT_TRUE(bad->has_error(ErrorCode::Mismatch));
}

// ============================================================================
// Structs
// ============================================================================

TEST(SemaTypeChecker, StructFieldsAreTyped)
{
  auto r = check_source(
    "struct Point { x: Float, y: Float }\n"
    "let p = Point { x: 1.0, y: 2.0 }\n"
    "p.x + p.y");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Float");
}

TEST(SemaTypeChecker, UnknownField)
{
  auto r = check_source(
    "struct Point { x: Float, y: Float }\n"
    "let p = Point { x: 1.0, y: 2.0 }\n"
    "p.z");
  EXPECT_TRUE(r->has_error(ErrorCode::UnknownField));
}

TEST(SemaTypeChecker, StructFieldTypeMismatch)
{
  auto r = check_source("struct Point { x: Float, y: Float }\nPoint { x: 1, y: 2.0 }");
  EXPECT_TRUE(r->has_error(ErrorCode::Mismatch));
}

TEST(SemaTypeChecker, DuplicateStruct)
{
  auto r = check_source("struct A { x: Int }\nstruct A { y: Int }");
  EXPECT_TRUE(r->has_error(ErrorCode::DuplicateDefinition));

  const Diagnostic * diag = r->outcome.diags.first_error();
  ASSERT_NE(diag, nullptr);
  ASSERT_EQ(diag->labels.size(), 2U);
  EXPECT_EQ(diag->labels[0].style, LabelStyle::Primary);
  EXPECT_EQ(diag->labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(diag->labels[1].message, "previous definition here");
  EXPECT_LT(diag->labels[1].range.get_begin().get_offset(), diag->labels[0].range.get_begin().get_offset());
}

TEST(SemaTypeChecker, DuplicateStructInLaterEntry)
{
  ScriptRun repl;
  ASSERT_TRUE(repl.run("struct A { x: Int }").ok);
  EXPECT_FALSE(repl.run("struct A { y: Int }").ok);

  const Diagnostic * diag = repl.outcome.diags.first_error();
  ASSERT_NE(diag, nullptr);
  EXPECT_EQ(diag->code, ErrorCode::DuplicateDefinition);
  EXPECT_EQ(diag->labels.size(), 1U);
}

TEST(SemaTypeChecker, DuplicateFieldPointsAtFirstDeclaration)
{
  auto r = check_source("struct A { x: Int, x: Float }");
  const Diagnostic * diag = r->outcome.diags.first_error();
  ASSERT_NE(diag, nullptr);
  EXPECT_EQ(diag->code, ErrorCode::DuplicateDefinition);
  ASSERT_EQ(diag->labels.size(), 2U);
  EXPECT_EQ(diag->labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(diag->labels[1].message, "first declared here");
}

// ============================================================================
// Arrays, matrices and comprehensions
// ============================================================================

TEST(SemaTypeChecker, NumericRowsAreAMatrix)
{
  auto r = check_source("[[1, 2], [3, 4]]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Matrix<Int>");
}

TEST(SemaTypeChecker, NonNumericRowsAreNestedArrays)
{
  auto r = check_source("[[\"a\", \"b\"], [\"c\", \"d\"]]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Array<Array<String>>");
}

TEST(SemaTypeChecker, MixedArrayElements)
{
  auto r = check_source("[1, \"two\"]");
  EXPECT_TRUE(r->has_error(ErrorCode::Mismatch));
}

TEST(SemaTypeChecker, ComprehensionType)
{
  auto r = check_source("[x * 2.0 | x in [1.0, 2.0, 3.0] if x > 1.0]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Array<Float>");
}

TEST(SemaTypeChecker, ComprehensionOverMatrixRows)
{
  auto r = check_source("[sum(row) | row in [[1, 2], [3, 4]]]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Array<Int>");
}

TEST(SemaTypeChecker, IndexingAMatrixYieldsARow)
{
  auto r = check_source("let m = [[1.0, 0.0], [0.0, 1.0]]\nm[1]");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Array<Float>");
}

// ============================================================================
// Modules, typeclasses, tasks
// ============================================================================

TEST(SemaTypeChecker, ImportResolvesAgainstRegistryModules)
{
  EXPECT_TRUE(check_source("import math { sqrt, pi }\nsqrt(pi)")->ok());
  EXPECT_TRUE(check_source("import physics")->has_error(ErrorCode::UnknownIdentifier));
  EXPECT_TRUE(check_source("import math { push }")->has_error(ErrorCode::UnknownIdentifier));
}

TEST(SemaTypeChecker, TypeclassInstanceChecked)
{
  const std::string decls =
    "struct Point { x: Float, y: Float }\n"
    "typeclass Show a { show: (a) -> String }\n";

  auto ok = check_source(decls + "instance Show Point { show(p) = to_string(p.x) }\nshow(Point { x: 1.0, y: 2.0 })");
  ASSERT_TRUE(ok->ok()) << ok->error();
  EXPECT_EQ(ok->outcome.type, "String");

  auto wrong_result = check_source(decls + "instance Show Point { show(p) = p.x }");
  EXPECT_TRUE(wrong_result->has_error(ErrorCode::Mismatch));

  auto missing = check_source(decls + "instance Show Point { }");
  EXPECT_TRUE(missing->has_error(ErrorCode::ArityMismatch));

  auto extra = check_source(decls + "instance Show Point { show(p) = \"p\", render(p) = \"p\" }");
  EXPECT_TRUE(extra->has_error(ErrorCode::UnknownIdentifier));
}

TEST(SemaTypeChecker, MathFunctionsAcceptBothNumericTypes)
{
  for (const char * src : {"sqrt(16)", "sqrt(2.0)", "floor(3)", "ln(10)", "log10(100)"}) {
    auto r = check_source(src);
    ASSERT_TRUE(r->ok()) << src << ": " << r->error();
    EXPECT_EQ(r->outcome.type, "Float") << src;
  }
  EXPECT_TRUE(check_source("sqrt(\"4\")")->has_error(ErrorCode::Mismatch));
}

TEST(SemaTypeChecker, EmptyReductionTypeFollowsAnnotation)
{
  auto r = check_source("let xs: Array<Float> = []\nsum(xs)");
  ASSERT_TRUE(r->ok()) << r->error();
  EXPECT_EQ(r->outcome.type, "Float");
}

TEST(SemaTypeChecker, SpawnAndWait)
{
  auto single = check_source("wait spawn { 1 + 1 }");
  ASSERT_TRUE(single->ok()) << single->error();
  EXPECT_EQ(single->outcome.type, "Int");

  auto many = check_source("let a = spawn { 1.0 }\nlet b = spawn { 2.0 }\nwait [a, b]");
  ASSERT_TRUE(many->ok()) << many->error();
  EXPECT_EQ(many->outcome.type, "Array<Float>");
}

// ============================================================================
// Incremental checking
// ============================================================================

TEST(SemaTypeChecker, BindingsPersistAcrossEntries)
{
  ScriptRun run;
  ASSERT_TRUE(run.session.check("let x = 1").ok);
  const auto next = run.session.check("x + 1");
  ASSERT_TRUE(next.ok) << next.first_error();
  EXPECT_EQ(next.type, "Int");
}

TEST(SemaTypeChecker, FailedEntryLeavesNoBinding)
{
  ScriptRun run;
  EXPECT_FALSE(run.session.check("let y = 1\nlet z = foo").ok);
  const auto next = run.session.check("y");
  EXPECT_FALSE(next.ok);
  EXPECT_TRUE(next.diags.has_error_code(ErrorCode::UnknownIdentifier));
}

TEST(SemaTypeChecker, TypeOfExpression)
{
  ScriptRun run;
  const auto id = run.session.type_of("(x) => x");
  ASSERT_TRUE(id.ok) << id.first_error();
  EXPECT_EQ(id.type, "(a) -> a");

  const auto len = run.session.type_of("len");
  ASSERT_TRUE(len.ok);
  EXPECT_EQ(len.type, "(Array<a>) -> Int");

  const auto stmt = run.session.type_of("let q = 1");
  EXPECT_FALSE(stmt.ok);
  EXPECT_TRUE(stmt.diags.has_error_code(ErrorCode::UnexpectedToken));
}

TEST(SemaTypeChecker, DescribeEnvListsGlobals)
{
  ScriptRun run;
  ASSERT_TRUE(run.session.check("let n = 1\nlet id = (x) => x").ok);
  const auto env = run.session.describe_env();
  ASSERT_EQ(env.size(), 2U);
  EXPECT_EQ(env[0].first, "id");
  EXPECT_EQ(env[0].second, "(a) -> a");
  EXPECT_EQ(env[1].first, "n");
  EXPECT_EQ(env[1].second, "Int");
}
