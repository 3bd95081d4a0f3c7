// tests/unit/driver/test_session.cpp - Session pipeline
//

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "matrix_lang/driver/session.hpp"

using namespace matrix_lang;

TEST(DriverSession, RunReportsValueAndType)
{
  std::ostringstream out;
  Session session({}, out);
  EvalOutcome r = session.run("let x = 5 + 3");
  ASSERT_TRUE(r.ok) << r.first_error();
  ASSERT_TRUE(r.value.has_value());
  EXPECT_EQ(r.value->as_int(), 8);
  EXPECT_EQ(r.type, "Int");
  EXPECT_TRUE(r.first_error().empty());
}

TEST(DriverSession, PrintGoesToSessionStream)
{
  std::ostringstream out;
  Session session({}, out);
  EvalOutcome r = session.run("println(\"hello\")");
  ASSERT_TRUE(r.ok) << r.first_error();
  EXPECT_EQ(out.str(), "hello\n");
  EXPECT_TRUE(r.value->is_unit());
}

TEST(DriverSession, CheckDoesNotEvaluate)
{
  std::ostringstream out;
  Session session({}, out);
  EvalOutcome r = session.check("println(1); 2.5 * 2.0");
  ASSERT_TRUE(r.ok) << r.first_error();
  EXPECT_FALSE(r.value.has_value());
  EXPECT_EQ(r.type, "Float");
  EXPECT_TRUE(out.str().empty());
}

TEST(DriverSession, ErrorsCarryPositions)
{
  Session session;
  EvalOutcome parse = session.run("let = 1");
  EXPECT_FALSE(parse.ok);
  EXPECT_EQ(parse.first_error().rfind("ParseError: ", 0), 0U) << parse.first_error();

  EvalOutcome lex = session.run("1 $ 2");
  EXPECT_FALSE(lex.ok);
  EXPECT_EQ(lex.first_error(), "LexError: invalid character '$' at line 1, column 3");

  EvalOutcome runtime = session.run("\n  10 / 0");
  EXPECT_FALSE(runtime.ok);
  EXPECT_TRUE(runtime.diags.has_error_code(ErrorCode::DivisionByZero));
  EXPECT_NE(runtime.first_error().find("at line 2, column 3"), std::string::npos)
    << runtime.first_error();
}

TEST(DriverSession, TypeOfGeneralizes)
{
  Session session;
  EvalOutcome r = session.type_of("(x) => x");
  ASSERT_TRUE(r.ok) << r.first_error();
  EXPECT_EQ(r.type, "(a) -> a");

  EvalOutcome multi = session.type_of("1; 2");
  EXPECT_FALSE(multi.ok);
}

TEST(DriverSession, TypeOfBindsNothing)
{
  Session session;
  ASSERT_TRUE(session.type_of("(y) => y + 1").ok);
  EXPECT_TRUE(session.describe_env().empty());
}

TEST(DriverSession, EnvironmentListing)
{
  Session session;
  ASSERT_TRUE(session.run("let n = 1").ok);
  ASSERT_TRUE(session.run("let name = \"x\"").ok);
  const auto env = session.describe_env();
  ASSERT_EQ(env.size(), 2U);
  EXPECT_EQ(env[0], std::make_pair(std::string("n"), std::string("Int")));
  EXPECT_EQ(env[1], std::make_pair(std::string("name"), std::string("String")));
}

TEST(DriverSession, VerboseModeStillEvaluates)
{
  SessionOptions options;
  options.verbose = true;
  std::ostringstream out;
  Session session(options, out);
  EvalOutcome r = session.run("1 + 1");
  ASSERT_TRUE(r.ok) << r.first_error();
  EXPECT_EQ(r.value->as_int(), 2);
}

TEST(DriverSession, NamedSourcePath)
{
  Session session;
  EvalOutcome r = session.run("1 + true", "scripts/bad.mtx");
  EXPECT_FALSE(r.ok);
  ASSERT_NE(r.source, nullptr);
  EXPECT_TRUE(r.diags.has_error_code(ErrorCode::Mismatch));
}
