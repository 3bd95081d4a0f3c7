// tests/unit/runtime/test_builtin_registry.cpp - Registry keeps schemes and implementations in step
//

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "matrix_lang/runtime/builtin_registry.hpp"
#include "matrix_lang/sema/type.hpp"
#include "matrix_lang/test_support/session_helpers.hpp"

using namespace matrix_lang;
using matrix_lang::test_support::ScriptRun;

namespace
{

Scheme int_to_int(TypeContext & types)
{
  return Scheme::mono(types.function_type({types.int_type()}, types.int_type()));
}

Value twice(CallContext &, const std::vector<Value> & args)
{
  return Value::make_int(args[0].as_int() * 2);
}

}  // namespace

TEST(RuntimeBuiltinRegistry, RegisterAddsBothTables)
{
  TypeContext types;
  BuiltinRegistry registry(types);

  ASSERT_TRUE(registry.register_builtin("twice", "demo", int_to_int(types), twice));

  const auto * sig = registry.signatures().find("twice");
  ASSERT_NE(sig, nullptr);
  EXPECT_EQ(sig->module, "demo");
  EXPECT_TRUE(registry.signatures().has_module("demo"));
  EXPECT_TRUE(registry.signatures().exports("demo", "twice"));

  const auto * impl = registry.find_impl("twice");
  ASSERT_NE(impl, nullptr);
  EXPECT_EQ(impl->arity, 1U);
  EXPECT_FALSE(impl->isConstant);
}

TEST(RuntimeBuiltinRegistry, DuplicateNameLeavesBothTablesUnchanged)
{
  TypeContext types;
  BuiltinRegistry registry(types);
  ASSERT_TRUE(registry.register_builtin("twice", "demo", int_to_int(types), twice));

  const size_t impls = registry.size();
  const size_t sigs = registry.signatures().size();

  const Scheme other = Scheme::mono(types.function_type({types.float_type()}, types.float_type()));
  EXPECT_FALSE(registry.register_builtin("twice", "other", other, twice));

  EXPECT_EQ(registry.size(), impls);
  EXPECT_EQ(registry.signatures().size(), sigs);
  EXPECT_EQ(registry.signatures().find("twice")->module, "demo");
  EXPECT_FALSE(registry.signatures().has_module("other"));
}

TEST(RuntimeBuiltinRegistry, EmptyImplementationIsRejected)
{
  TypeContext types;
  BuiltinRegistry registry(types);
  EXPECT_FALSE(registry.register_builtin("nothing", "demo", int_to_int(types), BuiltinFn{}));
  EXPECT_EQ(registry.size(), 0U);
  EXPECT_EQ(registry.signatures().size(), 0U);
}

TEST(RuntimeBuiltinRegistry, NonFunctionSchemeIsAConstant)
{
  TypeContext types;
  BuiltinRegistry registry(types);
  ASSERT_TRUE(registry.register_builtin(
    "answer", "demo", Scheme::mono(types.int_type()),
    [](CallContext &, const std::vector<Value> &) { return Value::make_int(42); }));
  EXPECT_TRUE(registry.find_impl("answer")->isConstant);
  EXPECT_EQ(registry.find_impl("answer")->arity, 0U);
}

TEST(RuntimeBuiltinRegistry, StdlibTablesAgree)
{
  TypeContext types;
  BuiltinRegistry registry(types);
  install_stdlib(registry);

  EXPECT_EQ(registry.size(), registry.signatures().size());
  for (const auto & [name, sig] : registry.signatures()) {
    EXPECT_TRUE(registry.contains(name)) << name;
  }
  for (const char * module : {"math", "io", "array", "vector", "matrix", "random", "jit"}) {
    EXPECT_TRUE(registry.signatures().has_module(module)) << module;
  }
}

TEST(RuntimeBuiltinRegistry, InstallingTwiceThrows)
{
  TypeContext types;
  BuiltinRegistry registry(types);
  install_stdlib(registry);
  EXPECT_THROW(install_stdlib(registry), std::logic_error);
}

TEST(RuntimeBuiltinRegistry, SessionSeesLateRegistration)
{
  ScriptRun run;
  auto & registry = run.session.registry();
  ASSERT_TRUE(registry.register_builtin("twice", "demo", int_to_int(registry.types()), twice));

  const auto & out = run.run("import demo { twice }\ntwice(21)");
  ASSERT_TRUE(out.ok) << out.first_error();
  EXPECT_EQ(out.value->as_int(), 42);

  const auto & bad = run.run("twice(1.5)");
  EXPECT_FALSE(bad.ok);
  EXPECT_TRUE(bad.diags.has_error_code(ErrorCode::Mismatch));
}

TEST(RuntimeBuiltinRegistry, BuiltinsAreFirstClassValues)
{
  ScriptRun run;
  const auto & out = run.run("let f = sqrt\nmap([4.0, 9.0], f)");
  ASSERT_TRUE(out.ok) << out.first_error();
  EXPECT_EQ(format_value(*out.value), "[2.0, 3.0]");
}
