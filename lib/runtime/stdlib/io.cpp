// matrix_lang/runtime/stdlib/io.cpp - `io` module
#include <ostream>

#include "stdlib_support.hpp"

namespace matrix_lang::stdlib
{

namespace
{

constexpr std::string_view k_module = "io";

}  // namespace

void install_io(BuiltinRegistry & registry)
{
  {
    SchemeBuilder s(registry.types());
    define(
      registry, "print", k_module, s.fn({s.var()}, s.Unit()),
      [](CallContext & ctx, const std::vector<Value> & args) {
        ctx.out() << format_value(args[0]);
        return Value::unit();
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "println", k_module, s.fn({s.var()}, s.Unit()),
      [](CallContext & ctx, const std::vector<Value> & args) {
        ctx.out() << format_value(args[0]) << '\n';
        return Value::unit();
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "to_string", k_module, s.fn({s.var()}, s.String()),
      [](CallContext &, const std::vector<Value> & args) {
        return Value::make_string(format_value(args[0]));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "type_of", k_module, s.fn({s.var()}, s.String()),
      [](CallContext &, const std::vector<Value> & args) {
        return Value::make_string(std::string(runtime_type_name(args[0])));
      });
  }
}

}  // namespace matrix_lang::stdlib
