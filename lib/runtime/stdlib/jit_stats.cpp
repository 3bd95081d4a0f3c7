// matrix_lang/runtime/stdlib/jit_stats.cpp - `jit` module
#include "stdlib_support.hpp"

namespace matrix_lang::stdlib
{

void install_jit(BuiltinRegistry & registry)
{
  SchemeBuilder s(registry.types());
  define(
    registry, "jit_stats", "jit", s.fn({}, s.String()),
    [](CallContext & ctx, const std::vector<Value> &) {
      return Value::make_string(ctx.jit_summary());
    });
}

}  // namespace matrix_lang::stdlib
