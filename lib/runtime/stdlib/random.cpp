// matrix_lang/runtime/stdlib/random.cpp - `random` module
//
// Generator state lives in the session's HandleTable; scripts only see
// the opaque Handle.
//
#include <memory>
#include <random>

#include "matrix_lang/runtime/handle_table.hpp"
#include "stdlib_support.hpp"

namespace matrix_lang::stdlib
{

namespace
{

constexpr std::string_view k_module = "random";

RandomSource & source_arg(
  std::string_view fn, CallContext & ctx, const std::vector<Value> & args, size_t i)
{
  const uint64_t id = handle_arg(fn, args, i);
  auto * source = ctx.handles().get<RandomSource>(id);
  if (!source) {
    throw RuntimeError(
      ErrorCode::ArgumentMismatch,
      fmt::format("'{}': handle {} is not a random source", fn, id));
  }
  return *source;
}

}  // namespace

void install_random(BuiltinRegistry & registry)
{
  {
    SchemeBuilder s(registry.types());
    define(
      registry, "rng_new", k_module, s.fn({s.Int()}, s.Handle()),
      [](CallContext & ctx, const std::vector<Value> & args) {
        const auto seed = static_cast<uint64_t>(int_arg("rng_new", args, 0));
        return Value::make_handle(ctx.handles().add(std::make_unique<RandomSource>(seed)));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "rng_next", k_module, s.fn({s.Handle()}, s.Float()),
      [](CallContext & ctx, const std::vector<Value> & args) {
        auto & source = source_arg("rng_next", ctx, args, 0);
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return Value::make_float(dist(source.engine));
      });
  }

  {
    SchemeBuilder s(registry.types());
    define(
      registry, "rng_int", k_module, s.fn({s.Handle(), s.Int(), s.Int()}, s.Int()),
      [](CallContext & ctx, const std::vector<Value> & args) {
        auto & source = source_arg("rng_int", ctx, args, 0);
        const int64_t lo = int_arg("rng_int", args, 1);
        const int64_t hi = int_arg("rng_int", args, 2);
        if (lo > hi) domain_error(fmt::format("rng_int: empty range [{}, {}]", lo, hi));
        std::uniform_int_distribution<int64_t> dist(lo, hi);
        return Value::make_int(dist(source.engine));
      });
  }
}

}  // namespace matrix_lang::stdlib
