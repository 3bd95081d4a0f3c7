// matrix_lang/runtime/environment.cpp - Evaluation frames
#include "matrix_lang/runtime/environment.hpp"

namespace matrix_lang
{

Environment::~Environment()
{
  // A long script leaves a long chain of frames; unlink it iteratively.
  std::shared_ptr<Environment> next = std::move(parent_);
  while (next && next.use_count() == 1) {
    std::shared_ptr<Environment> after = std::move(next->parent_);
    next = std::move(after);
  }
}

void Environment::define(std::string_view name, Value value)
{
  auto it = values_.find(name);
  if (it != values_.end()) {
    it->second = std::move(value);
    return;
  }
  values_.emplace(std::string(name), std::move(value));
}

bool Environment::assign(std::string_view name, Value value)
{
  Environment * frame = frame_defining(name);
  if (!frame) return false;
  frame->values_.find(name)->second = std::move(value);
  return true;
}

Environment * Environment::frame_defining(std::string_view name)
{
  for (Environment * env = this; env != nullptr; env = env->parent_.get()) {
    if (env->defines(name)) return env;
  }
  return nullptr;
}

const Value * Environment::lookup(std::string_view name) const
{
  for (const Environment * env = this; env != nullptr; env = env->parent_.get()) {
    auto it = env->values_.find(name);
    if (it != env->values_.end()) return &it->second;
  }
  return nullptr;
}

}  // namespace matrix_lang
