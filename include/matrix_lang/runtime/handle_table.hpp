// matrix_lang/runtime/handle_table.hpp - Opaque objects behind Handle values
#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <unordered_map>
#include <utility>

#include "matrix_lang/runtime/value.hpp"

namespace matrix_lang
{

/// State owned by an external collaborator and referenced through a Handle.
class HandleObject
{
public:
  virtual ~HandleObject() = default;
};

/// Seeded generator behind the `random` builtins.
class RandomSource : public HandleObject
{
public:
  explicit RandomSource(uint64_t seed) : engine(seed) {}

  std::mt19937_64 engine;
};

/**
 * Session-wide table of handle objects.
 *
 * Ids start at 1 and are never reused within a session. Task handles draw
 * their ids from the same sequence but carry their result in the Value, so
 * they take no slot here.
 */
class HandleTable
{
public:
  uint64_t add(std::unique_ptr<HandleObject> object)
  {
    const uint64_t id = next_id();
    objects_.emplace(id, std::move(object));
    return id;
  }

  uint64_t next_id() noexcept { return next_id_++; }

  /// Object of the requested type, or nullptr for an unknown id or a different type.
  template <typename T>
  [[nodiscard]] T * get(uint64_t id) const
  {
    auto it = objects_.find(id);
    if (it == objects_.end()) return nullptr;
    return dynamic_cast<T *>(it->second.get());
  }

  [[nodiscard]] size_t size() const noexcept { return objects_.size(); }

private:
  std::unordered_map<uint64_t, std::unique_ptr<HandleObject>> objects_;
  uint64_t next_id_ = 1;
};

}  // namespace matrix_lang
