// matrix_lang/runtime/environment.hpp - Evaluation frames
#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "matrix_lang/runtime/value.hpp"

namespace matrix_lang
{

/**
 * One evaluation frame: name to value bindings plus a link to the
 * enclosing frame.
 *
 * Frames are shared: a closure keeps the frame it was created in alive
 * after the block that created it has returned. Links only point outward,
 * and the interpreter never stores a closure in a frame the closure can
 * reach, so frames form a tree of plain `shared_ptr`s.
 */
class Environment : public std::enable_shared_from_this<Environment>
{
public:
  explicit Environment(std::shared_ptr<Environment> parent = nullptr)
  : parent_(std::move(parent))
  {
  }

  ~Environment();

  Environment(const Environment &) = delete;
  Environment & operator=(const Environment &) = delete;

  /// Bind in this frame, replacing an existing binding of the same name.
  void define(std::string_view name, Value value);

  /// Rebind the nearest frame that defines `name`. Returns false if none does.
  [[nodiscard]] bool assign(std::string_view name, Value value);

  /// Nearest frame (this one or an ancestor) that defines `name`, or nullptr.
  [[nodiscard]] Environment * frame_defining(std::string_view name);

  /// Nearest binding of `name`, or nullptr.
  [[nodiscard]] const Value * lookup(std::string_view name) const;

  [[nodiscard]] bool defines(std::string_view name) const { return values_.count(name) != 0; }

  /// Drop every binding of this frame.
  void clear() noexcept { values_.clear(); }

  [[nodiscard]] const std::shared_ptr<Environment> & parent() const noexcept { return parent_; }

  [[nodiscard]] const std::map<std::string, Value, std::less<>> & values() const noexcept
  {
    return values_;
  }

private:
  std::shared_ptr<Environment> parent_;
  std::map<std::string, Value, std::less<>> values_;
};

}  // namespace matrix_lang
