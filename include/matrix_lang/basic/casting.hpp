// matrix_lang/basic/casting.hpp - isa / cast / dyn_cast over NodeKind
//
// Target classes provide `static bool classof(const AstNode *)`. Constness
// of the argument carries over to the result.
//
#pragma once

#include <cassert>
#include <type_traits>

namespace matrix_lang
{

namespace detail
{

template <typename To, typename From>
using CastResult = std::conditional_t<std::is_const_v<From>, const To *, To *>;

}  // namespace detail

template <typename To, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  return node != nullptr && To::classof(node);
}

/// Downcast whose target the caller has already established.
template <typename To, typename From>
[[nodiscard]] inline detail::CastResult<To, From> cast(From * node) noexcept
{
  assert(isa<To>(node) && "cast<> to the wrong node kind");
  return static_cast<detail::CastResult<To, From>>(node);
}

/// nullptr for a null node or a different kind.
template <typename To, typename From>
[[nodiscard]] inline detail::CastResult<To, From> dyn_cast(From * node) noexcept
{
  return isa<To>(node) ? static_cast<detail::CastResult<To, From>>(node) : nullptr;
}

}  // namespace matrix_lang
