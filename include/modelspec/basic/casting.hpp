// modelspec/basic/casting.hpp - isa / cast / dyn_cast over NodeKind
//
// A target type T participates by providing `static bool classof(const Base *)`.
// The result of cast/dyn_cast keeps the constness of the argument.
//
#pragma once

#include <cassert>
#include <type_traits>

namespace modelspec
{

namespace detail
{

template <typename To, typename From>
using CastResult = std::conditional_t<std::is_const_v<From>, const To, To>;

}  // namespace detail

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline detail::CastResult<T, From> * cast(From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<detail::CastResult<T, From> *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline detail::CastResult<T, From> * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<detail::CastResult<T, From> *>(node) : nullptr;
}

}  // namespace modelspec
