////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#ifndef LHL_LIST_CONS_HPP_
#define LHL_LIST_CONS_HPP_

#include "lhl/label/Label.hpp"
#include "lhl/list/Labels.hpp"
#include "lhl/list/Lookup.hpp"
#include "lhl/meta/Core.hpp"

#include <type_traits>
#include <utility>

namespace lhl
{

/** @struct Nil
 *  @brief The end of every list, and the empty list.
 */
struct Nil
{
  template <typename L>
  static constexpr bool has_label() noexcept
  {
    return false;
  }

  template <typename L>
  static constexpr bool has_label(L const&) noexcept
  {
    return false;
  }
};

/** @struct Cons
 *  @brief One node of a heterogeneous list: a head value and the rest
 *         of the list.
 *
 *  A node exclusively owns both its head and its tail, so a whole list
 *  is a single value with a layout fixed at compile time. Labeled
 *  lists are chains of `Cons<LabeledValue<L>, ...>` ending in `Nil`;
 *  the accessors taking a label only make sense for those.
 *
 *  @tparam H The type of the head.
 *  @tparam T The type of the tail (another Cons, or Nil).
 */
template <typename H, typename T>
struct Cons
{
  using head_type = H;
  using tail_type = T;

  H head;
  T tail;

  /** @brief Whether label L is in this list. */
  template <typename L>
  static constexpr bool has_label() noexcept
  {
    return HasLabel<Cons, L>;
  }

  template <typename L>
  static constexpr bool has_label(L const&) noexcept
  {
    return HasLabel<Cons, L>;
  }

  /** @brief The labeled value stored under label L. */
  template <typename L>
  constexpr auto& elem() & noexcept
  {
    return lhl::elem<L>(*this);
  }

  template <typename L>
  constexpr auto const& elem() const& noexcept
  {
    return lhl::elem<L>(*this);
  }

  template <typename L>
  void elem() const&& = delete;

  /** @brief The value stored under label L. */
  template <typename L>
  constexpr LabelType<L>& value() & noexcept
  {
    return lhl::value<L>(*this);
  }

  template <typename L>
  constexpr LabelType<L> const& value() const& noexcept
  {
    return lhl::value<L>(*this);
  }

  template <typename L>
  void value() const&& = delete;

  /** @brief The value stored under the given label: `list[Count{}]`. */
  template <typename L, meta::EnableWhen<IsLabel<L>, int> = 0>
  constexpr LabelType<L>& operator[](L const&) & noexcept
  {
    return lhl::value<L>(*this);
  }

  template <typename L, meta::EnableWhen<IsLabel<L>, int> = 0>
  constexpr LabelType<L> const& operator[](L const&) const& noexcept
  {
    return lhl::value<L>(*this);
  }

  template <typename L, meta::EnableWhen<IsLabel<L>, int> = 0>
  void operator[](L const&) const&& = delete;
};

/** @brief A labeled list node. */
template <typename L, typename T>
using LVCons = Cons<LabeledValue<L>, T>;

/** @brief Prepend a value to a list. */
template <typename H, typename T>
constexpr Cons<std::decay_t<H>, std::decay_t<T>> cons(H&& head, T&& tail)
{
  return {std::forward<H>(head), std::forward<T>(tail)};
}

/** @brief Build an unlabeled list holding the arguments in order.
 *
 *  `cons_list(8, "Hi", 4.3)` is `cons(8, cons("Hi", cons(4.3, Nil{})))`.
 */
constexpr Nil cons_list() noexcept
{
  return {};
}

template <typename A, typename... As>
constexpr auto cons_list(A&& first, As&&... rest)
{
  return cons(std::forward<A>(first), cons_list(std::forward<As>(rest)...));
}

/** @brief The number of elements in a list. */
template <typename List>
struct LenVT;

template <typename List>
inline constexpr unsigned long Len = LenVT<List>::value;

template <>
struct LenVT<Nil> : meta::ValueAsType<unsigned long, 0UL>
{};

template <typename H, typename T>
struct LenVT<Cons<H, T>> : meta::ValueAsType<unsigned long, 1UL + Len<T>>
{};

template <typename List>
constexpr unsigned long length(List const&) noexcept
{
  return Len<List>;
}

// Lists compare element-wise. Lists of different lengths do not
// compare at all.

constexpr bool operator==(Nil const&, Nil const&) noexcept
{
  return true;
}

constexpr bool operator!=(Nil const&, Nil const&) noexcept
{
  return false;
}

template <typename H1, typename T1, typename H2, typename T2>
constexpr bool operator==(Cons<H1, T1> const& a, Cons<H2, T2> const& b)
{
  return a.head == b.head && a.tail == b.tail;
}

template <typename H1, typename T1, typename H2, typename T2>
constexpr bool operator!=(Cons<H1, T1> const& a, Cons<H2, T2> const& b)
{
  return !(a == b);
}

} // namespace lhl
#endif // LHL_LIST_CONS_HPP_
