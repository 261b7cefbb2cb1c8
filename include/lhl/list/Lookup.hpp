////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 *  Label-indexed lookup.
 *
 *  Resolution happens entirely in the type system. For a list
 *  `Cons<H, T>` and a requested label L: if the label of H is L, the
 *  result is the head; otherwise the lookup recurses into T. There is
 *  no match for `Nil`, so asking for a label that is not in the list
 *  does not compile. If a hand-built list repeats a label, the
 *  outermost occurrence is found.
 */

#include "lhl/label/Label.hpp"
#include "lhl/list/Labels.hpp"
#include "lhl/meta/Core.hpp"

namespace lhl
{
namespace internal
{

/** @brief Resolve the element of List labeled Target.
 *
 *  Provides `elem_type` and `get(list)` for both constant and mutable
 *  lists. Left undefined for `Nil`.
 */
template <typename List, typename Target>
struct LookupElemByLabelT;

template <typename H, typename T, typename Target, bool HeadMatches>
struct LookupElemByLabelMatchT;

template <typename H, typename T, typename Target>
struct LookupElemByLabelT<Cons<H, T>, Target>
  : LookupElemByLabelMatchT<H, T, Target, LabelEq<LabelOf<H>, Target>>
{};

// Head matches.
template <typename H, typename T, typename Target>
struct LookupElemByLabelMatchT<H, T, Target, true>
{
  using elem_type = H;

  static constexpr elem_type& get(Cons<H, T>& list) noexcept
  {
    return list.head;
  }

  static constexpr elem_type const& get(Cons<H, T> const& list) noexcept
  {
    return list.head;
  }
};

// Head does not match; try the tail.
template <typename H, typename T, typename Target>
struct LookupElemByLabelMatchT<H, T, Target, false>
{
private:
  using Next_ = LookupElemByLabelT<T, Target>;

public:
  using elem_type = typename Next_::elem_type;

  static constexpr elem_type& get(Cons<H, T>& list) noexcept
  {
    return Next_::get(list.tail);
  }

  static constexpr elem_type const& get(Cons<H, T> const& list) noexcept
  {
    return Next_::get(list.tail);
  }
};

} // namespace internal

/** @brief The element type stored under label L in List. */
template <typename List, typename L>
using ElemType = typename internal::LookupElemByLabelT<List, L>::elem_type;

/** @brief Get the labeled value stored under label L. */
template <typename L, typename List>
constexpr auto& elem(List& list) noexcept
{
  static_assert(HasLabel<List, L>, "Label is not present in this list");
  return internal::LookupElemByLabelT<List, L>::get(list);
}

template <typename L, typename List>
constexpr auto const& elem(List const& list) noexcept
{
  static_assert(HasLabel<List, L>, "Label is not present in this list");
  return internal::LookupElemByLabelT<List, L>::get(list);
}

// The result would refer into a list that is about to be destroyed.
template <typename L, typename List>
void elem(List const&& list) = delete;

/** @brief Get the value stored under label L.
 *
 *  The result has the payload type bound to L. The mutable overload
 *  allows updating that slot in place; no other slot is affected.
 */
template <typename L, typename List>
constexpr LabelType<L>& value(List& list) noexcept
{
  return elem<L>(list).value;
}

template <typename L, typename List>
constexpr LabelType<L> const& value(List const& list) noexcept
{
  return elem<L>(list).value;
}

template <typename L, typename List>
void value(List const&& list) = delete;

/** @brief Whether label L is in the list. Always false for `Nil`. */
template <typename L, typename List>
constexpr bool has_label(List const&) noexcept
{
  return HasLabel<List, L>;
}

template <typename L, typename List>
constexpr bool has_label(List const&, L const&) noexcept
{
  return HasLabel<List, L>;
}

} // namespace lhl
