////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 *  Building labeled lists.
 *
 *  Entries are folded right to left onto `Nil`, so the first entry
 *  becomes the head and the list keeps declaration order:
 *
 *  @code
 *  auto list = lhlist(Count{} = 3, Name{} = "abc", Active{} = true);
 *  // LVCons<Count, LVCons<Name, LVCons<Active, Nil>>>
 *  @endcode
 *
 *  A label may appear only once in a list built this way.
 */

#include "lhl/label/Label.hpp"
#include "lhl/list/Cons.hpp"
#include "lhl/list/Labels.hpp"
#include "lhl/meta/Core.hpp"
#include "lhl/meta/TypeList.hpp"

#include <utility>

namespace lhl
{

/** @brief The labeled list type holding labels Ls, in order. */
template <typename... Ls>
struct LHListT;

template <typename... Ls>
using LHList = meta::Force<LHListT<Ls...>>;

#ifndef DOXYGEN_SHOULD_SKIP_THIS

template <>
struct LHListT<>
{
  using type = Nil;
};

template <typename L, typename... Ls>
struct LHListT<L, Ls...>
{
  static_assert(IsLabel<L>, "Labeled lists may only be keyed by labels");
  using type = LVCons<L, LHList<Ls...>>;
};

#endif // DOXYGEN_SHOULD_SKIP_THIS

/** @brief The empty labeled list. */
constexpr Nil lhlist() noexcept
{
  return {};
}

/** @brief Build a labeled list from `label = value` entries.
 *
 *  @param[in] head The first entry; it becomes the head of the list.
 *  @param[in] rest The remaining entries, in order.
 */
template <typename L, typename... Ls>
constexpr LHList<L, Ls...> lhlist(LabeledValue<L> head,
                                  LabeledValue<Ls>... rest)
{
  static_assert(meta::tlist::Distinct<meta::TL<L, Ls...>>,
                "A label may appear only once in a labeled list");
  return {std::move(head), lhlist(std::move(rest)...)};
}

/** @brief Build a labeled list from values given positionally.
 *
 *  `make_lhlist<Count, Name>(3, "abc")` is
 *  `lhlist(Count{} = 3, Name{} = "abc")`.
 */
template <typename... Ls, typename... Vs>
constexpr LHList<Ls...> make_lhlist(Vs&&... values)
{
  static_assert(sizeof...(Ls) == sizeof...(Vs),
                "make_lhlist needs exactly one value per label");
  return lhlist(labeled<Ls>(std::forward<Vs>(values))...);
}

} // namespace lhl
