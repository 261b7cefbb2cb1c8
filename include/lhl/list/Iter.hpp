////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 *  Walking and transforming lists element by element.
 *
 *  Since every element may have a different type, iteration is a
 *  compile-time unrolled walk rather than a runtime loop. An iterator
 *  borrows a list and carries an adapter, a callable applied to each
 *  element as it is produced. `map` stacks another callable on top of
 *  the current adapter; `collect` materializes the adapted elements as
 *  a new list.
 *
 *  @code
 *  auto sizes = iter_values(list).map(SizeOf{}).collect();
 *  auto relabeled =
 *    iter_values(list).map(SizeOf{}).collect_labeled<TL<A, B, C>>();
 *  @endcode
 *
 *  Callables must be invocable as const objects and must accept every
 *  element type they will see (a generic lambda or an overload set).
 */

#include "lhl/label/Label.hpp"
#include "lhl/list/Cons.hpp"
#include "lhl/meta/Core.hpp"
#include "lhl/meta/TypeList.hpp"

#include <type_traits>
#include <utility>

namespace lhl
{

/** @brief The adapter that passes elements through unchanged. */
struct IdentityAdapter
{
  template <typename T>
  constexpr T&& operator()(T&& x) const noexcept
  {
    return std::forward<T>(x);
  }
};

namespace internal
{

/** @brief How an adapter result is held once the call returns.
 *
 *  Lvalue references (into the list) are kept. An rvalue reference may
 *  refer to a temporary made inside the call, so it is held by value.
 */
template <typename R>
using HeldResult =
  meta::IfThenElse<std::is_rvalue_reference_v<R>, std::decay_t<R>, R>;

} // namespace internal

/** @brief Apply `Inner` first, then `F`. */
template <typename F, typename Inner>
struct ComposedAdapter
{
  F f;
  Inner inner;

  template <typename T>
  constexpr auto operator()(T&& x) const
    -> internal::HeldResult<decltype(f(inner(std::forward<T>(x))))>
  {
    return f(inner(std::forward<T>(x)));
  }
};

/** @brief Produces the whole labeled value (or plain element). */
struct ElemAccess
{
  template <typename H, typename T>
  static constexpr H const& get(Cons<H, T> const& node) noexcept
  {
    return node.head;
  }
};

/** @brief Produces only the payload of a labeled value. */
struct ValueAccess
{
  template <typename L, typename T>
  static constexpr LabelType<L> const& get(
    Cons<LabeledValue<L>, T> const& node) noexcept
  {
    return node.head.value;
  }
};

/** @class ListIterator
 *  @brief An iterator over a borrowed list.
 *
 *  @tparam List The (remaining) list being iterated.
 *  @tparam Access How an element is read from a node.
 *  @tparam Adapter The callable applied to each element.
 */
template <typename List, typename Access, typename Adapter = IdentityAdapter>
class ListIterator
{
public:
  using list_type = List;
  using adapter_type = Adapter;

  explicit constexpr ListIterator(List const& list, Adapter adapter = {})
    : m_list(&list), m_adapter(std::move(adapter))
  {}

  /** @brief Whether the iterator has reached the end of the list. */
  static constexpr bool done() noexcept { return meta::Eq<List, Nil>; }

  /** @brief Get the adapted head and an iterator over the tail. */
  constexpr auto next() const
  {
    static_assert(!meta::Eq<List, Nil>, "Cannot advance past the end of a list");
    using TailIter = ListIterator<typename List::tail_type, Access, Adapter>;
    using Item =
      internal::HeldResult<decltype(m_adapter(Access::get(*m_list)))>;
    return std::pair<Item, TailIter>(m_adapter(Access::get(*m_list)),
                                     TailIter(m_list->tail, m_adapter));
  }

  /** @brief Add a callable applied after the current adapter. */
  template <typename F>
  constexpr ListIterator<List, Access, ComposedAdapter<F, Adapter>>
  map(F f) const
  {
    return ListIterator<List, Access, ComposedAdapter<F, Adapter>>(
      *m_list, ComposedAdapter<F, Adapter>{std::move(f), m_adapter});
  }

  /** @brief Collect the adapted elements into an unlabeled list. */
  constexpr auto collect() const { return collect_impl(*m_list); }

  /** @brief Collect the adapted elements into a labeled list.
   *
   *  @tparam Labels A TypeList with one new label per element. Each
   *                 adapted element must be a payload of its new label,
   *                 as for `labeled`.
   */
  template <typename Labels>
  constexpr auto collect_labeled() const
  {
    static_assert(meta::tlist::Length<Labels> == Len<List>,
                  "collect_labeled needs exactly one label per element");
    static_assert(meta::tlist::Distinct<Labels>,
                  "A label may appear only once in a labeled list");
    return collect_labeled_impl<Labels>(*m_list);
  }

  /** @brief Call `f` on every adapted element, in order. */
  template <typename F>
  constexpr void for_each(F&& f) const
  {
    for_each_impl(*m_list, f);
  }

private:
  List const* m_list;
  Adapter m_adapter;

  template <typename N>
  constexpr auto collect_impl(N const& node) const
  {
    if constexpr (meta::Eq<N, Nil>)
    {
      return Nil{};
    }
    else
    {
      using Item = std::decay_t<decltype(m_adapter(Access::get(node)))>;
      return Cons<Item, decltype(collect_impl(node.tail))>{
        m_adapter(Access::get(node)), collect_impl(node.tail)};
    }
  }

  template <typename Labels, typename N>
  constexpr auto collect_labeled_impl(N const& node) const
  {
    if constexpr (meta::Eq<N, Nil>)
    {
      return Nil{};
    }
    else
    {
      using L = meta::tlist::Car<Labels>;
      using Rest = meta::tlist::Cdr<Labels>;
      return LVCons<L, decltype(collect_labeled_impl<Rest>(node.tail))>{
        labeled<L>(m_adapter(Access::get(node))),
        collect_labeled_impl<Rest>(node.tail)};
    }
  }

  template <typename N, typename F>
  constexpr void for_each_impl(N const& node, F& f) const
  {
    if constexpr (!meta::Eq<N, Nil>)
    {
      f(m_adapter(Access::get(node)));
      for_each_impl(node.tail, f);
    }
  }
};

/** @brief Iterates over the elements (labeled values) of a list. */
template <typename List, typename Adapter = IdentityAdapter>
using ConsIterator = ListIterator<List, ElemAccess, Adapter>;

/** @brief Iterates over the payloads of a labeled list. */
template <typename List, typename Adapter = IdentityAdapter>
using ValuesIterator = ListIterator<List, ValueAccess, Adapter>;

template <typename List>
constexpr ConsIterator<List> iter(List const& list)
{
  return ConsIterator<List>(list);
}

template <typename List>
constexpr ValuesIterator<List> iter_values(List const& list)
{
  static_assert(IsLabeledList<List>,
                "iter_values requires a list of labeled values");
  return ValuesIterator<List>(list);
}

/** @brief Call `f` on every element of a list, in order.
 *
 *  `f` receives a mutable reference when the list is mutable.
 */
template <typename List, typename F>
constexpr void for_each(List&& list, F&& f)
{
  if constexpr (!meta::Eq<std::decay_t<List>, Nil>)
  {
    f(list.head);
    for_each(std::forward<List>(list).tail, f);
  }
}

/** @brief Call `f` on the payload of every element of a labeled list. */
template <typename List, typename F>
constexpr void for_each_value(List&& list, F&& f)
{
  static_assert(IsLabeledList<std::decay_t<List>>,
                "for_each_value requires a list of labeled values");
  lhl::for_each(std::forward<List>(list), [&f](auto&& elem) {
    f(std::forward<decltype(elem)>(elem).value);
  });
}

} // namespace lhl
