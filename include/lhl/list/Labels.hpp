////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 *  Type-level views of a list: its labels and its element types, and
 *  the predicates built on them.
 */

#include "lhl/label/Label.hpp"
#include "lhl/meta/TypeList.hpp"

#include <string>
#include <vector>

namespace lhl
{

struct Nil;

template <typename H, typename T>
struct Cons;

/** @brief The labels of a list, in declaration order, as a TypeList.
 *
 *  Elements that carry no label contribute `NotALabel`.
 */
template <typename List>
struct LabelsOfT;

template <typename List>
using LabelsOf = meta::Force<LabelsOfT<List>>;

/** @brief The element types of a list, in order, as a TypeList. */
template <typename List>
struct ElementsOfT;

template <typename List>
using ElementsOf = meta::Force<ElementsOfT<List>>;

/** @brief Whether label L occurs in List. */
template <typename List, typename L>
inline constexpr bool HasLabel = meta::tlist::Member<L, LabelsOf<List>>;

/** @brief Whether every label in List occurs only once. */
template <typename List>
inline constexpr bool HasDistinctLabels =
  meta::tlist::Distinct<LabelsOf<List>>;

/** @brief Whether every element of List is a labeled value. */
template <typename List>
inline constexpr bool IsLabeledList =
  !meta::tlist::Member<NotALabel, LabelsOf<List>>;

/** @brief Position of label L in List, or `meta::tlist::InvalidIdx`. */
template <typename List, typename L>
inline constexpr unsigned long IndexOf = meta::tlist::Find<LabelsOf<List>, L>;

#ifndef DOXYGEN_SHOULD_SKIP_THIS

template <>
struct LabelsOfT<Nil>
{
  using type = meta::tlist::Empty;
};

template <typename H, typename T>
struct LabelsOfT<Cons<H, T>>
{
  using type = meta::tlist::Cons<LabelOf<H>, LabelsOf<T>>;
};

template <>
struct ElementsOfT<Nil>
{
  using type = meta::tlist::Empty;
};

template <typename H, typename T>
struct ElementsOfT<Cons<H, T>>
{
  using type = meta::tlist::Cons<H, ElementsOf<T>>;
};

template <typename... Ls>
std::vector<std::string> label_names_impl(meta::TL<Ls...> const&)
{
  return {label_name<Ls>()...};
}

#endif // DOXYGEN_SHOULD_SKIP_THIS

/** @brief The labels of a list as a (zero-size) TypeList value. */
template <typename List>
constexpr LabelsOf<List> labels_of(List const&) noexcept
{
  return {};
}

/** @brief The names of the labels of List, in declaration order. */
template <typename List>
std::vector<std::string> label_names()
{
  static_assert(IsLabeledList<List>,
                "label_names requires a list of labeled values");
  return label_names_impl(LabelsOf<List>{});
}

template <typename List>
std::vector<std::string> label_names(List const&)
{
  return label_names<List>();
}

/** @brief The position of label L in a list, in declaration order.
 *
 *  Fails to compile if L is not in the list.
 */
template <typename L, typename List>
constexpr unsigned long index_of(List const&) noexcept
{
  static_assert(HasLabel<List, L>, "Label is not present in this list");
  return IndexOf<List, L>;
}

} // namespace lhl
