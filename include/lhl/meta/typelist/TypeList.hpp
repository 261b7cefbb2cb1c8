////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "lhl/meta/Core.hpp"

namespace lhl
{
namespace meta
{
/** @struct TypeList
 *  @brief A basic type list.
 *
 *  Functions that act on typelists are in the tlist namespace. The
 *  accessors follow Lisp naming (Cons, Car, Cdr); when a semantic
 *  choice has to be made (e.g., the Car of the empty list), the ANSI
 *  Common Lisp answer is used.
 *
 *  In LHList, type lists mostly carry labels: the labels of a
 *  labeled list, or the target labels of a relabeling collect.
 */
template <typename... Ts>
struct TypeList
{};

/** @brief A short-hand alias for TypeLists. */
template <typename... Ts>
using TL = TypeList<Ts...>;

/** @brief Basic metamethods on TypeLists. */
namespace tlist
{
/** @brief The empty list. */
using Empty = TypeList<>;

/** @brief Prepend an item to a list. */
template <typename T, typename List>
struct ConsT;

template <typename T, typename List>
using Cons = Force<ConsT<T, List>>;

/** @brief Get the first item in a list. */
template <typename List>
struct CarT;

template <typename List>
using Car = Force<CarT<List>>;

/** @brief Get a copy of the list with the first item removed. */
template <typename List>
struct CdrT;

template <typename List>
using Cdr = Force<CdrT<List>>;

/** @brief Get the length of the given typelist. */
template <typename List>
struct LengthVT;

template <typename List>
inline constexpr unsigned long Length = LengthVT<List>::value;

#ifndef DOXYGEN_SHOULD_SKIP_THIS

template <typename T, typename... Ts>
struct ConsT<T, TypeList<Ts...>>
{
  using type = TypeList<T, Ts...>;
};

template <typename T, typename... Ts>
struct CarT<TypeList<T, Ts...>>
{
  using type = T;
};

// (car nil) => nil
template <>
struct CarT<Empty>
{
  using type = Empty;
};

template <typename T, typename... Ts>
struct CdrT<TypeList<T, Ts...>>
{
  using type = TypeList<Ts...>;
};

template <>
struct CdrT<Empty>
{
  using type = Empty;
};

template <typename... Ts>
struct LengthVT<TypeList<Ts...>> : ValueAsType<unsigned long, sizeof...(Ts)>
{};

#endif // DOXYGEN_SHOULD_SKIP_THIS
} // namespace tlist
} // namespace meta
} // namespace lhl
