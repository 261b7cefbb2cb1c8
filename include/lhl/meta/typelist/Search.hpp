////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "TypeList.hpp"
#include "lhl/meta/Core.hpp"

/** @file
 *
 *  Searching type lists: position of an entry, membership, and
 *  whether all entries are pairwise distinct.
 */

namespace lhl
{
namespace meta
{
namespace tlist
{
constexpr static unsigned long InvalidIdx = static_cast<unsigned long>(-1);

/** @brief Get the index of the first occurrence of T in the list.
 *
 *  The result is `InvalidIdx` if T does not occur.
 */
template <typename List, typename T>
struct FindVT;

template <typename List, typename T>
inline constexpr unsigned long Find = FindVT<List, T>::value;

/** @brief Determine if T is a member of List. */
template <typename T, typename List>
struct MemberVT;

template <typename T, typename List>
inline constexpr bool Member = MemberVT<T, List>::value;

/** @brief Determine if no type occurs twice in List. */
template <typename List>
struct DistinctVT;

template <typename List>
inline constexpr bool Distinct = DistinctVT<List>::value;

#ifndef DOXYGEN_SHOULD_SKIP_THIS

template <typename List, typename T, unsigned long N>
struct FindVTImpl;

template <typename T, unsigned long N>
struct FindVTImpl<Empty, T, N> : ValueAsType<unsigned long, InvalidIdx>
{};

template <typename T, typename... Ts, unsigned long N>
struct FindVTImpl<TL<T, Ts...>, T, N> : ValueAsType<unsigned long, N>
{};

template <typename S, typename... Ts, typename T, unsigned long N>
struct FindVTImpl<TL<S, Ts...>, T, N> : FindVTImpl<TL<Ts...>, T, N + 1>
{};

template <typename List, typename T>
struct FindVT : FindVTImpl<List, T, 0UL>
{};

template <typename T, typename List>
struct MemberVT : BoolAsType<(Find<List, T> != InvalidIdx)>
{};

template <>
struct DistinctVT<Empty> : TrueType
{};

template <typename T, typename... Ts>
struct DistinctVT<TL<T, Ts...>>
  : BoolAsType<(!Member<T, TL<Ts...>> && DistinctVT<TL<Ts...>>::value)>
{};

#endif // DOXYGEN_SHOULD_SKIP_THIS
} // namespace tlist
} // namespace meta
} // namespace lhl
