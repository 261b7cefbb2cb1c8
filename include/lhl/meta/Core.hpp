////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#ifndef LHL_META_CORE_HPP_
#define LHL_META_CORE_HPP_

/** @file
 *
 *  Basic building blocks for the type-level code in LHList.
 *
 *  Metafunctions come in two flavors. Those whose name ends in `T`
 *  are "suspended": they expose their result as a nested `type`. The
 *  unsuffixed alias forces that result. Predicates end in `VT` and
 *  expose a nested `value`; the unsuffixed variable template gives
 *  the value directly.
 */

namespace lhl
{
namespace meta
{
/** @brief Suspend a given type. */
template <typename T>
struct Susp
{
  using type = T;
};

/** @brief Extract the internal type from a suspended type. */
template <typename SuspT>
using Force = typename SuspT::type;

/** @brief A constexpr value represented as a type. */
template <typename T, T Value>
struct ValueAsTypeT
{
  static constexpr T value = Value;
  using value_type = T;
  using type = ValueAsTypeT;
  constexpr operator value_type() const noexcept { return value; }
  constexpr value_type operator()() const noexcept { return value; }
};

/** @brief A constexpr value represented as a type. */
template <typename T, T Value>
using ValueAsType = Force<ValueAsTypeT<T, Value>>;

/** @brief A boolean represented as a type. */
template <bool B>
using BoolAsType = ValueAsType<bool, B>;

using TrueType = BoolAsType<true>;
using FalseType = BoolAsType<false>;

/** @brief Select `T` when `B` is true and `F` otherwise. */
template <bool B, typename T, typename F>
struct IfThenElseT
{
  using type = F;
};

template <typename T, typename F>
struct IfThenElseT<true, T, F>
{
  using type = T;
};

template <bool B, typename T, typename F>
using IfThenElse = Force<IfThenElseT<B, T, F>>;

/** @brief Binary metafunction for type identity. */
template <typename T, typename U>
struct EqVT : FalseType
{};

template <typename T>
struct EqVT<T, T> : TrueType
{};

template <typename T, typename U>
inline constexpr bool Eq = EqVT<T, U>::value;

/** @brief Contains a typedef `type` only if the condition is `true`. */
template <bool B, typename ResultT = void>
struct EnableIfT
{};

template <typename ResultT>
struct EnableIfT<true, ResultT>
{
  using type = ResultT;
};

template <bool B, typename ResultT = void>
using EnableIf = Force<EnableIfT<B, ResultT>>;

/** @brief An alias for EnableIf. */
template <bool B, typename ResultT = void>
using EnableWhen = EnableIf<B, ResultT>;

/** @brief Contains a type only when the condition is false. */
template <bool B, typename ResultT = void>
using EnableUnless = EnableWhen<!B, ResultT>;

/** @brief Map any well-formed set of types to `void`.
 *
 *  This is the usual detection idiom: a partial specialization
 *  keyed on `VoidT<...>` only participates when every argument is
 *  well-formed.
 */
template <typename...>
using VoidT = void;

/** @brief A false value that depends on `T`.
 *
 *  Use this in a `static_assert` that should only fire when a
 *  template is actually instantiated.
 */
template <typename... Ts>
inline constexpr bool DependentFalse = false;

} // namespace meta
} // namespace lhl
#endif // LHL_META_CORE_HPP_
