////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#ifndef LHL_LABEL_LABEL_HPP_
#define LHL_LABEL_LABEL_HPP_

#include "lhl/meta/Core.hpp"

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

/** @file
 *
 *  Labels are zero-size marker types used as compile-time keys into a
 *  labeled list. Each label is bound, when it is declared, to exactly
 *  one payload type. Two labels are the same label if and only if they
 *  are the same type; two labels with the same payload type are still
 *  distinct.
 *
 *  Labels are declared with the macros below:
 *
 *  @code
 *  LHL_NEW_LABEL(Count, int);
 *  LHL_NEW_NAMED_LABEL(Name, "Full name", std::string);
 *  LHL_NEW_UNIT_LABEL(Marker);
 *  @endcode
 *
 *  Redeclaring a label in the same scope is an ordinary redefinition
 *  error.
 */

/** @def LHL_NEW_NAMED_LABEL(Name, NameStr, ...)
 *  @brief Declare a label type `Name` whose printable name is `NameStr`.
 *
 *  The payload type is given last so that it may contain commas.
 */
#define LHL_NEW_NAMED_LABEL(Name, NameStr, ...)                                \
  struct Name : ::lhl::Label<Name, __VA_ARGS__>                                \
  {                                                                            \
    using ::lhl::Label<Name, __VA_ARGS__>::operator=;                          \
    static constexpr char const* name() noexcept { return NameStr; }           \
  }

/** @def LHL_NEW_LABEL(Name, ...)
 *  @brief Declare a label type `Name` named after its identifier.
 */
#define LHL_NEW_LABEL(Name, ...) LHL_NEW_NAMED_LABEL(Name, #Name, __VA_ARGS__)

/** @def LHL_NEW_UNIT_LABEL(Name)
 *  @brief Declare a label that carries no data (payload `lhl::Unit`).
 */
#define LHL_NEW_UNIT_LABEL(Name) LHL_NEW_LABEL(Name, ::lhl::Unit)

namespace lhl
{

/** @brief The payload of labels declared without a type. */
struct Unit
{};

constexpr bool operator==(Unit const&, Unit const&) noexcept
{
  return true;
}

constexpr bool operator!=(Unit const&, Unit const&) noexcept
{
  return false;
}

inline std::ostream& operator<<(std::ostream& os, Unit const&)
{
  return os << "()";
}

/** @brief Common, non-template base of every label. */
struct LabelTag
{};

template <typename L>
struct LabeledValue;

/** @class Label
 *  @brief CRTP base of every label.
 *
 *  @tparam Derived The label being declared.
 *  @tparam T The payload type bound to the label.
 *
 *  Assigning a value to a label object does not modify the label; it
 *  builds the `label = value` entry used to construct a list:
 *
 *  @code
 *  auto entry = Count{} = 3; // LabeledValue<Count>
 *  @endcode
 */
template <typename Derived, typename T>
struct Label : LabelTag
{
  static_assert(!std::is_reference_v<T>,
                "The payload type of a label may not be a reference");

  using label_type = Derived;
  using value_type = T;

  /** @brief Build the entry pairing this label with a value. */
  template <typename U>
  [[nodiscard]] constexpr LabeledValue<Derived> operator=(U&& value) const;
};

/** @brief Predicate for label types. */
template <typename T>
struct IsLabelVT : meta::BoolAsType<std::is_base_of_v<LabelTag, T>>
{};

template <typename T>
inline constexpr bool IsLabel = IsLabelVT<T>::value;

/** @brief The payload type bound to label L. */
template <typename L>
using LabelType = typename L::value_type;

/** @brief Label identity: true only if L and M are the same label. */
template <typename L, typename M>
inline constexpr bool LabelEq = meta::Eq<L, M>;

/** @brief The printable name of label L. */
template <typename L>
inline std::string label_name()
{
  static_assert(IsLabel<L>, "label_name requires a label type");
  return L::name();
}

/** @brief A value tagged with its label.
 *
 *  This is the element type of labeled lists. It owns its value.
 *
 *  @tparam L The label.
 */
template <typename L>
struct LabeledValue
{
  static_assert(IsLabel<L>, "LabeledValue requires a label type");

  using label_type = L;
  using value_type = LabelType<L>;

  value_type value;

  /** @brief The name of the label. */
  static std::string name() { return label_name<L>(); }
};

template <typename L>
constexpr bool operator==(LabeledValue<L> const& a, LabeledValue<L> const& b)
{
  return a.value == b.value;
}

template <typename L>
constexpr bool operator!=(LabeledValue<L> const& a, LabeledValue<L> const& b)
{
  return !(a == b);
}

/** @brief Whether a value of type U may fill a payload of type P.
 *
 *  U must be P itself. The only other values accepted are implicit
 *  conversions between non-arithmetic types, such as a string literal
 *  for a `std::string` payload. No arithmetic conversion is accepted:
 *  an `int` payload takes neither a `bool` nor a `char`.
 */
template <typename P, typename U>
struct AcceptsPayloadVT
  : meta::BoolAsType<meta::Eq<std::decay_t<U>, P>
                     || (!std::is_arithmetic_v<P>
                         && !std::is_arithmetic_v<std::decay_t<U>>
                         && std::is_convertible_v<U&&, P>)>
{};

template <typename P, typename U>
inline constexpr bool AcceptsPayload = AcceptsPayloadVT<P, U>::value;

/** @brief Build a labeled value from a value of the payload type. */
template <typename L, typename U>
constexpr LabeledValue<L> labeled(U&& value)
{
  static_assert(IsLabel<L>, "labeled requires a label type");
  static_assert(AcceptsPayload<LabelType<L>, U>,
                "Value does not match the payload type of the label");
  return LabeledValue<L>{std::forward<U>(value)};
}

/** @brief Build a labeled value, taking the label from an object. */
template <typename L, typename U>
constexpr LabeledValue<L> labeled(L const&, U&& value)
{
  return labeled<L>(std::forward<U>(value));
}

template <typename Derived, typename T>
template <typename U>
constexpr LabeledValue<Derived> Label<Derived, T>::operator=(U&& value) const
{
  return labeled<Derived>(std::forward<U>(value));
}

/** @brief The label carried by an element type.
 *
 *  This is L for both `LabeledValue<L>` and a bare label L, and
 *  `NotALabel` for anything else.
 */
struct NotALabel
{};

template <typename T>
struct LabelOfT
{
  using type = meta::IfThenElse<IsLabel<T>, T, NotALabel>;
};

template <typename L>
struct LabelOfT<LabeledValue<L>>
{
  using type = L;
};

template <typename T>
using LabelOf = meta::Force<LabelOfT<T>>;

} // namespace lhl
#endif // LHL_LABEL_LABEL_HPP_
