////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 *  Text output for lists.
 *
 *  Labeled lists print as `{Count = 3, Name = abc}`, unlabeled lists as
 *  `(8, Hi, 4.3)`, and the empty list as `{}`.
 */

#include "lhl/label/Label.hpp"
#include "lhl/list/Cons.hpp"
#include "lhl/list/Labels.hpp"
#include "lhl/meta/TypeList.hpp"
#include "lhl/utils/Logger.hpp"
#include "lhl/utils/typename.hpp"

#include <ostream>
#include <sstream>
#include <string>

namespace lhl
{

template <typename L>
std::ostream& operator<<(std::ostream& os, LabeledValue<L> const& lv)
{
  return os << L::name() << " = " << lv.value;
}

inline std::ostream& operator<<(std::ostream& os, Nil const&)
{
  return os << "{}";
}

namespace internal
{

template <typename List>
void print_elements(std::ostream& os, List const& list)
{
  if constexpr (!meta::Eq<List, Nil>)
  {
    os << list.head;
    if constexpr (!meta::Eq<typename List::tail_type, Nil>)
    {
      os << ", ";
    }
    print_elements(os, list.tail);
  }
}

/** @brief Names a label together with its payload type. */
struct LabelDeclNamer
{
  template <typename L>
  static std::string name()
  {
    return label_name<L>() + ": " + TypeName<LabelType<L>>();
  }
};

} // namespace internal

template <typename H, typename T>
std::ostream& operator<<(std::ostream& os, Cons<H, T> const& list)
{
  constexpr bool is_labeled = IsLabeledList<Cons<H, T>>;
  os << (is_labeled ? "{" : "(");
  internal::print_elements(os, list);
  return os << (is_labeled ? "}" : ")");
}

/** @brief The text form of a list (or of any streamable value). */
template <typename List>
std::string describe(List const& list)
{
  std::ostringstream ss;
  ss << list;
  return ss.str();
}

/** @brief Describe the shape of a list type.
 *
 *  Labeled lists give `"Count: int, Name: std::string"`; unlabeled
 *  lists give their element types, `"int, double"`.
 */
template <typename List>
std::string describe_type()
{
  if constexpr (IsLabeledList<List>)
  {
    return meta::tlist::print<internal::LabelDeclNamer>(LabelsOf<List>{});
  }
  else
  {
    return meta::tlist::print(ElementsOf<List>{});
  }
}

/** @brief Write a list to the library logger at debug level. */
template <typename List>
void log_list(List const& list, std::string const& what = "list")
{
  if (logger().should_log(spdlog::level::debug))
  {
    LHL_DEBUG("{} [{}]: {}", what, describe_type<List>(), describe(list));
  }
}

} // namespace lhl
