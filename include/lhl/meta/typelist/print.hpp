////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "TypeList.hpp"
#include "lhl/utils/typename.hpp"

#include <string>

namespace lhl
{
namespace meta
{
namespace tlist
{
/** @brief Default naming policy for print: the readable type name. */
struct TypeNamer
{
  template <typename T>
  static std::string name()
  {
    return TypeName<T>();
  }
};

#ifndef DOXYGEN_SHOULD_SKIP_THIS

template <typename List, typename Namer>
struct PrintTLT;

template <typename Namer>
struct PrintTLT<Empty, Namer>
{
  static std::string to_string(std::string const&) { return ""; }
};

template <typename T, typename Namer>
struct PrintTLT<TL<T>, Namer>
{
  static std::string to_string(std::string const&)
  {
    return Namer::template name<T>();
  }
};

template <typename T, typename... Ts, typename Namer>
struct PrintTLT<TL<T, Ts...>, Namer>
{
  static std::string to_string(std::string const& sep)
  {
    return Namer::template name<T>() + sep
           + PrintTLT<TL<Ts...>, Namer>::to_string(sep);
  }
};

#endif // DOXYGEN_SHOULD_SKIP_THIS

/** @brief Convert a type list to a string.
 *
 *  @tparam Namer Policy with a static `name<T>()` giving the text for
 *                each entry.
 *  @param[in] sep Text placed between consecutive entries.
 */
template <typename Namer = TypeNamer, typename... Ts>
std::string print(TL<Ts...> const&, std::string const& sep = ", ")
{
  return PrintTLT<TL<Ts...>, Namer>::to_string(sep);
}

} // namespace tlist
} // namespace meta
} // namespace lhl
