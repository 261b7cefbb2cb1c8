////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#ifndef LHL_LHLIST_HPP_
#define LHL_LHLIST_HPP_

/** @file
 *
 *  Labeled heterogeneous lists.
 *
 *  A labeled list is a statically typed record built on the fly:
 *
 *  @code
 *  LHL_NEW_LABEL(Count, int);
 *  LHL_NEW_LABEL(Name, std::string);
 *
 *  auto rec = lhl::lhlist(Count{} = 3, Name{} = "abc");
 *  rec[Count{}] = 7;
 *  std::string const& n = lhl::value<Name>(rec);
 *  @endcode
 *
 *  Asking for a label that is not in the list, or giving a label a
 *  value of the wrong type, does not compile.
 */

#include "lhl/label/Label.hpp"
#include "lhl/list/Cons.hpp"
#include "lhl/list/Construct.hpp"
#include "lhl/list/Iter.hpp"
#include "lhl/list/Labels.hpp"
#include "lhl/list/Lookup.hpp"
#include "lhl/list/io.hpp"

#endif // LHL_LHLIST_HPP_
