////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lhl/list/Cons.hpp"
#include "lhl/list/Construct.hpp"

#include <string>

using namespace lhl;

namespace static_test_construct
{
LHL_NEW_LABEL(Count, int);
LHL_NEW_LABEL(Ratio, double);
LHL_NEW_LABEL(Active, bool);
LHL_NEW_LABEL(Name, std::string);

// The list type follows declaration order.
static_assert(meta::Eq<LHList<>, Nil>, "No labels gives Nil.");
static_assert(
  meta::Eq<LHList<Count, Active>,
           Cons<LabeledValue<Count>, Cons<LabeledValue<Active>, Nil>>>,
  "LHList nests labels in order.");

static_assert(meta::Eq<decltype(lhlist()), Nil>, "Empty lhlist is Nil.");
static_assert(
  meta::Eq<decltype(lhlist(Count{} = 3, Name{} = "abc", Active{} = true)),
           LHList<Count, Name, Active>>,
  "lhlist encodes labels in the order given.");
static_assert(
  meta::Eq<decltype(lhlist(Active{} = true, Count{} = 3)),
           LHList<Active, Count>>,
  "A different order gives a different type.");
static_assert(
  meta::Eq<decltype(make_lhlist<Count, Name>(3, "abc")), LHList<Count, Name>>,
  "make_lhlist takes the labels explicitly.");

// Construction is constexpr for literal payloads.
constexpr auto list = lhlist(Count{} = 3, Ratio{} = 0.5, Active{} = true);
static_assert(list.head.value == 3, "First entry is the head.");
static_assert(list.tail.head.value == 0.5, "Second entry.");
static_assert(list.tail.tail.head.value, "Third entry.");
static_assert(meta::Eq<decltype(list.tail.tail.tail), Nil>,
              "The list ends in Nil.");

constexpr auto same = make_lhlist<Count, Ratio, Active>(3, 0.5, true);
static_assert(list == same, "Both construction forms agree.");

} // namespace static_test_construct
