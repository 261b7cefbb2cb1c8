////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lhl/list/Cons.hpp"

using namespace lhl;

namespace static_test_cons
{
LHL_NEW_LABEL(Count, int);

// Unlabeled lists
using IntCharDouble = Cons<int, Cons<char, Cons<double, Nil>>>;

static_assert(meta::Eq<decltype(cons_list()), Nil>, "Empty cons_list is Nil.");
static_assert(meta::Eq<decltype(cons_list(1, 'a', 2.0)), IntCharDouble>,
              "cons_list nests in argument order.");
static_assert(meta::Eq<decltype(cons(1, Nil{})), Cons<int, Nil>>,
              "cons prepends.");
static_assert(meta::Eq<decltype(cons_list("Hi")), Cons<char const*, Nil>>,
              "Arrays decay.");

// Length
static_assert(Len<Nil> == 0UL, "Nil has no elements.");
static_assert(Len<IntCharDouble> == 3UL, "Three elements.");
static_assert(length(cons_list(1, 2)) == 2UL, "length of a value.");

// Lists are plain aggregates; Nil takes no space of its own.
static_assert(std::is_empty_v<Nil>, "Nil is empty.");
static_assert(std::is_aggregate_v<IntCharDouble>, "Cons is an aggregate.");

// Labeled nodes
static_assert(meta::Eq<LVCons<Count, Nil>, Cons<LabeledValue<Count>, Nil>>,
              "LVCons is a Cons of a labeled value.");

// Comparison
static_assert(cons_list(1, 2) == cons_list(1, 2), "Equal lists.");
static_assert(cons_list(1, 2) != cons_list(1, 3), "Unequal lists.");
static_assert(cons_list(1, 2.0) == cons_list(1L, 2.0f),
              "Elements compare with their own operators.");
static_assert(Nil{} == Nil{}, "Nil equals Nil.");

} // namespace static_test_cons
