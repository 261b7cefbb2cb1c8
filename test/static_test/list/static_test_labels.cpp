////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lhl/list/Cons.hpp"
#include "lhl/list/Construct.hpp"
#include "lhl/list/Labels.hpp"

using namespace lhl;

namespace static_test_labels
{
LHL_NEW_LABEL(Count, int);
LHL_NEW_LABEL(Size, int);
LHL_NEW_LABEL(Active, bool);
LHL_NEW_LABEL(Absent, int);

using List = LHList<Count, Size, Active>;

// LabelsOf and ElementsOf
static_assert(meta::Eq<LabelsOf<List>, meta::TL<Count, Size, Active>>,
              "Labels in declaration order.");
static_assert(meta::Eq<LabelsOf<Nil>, meta::tlist::Empty>,
              "Nil has no labels.");
static_assert(meta::Eq<LabelsOf<Cons<int, LHList<Count>>>,
                       meta::TL<NotALabel, Count>>,
              "Unlabeled elements contribute NotALabel.");
static_assert(meta::Eq<ElementsOf<Cons<int, Cons<char, Nil>>>,
                       meta::TL<int, char>>,
              "Element types in order.");

// HasLabel
static_assert(HasLabel<List, Count>, "Count is present.");
static_assert(HasLabel<List, Active>, "Active is present.");
static_assert(!HasLabel<List, Absent>, "Absent is not present.");
static_assert(!HasLabel<Nil, Count>, "Nil has no labels.");
static_assert(List::has_label<Size>(), "Member form.");
static_assert(!List::has_label(Absent{}),
              "Member form with a label object.");
static_assert(!Nil::has_label<Count>(), "Nil member form.");

// IndexOf
static_assert(IndexOf<List, Count> == 0UL, "Count is first.");
static_assert(IndexOf<List, Active> == 2UL, "Active is third.");
static_assert(IndexOf<List, Absent> == meta::tlist::InvalidIdx,
              "Absent has no index.");

// Predicates
static_assert(IsLabeledList<List>, "All elements are labeled.");
static_assert(IsLabeledList<Nil>, "Nil is trivially labeled.");
static_assert(!IsLabeledList<Cons<int, Nil>>, "An int is not labeled.");
static_assert(HasDistinctLabels<List>, "Labels are distinct.");
static_assert(!HasDistinctLabels<LVCons<Count, LVCons<Count, Nil>>>,
              "A hand-built list can repeat a label.");

} // namespace static_test_labels
