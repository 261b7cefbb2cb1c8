////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lhl/list/Cons.hpp"
#include "lhl/list/Construct.hpp"
#include "lhl/list/Iter.hpp"

#include <cstddef>

using namespace lhl;

namespace static_test_iter
{
LHL_NEW_LABEL(Small, char);
LHL_NEW_LABEL(Medium, short);
LHL_NEW_LABEL(Large, double);
LHL_NEW_LABEL(A, std::size_t);
LHL_NEW_LABEL(B, std::size_t);
LHL_NEW_LABEL(C, std::size_t);

struct SizeOf
{
  template <typename T>
  constexpr std::size_t operator()(T const&) const noexcept
  {
    return sizeof(T);
  }
};

using List = LHList<Small, Medium, Large>;

// Iterator types
static_assert(!ConsIterator<List>::done(), "A nonempty list is not done.");
static_assert(ConsIterator<Nil>::done(), "Nil is done.");
static_assert(
  meta::Eq<decltype(iter(std::declval<List const&>()).next().first),
           LabeledValue<Small> const&>,
  "iter produces the entries.");
static_assert(
  meta::Eq<decltype(iter_values(std::declval<List const&>()).next().first),
           char const&>,
  "iter_values produces the payloads.");
static_assert(
  meta::Eq<decltype(iter_values(std::declval<List const&>()).next().second),
           ValuesIterator<LHList<Medium, Large>>>,
  "next gives an iterator over the tail.");

// Collected types
static_assert(
  meta::Eq<decltype(iter_values(std::declval<List const&>()).collect()),
           Cons<char, Cons<short, Cons<double, Nil>>>>,
  "collect drops the labels.");
static_assert(
  meta::Eq<decltype(iter_values(std::declval<List const&>())
                      .map(SizeOf{})
                      .collect()),
           Cons<std::size_t, Cons<std::size_t, Cons<std::size_t, Nil>>>>,
  "map changes the element types.");
static_assert(
  meta::Eq<decltype(iter_values(std::declval<List const&>())
                      .map(SizeOf{})
                      .collect_labeled<meta::TL<A, B, C>>()),
           LHList<A, B, C>>,
  "collect_labeled relabels.");
static_assert(
  meta::Eq<decltype(iter_values(std::declval<List const&>())
                      .map(IdentityAdapter{})
                      .next()
                      .first),
           char const&>,
  "Passing a list element through an adapter still refers to it.");
static_assert(
  meta::Eq<decltype(iter_values(std::declval<List const&>())
                      .map(SizeOf{})
                      .map(IdentityAdapter{})
                      .next()
                      .first),
           std::size_t>,
  "A computed element forwarded by a later adapter is held by value.");
static_assert(meta::Eq<decltype(iter(Nil{}).collect()), Nil>,
              "Collecting nothing gives Nil.");

// Iteration is usable in constant expressions.
constexpr List list = make_lhlist<Small, Medium, Large>('a', short{2}, 4.0);
constexpr auto sizes = iter_values(list).map(SizeOf{}).collect();
static_assert(sizes.head == sizeof(char), "Size of the first payload.");
static_assert(sizes.tail.tail.head == sizeof(double),
              "Size of the third payload.");

} // namespace static_test_iter
