////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

// Looking up a label the list does not hold.

#include "lhl/LHList.hpp"

#include <string>

LHL_NEW_LABEL(Count, int);
LHL_NEW_LABEL(Name, std::string);
LHL_NEW_LABEL(Active, bool);

int main()
{
  auto list = lhl::lhlist(Count{} = 3, Name{} = "abc");
  return lhl::value<Active>(list) ? 0 : 1;
}
