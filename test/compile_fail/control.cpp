////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

// Builds. Each other file in this directory differs from this one in
// exactly one misuse.

#include "lhl/LHList.hpp"

#include <string>

LHL_NEW_LABEL(Count, int);
LHL_NEW_LABEL(Name, std::string);

int main()
{
  auto list = lhl::lhlist(Count{} = 3, Name{} = "abc");
  lhl::value<Count>(list) = 7;
  return lhl::value<Count>(list) == 7 ? 0 : 1;
}
