////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

// Updating a value of a constant list.

#include "lhl/LHList.hpp"

LHL_NEW_LABEL(Count, int);

int main()
{
  auto const list = lhl::lhlist(Count{} = 3);
  lhl::value<Count>(list) = 7;
  return 0;
}
