////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include <lhl_config.hpp>

#include <lhl/Version.hpp>

#define STRINGIFY(thing) LAYER_TWO(thing)
#define LAYER_TWO(thing) #thing

namespace lhl
{
std::string Version() noexcept
{
  return STRINGIFY(LHL_VERSION_MAJOR) "." STRINGIFY(
    LHL_VERSION_MINOR) "." STRINGIFY(LHL_VERSION_PATCH);
}

}  // namespace lhl
