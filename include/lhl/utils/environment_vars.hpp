////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * Utilities to interface with environment variables.
 */

#include "lhl/utils/strings.hpp"

#include <string>
#include <vector>

namespace lhl
{

/**
 * Configuration in LHList comes from the environment.
 *
 * The `env` namespace reads the library's own settings. They are named
 * here without their "LHL_" prefix: `env::get<bool>("DEBUG_BACKTRACE")`
 * reads `LHL_DEBUG_BACKTRACE`. Each setting has a default, and what the
 * environment holds is read once and then cached. Names that are not
 * settings of the library throw LHLNonfatalException.
 *
 * The `env::raw` namespace reads arbitrary variables, by their full
 * names and without caching.
 */

namespace env
{

/** Return true if the setting is set in the environment. */
bool exists(std::string const& name);

/** Return the setting as a string: the environment's, or the default. */
std::string get_raw(std::string const& name);

/** Return the setting converted to T via `from_string`. */
template <typename T>
inline T get(std::string const& name)
{
  return from_string<T>(get_raw(name));
}

/** Return the default value of the setting. */
std::string get_default(std::string const& name);

/** Return a one-line description of the setting. */
std::string about(std::string const& name);

/** Names of all settings, without the "LHL_" prefix. */
std::vector<std::string> registered();

/** Forget cached values, so the next read sees the environment again. */
void reload();

namespace raw
{

/** Return true if the environment variable name is set. */
bool exists(std::string const& name);

/** Return the value of the environment variable, or "" if unset. */
std::string get_raw(std::string const& name);

template <typename T>
inline T get(std::string const& name)
{
  return from_string<T>(get_raw(name));
}

} // namespace raw

} // namespace env

} // namespace lhl
