////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <string>

/** @namespace lhl
 *  @brief The main namespace for LHList.
 */

namespace lhl
{
/** @brief Get the version string for LHList
 *  @returns A string of the format "MAJOR.MINOR.PATCH".
 */
std::string Version() noexcept;

} // namespace lhl
