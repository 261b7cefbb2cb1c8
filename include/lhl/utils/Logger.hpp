////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include "lhl_config.hpp"

#include <spdlog/spdlog.h>

#include <string>

// We can ignore the SPDLOG level and manage it here.

#define LHL_LOG_LEVEL_TRACE SPDLOG_LEVEL_TRACE
#define LHL_LOG_LEVEL_DEBUG SPDLOG_LEVEL_DEBUG
#define LHL_LOG_LEVEL_INFO SPDLOG_LEVEL_INFO
#define LHL_LOG_LEVEL_WARN SPDLOG_LEVEL_WARN
#define LHL_LOG_LEVEL_ERROR SPDLOG_LEVEL_ERROR
#define LHL_LOG_LEVEL_CRITICAL SPDLOG_LEVEL_CRITICAL
#define LHL_LOG_LEVEL_OFF SPDLOG_LEVEL_OFF

#ifndef LHL_LOG_ACTIVE_LEVEL
#define LHL_LOG_ACTIVE_LEVEL LHL_LOG_LEVEL_TRACE
#endif

#define LHL_LOG(level, ...)                                                    \
  ::lhl::logger().log(                                                         \
    ::spdlog::source_loc{__FILE__, __LINE__, LHL_PRETTY_FUNCTION},             \
    level,                                                                     \
    __VA_ARGS__)

#if LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_TRACE
#define LHL_TRACE(...) LHL_LOG(::spdlog::level::trace, __VA_ARGS__)
#else
#define LHL_TRACE(...) (void) 0
#endif // LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_TRACE

#if LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_DEBUG
#define LHL_DEBUG(...) LHL_LOG(::spdlog::level::debug, __VA_ARGS__)
#else
#define LHL_DEBUG(...) (void) 0
#endif // LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_DEBUG

#if LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_INFO
#define LHL_INFO(...) LHL_LOG(::spdlog::level::info, __VA_ARGS__)
#else
#define LHL_INFO(...) (void) 0
#endif // LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_INFO

#if LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_WARN
#define LHL_WARN(...) LHL_LOG(::spdlog::level::warn, __VA_ARGS__)
#else
#define LHL_WARN(...) (void) 0
#endif // LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_WARN

#if LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_ERROR
#define LHL_ERROR(...) LHL_LOG(::spdlog::level::err, __VA_ARGS__)
#else
#define LHL_ERROR(...) (void) 0
#endif // LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_ERROR

#if LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_CRITICAL
#define LHL_CRITICAL(...) LHL_LOG(::spdlog::level::critical, __VA_ARGS__)
#else
#define LHL_CRITICAL(...) (void) 0
#endif // LHL_LOG_ACTIVE_LEVEL <= LHL_LOG_LEVEL_CRITICAL

namespace lhl
{

/** @brief Get the spdlog::logger used by LHList.
 *
 *  The logger is named "lhl" and is created on first use. Its level is
 *  taken from the LHL_LOG_LEVEL environment variable, then from
 *  SPDLOG_LEVEL if that is set.
 */
spdlog::logger& logger();

namespace internal
{

/** @brief Convert a level name to an spdlog level.
 *
 *  Accepts trace, debug, info, warn, warning, err, error, critical and
 *  off in any case, surrounded by optional whitespace.
 *
 *  @throws LHLNonfatalException if the name is not a level.
 */
spdlog::level::level_enum get_log_level(std::string const& level);

/** @brief The canonical upper-case name of an spdlog level. */
std::string get_log_level_string(spdlog::level::level_enum level);

} // namespace internal

} // namespace lhl
