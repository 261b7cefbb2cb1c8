////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * Utilities for working with strings.
 */

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <utility>

namespace lhl
{

/**
 * Build a string by concatenating all the arguments to this function.
 *
 * All arguments must be stream-outputable (i.e., have an operator<<
 * defined for the type).
 *
 * @tparam Args The (inferred) types of the arguments.
 *
 * @param[in] args The things to be concatenated into a string.
 */
template <typename... Args>
inline std::string build_string(Args&&... args) noexcept(sizeof...(Args) == 0)
{
  if constexpr (sizeof...(Args) == 0)
  {
    return std::string();
  }
  else
  {
    std::ostringstream ss;
    (ss << ... << std::forward<Args>(args));
    return ss.str();
  }
}

inline std::string build_string(const char* s)
{
  return std::string(s);
}

inline std::string build_string(const std::string& s)
{
  return std::string(s);
}

/** Return an upper-cased version of a string. */
inline std::string str_toupper(std::string str)
{
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return std::toupper(c);
  });
  return str;
}

/** Return a lower-cased version of a string. */
inline std::string str_tolower(std::string str)
{
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return str;
}

/** Return a copy of the string without leading or trailing whitespace. */
inline std::string str_trim(std::string const& str)
{
  auto const not_space = [](unsigned char c) { return !std::isspace(c); };
  auto const first = std::find_if(str.begin(), str.end(), not_space);
  auto const last = std::find_if(str.rbegin(), str.rend(), not_space).base();
  return (first < last) ? std::string(first, last) : std::string();
}

/**
 * Convert an input string to type T.
 *
 * Conversions of numbers defer to the standard `sto*` family and
 * throw `std::invalid_argument` or `std::out_of_range` like they do.
 */
template <typename T>
inline T from_string(const std::string& str);

template <>
inline std::string from_string<std::string>(const std::string& str)
{
  return str;
}

template <>
inline int from_string<int>(const std::string& str)
{
  return std::stoi(str);
}

template <>
inline long from_string<long>(const std::string& str)
{
  return std::stol(str);
}

template <>
inline long long from_string<long long>(const std::string& str)
{
  return std::stoll(str);
}

template <>
inline unsigned long from_string<unsigned long>(const std::string& str)
{
  return std::stoul(str);
}

template <>
inline double from_string<double>(const std::string& str)
{
  return std::stod(str);
}

/**
 * Convert a string to a boolean.
 *
 * Values considered true: the string "true" (any case); a string
 * convertible to an integer that is non-zero.
 *
 * Values considered false: the string "false" (any case); a string
 * convertible to an integer that is zero.
 *
 * An empty string will throw. Other strings will throw.
 */
template <>
inline bool from_string<bool>(const std::string& str)
{
  std::string upstr = str_toupper(str);
  if (upstr == "TRUE")
  {
    return true;
  }
  else if (upstr == "FALSE")
  {
    return false;
  }
  else
  {
    return static_cast<bool>(from_string<long long>(str));
  }
}

} // namespace lhl
