////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#pragma once

/** @file
 *
 * Utilities for getting string representations of types.
 */

#include <string>
#include <typeinfo>

namespace lhl
{

namespace internal
{
/**
 * Rewrite a demangled name so standard library types read the way they
 * are written in code: `std::string` rather than its `basic_string`
 * expansion, and no inline ABI namespaces.
 */
std::string tidy_type_name(std::string name);

/**
 * Return a string name for a type, given its `type_info`.
 *
 * The name is demangled where the platform allows it, and tidied.
 */
std::string get_type_name(std::type_info const& tinfo);
} // namespace internal

/** Return a string naming the given type. */
template <typename T>
inline std::string TypeName()
{
  return internal::get_type_name(typeid(T));
}

// Specializations for built-in types and the string type, which would
// otherwise show up with their implementation-specific spelling.
#define LHL_ADD_TYPENAME(Type, Name)                                           \
  template <>                                                                  \
  inline std::string TypeName<Type>()                                          \
  {                                                                            \
    return Name;                                                               \
  }

LHL_ADD_TYPENAME(bool, "bool")
LHL_ADD_TYPENAME(char, "char")
LHL_ADD_TYPENAME(unsigned char, "unsigned char")
LHL_ADD_TYPENAME(signed char, "signed char")
LHL_ADD_TYPENAME(short, "short")
LHL_ADD_TYPENAME(unsigned short, "unsigned short")
LHL_ADD_TYPENAME(int, "int")
LHL_ADD_TYPENAME(unsigned int, "unsigned int")
LHL_ADD_TYPENAME(long, "long")
LHL_ADD_TYPENAME(unsigned long, "unsigned long")
LHL_ADD_TYPENAME(long long, "long long")
LHL_ADD_TYPENAME(unsigned long long, "unsigned long long")
LHL_ADD_TYPENAME(float, "float")
LHL_ADD_TYPENAME(double, "double")
LHL_ADD_TYPENAME(long double, "long double")
LHL_ADD_TYPENAME(std::string, "std::string")

#undef LHL_ADD_TYPENAME

} // namespace lhl
