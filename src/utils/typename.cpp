////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lhl/utils/typename.hpp"

#include "lhl/utils/Error.hpp"
#include "lhl/utils/Logger.hpp"

#include <cstdlib>
#include <memory>
#include <utility>

#if __has_include(<cxxabi.h>)
#include <cxxabi.h>
#define LHL_HAS_CXXABI_H
#endif

namespace
{

// Spellings the demangler gives standard types, in the order they are
// rewritten. The inline ABI namespaces go first so that the longer
// spellings below match on every standard library.
std::pair<char const*, char const*> const standard_spellings[] = {
  {"std::__cxx11::", "std::"},
  {"std::__1::", "std::"},
  {"std::basic_string<char, std::char_traits<char>, std::allocator<char> >",
   "std::string"},
  {"std::basic_string_view<char, std::char_traits<char> >",
   "std::string_view"},
};

std::string demangle(char const* mangled)
{
  LHL_ASSERT_ALWAYS(mangled != nullptr, "Attempt to demangle a null pointer");
#ifdef LHL_HAS_CXXABI_H
  int status = 0;
  std::unique_ptr<char, decltype(&std::free)> demangled{
    abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free};
  if (status == 0 && demangled)
  {
    return demangled.get();
  }
  LHL_DEBUG("Could not demangle {} (status {})", mangled, status);
#endif
  return mangled;
}

} // namespace

namespace lhl
{

namespace internal
{

std::string tidy_type_name(std::string name)
{
  for (auto const& [from, to] : standard_spellings)
  {
    std::string const pattern{from};
    std::string const replacement{to};
    for (auto pos = name.find(pattern); pos != std::string::npos;
         pos = name.find(pattern, pos + replacement.size()))
    {
      name.replace(pos, pattern.size(), replacement);
    }
  }
  return name;
}

std::string get_type_name(std::type_info const& tinfo)
{
  return tidy_type_name(demangle(tinfo.name()));
}

} // namespace internal

} // namespace lhl
